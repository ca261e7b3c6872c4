#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "helios/cache.hpp"
#include "helios/clock.hpp"
#include "helios/config.hpp"
#include "helios/executor.hpp"
#include "helios/governor.hpp"
#include "helios/hash.hpp"
#include "helios/jsonlite.hpp"
#include "helios/observability.hpp"
#include "helios/process_executor.hpp"
#include "helios/router.hpp"
#include "helios/scheduler.hpp"
#include "helios/service.hpp"
#include "helios/state_store.hpp"
#include "helios/types.hpp"
#include "helios/version.hpp"
#include "helios/worker.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) <= eps; }

// Polls `pred` for up to `timeout_ms`.
template <typename Pred>
bool wait_until(Pred pred, int timeout_ms = 5000) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

// ============================================================================
// Test doubles
// ============================================================================

// Every operation fails as a backend outage would.
class UnavailableStore : public helios::IStateStore {
 public:
  helios::StoreStatus get(const std::string&, std::string&, uint64_t*) const override {
    return helios::StoreStatus::unavailable;
  }
  helios::StoreStatus set(const std::string&, const std::string&, uint64_t) override {
    return helios::StoreStatus::unavailable;
  }
  helios::StoreStatus compare_and_swap(const std::string&, const std::optional<std::string>&, const std::string&,
                                       uint64_t) override {
    return helios::StoreStatus::unavailable;
  }
  helios::StoreStatus remove(const std::string&) override { return helios::StoreStatus::unavailable; }
  std::vector<std::string> scan_keys(const std::string&) const override { return {}; }
  size_t purge_expired() override { return 0; }
  size_t size() const override { return 0; }
  std::string backend_id() const override { return "unavailable"; }
};

// Lists keys of a live store but fails every read and removal.
class ScanOnlyStore : public helios::IStateStore {
 public:
  explicit ScanOnlyStore(std::shared_ptr<helios::MemoryStateStore> backing) : backing_(std::move(backing)) {}

  helios::StoreStatus get(const std::string&, std::string&, uint64_t*) const override {
    return helios::StoreStatus::unavailable;
  }
  helios::StoreStatus set(const std::string& key, const std::string& value, uint64_t ttl_ms) override {
    return backing_->set(key, value, ttl_ms);
  }
  helios::StoreStatus compare_and_swap(const std::string&, const std::optional<std::string>&, const std::string&,
                                       uint64_t) override {
    return helios::StoreStatus::unavailable;
  }
  helios::StoreStatus remove(const std::string&) override { return helios::StoreStatus::unavailable; }
  std::vector<std::string> scan_keys(const std::string& prefix) const override {
    scans.fetch_add(1);
    return backing_->scan_keys(prefix);
  }
  size_t purge_expired() override { return 0; }
  size_t size() const override { return backing_->size(); }
  std::string backend_id() const override { return "scan-only"; }

  mutable std::atomic<int> scans{0};

 private:
  std::shared_ptr<helios::MemoryStateStore> backing_;
};

// Succeeds unless told to fail a task; failures[id] = attempts to fail first,
// -1 = always fail. Records execution order.
class ScriptedExecutor : public helios::IExecutor {
 public:
  helios::ExecutorResult execute(const helios::Task& task) override {
    calls.fetch_add(1);
    const int now_running = running.fetch_add(1) + 1;
    int seen = max_running.load();
    while (now_running > seen && !max_running.compare_exchange_weak(seen, now_running)) {
    }
    int attempt = 0;
    {
      std::lock_guard<std::mutex> lk(mu);
      attempt = ++attempts[task.id];
      order.push_back(task.id);
    }
    if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    running.fetch_sub(1);

    helios::ExecutorResult r;
    r.actual_units = task.estimated_units;
    auto it = failures.find(task.id);
    if (it != failures.end() && (it->second < 0 || attempt <= it->second)) {
      r.error = "scripted failure";
      return r;
    }
    r.success = true;
    r.result = "done:" + task.id;
    return r;
  }
  std::string executor_id() const override { return "scripted"; }

  int attempts_of(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu);
    return attempts[id];
  }
  size_t position_of(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu);
    return static_cast<size_t>(std::find(order.begin(), order.end(), id) - order.begin());
  }

  std::map<std::string, int> failures;
  int delay_ms{0};
  std::atomic<int> calls{0};
  std::atomic<int> running{0};
  std::atomic<int> max_running{0};

 private:
  std::mutex mu;
  std::map<std::string, int> attempts;
  std::vector<std::string> order;
};

// Blocks every attempt until open() is called.
class GatedExecutor : public helios::IExecutor {
 public:
  helios::ExecutorResult execute(const helios::Task& task) override {
    entered.store(true);
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this]() { return open_; });
    helios::ExecutorResult r;
    r.success = true;
    r.actual_units = task.estimated_units;
    r.result = "late:" + task.id;
    return r;
  }
  std::string executor_id() const override { return "gated"; }

  void open() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      open_ = true;
    }
    cv_.notify_all();
  }

  std::atomic<bool> entered{false};

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool open_{false};
};

// The first `hang_calls` calls block until release(); later calls succeed at once.
class HangingExecutor : public helios::IExecutor {
 public:
  explicit HangingExecutor(int hang_calls) : hang_calls_(hang_calls) {}

  helios::ExecutorResult execute(const helios::Task& task) override {
    if (calls.fetch_add(1) < hang_calls_) {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this]() { return released_; });
    }
    helios::ExecutorResult r;
    r.success = true;
    r.actual_units = task.estimated_units;
    r.result = "done:" + task.id;
    return r;
  }
  std::string executor_id() const override { return "hanging"; }

  void release() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      released_ = true;
    }
    cv_.notify_all();
  }

  std::atomic<int> calls{0};

 private:
  const int hang_calls_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool released_{false};
};

// Wires one of each component around a MemoryStateStore.
struct Stack {
  Stack(helios::IExecutor& executor, helios::SchedulerPolicy sp,
        std::shared_ptr<const helios::Clock> c = helios::make_system_clock(),
        helios::GovernorPolicy gp = helios::GovernorPolicy{})
      : clock(std::move(c)),
        store(std::make_shared<helios::MemoryStateStore>(clock)),
        router(store, helios::RouterPolicy::default_policy()),
        governor(store, router, gp, clock),
        cache(store, helios::CachePolicy{}, clock),
        scheduler(governor, router, cache, executor, sp, clock) {}

  std::shared_ptr<const helios::Clock> clock;
  std::shared_ptr<helios::MemoryStateStore> store;
  helios::EconomicRouter router;
  helios::ResourceGovernor governor;
  helios::CacheManager cache;
  helios::HybridScheduler scheduler;
};

helios::SchedulerPolicy fast_policy() {
  helios::SchedulerPolicy p;
  p.global_max_concurrency = 4;
  p.max_parallel_per_project = 4;
  p.backoff_base_ms = 1;
  p.backoff_max_ms = 4;
  p.requeue_delay_cap_ms = 5;
  p.poll_interval_ms = 1;
  return p;
}

helios::Task make_task(const std::string& id, const std::vector<std::string>& deps = {},
                       const std::string& task_type = "testing") {
  helios::Task t;
  t.id = id;
  t.name = id;
  t.task_type = task_type;
  t.input = "input for " + id;
  t.estimated_units = 10;
  t.priority = 5;
  t.depends_on = deps;
  return t;
}

helios::TaskResourceRequest make_request(const std::string& task_id, uint64_t units, int priority = 5,
                                         bool mandatory = false) {
  helios::TaskResourceRequest r;
  r.task_id = task_id;
  r.project_id = "proj";
  r.task_type = "testing";
  r.estimated_units = units;
  r.priority = priority;
  r.mandatory_high_tier = mandatory;
  return r;
}

helios::Task find_task(const helios::ProjectStatus& s, const std::string& id) {
  for (const auto& t : s.tasks) {
    if (t.id == id) return t;
  }
  expect(false, "task " + id + " missing from status");
  return {};
}

// ============================================================================
// [Store] Shared state store
// ============================================================================

void test_hash_domain_separation() {
  const std::string a = helios::hash_domain("l2:", "payload");
  const std::string b = helios::hash_domain("l3:", "payload");
  expect(a.size() == 64, "digest is 64 hex chars");
  expect(a != b, "domains separate digests");
  expect(helios::hash_domain_parts("l2:", {"ab", "c"}) != helios::hash_domain_parts("l2:", {"a", "bc"}),
         "part boundaries are significant");
  expect(helios::task_type_tag("code_review") == helios::task_type_tag("code_review"), "tag is stable");
  expect(helios::task_type_tag("code_review").size() == 16, "tag is 16 hex chars");
}

void test_memory_store_ttl() {
  auto clock = std::make_shared<helios::ManualClock>();
  helios::MemoryStateStore store(clock);
  expect(store.set("k", "v", 100) == helios::StoreStatus::ok, "set with ttl");
  std::string out;
  uint64_t expires_at = 0;
  expect(store.get("k", out, &expires_at) == helios::StoreStatus::ok && out == "v", "live read");
  expect(expires_at == clock->now_unix_ms() + 100, "absolute expiry reported");
  clock->advance(99);
  expect(store.get("k", out) == helios::StoreStatus::ok, "still live before expiry");
  clock->advance(1);
  expect(store.get("k", out) == helios::StoreStatus::not_found, "expired entry reads as absent");
  expect(store.scan_keys("k").empty(), "expired entry not scanned");
  expect(store.compare_and_swap("k", std::nullopt, "v2") == helios::StoreStatus::ok,
         "CAS treats expired entry as absent");
  expect(store.purge_expired() == 0, "nothing left to purge");
}

void test_memory_store_cas() {
  auto clock = std::make_shared<helios::ManualClock>();
  helios::MemoryStateStore store(clock);
  expect(store.compare_and_swap("w", std::nullopt, "1") == helios::StoreStatus::ok, "create when absent");
  expect(store.compare_and_swap("w", std::nullopt, "2") == helios::StoreStatus::conflict,
         "create-if-absent conflicts when present");
  expect(store.compare_and_swap("w", std::string("9"), "2") == helios::StoreStatus::conflict,
         "stale expectation conflicts");
  expect(store.compare_and_swap("w", std::string("1"), "2") == helios::StoreStatus::ok, "matching CAS swaps");
  std::string out;
  expect(store.get("w", out) == helios::StoreStatus::ok && out == "2", "CAS result visible");

  store.set("p:b", "x");
  store.set("p:a", "x");
  store.set("q:a", "x");
  const auto keys = store.scan_keys("p:");
  expect(keys.size() == 2 && keys[0] == "p:a" && keys[1] == "p:b", "scan is prefix-scoped and sorted");
  expect(store.remove("p:a") == helios::StoreStatus::ok, "remove live key");
  expect(store.remove("p:a") == helios::StoreStatus::not_found, "second remove is not_found");
}

void test_memory_store_concurrent_cas() {
  auto store = std::make_shared<helios::MemoryStateStore>();
  store->set("counter", "0");
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&store]() {
      for (int n = 0; n < 100; ++n) {
        while (true) {
          std::string cur;
          store->get("counter", cur);
          const std::string next = std::to_string(std::stoi(cur) + 1);
          if (store->compare_and_swap("counter", cur, next) == helios::StoreStatus::ok) break;
        }
      }
    });
  }
  for (auto& t : threads) t.join();
  std::string out;
  store->get("counter", out);
  expect(out == "800", "no lost updates under CAS, got " + out);
}

size_t object_file_count(const fs::path& root) {
  size_t n = 0;
  for (const auto& entry : fs::recursive_directory_iterator(root / "objects")) {
    if (entry.is_regular_file()) ++n;
  }
  return n;
}

void test_file_store_persistence() {
  const fs::path root = fs::temp_directory_path() / "helios_file_store_test";
  fs::remove_all(root);
  auto clock = std::make_shared<helios::ManualClock>();
  {
    helios::FileStateStore store(root.string(), clock, 64);
    expect(store.set("helios:a", "alpha") == helios::StoreStatus::ok, "file set");
    expect(store.set("helios:big", std::string(4096, 'z')) == helios::StoreStatus::ok, "large set");
    expect(store.set("helios:ttl", "short", 10) == helios::StoreStatus::ok, "ttl set");
    expect(store.compare_and_swap("helios:a", std::string("alpha"), "beta") == helios::StoreStatus::ok,
           "file CAS");
  }
  helios::FileStateStore reopened(root.string(), clock, 64);
  std::string out;
  expect(reopened.get("helios:a", out) == helios::StoreStatus::ok && out == "beta", "value survives reopen");
  expect(reopened.get("helios:big", out) == helios::StoreStatus::ok && out == std::string(4096, 'z'),
         "large payload round-trips");
  clock->advance(10);
  expect(reopened.get("helios:ttl", out) == helios::StoreStatus::not_found, "file TTL enforced");
  expect(reopened.purge_expired() == 0, "expired object already dropped by the read");
  const auto keys = reopened.scan_keys("helios:");
  expect(keys.size() == 2, "scan sees two live keys");
  expect(reopened.compare_and_swap("helios:a", std::string("alpha"), "gamma") == helios::StoreStatus::conflict,
         "stale file CAS conflicts");
  fs::remove_all(root);
}

void test_file_store_detects_corruption() {
  const fs::path root = fs::temp_directory_path() / "helios_file_corrupt_test";
  fs::remove_all(root);
  helios::FileStateStore store(root.string());
  store.set("helios:victim", "payload");

  bool corrupted = false;
  for (const auto& entry : fs::recursive_directory_iterator(root / "objects")) {
    if (!entry.is_regular_file()) continue;
    std::ofstream ofs(entry.path(), std::ios::binary | std::ios::app);
    ofs << "tampered";
    corrupted = true;
  }
  expect(corrupted, "found object file to corrupt");
  std::string out;
  expect(store.get("helios:victim", out) == helios::StoreStatus::not_found, "corrupt object reads as absent");
  fs::remove_all(root);
}

void test_store_drops_expired_entries() {
  auto clock = std::make_shared<helios::ManualClock>();
  helios::MemoryStateStore mem(clock);
  mem.set("a", "1", 10);
  mem.set("b", "2", 10);
  mem.set("c", "3");
  clock->advance(10);
  std::string out;
  expect(mem.get("a", out) == helios::StoreStatus::not_found, "expired read misses");
  expect(mem.purge_expired() == 1, "read dropped a, sweep takes b");
  expect(mem.purge_expired() == 0 && mem.size() == 1, "only c left");

  const fs::path root = fs::temp_directory_path() / "helios_file_expiry_test";
  fs::remove_all(root);
  helios::FileStateStore files(root.string(), clock);
  files.set("x", "1", 10);
  files.set("y", "2", 10);
  files.set("z", "3");
  expect(object_file_count(root) == 3, "one object per key");
  clock->advance(10);
  expect(files.get("x", out) == helios::StoreStatus::not_found, "expired object misses");
  expect(object_file_count(root) == 2, "expired object removed on read");
  expect(files.purge_expired() == 1, "sweep removes the other expired object");
  expect(object_file_count(root) == 1, "live object kept");
  expect(files.get("z", out) == helios::StoreStatus::ok && out == "3", "live value intact");
  fs::remove_all(root);
}

// ============================================================================
// [Governor] Usage window and admission
// ============================================================================

helios::GovernorPolicy small_window(uint64_t ceiling = 100, uint64_t duration_ms = 1000) {
  helios::GovernorPolicy p;
  p.window_ceiling_units = ceiling;
  p.window_duration_ms = duration_ms;
  return p;
}

void test_governor_normal_zone_routes() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  helios::ResourceGovernor gov(store, router, small_window(), clock);

  const auto a = gov.request_resources(make_request("t1", 10));
  expect(a.allocated && a.decision == helios::AdmissionDecision::admitted, "normal zone admits");
  expect(a.zone == helios::BudgetHealth::normal, "zone reported as normal");
  expect(a.reserved_units == 10, "full estimate reserved");

  const auto status = gov.budget_status();
  expect(status.used_units == 10 && status.open_reservations == 1, "reservation counted in window");
  expect(near(status.utilization_pct, 10.0), "utilization 10%");

  const auto ack = gov.record_usage("t1", a.tier, 4);
  expect(ack.ok && ack.had_reservation && ack.reserved_units == 10, "reservation reconciled");
  expect(ack.correction_units == -6, "correction is actual - reserved");
  const auto after = gov.budget_status();
  expect(after.used_units == 4 && after.open_reservations == 0, "actual replaces reservation");
}

void test_governor_throttled_zone() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  helios::ResourceGovernor gov(store, router, small_window(100, 60000), clock);
  expect(gov.record_usage("seed", helios::Tier::high_capability, 85).ok, "seed usage");

  const auto s = gov.budget_status();
  expect(s.health == helios::BudgetHealth::throttled && s.is_throttling, "85% is throttled");

  const auto econ = gov.request_resources(make_request("t-econ", 5));
  expect(econ.allocated && econ.tier == helios::Tier::economical, "throttled zone admits on economical tier");
  expect(near(econ.router_confidence, 0.7), "throttled confidence 0.7");

  const auto mandatory = gov.request_resources(make_request("t-high", 5, 9, true));
  expect(!mandatory.allocated && mandatory.decision == helios::AdmissionDecision::queued,
         "mandatory high tier queued while throttled");
  expect(mandatory.error_code == helios::ErrorCode::admission_denied, "queued carries admission_denied");
  expect(mandatory.retry_after_ms > 0 && mandatory.retry_after_ms <= 60000, "retry hint within window");

  const auto w = gov.current_window();
  expect(w && w->queued_count == 1 && w->throttle_events == 2, "queue and throttle events counted");
}

void test_governor_critical_zone() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  helios::ResourceGovernor gov(store, router, small_window(100, 60000), clock);
  gov.record_usage("seed", helios::Tier::economical, 97);
  expect(gov.budget_status().health == helios::BudgetHealth::critical, "97% is critical");

  const auto low = gov.request_resources(make_request("t-low", 5, 5));
  expect(!low.allocated && low.decision == helios::AdmissionDecision::rejected, "low priority rejected");
  expect(low.retry_after_ms > 0, "rejection carries retry hint");

  const auto high = gov.request_resources(make_request("t-urgent", 20, 9));
  expect(high.allocated && high.tier == helios::Tier::economical, "priority 9 admitted economically");
  expect(high.reserved_units == 3, "reservation clamped to remaining units");

  const auto s = gov.budget_status();
  expect(s.used_units == 100 && s.remaining_units == 0, "window full, never above ceiling");
  const auto none = gov.request_resources(make_request("t-late", 1, 10));
  expect(!none.allocated && none.decision == helios::AdmissionDecision::rejected, "exhausted rejects all");
}

void test_governor_overage_accounting() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  helios::ResourceGovernor gov(store, router, small_window(100, 60000), clock);

  const auto ack = gov.record_usage("big", helios::Tier::high_capability, 120);
  expect(ack.ok && !ack.had_reservation, "direct usage recorded");
  expect(ack.overage_units == 20, "excess booked as overage");
  const auto s = gov.budget_status();
  expect(s.used_units == 100 && s.overage_units == 20, "ceiling holds, overage tracked");
  expect(gov.usage_metrics().overage_units == 20, "metrics report overage");
}

void test_governor_rollover_and_history() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  helios::ResourceGovernor gov(store, router, small_window(100, 1000), clock);

  gov.record_usage("a", helios::Tier::economical, 60);
  const std::string first = gov.budget_status().window_id;
  clock->advance(1000);
  gov.record_usage("b", helios::Tier::economical, 70);

  const auto s = gov.budget_status();
  expect(s.window_id != first, "new window after duration");
  expect(s.used_units == 70, "new window starts from zero");
  expect(s.window_start_unix_ms == clock->now_unix_ms(), "window starts at rollover time");

  const auto history = gov.window_history();
  expect(history.size() == 1 && history[0].window_id == first, "closed window archived");
  expect(history[0].total_recorded_units() == 60 && history[0].closed_at_unix_ms != 0, "archived window intact");

  const auto m = gov.usage_metrics();
  expect(m.windows_in_history == 1 && m.history_total_units == 60, "history totals in metrics");
  expect(m.history_total_units + s.used_units == 130, "usage sums across windows");
}

void test_governor_history_retention() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  auto policy = small_window(100, 1000);
  policy.history_retention = 3;
  helios::ResourceGovernor gov(store, router, policy, clock);
  for (int i = 0; i < 6; ++i) {
    gov.record_usage("t" + std::to_string(i), helios::Tier::economical, 1);
    clock->advance(1000);
  }
  const auto all = gov.window_history();
  expect(all.size() == 3, "history trimmed to retention");
  expect(all[0].start_unix_ms > all[1].start_unix_ms, "history newest first");
  expect(gov.window_history(1).size() == 1, "limit honoured");
}

void test_governor_closed_window_reservation() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  helios::ResourceGovernor gov(store, router, small_window(100, 1000), clock);

  const auto a = gov.request_resources(make_request("long", 10));
  expect(a.allocated, "admitted in first window");
  clock->advance(1500);
  const auto ack = gov.record_usage("long", a.tier, 15);
  expect(ack.ok && ack.reservation_in_closed_window, "reservation found in closed window");
  expect(gov.budget_status().used_units == 5, "only the excess charges the new window");
  expect(gov.window_history()[0].used_units() == 10, "closed window unchanged");
}

void test_governor_manual_throttle() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  helios::ResourceGovernor gov(store, router, small_window(100, 1000), clock);

  expect(gov.force_throttle("incident"), "throttle engaged");
  auto s = gov.budget_status();
  expect(s.health == helios::BudgetHealth::throttled && s.manual_throttle, "manual throttle lifts zone");
  const auto a = gov.request_resources(make_request("t", 5, 10));
  expect(a.allocated && a.tier == helios::Tier::economical, "throttle forces economical tier");

  clock->advance(1000);
  s = gov.budget_status();
  expect(s.manual_throttle && s.throttle_reason == "incident", "throttle carried over rollover");
  expect(gov.clear_throttle(), "throttle cleared");
  expect(gov.budget_status().health == helios::BudgetHealth::normal, "normal after clear");
}

void test_governor_monotonic_admission() {
  // Higher utilization never admits a request that lower utilization rejected.
  const std::vector<uint64_t> usage = {0, 50, 79, 80, 90, 95, 96, 99};
  for (int priority : {0, 5, 8, 10}) {
    for (bool mandatory : {false, true}) {
      bool previously_denied = false;
      for (uint64_t used : usage) {
        auto clock = std::make_shared<helios::ManualClock>();
        auto store = std::make_shared<helios::MemoryStateStore>(clock);
        helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
        helios::ResourceGovernor gov(store, router, small_window(100, 60000), clock);
        if (used > 0) gov.record_usage("seed", helios::Tier::economical, used);
        const bool admitted = gov.request_resources(make_request("zone-check", 1, priority, mandatory)).allocated;
        expect(!(previously_denied && admitted), "admission monotonic at " + std::to_string(used) + "% priority " +
                                                     std::to_string(priority));
        if (!admitted) previously_denied = true;
      }
    }
  }
}

void test_governor_concurrent_ceiling() {
  auto store = std::make_shared<helios::MemoryStateStore>();
  helios::EconomicRouter router_a(store, helios::RouterPolicy::default_policy());
  helios::EconomicRouter router_b(store, helios::RouterPolicy::default_policy());
  const auto policy = small_window(100, 3600000);
  auto clock = helios::make_system_clock();
  // Two governors over one store behave like two worker processes.
  helios::ResourceGovernor gov_a(store, router_a, policy, clock);
  helios::ResourceGovernor gov_b(store, router_b, policy, clock);

  std::atomic<uint64_t> reserved{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i]() {
      auto& gov = (i % 2 == 0) ? gov_a : gov_b;
      for (int n = 0; n < 5; ++n) {
        const auto a = gov.request_resources(make_request("w" + std::to_string(i) + "-" + std::to_string(n), 7, 10));
        if (a.allocated) reserved.fetch_add(a.reserved_units);
      }
    });
  }
  for (auto& t : threads) t.join();
  const auto s = gov_a.budget_status();
  expect(s.used_units <= 100, "ceiling never exceeded");
  expect(reserved.load() == s.used_units, "every reserved unit accounted exactly once");
}

void test_governor_store_unavailable() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<UnavailableStore>();
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  helios::ResourceGovernor gov(store, router, small_window(), clock);
  const auto a = gov.request_resources(make_request("t", 1));
  expect(!a.allocated && a.error_code == helios::ErrorCode::state_store_unavailable, "store outage denies");
  expect(a.retry_after_ms > 0, "store outage carries retry hint");
  expect(gov.budget_status().window_id.empty(), "status empty on outage");
  expect(!gov.record_usage("t", helios::Tier::economical, 1).ok, "usage not acknowledged on outage");
}

void test_governor_malformed_request() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  helios::ResourceGovernor gov(store, router, small_window(), clock);
  auto bad = make_request("t", 1, 11);
  expect(gov.request_resources(bad).error_code == helios::ErrorCode::malformed_request, "priority 11 rejected");
  bad = make_request("t", 0);
  expect(gov.request_resources(bad).error_code == helios::ErrorCode::malformed_request, "zero units rejected");
}

// ============================================================================
// [Router] Economic routing
// ============================================================================

helios::BudgetStatus status_at(double pct, bool throttling = false) {
  helios::BudgetStatus s;
  s.window_id = "w";
  s.ceiling_units = 100;
  s.utilization_pct = pct;
  s.is_throttling = throttling;
  return s;
}

void test_router_factors() {
  auto store = std::make_shared<helios::MemoryStateStore>();
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  auto req = make_request("r", 100, 9);
  req.task_type = "code_generation";
  expect(near(router.complexity_score(req), 7.2), "complexity for large code generation");
  expect(helios::EconomicRouter::complexity_level(7.2) == "complex", "complex level");
  expect(helios::EconomicRouter::complexity_level(1.0) == "trivial", "trivial level");
  expect(helios::EconomicRouter::budget_factor(10.0) == 9.0, "ample budget factor");
  expect(helios::EconomicRouter::budget_factor(85.0) == 2.0, "tight budget factor");
  expect(helios::EconomicRouter::budget_factor(99.0) == 0.0, "exhausted budget factor");

  helios::TaskTypePerformance perf;
  perf.high_success_rate = 0.9;
  perf.economical_success_rate = 0.5;
  expect(helios::EconomicRouter::history_factor(perf) == 8.0, "high tier clearly better");
  perf.economical_success_rate = 0.9;
  expect(helios::EconomicRouter::history_factor(perf) == 5.0, "tiers equal is neutral");
  perf.high_success_rate = 0.4;
  expect(helios::EconomicRouter::history_factor(perf) == 2.0, "economical clearly better");
}

void test_router_decisions() {
  auto store = std::make_shared<helios::MemoryStateStore>();
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());

  auto heavy = make_request("heavy", 100, 9);
  heavy.task_type = "code_generation";
  const auto d = router.route_task(heavy, status_at(0.0));
  expect(d.tier == helios::Tier::high_capability, "complex task with headroom goes high");
  expect(near(d.decision_score, 7.48), "weighted score");
  expect(d.confidence >= 0.6 && d.confidence <= 1.0, "high confidence bounded");

  const auto throttled = router.route_task(heavy, status_at(0.0, true));
  expect(throttled.tier == helios::Tier::economical, "throttling downgrades high score");

  auto light = make_request("light", 2, 2);
  light.task_type = "documentation";
  const auto e = router.route_task(light, status_at(90.0));
  expect(e.tier == helios::Tier::economical, "simple task under pressure goes economical");
  expect(near(e.decision_score, 3.24), "low weighted score");
  expect(near(e.confidence, std::min(1.0, (4.5 - 3.24) / 4.5 + 0.6)), "economical confidence formula");

  auto mandatory = light;
  mandatory.mandatory_high_tier = true;
  const auto m = router.route_task(mandatory, status_at(90.0));
  expect(m.tier == helios::Tier::high_capability && m.mandatory_override && m.confidence == 1.0,
         "mandatory bypasses scoring");

  const std::string stats = router.routing_stats_to_json();
  std::optional<helios::jsonlite::JsonError> err;
  const auto obj = helios::jsonlite::parse(stats, &err);
  expect(!err, "stats JSON parses");
  expect(helios::jsonlite::get_u64(obj, "total_decisions") == 4, "decisions counted");
  expect(helios::jsonlite::get_u64(obj, "mandatory_overrides") == 1, "override counted");
  expect(helios::jsonlite::get_u64(obj, "throttle_downgrades") == 1, "downgrade counted");
}

void test_router_explain_has_no_side_effects() {
  auto store = std::make_shared<helios::MemoryStateStore>();
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  const auto e = router.explain_decision(make_request("x", 30), status_at(20.0));
  expect(e.policy.complexity_weight == 0.4, "explanation carries weights");
  const std::string json = helios::decision_explanation_to_json(e);
  expect(json.find("\"contributions\"") != std::string::npos, "contributions listed");
  std::optional<helios::jsonlite::JsonError> err;
  const auto stats = helios::jsonlite::parse(router.routing_stats_to_json(), &err);
  expect(helios::jsonlite::get_u64(stats, "total_decisions") == 0, "explain is not counted");
}

void test_router_learning_ema() {
  auto store = std::make_shared<helios::MemoryStateStore>();
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  expect(router.record_outcome("qa", helios::Tier::high_capability, true), "outcome recorded");
  expect(router.record_outcome("qa", helios::Tier::economical, false), "outcome recorded");
  auto table = router.performance_table();
  expect(table.count("qa") == 1, "type learned");
  expect(near(table["qa"].high_success_rate, 0.6), "EMA high after success");
  expect(near(table["qa"].economical_success_rate, 0.4), "EMA economical after failure");
  expect(table["qa"].high_samples == 1 && table["qa"].economical_samples == 1, "samples counted");

  // A second router on the same store sees the same history.
  helios::EconomicRouter peer(store, helios::RouterPolicy::default_policy());
  const auto d = peer.explain_decision(make_request("q", 10), status_at(10.0));
  expect(!d.decision.factors.known_task_type, "unrelated type stays neutral");
  auto req = make_request("q", 10);
  req.task_type = "qa";
  expect(peer.explain_decision(req, status_at(10.0)).decision.factors.known_task_type, "shared table visible");
}

// ============================================================================
// [Cache] Three-tier cache
// ============================================================================

helios::CacheStoreRequest store_request(const std::string& type, const std::string& input,
                                        const std::string& response, double cost = 3.0) {
  helios::CacheStoreRequest r;
  r.query.task_type = type;
  r.query.input = input;
  r.response = response;
  r.cost_units = cost;
  return r;
}

helios::CacheQuery query(const std::string& type, const std::string& input) {
  helios::CacheQuery q;
  q.task_type = type;
  q.input = input;
  return q;
}

void test_cache_normalization_and_embedding() {
  expect(helios::normalize_cache_input("  Hello \t  World\n") == "hello world", "normalize trims and folds");
  helios::HashingEmbeddingProvider emb(64);
  const auto a = emb.embed("The quick brown fox");
  const auto b = emb.embed("the QUICK brown fox!");
  expect(a.size() == 64, "embedding dimension");
  expect(near(helios::cosine_similarity(a, b), 1.0), "case and punctuation insensitive");
  expect(helios::cosine_similarity(a, emb.embed("completely unrelated words here")) < 0.85,
         "unrelated text dissimilar");
  expect(helios::cosine_similarity({1.0, 0.0}, {1.0}) == 0.0, "dimension mismatch scores zero");
}

void test_cache_l2_exact_hit() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::CacheManager cache(store, helios::CachePolicy{}, clock);

  expect(!cache.lookup(query("code_review", "Explain RAII")).hit, "cold cache misses");
  const auto stored = cache.store(store_request("code_review", "Explain RAII", "resources bound to scope"));
  expect(stored.ok, "store succeeded");
  expect(!stored.tiers[0].eligible, "L1 ineligible without prefix");
  expect(stored.tiers[1].stored && stored.tiers[2].stored, "L2 and L3 written");

  for (int i = 0; i < 2; ++i) {
    const auto hit = cache.lookup(query("code_review", "  explain   raii "));
    expect(hit.hit && hit.tier == helios::CacheTier::l2_exact, "normalized input hits L2");
    expect(hit.response == "resources bound to scope", "L2 response");
    expect(hit.confidence == 1.0, "exact hit confidence 1.0");
    expect(near(hit.cost_avoided_units, 3.0), "cost avoided reported");
  }
  expect(!cache.lookup(query("documentation", "Explain RAII")).hit, "task type scopes entries");
}

void test_cache_idempotence() {
  const std::vector<std::string> forms = {"Plan the Release", "  plan   the RELEASE "};
  for (size_t order = 0; order < 2; ++order) {
    auto clock = std::make_shared<helios::ManualClock>();
    auto store = std::make_shared<helios::MemoryStateStore>(clock);
    helios::CacheManager cache(store, helios::CachePolicy{}, clock);
    expect(cache.store(store_request("prd_generation", forms[order], "release plan")).ok, "first store");
    expect(cache.store(store_request("prd_generation", forms[1 - order], "release plan")).ok, "second store");
    expect(store->scan_keys("helios:cache:l2:").size() == 1, "one L2 entry per normalized input");
    for (const auto& form : forms) {
      const auto hit = cache.lookup(query("prd_generation", form));
      expect(hit.hit && hit.tier == helios::CacheTier::l2_exact, "repeated store answers from L2");
      expect(hit.confidence == 1.0 && hit.response == "release plan", "exact hit confidence 1.0");
    }
  }
}

void test_cache_hit_access_count() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::CachePolicy policy;
  helios::CacheManager cache(store, policy, clock);
  const auto stored = cache.store(store_request("code_review", "Explain RAII", "scope"));
  const std::string l2_key = stored.tiers[1].key;
  const std::string l3_key = stored.tiers[2].key;

  auto read_entry = [&](const std::string& key, uint64_t* expires_at) {
    std::string raw;
    expect(store->get(key, raw, expires_at) == helios::StoreStatus::ok, "entry readable: " + key);
    std::optional<helios::jsonlite::JsonError> err;
    const auto entry = helios::jsonlite::parse(raw, &err);
    expect(!err, "entry is JSON");
    return entry;
  };

  uint64_t expires_before = 0;
  expect(helios::jsonlite::get_u64(read_entry(l2_key, &expires_before), "access_count", 99) == 0,
         "new L2 entry starts at zero");
  expect(helios::jsonlite::get_u64(read_entry(l3_key, nullptr), "access_count", 99) == 0,
         "new L3 entry starts at zero");

  clock->advance(1000);
  for (int i = 0; i < 2; ++i) {
    expect(cache.lookup(query("code_review", "explain raii")).tier == helios::CacheTier::l2_exact, "L2 hit");
  }
  uint64_t expires_after = 0;
  const auto l2 = read_entry(l2_key, &expires_after);
  expect(helios::jsonlite::get_u64(l2, "access_count") == 2, "every L2 hit counted");
  expect(helios::jsonlite::get_u64(l2, "last_access_at") == clock->now_unix_ms(), "last access stamped");
  expect(expires_after == expires_before, "hit keeps the remaining TTL");

  clock->advance(policy.l2_ttl_ms);
  const auto semantic = cache.lookup(query("code_review", "Explain RAII"));
  expect(semantic.tier == helios::CacheTier::l3_semantic, "L3 answers after L2 expiry");
  const auto l3 = read_entry(l3_key, nullptr);
  expect(helios::jsonlite::get_u64(l3, "access_count") == 1, "L3 hit counted");
  expect(near(helios::jsonlite::get_double(l3, "similarity_ema"), 1.0), "L3 similarity tracked");
}

void test_cache_waterfall_to_l3_after_l2_expiry() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::CachePolicy policy;
  helios::CacheManager cache(store, policy, clock);
  cache.store(store_request("qa", "What is a mutex", "a lock"));

  clock->advance(policy.l2_ttl_ms);
  const auto hit = cache.lookup(query("qa", "what is a MUTEX?"));
  expect(hit.hit && hit.tier == helios::CacheTier::l3_semantic, "L3 answers after L2 expiry");
  expect(near(hit.similarity, 1.0) && hit.confidence == hit.similarity, "similarity is confidence");

  clock->advance(policy.l3_ttl_ms);
  expect(!cache.lookup(query("qa", "what is a mutex")).hit, "everything expired");
}

void test_cache_l3_threshold_with_explicit_embeddings() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::CacheManager cache(store, helios::CachePolicy{}, clock);

  auto req = store_request("qa", "alpha", "alpha answer");
  req.query.embedding = {1.0, 0.0};
  req.allow_l2 = false;
  expect(cache.store(req).ok, "L3-only store");

  auto close = query("qa", "beta");
  close.embedding = {0.9, std::sqrt(1.0 - 0.81)};
  const auto hit = cache.lookup(close);
  expect(hit.hit && hit.tier == helios::CacheTier::l3_semantic, "similarity 0.90 hits");
  expect(near(hit.similarity, 0.9), "similarity reported");
  expect(hit.response == "alpha answer", "L3 response");

  auto far = query("qa", "gamma");
  far.embedding = {0.8, 0.6};
  expect(!cache.lookup(far).hit, "similarity 0.80 misses");

  const auto m = cache.metrics();
  expect(m.hits == 1 && m.lookups == 2, "metrics count lookups");
  expect(near(m.l3_avg_similarity, 0.9), "average L3 similarity");
}

void test_cache_l1_prefix_and_ttl_cap() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::CachePolicy policy;
  helios::CacheManager cache(store, policy, clock);

  const std::string prefix(policy.l1_min_prefix_tokens * 4, 'p');
  auto req = store_request("analysis", "summarize", "summary");
  req.query.context_prefix = prefix;
  req.ttl_ms = 60ull * 60 * 1000;
  const auto stored = cache.store(req);
  expect(stored.tiers[0].eligible && stored.tiers[0].stored, "long prefix stored in L1");

  auto q = query("analysis", "summarize");
  q.context_prefix = prefix;
  const auto l1 = cache.lookup(q);
  expect(l1.hit && l1.tier == helios::CacheTier::l1_prefix, "L1 hit with same prefix");

  auto short_prefix = query("analysis", "summarize");
  short_prefix.context_prefix = "short";
  expect(cache.lookup(short_prefix).tier == helios::CacheTier::l2_exact, "short prefix skips L1");

  clock->advance(policy.l1_ttl_ms);
  const auto after = cache.lookup(q);
  expect(after.hit && after.tier == helios::CacheTier::l2_exact, "L1 ttl capped, L2 still live");
}

void test_cache_invalidate_exact_scope() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::CacheManager cache(store, helios::CachePolicy{}, clock);
  cache.store(store_request("a", "one", "1"));
  cache.store(store_request("b", "two", "2"));
  store->set("helios:governor:window", "{}");

  const auto r = cache.invalidate("a");
  expect(r.ok && r.removed == 2, "L2+L3 entries of type a removed");
  expect(!cache.lookup(query("a", "one")).hit, "type a gone");
  expect(cache.lookup(query("b", "two")).hit, "type b untouched");

  const auto all = cache.invalidate();
  expect(all.removed == 2, "full invalidation removes the rest");
  std::string out;
  expect(store->get("helios:governor:window", out) == helios::StoreStatus::ok, "non-cache keys untouched");
}

void test_cache_sweeps_expired_entries() {
  const fs::path root = fs::temp_directory_path() / "helios_cache_sweep_test";
  fs::remove_all(root);
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::FileStateStore>(root.string(), clock);
  helios::CacheManager cache(store, helios::CachePolicy{}, clock);
  for (int i = 0; i < 20; ++i) {
    expect(cache.store(store_request("docs", "entry " + std::to_string(i), "r")).ok, "stored");
  }
  expect(object_file_count(root) == 40, "L2 and L3 object per entry");

  clock->advance(8ull * 24 * 60 * 60 * 1000);
  expect(!cache.lookup(query("docs", "entry 0")).hit, "expired entries miss");
  expect(object_file_count(root) == 39, "expired L2 object dropped by the lookup");
  expect(cache.store(store_request("docs", "fresh", "r")).ok, "new entry stored");
  expect(object_file_count(root) == 2, "cache write swept every expired object");
  expect(cache.metrics().purged == 39, "sweep counted");
  expect(cache.lookup(query("docs", "fresh")).hit, "new entry survives the sweep");
  fs::remove_all(root);
}

void test_cache_invalidate_stops_on_outage() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto backing = std::make_shared<helios::MemoryStateStore>(clock);
  helios::CacheManager writer(backing, helios::CachePolicy{}, clock);
  writer.store(store_request("a", "one", "1"));
  writer.store(store_request("a", "two", "2"));

  auto failing = std::make_shared<ScanOnlyStore>(backing);
  helios::CacheManager cache(failing, helios::CachePolicy{}, clock);
  const auto scoped = cache.invalidate("a");
  expect(!scoped.ok && scoped.removed == 0, "outage reported");
  expect(failing->scans.load() == 2, "L3 not scanned after the L2 outage");

  const auto all = cache.invalidate();
  expect(!all.ok && all.removed == 0 && failing->scans.load() == 3, "full invalidation stops at the first failure");
  expect(backing->scan_keys("helios:cache:").size() == 4, "entries untouched");
}

void test_cache_degraded_store() {
  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<UnavailableStore>();
  helios::CacheManager cache(store, helios::CachePolicy{}, clock);
  const auto r = cache.lookup(query("qa", "anything"));
  expect(!r.hit && r.degraded, "outage reads as degraded miss");
  expect(r.error_code == helios::ErrorCode::cache_unavailable, "cache_unavailable reported");
  const auto s = cache.store(store_request("qa", "anything", "x"));
  expect(!s.ok, "store reports failure");
  expect(cache.metrics().degraded_lookups == 1, "degraded lookup counted");
}

// ============================================================================
// [Scheduler] DAG planning and execution
// ============================================================================

helios::TaskDAG diamond(const std::string& project_id) {
  helios::TaskDAG dag;
  dag.project_id = project_id;
  dag.add_task(make_task("A"));
  dag.add_task(make_task("B", {"A"}));
  dag.add_task(make_task("C", {"A"}));
  dag.add_task(make_task("D", {"B", "C"}));
  dag.add_task(make_task("E"));
  return dag;
}

void test_scheduler_rejects_cycle() {
  ScriptedExecutor ex;
  Stack s(ex, fast_policy());
  helios::TaskDAG dag;
  dag.project_id = "cyclic";
  dag.add_task(make_task("A", {"C"}));
  dag.add_task(make_task("B", {"A"}));
  dag.add_task(make_task("C", {"B"}));
  const auto r = s.scheduler.schedule_project(std::move(dag));
  expect(!r.ok && r.error_code == helios::ErrorCode::cyclic_dependency, "cycle rejected");
  expect(r.error.find("A") != std::string::npos, "cycle members named");
  expect(!s.scheduler.project_status("cyclic").has_value(), "no project created");
  expect(s.scheduler.list_projects().empty(), "no tasks created");
}

void test_scheduler_rejects_malformed_graphs() {
  ScriptedExecutor ex;
  Stack s(ex, fast_policy());
  helios::TaskDAG unknown;
  unknown.project_id = "p";
  unknown.add_task(make_task("A", {"missing"}));
  expect(s.scheduler.schedule_project(unknown).error_code == helios::ErrorCode::malformed_request,
         "unknown dependency rejected");

  helios::TaskDAG dup;
  dup.project_id = "p";
  dup.add_task(make_task("A"));
  dup.add_task(make_task("A"));
  expect(s.scheduler.schedule_project(dup).error_code == helios::ErrorCode::malformed_request,
         "duplicate id rejected");

  helios::TaskDAG empty;
  empty.project_id = "p";
  expect(s.scheduler.schedule_project(empty).error_code == helios::ErrorCode::malformed_request,
         "empty project rejected");
}

void test_scheduler_waves_and_plan() {
  ScriptedExecutor ex;
  Stack s(ex, fast_policy());
  const auto r = s.scheduler.schedule_project(diamond("plan"));
  expect(r.ok, "diamond scheduled");
  const auto& plan = r.plan;
  expect(plan.waves.size() == 3 && plan.task_count == 5, "three waves");
  expect(plan.wave_of.at("A") == 0 && plan.wave_of.at("E") == 0, "roots in wave 0");
  expect(plan.wave_of.at("B") == 1 && plan.wave_of.at("C") == 1, "middle in wave 1");
  expect(plan.wave_of.at("D") == 2, "sink in wave 2");
  for (const auto& t : diamond("plan").tasks) {
    for (const auto& dep : t.depends_on) {
      expect(plan.wave_of.at(t.id) > plan.wave_of.at(dep), "wave above every dependency");
    }
  }
  expect(plan.critical_path == std::vector<std::string>({"A", "B", "D"}), "critical path");
  expect(near(plan.estimated_cost_units, 75.0), "blended cost estimate");
  expect(plan.estimated_duration_ms == 3 * fast_policy().average_task_ms, "duration per wave");

  const auto stored = s.scheduler.execution_plan("plan");
  expect(stored && stored->waves == plan.waves, "plan retrievable");
  const auto status = s.scheduler.project_status("plan");
  expect(status && status->pending == 5 && !status->executing, "tasks pending before execute");
}

void test_scheduler_wave_priority_order() {
  ScriptedExecutor ex;
  Stack s(ex, fast_policy());
  helios::TaskDAG dag;
  dag.project_id = "prio";
  auto low = make_task("low");
  low.priority = 2;
  auto high = make_task("high");
  high.priority = 9;
  auto urgent = make_task("urgent");
  urgent.priority = 2;
  urgent.deadline_unix_ms = s.clock->now_unix_ms() + 10 * 60 * 1000;
  dag.add_task(low);
  dag.add_task(high);
  dag.add_task(urgent);
  const auto r = s.scheduler.schedule_project(std::move(dag));
  expect(r.plan.waves[0] == std::vector<std::string>({"high", "urgent", "low"}), "wave ordered by priority");
  expect(helios::HybridScheduler::dynamic_priority(urgent, s.clock->now_unix_ms()) == 7.0,
         "deadline within the hour adds 5");
  auto retried = low;
  retried.retry_count = 4;
  expect(helios::HybridScheduler::dynamic_priority(retried, 0) == 1.0, "dynamic priority floored at 1");
}

void test_scheduler_executes_in_dependency_order() {
  ScriptedExecutor ex;
  Stack s(ex, fast_policy());
  expect(s.scheduler.schedule_project(diamond("run")).ok, "scheduled");
  const auto status = s.scheduler.execute_project("run");
  expect(status.finished && status.completed == 5, "all tasks completed");
  expect(near(status.completion_rate, 1.0) && near(status.success_rate, 1.0), "rates");
  expect(ex.position_of("A") < ex.position_of("B") && ex.position_of("A") < ex.position_of("C"),
         "A before its dependents");
  expect(ex.position_of("B") < ex.position_of("D") && ex.position_of("C") < ex.position_of("D"),
         "D after both dependencies");
  const auto d = find_task(status, "D");
  expect(d.result == "done:D" && d.allocated_tier.has_value(), "result and tier recorded");
  expect(status.total_actual_units == 50, "actual units summed");
  expect(s.governor.budget_status().used_units == 50, "governor charged actual usage");
  expect(s.governor.budget_status().open_reservations == 0, "no dangling reservations");
}

void test_scheduler_failure_blocks_dependents() {
  ScriptedExecutor ex;
  ex.failures["A"] = -1;
  Stack s(ex, fast_policy());
  helios::TaskDAG dag;
  dag.project_id = "chain";
  auto a = make_task("A");
  a.max_retries = 1;
  dag.add_task(a);
  dag.add_task(make_task("B", {"A"}));
  dag.add_task(make_task("C", {"B"}));
  dag.add_task(make_task("X"));
  s.scheduler.schedule_project(std::move(dag));
  const auto status = s.scheduler.execute_project("chain");

  expect(status.failed == 1 && status.blocked == 2 && status.completed == 1, "failed/blocked distinct");
  const auto ta = find_task(status, "A");
  expect(ta.status == helios::TaskStatus::failed && ta.error_code == helios::ErrorCode::executor_failure,
         "A failed terminally");
  expect(ta.retry_count == 2 && ex.attempts_of("A") == 2, "A tried 1 + max_retries times");
  const auto tc = find_task(status, "C");
  expect(tc.status == helios::TaskStatus::blocked && tc.error_code == helios::ErrorCode::dependency_failed,
         "transitive dependent blocked");
  expect(ex.attempts_of("B") == 0 && ex.attempts_of("C") == 0, "blocked tasks never executed");
  expect(near(status.success_rate, 0.5), "success rate over terminal outcomes");
}

void test_scheduler_retries_with_backoff() {
  ScriptedExecutor ex;
  ex.failures["flaky"] = 2;
  Stack s(ex, fast_policy());
  helios::TaskDAG dag;
  dag.project_id = "retry";
  dag.add_task(make_task("flaky"));
  s.scheduler.schedule_project(std::move(dag));
  const auto status = s.scheduler.execute_project("retry");
  const auto t = find_task(status, "flaky");
  expect(t.status == helios::TaskStatus::completed, "succeeds after retries");
  expect(t.retry_count == 2 && status.total_retries == 2, "two retries recorded");
  expect(ex.attempts_of("flaky") == 3, "three attempts");
  expect(t.actual_units == 30, "usage of every attempt counted");

  helios::SchedulerPolicy p;
  p.backoff_base_ms = 2000;
  p.backoff_max_ms = 60000;
  ScriptedExecutor other;
  Stack defaults(other, p);
  expect(defaults.scheduler.retry_backoff_ms(1) == 2000, "first backoff is base");
  expect(defaults.scheduler.retry_backoff_ms(3) == 8000, "exponential backoff");
  expect(defaults.scheduler.retry_backoff_ms(10) == 60000, "backoff capped");
}

void test_scheduler_cache_hit_skips_governor() {
  ScriptedExecutor ex;
  Stack s(ex, fast_policy());
  helios::TaskDAG first;
  first.project_id = "first";
  auto t = make_task("X", {}, "documentation");
  t.input = "Summarize Q3";
  first.add_task(t);
  s.scheduler.schedule_project(std::move(first));
  expect(s.scheduler.execute_project("first").completed == 1, "first run executes");
  const uint64_t used = s.governor.budget_status().used_units;

  helios::TaskDAG second;
  second.project_id = "second";
  auto y = make_task("Y", {}, "documentation");
  y.input = "  summarize   q3 ";
  second.add_task(y);
  s.scheduler.schedule_project(std::move(second));
  const auto status = s.scheduler.execute_project("second");
  const auto ty = find_task(status, "Y");
  expect(ty.status == helios::TaskStatus::completed && ty.cache_tier_hit == "l2", "completed from L2");
  expect(ty.result == "done:X", "cached result returned");
  expect(status.cache_hits == 1 && ty.actual_units == 0, "cache hit costs nothing");
  expect(ex.calls.load() == 1, "executor not called on hit");
  expect(s.governor.budget_status().used_units == used, "governor not charged on hit");
}

void test_scheduler_deadline_exceeded() {
  ScriptedExecutor ex;
  auto clock = std::make_shared<helios::ManualClock>();
  Stack s(ex, fast_policy(), clock);
  helios::TaskDAG dag;
  dag.project_id = "late";
  auto a = make_task("A");
  a.deadline_unix_ms = clock->now_unix_ms() - 1;
  dag.add_task(a);
  dag.add_task(make_task("B", {"A"}));
  s.scheduler.schedule_project(std::move(dag));
  const auto status = s.scheduler.execute_project("late");
  const auto ta = find_task(status, "A");
  expect(ta.status == helios::TaskStatus::failed && ta.error_code == helios::ErrorCode::deadline_exceeded,
         "expired task fails with deadline_exceeded");
  expect(find_task(status, "B").status == helios::TaskStatus::blocked, "dependent blocked");
  expect(ex.calls.load() == 0, "expired task never executed");
}

void test_scheduler_admission_denial_requeues() {
  ScriptedExecutor ex;
  Stack s(ex, fast_policy());
  expect(s.governor.force_throttle("test"), "throttle engaged");
  helios::TaskDAG dag;
  dag.project_id = "denied";
  auto a = make_task("A");
  a.mandatory_high_tier = true;
  a.cacheable = false;
  a.deadline_unix_ms = s.clock->now_unix_ms() + 40;
  dag.add_task(a);
  s.scheduler.schedule_project(std::move(dag));
  const auto status = s.scheduler.execute_project("denied");
  const auto ta = find_task(status, "A");
  expect(ta.admission_denials >= 1 && status.admission_denials >= 1, "denials counted");
  expect(ta.status == helios::TaskStatus::failed && ta.error_code == helios::ErrorCode::deadline_exceeded,
         "queued until the deadline passed");
  expect(ex.calls.load() == 0, "denied task never executed");
}

void test_scheduler_per_project_concurrency() {
  ScriptedExecutor ex;
  ex.delay_ms = 5;
  auto policy = fast_policy();
  policy.global_max_concurrency = 8;
  policy.max_parallel_per_project = 2;
  Stack s(ex, policy);
  helios::TaskDAG dag;
  dag.project_id = "wide";
  for (int i = 0; i < 6; ++i) dag.add_task(make_task("t" + std::to_string(i)));
  s.scheduler.schedule_project(std::move(dag));
  const auto status = s.scheduler.execute_project("wide");
  expect(status.completed == 6, "all completed");
  expect(ex.max_running.load() <= 2, "never more than two in flight");
}

void test_scheduler_cancellation() {
  GatedExecutor ex;
  Stack s(ex, fast_policy());
  helios::TaskDAG dag;
  dag.project_id = "cancel";
  dag.add_task(make_task("A"));
  dag.add_task(make_task("B", {"A"}));
  s.scheduler.schedule_project(std::move(dag));

  helios::ProjectStatus result;
  std::thread runner([&]() { result = s.scheduler.execute_project("cancel"); });
  expect(wait_until([&]() { return ex.entered.load(); }), "A started");
  expect(s.scheduler.cancel_project("cancel"), "cancel accepted");
  runner.join();

  expect(result.cancelled && result.cancelled_tasks == 2, "every non-terminal task cancelled");
  expect(result.completed == 0 && result.failed == 0, "cancelled distinct from failed");

  ex.open();
  expect(wait_until([&]() { return s.governor.budget_status().open_reservations == 0; }),
         "late attempt reconciles its reservation");
  const auto after = s.scheduler.project_status("cancel");
  const auto ta = find_task(*after, "A");
  expect(ta.status == helios::TaskStatus::cancelled && ta.result.empty(), "late result discarded");
  expect(!s.cache.lookup(query("testing", "input for A")).hit, "late result not cached");
  expect(!s.scheduler.cancel_project("nope"), "unknown project cannot be cancelled");
  expect(!s.scheduler.execute_project("nope").known, "unknown project reported");
}

void test_scheduler_executor_timeout_requeues() {
  HangingExecutor ex(1);
  auto policy = fast_policy();
  policy.executor_timeout_ms = 50;
  Stack s(ex, policy);
  helios::TaskDAG dag;
  dag.project_id = "hang";
  dag.add_task(make_task("A"));
  s.scheduler.schedule_project(std::move(dag));

  const auto status = s.scheduler.execute_project("hang");
  const auto t = find_task(status, "A");
  expect(t.status == helios::TaskStatus::completed && t.result == "done:A", "retry after timeout completes");
  expect(t.retry_count == 1 && ex.calls.load() == 2, "one timed-out attempt, one retry");
  expect(t.actual_units == 20, "abandoned attempt charged its reservation");
  expect(s.scheduler.overdue_executor_calls() == 1, "hung call still outstanding");

  ex.release();
  expect(wait_until([&]() { return s.scheduler.overdue_executor_calls() == 0; }), "hung call returns");
  const auto after = find_task(*s.scheduler.project_status("hang"), "A");
  expect(after.actual_units == 20 && after.status == helios::TaskStatus::completed, "late result discarded");
}

void test_scheduler_executor_timeout_exhausts_retries() {
  HangingExecutor ex(100);
  auto policy = fast_policy();
  policy.executor_timeout_ms = 20;
  Stack s(ex, policy);
  helios::TaskDAG dag;
  dag.project_id = "stuck";
  auto a = make_task("A");
  a.max_retries = 1;
  dag.add_task(a);
  dag.add_task(make_task("B", {"A"}));
  s.scheduler.schedule_project(std::move(dag));

  const auto status = s.scheduler.execute_project("stuck");
  const auto ta = find_task(status, "A");
  expect(ta.status == helios::TaskStatus::failed, "hung task fails once retries run out");
  expect(ta.error_code == helios::ErrorCode::executor_timeout, "failure is a timeout");
  expect(ta.retry_count == 2 && ex.calls.load() == 2, "initial attempt plus one retry");
  expect(find_task(status, "B").status == helios::TaskStatus::blocked, "dependent blocked");
  expect(s.governor.budget_status().open_reservations == 0, "reservations reconciled");
  ex.release();
}

// ============================================================================
// [Executor] Process executor
// ============================================================================

void test_process_executor_protocol() {
  helios::ExecutorConfig cfg;
  cfg.command = "/bin/sh";
  cfg.args = {"-c", "cat >/dev/null; printf '{\"result\":\"%s\",\"actual_units\":7}' \"$HELIOS_TASK_ID\""};
  cfg.timeout_ms = 5000;
  helios::ProcessExecutor ex(cfg);
  const auto r = ex.execute(make_task("proc-1"));
  expect(r.success, "child succeeded: " + r.error);
  expect(r.result == "proc-1" && r.actual_units == 7, "structured stdout parsed");

  cfg.args = {"-c", "echo boom >&2; exit 3"};
  const auto failed = helios::ProcessExecutor(cfg).execute(make_task("proc-2"));
  expect(!failed.success && failed.error.find("exit 3") != std::string::npos, "exit code reported");

  cfg.args = {"-c", "sleep 5"};
  cfg.timeout_ms = 50;
  const auto slow = helios::ProcessExecutor(cfg).execute(make_task("proc-3"));
  expect(!slow.success && slow.timed_out, "timeout reported");
}

// ============================================================================
// [Service] JSON API, config, observability
// ============================================================================

helios::jsonlite::Object parse_ok(const std::string& resp) {
  std::optional<helios::jsonlite::JsonError> err;
  const auto obj = helios::jsonlite::parse(resp, &err);
  expect(!err, "response is JSON: " + resp);
  expect(helios::jsonlite::get_bool(obj, "ok"), "ok response: " + resp);
  return helios::jsonlite::get_object(obj, "result");
}

std::string error_code_of(const std::string& resp) {
  std::optional<helios::jsonlite::JsonError> err;
  const auto obj = helios::jsonlite::parse(resp, &err);
  expect(!err && !helios::jsonlite::get_bool(obj, "ok", true), "error response: " + resp);
  return helios::jsonlite::get_string(helios::jsonlite::get_object(obj, "error"), "code");
}

helios::ServiceDependencies service_deps(std::shared_ptr<helios::IExecutor> executor) {
  helios::ServiceDependencies deps;
  deps.clock = std::make_shared<helios::ManualClock>();
  deps.store = std::make_shared<helios::MemoryStateStore>(deps.clock);
  deps.executor = std::move(executor);
  return deps;
}

void test_service_governor_ops() {
  helios::HeliosService svc(helios::default_config(), service_deps(std::make_shared<ScriptedExecutor>()));
  auto status = parse_ok(svc.handle("budget.status", ""));
  expect(helios::jsonlite::get_u64(status, "ceiling_units") == 900, "default ceiling");

  auto alloc = parse_ok(svc.handle(
      "resources.request",
      R"({"task_id":"t1","project_id":"p","task_type":"testing","estimated_units":5,"priority":5})"));
  expect(helios::jsonlite::get_bool(alloc, "allocated"), "request admitted");
  const std::string tier = helios::jsonlite::get_string(alloc, "tier");

  auto ack = parse_ok(svc.handle("resources.record_usage",
                                 R"({"task_id":"t1","tier":")" + tier + R"(","actual_units":3})"));
  expect(helios::jsonlite::get_bool(ack, "ok") && helios::jsonlite::get_bool(ack, "had_reservation"), "usage acked");
  expect(helios::jsonlite::get_u64(ack, "reserved_units") == 5, "reservation reported");
  status = parse_ok(svc.handle("budget.status", ""));
  expect(helios::jsonlite::get_u64(status, "used_units") == 3, "usage reflected");

  expect(error_code_of(svc.handle("resources.request", R"({"task_id":"t2","project_id":"p","priority":42})")) ==
             "malformed_request",
         "invalid priority rejected");
  expect(error_code_of(svc.handle("resources.record_usage", R"({"task_id":"t1","tier":"gold","actual_units":1})")) ==
             "malformed_request",
         "unknown tier rejected");

  parse_ok(svc.handle("governor.throttle", R"({"reason":"drill"})"));
  status = parse_ok(svc.handle("budget.status", ""));
  expect(helios::jsonlite::get_bool(status, "manual_throttle"), "throttle via API");
  parse_ok(svc.handle("governor.clear_throttle", ""));

  auto explain = parse_ok(svc.handle(
      "router.explain", R"({"task_id":"e","project_id":"p","task_type":"code_generation","estimated_units":80})"));
  expect(helios::jsonlite::has_key(explain, "weights"), "explain includes weights");
  parse_ok(svc.handle("usage.metrics", ""));
  parse_ok(svc.handle("governor.history", R"({"limit":5})"));
}

void test_service_cache_ops() {
  helios::HeliosService svc(helios::default_config(), service_deps(std::make_shared<ScriptedExecutor>()));
  auto miss = parse_ok(svc.handle("cache.lookup", R"({"task_type":"qa","input":"hello"})"));
  expect(!helios::jsonlite::get_bool(miss, "hit", true), "miss is a successful response");
  parse_ok(svc.handle("cache.store", R"({"task_type":"qa","input":"hello","response":"world","tiers":["l2"]})"));
  auto hit = parse_ok(svc.handle("cache.lookup", R"({"task_type":"qa","input":"HELLO"})"));
  expect(helios::jsonlite::get_bool(hit, "hit") && helios::jsonlite::get_string(hit, "tier") == "l2", "L2 hit");
  expect(helios::jsonlite::get_string(hit, "response") == "world", "response via API");
  auto inv = parse_ok(svc.handle("cache.invalidate", R"({"task_type":"qa"})"));
  expect(helios::jsonlite::get_u64(inv, "removed") == 1, "only the L2 entry existed");
  expect(error_code_of(svc.handle("cache.lookup", R"({"input":"x"})")) == "malformed_request", "task_type required");
  parse_ok(svc.handle("cache.metrics", ""));
}

void test_service_project_ops() {
  auto executor = std::make_shared<ScriptedExecutor>();
  helios::HeliosService svc(helios::default_config(), service_deps(executor));
  const std::string dag = R"({"project_id":"api","tasks":[
      {"id":"a","task_type":"testing","input":"one","estimated_units":2},
      {"id":"b","task_type":"testing","input":"two","estimated_units":2,"depends_on":["a"]}]})";
  auto plan = parse_ok(svc.handle("project.schedule", dag));
  expect(helios::jsonlite::get_u64(plan, "task_count") == 2, "plan returned");
  auto list = parse_ok(svc.handle("project.list", ""));
  expect(helios::jsonlite::get_string_array(list, "projects") == std::vector<std::string>({"api"}), "listed");

  auto done = parse_ok(svc.handle("project.execute", R"({"project_id":"api"})"));
  expect(helios::jsonlite::get_u64(helios::jsonlite::get_object(done, "counts"), "completed") == 2, "executed");
  auto status = parse_ok(svc.handle("project.status", R"({"project_id":"api","include_tasks":false})"));
  expect(!helios::jsonlite::has_key(status, "tasks"), "task list omitted on request");
  parse_ok(svc.handle("project.plan", R"({"project_id":"api"})"));

  expect(error_code_of(svc.handle("project.status", R"({"project_id":"ghost"})")) == "unknown_project",
         "unknown project");
  const std::string cyclic = R"({"project_id":"loop","tasks":[
      {"id":"a","task_type":"t","depends_on":["b"]},{"id":"b","task_type":"t","depends_on":["a"]}]})";
  expect(error_code_of(svc.handle("project.schedule", cyclic)) == "cyclic_dependency", "cycle over API");
}

void test_service_framing() {
  helios::HeliosService svc(helios::default_config(), service_deps(std::make_shared<ScriptedExecutor>()));
  const std::string resp = svc.handle_line(R"({"id":"req-7","op":"health"})");
  expect(resp.rfind(R"({"id":"req-7",)", 0) == 0, "id echoed first");
  const auto health = parse_ok(resp);
  expect(helios::jsonlite::get_string(health, "status") == "ok", "healthy");
  expect(error_code_of(svc.handle("no.such.op", "")) == "malformed_request", "unknown op");
  expect(error_code_of(svc.handle("stats", "{not json")) == "malformed_request", "bad JSON body");
  expect(error_code_of(svc.handle_line(R"({"body":{}})")) == "malformed_request", "op required");
  for (const auto& op : helios::HeliosService::operations()) {
    if (op.rfind("project.", 0) == 0 || op.rfind("resources.", 0) == 0 || op == "router.explain" ||
        op.rfind("cache.lookup", 0) == 0 || op == "cache.store") {
      continue;
    }
    std::optional<helios::jsonlite::JsonError> err;
    const auto obj = helios::jsonlite::parse(svc.handle(op, ""), &err);
    expect(!err && helios::jsonlite::get_bool(obj, "ok"), "op " + op + " answers without a body");
  }
}

void test_service_store_outage() {
  helios::ServiceDependencies deps = service_deps(std::make_shared<ScriptedExecutor>());
  deps.store = std::make_shared<UnavailableStore>();
  helios::HeliosService svc(helios::default_config(), deps);
  expect(error_code_of(svc.handle("budget.status", "")) == "state_store_unavailable", "outage surfaced");
  const auto health = parse_ok(svc.handle("health", ""));
  expect(helios::jsonlite::get_string(health, "status") == "degraded", "health degraded");
  const auto miss = parse_ok(svc.handle("cache.lookup", R"({"task_type":"qa","input":"x"})"));
  expect(helios::jsonlite::get_bool(miss, "degraded"), "cache degrades instead of failing");
}

void test_service_cancel_while_executing() {
  auto gate = std::make_shared<GatedExecutor>();
  helios::HeliosService svc(helios::default_config(), service_deps(gate));
  parse_ok(svc.handle("project.schedule", R"({"project_id":"live","tasks":[
      {"id":"a","task_type":"testing","input":"one","estimated_units":2},
      {"id":"b","task_type":"testing","input":"two","estimated_units":2,"depends_on":["a"]}]})"));

  std::mutex mu;
  std::vector<std::string> lines;
  auto responses = [&]() {
    std::lock_guard<std::mutex> lk(mu);
    return lines;
  };
  {
    helios::LineServer server(svc, [&](const std::string& resp) {
      std::lock_guard<std::mutex> lk(mu);
      lines.push_back(resp);
    });
    server.submit(R"({"id":"run","op":"project.execute","body":{"project_id":"live"}})");
    expect(wait_until([&]() { return gate->entered.load(); }), "task a running");
    expect(server.outstanding() == 1, "execute runs off the request loop");

    server.submit(R"({"id":"st","op":"project.status","body":{"project_id":"live","include_tasks":false}})");
    const auto early = responses();
    expect(early.size() == 1 && early[0].rfind(R"({"id":"st",)", 0) == 0, "status answered during execution");
    expect(helios::jsonlite::get_bool(parse_ok(early[0]), "executing"), "status sees the running project");

    server.submit(R"({"id":"cx","op":"project.cancel","body":{"project_id":"live"}})");
    gate->open();
    server.drain();
    expect(server.outstanding() == 0, "execute joined");
  }
  std::map<std::string, std::string> by_id;
  for (const auto& line : responses()) {
    std::optional<helios::jsonlite::JsonError> err;
    by_id[helios::jsonlite::get_string(helios::jsonlite::parse(line, &err), "id")] = line;
  }
  expect(by_id.size() == 3, "one response per request");
  expect(helios::jsonlite::get_bool(parse_ok(by_id["cx"]), "cancelled"), "cancel accepted");
  const auto done = parse_ok(by_id["run"]);
  expect(helios::jsonlite::get_bool(done, "cancelled"), "execution reports cancellation");
  expect(helios::jsonlite::get_u64(helios::jsonlite::get_object(done, "counts"), "completed") == 0,
         "nothing completed");
}

void test_config_loading() {
  helios::HeliosConfig cfg = helios::default_config();
  std::string err;
  expect(helios::config_from_json(
             R"({"governor":{"window_ceiling_units":50},"router":{"task_type_complexity":{"custom":9}},
                 "store":{"backend":"file","root":"/tmp/x"}})",
             cfg, &err),
         "policy overlay parses");
  expect(cfg.governor.window_ceiling_units == 50, "ceiling overridden");
  expect(cfg.governor.throttle_threshold_pct == 80.0, "other keys keep defaults");
  expect(cfg.router.task_type_complexity["custom"] == 9.0, "complexity table extended");
  expect(cfg.router.task_type_complexity.count("code_generation") == 1, "default table kept");
  expect(cfg.store.backend == "file" && cfg.store.root == "/tmp/x", "store config");
  expect(helios::validate_config(cfg).ok, "overlay valid");

  expect(!helios::config_from_json("{oops", cfg, &err) && !err.empty(), "malformed policy rejected");
  expect(!helios::load_config("/nonexistent/helios.json", cfg, &err), "missing file rejected");

  helios::HeliosConfig bad = helios::default_config();
  bad.governor.throttle_threshold_pct = 96.0;
  bad.governor.critical_threshold_pct = 90.0;
  const auto v = helios::validate_config(bad);
  expect(!v.ok && !v.errors.empty(), "inverted thresholds invalid");

  helios::HeliosConfig envcfg = helios::default_config();
  setenv("HELIOS_WINDOW_CEILING", "123", 1);
  helios::apply_env_overrides(envcfg);
  unsetenv("HELIOS_WINDOW_CEILING");
  expect(envcfg.governor.window_ceiling_units == 123, "env override applied");

  const fs::path file = fs::temp_directory_path() / "helios_config_test.json";
  {
    std::ofstream ofs(file);
    ofs << R"({"scheduler":{"max_retries":7},"cache":{"similarity_threshold":0.9}})";
  }
  helios::HeliosConfig loaded = helios::default_config();
  expect(helios::load_config(file.string(), loaded, &err), "file loads");
  expect(loaded.scheduler.max_retries == 7 && loaded.cache.similarity_threshold == 0.9, "file values applied");
  fs::remove(file);
}

int g_hook_events = 0;
void counting_hook(const helios::OrchestratorEvent&) { ++g_hook_events; }

void test_observability_stats() {
  auto& stats = helios::global_orchestrator_stats();
  stats.reset_for_testing();
  helios::set_event_hook(counting_hook);
  helios::OrchestratorEvent ev;
  ev.kind = helios::EventKind::admission;
  ev.outcome = "admitted";
  helios::emit_event(ev);
  ev.kind = helios::EventKind::cache_lookup;
  ev.outcome = "l3_hit";
  helios::emit_event(ev);
  ev.outcome = "miss";
  ev.error_code = "cache_unavailable";
  helios::emit_event(ev);
  helios::set_event_hook(nullptr);

  expect(g_hook_events == 3, "hook saw every event");
  expect(stats.admissions_granted.load() == 1, "admission counted");
  expect(stats.cache_lookups.load() == 2 && stats.cache_hits.load() == 1, "cache outcomes counted");
  expect(stats.cache_degraded.load() == 1, "degraded lookup counted");
  expect(stats.recent_events_snapshot().size() == 3, "events retained");
  expect(stats.to_json().find("\"admissions_granted\"") != std::string::npos, "stats JSON");
}

void test_worker_and_version() {
  expect(helios::global_worker_identity().worker_id == "test-worker", "identity set at startup");
  expect(helios::init_worker_identity("other").worker_id == "test-worker", "identity fixed after first init");

  auto clock = std::make_shared<helios::ManualClock>();
  auto store = std::make_shared<helios::MemoryStateStore>(clock);
  helios::EconomicRouter router(store, helios::RouterPolicy::default_policy());
  helios::ResourceGovernor gov(store, router, small_window(), clock);
  gov.request_resources(make_request("stamped", 1));
  const auto w = gov.current_window();
  expect(w && w->reservations.at("stamped").worker_id == "test-worker", "reservation stamped with worker id");

  const std::string manifest = helios::version::manifest_to_json(helios::version::current_manifest());
  expect(manifest.find(helios::version::kSemver) != std::string::npos, "manifest carries version");
}

}  // namespace

int main() {
  helios::set_log_level(helios::LogLevel::error);
  helios::init_worker_identity("test-worker");
  std::cout << "=== Helios Orchestration Core Test Suite ===\n";

  std::cout << "\n[Store] Hashing and shared state\n";
  run_test("hash domain separation", test_hash_domain_separation);
  run_test("memory store TTL", test_memory_store_ttl);
  run_test("memory store CAS + scan", test_memory_store_cas);
  run_test("memory store concurrent CAS", test_memory_store_concurrent_cas);
  run_test("file store persists across instances", test_file_store_persistence);
  run_test("file store detects corruption", test_file_store_detects_corruption);
  run_test("stores drop expired entries", test_store_drops_expired_entries);

  std::cout << "\n[Governor] Usage window and admission\n";
  run_test("normal zone routes + reconciles", test_governor_normal_zone_routes);
  run_test("throttled zone", test_governor_throttled_zone);
  run_test("critical zone", test_governor_critical_zone);
  run_test("overage accounting", test_governor_overage_accounting);
  run_test("window rollover + history", test_governor_rollover_and_history);
  run_test("history retention", test_governor_history_retention);
  run_test("reservation from closed window", test_governor_closed_window_reservation);
  run_test("manual throttle", test_governor_manual_throttle);
  run_test("monotonic admission", test_governor_monotonic_admission);
  run_test("concurrent admissions respect ceiling", test_governor_concurrent_ceiling);
  run_test("store outage", test_governor_store_unavailable);
  run_test("malformed request", test_governor_malformed_request);

  std::cout << "\n[Router] Economic routing\n";
  run_test("routing factors", test_router_factors);
  run_test("routing decisions", test_router_decisions);
  run_test("explain has no side effects", test_router_explain_has_no_side_effects);
  run_test("success-rate EMA", test_router_learning_ema);

  std::cout << "\n[Cache] Three-tier cache\n";
  run_test("normalization + embeddings", test_cache_normalization_and_embedding);
  run_test("L2 exact hit", test_cache_l2_exact_hit);
  run_test("idempotent stores", test_cache_idempotence);
  run_test("hit access counts", test_cache_hit_access_count);
  run_test("waterfall to L3 after L2 expiry", test_cache_waterfall_to_l3_after_l2_expiry);
  run_test("L3 similarity threshold", test_cache_l3_threshold_with_explicit_embeddings);
  run_test("L1 prefix + TTL cap", test_cache_l1_prefix_and_ttl_cap);
  run_test("invalidate exact scope", test_cache_invalidate_exact_scope);
  run_test("cache writes sweep expired entries", test_cache_sweeps_expired_entries);
  run_test("invalidate stops on outage", test_cache_invalidate_stops_on_outage);
  run_test("degraded store", test_cache_degraded_store);

  std::cout << "\n[Scheduler] DAG planning and execution\n";
  run_test("cycle rejected", test_scheduler_rejects_cycle);
  run_test("malformed graphs rejected", test_scheduler_rejects_malformed_graphs);
  run_test("waves + plan", test_scheduler_waves_and_plan);
  run_test("wave priority order", test_scheduler_wave_priority_order);
  run_test("dependency order", test_scheduler_executes_in_dependency_order);
  run_test("failure blocks dependents", test_scheduler_failure_blocks_dependents);
  run_test("retries with backoff", test_scheduler_retries_with_backoff);
  run_test("cache hit skips governor", test_scheduler_cache_hit_skips_governor);
  run_test("deadline exceeded", test_scheduler_deadline_exceeded);
  run_test("admission denial requeues", test_scheduler_admission_denial_requeues);
  run_test("per-project concurrency", test_scheduler_per_project_concurrency);
  run_test("cancellation", test_scheduler_cancellation);
  run_test("executor timeout requeues", test_scheduler_executor_timeout_requeues);
  run_test("executor timeout exhausts retries", test_scheduler_executor_timeout_exhausts_retries);

  std::cout << "\n[Executor] Child process protocol\n";
  run_test("process executor protocol", test_process_executor_protocol);

  std::cout << "\n[Service] JSON API, config, observability\n";
  run_test("governor ops", test_service_governor_ops);
  run_test("cache ops", test_service_cache_ops);
  run_test("project ops", test_service_project_ops);
  run_test("framing", test_service_framing);
  run_test("store outage", test_service_store_outage);
  run_test("cancel while executing", test_service_cancel_while_executing);
  run_test("config loading", test_config_loading);
  run_test("observability stats", test_observability_stats);
  run_test("worker identity + version", test_worker_and_version);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}

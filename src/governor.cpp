#include "helios/governor.hpp"

#include <algorithm>

#include "helios/jsonlite.hpp"
#include "helios/observability.hpp"
#include "helios/version.hpp"
#include "helios/worker.hpp"

namespace helios {

namespace {

constexpr const char* kWindowKey = "helios:governor:window";
constexpr const char* kHistoryKey = "helios:governor:history";

uint64_t sat_sub(uint64_t a, uint64_t b) { return a > b ? a - b : 0; }

uint64_t& tier_counter(UsageWindow& w, Tier tier) {
  return tier == Tier::high_capability ? w.high_units : w.economical_units;
}

BudgetHealth zone_for(double pct, const GovernorPolicy& policy) {
  if (pct > policy.critical_threshold_pct) return BudgetHealth::critical;
  if (pct >= policy.throttle_threshold_pct) return BudgetHealth::throttled;
  return BudgetHealth::normal;
}

void emit_governor_event(EventKind kind, const std::string& subject, const std::string& project,
                         const std::string& outcome, const std::string& tier, ErrorCode code,
                         uint64_t units, uint64_t duration_ns, uint64_t now) {
  OrchestratorEvent ev;
  ev.kind = kind;
  ev.subject_id = subject;
  ev.project_id = project;
  ev.outcome = outcome;
  ev.tier = tier;
  ev.error_code = code == ErrorCode::none ? "" : to_string(code);
  ev.units = units;
  ev.duration_ns = duration_ns;
  ev.timestamp_unix_ms = now;
  ev.worker_id = global_worker_identity().worker_id;
  emit_event(ev);
}

std::string history_to_json(const std::vector<UsageWindow>& windows) {
  jsonlite::Array arr;
  arr.reserve(windows.size());
  for (const auto& w : windows) arr.push_back(jsonlite::Value{usage_window_to_object(w)});
  jsonlite::Object root;
  root["format"] = jsonlite::Value{static_cast<std::uint64_t>(version::STATE_FORMAT_VERSION)};
  root["windows"] = jsonlite::Value{std::move(arr)};
  return jsonlite::to_json(root);
}

std::vector<UsageWindow> history_from_json(const std::string& text) {
  std::vector<UsageWindow> out;
  std::optional<jsonlite::JsonError> err;
  const auto root = jsonlite::parse(text, &err);
  if (err) {
    log_error("governor", "window history unreadable: " + err->message);
    return out;
  }
  for (const auto& v : jsonlite::get_array(root, "windows")) {
    if (!std::holds_alternative<jsonlite::Object>(v.v)) continue;
    UsageWindow w;
    std::string why;
    if (usage_window_from_object(std::get<jsonlite::Object>(v.v), w, &why)) {
      out.push_back(std::move(w));
    } else {
      log_warn("governor", "skipping history entry: " + why);
    }
  }
  return out;
}

}  // namespace

ResourceGovernor::ResourceGovernor(std::shared_ptr<IStateStore> store, EconomicRouter& router,
                                   GovernorPolicy policy, std::shared_ptr<const Clock> clock)
    : store_(std::move(store)), router_(router), policy_(policy), clock_(std::move(clock)) {}

BudgetStatus ResourceGovernor::status_from_window(const UsageWindow& w, const GovernorPolicy& policy,
                                                  uint64_t now_unix_ms) {
  BudgetStatus s;
  s.window_id = w.window_id;
  s.ceiling_units = w.ceiling_units;
  s.used_units = w.used_units();
  s.high_units = w.high_units;
  s.economical_units = w.economical_units;
  s.overage_units = w.overage_units;
  s.remaining_units = w.remaining_units();
  s.utilization_pct = w.ceiling_units == 0
                          ? 100.0
                          : 100.0 * static_cast<double>(s.used_units) / static_cast<double>(w.ceiling_units);
  s.health = zone_for(s.utilization_pct, policy);
  if (w.manual_throttle && s.health == BudgetHealth::normal) s.health = BudgetHealth::throttled;
  s.is_throttling = s.health != BudgetHealth::normal;
  s.manual_throttle = w.manual_throttle;
  s.throttle_reason = w.throttle_reason;
  s.window_start_unix_ms = w.start_unix_ms;
  s.window_end_unix_ms = w.end_unix_ms();
  s.ms_remaining_in_window = sat_sub(w.end_unix_ms(), now_unix_ms);
  s.open_reservations = w.reservations.size();
  return s;
}

UsageWindow ResourceGovernor::open_window(uint64_t now, const UsageWindow* previous) const {
  UsageWindow w;
  w.window_id = "win-" + std::to_string(now);
  w.start_unix_ms = now;
  w.duration_ms = policy_.window_duration_ms;
  w.ceiling_units = policy_.window_ceiling_units;
  if (previous) {
    w.manual_throttle = previous->manual_throttle;
    w.throttle_reason = previous->throttle_reason;
  }
  return w;
}

StoreStatus ResourceGovernor::load_current(uint64_t now, Snapshot& out) {
  for (uint32_t attempt = 0; attempt < policy_.max_cas_attempts; ++attempt) {
    std::string raw;
    const StoreStatus st = store_->get(kWindowKey, raw);
    if (st == StoreStatus::unavailable) return st;

    if (st == StoreStatus::not_found) {
      UsageWindow fresh = open_window(now, nullptr);
      const std::string json = usage_window_to_json(fresh);
      const StoreStatus cas = store_->compare_and_swap(kWindowKey, std::nullopt, json);
      if (cas == StoreStatus::ok) {
        log_info("governor", "opened window " + fresh.window_id);
        out.window = std::move(fresh);
        out.raw = json;
        return StoreStatus::ok;
      }
      if (cas == StoreStatus::unavailable) return cas;
      continue;
    }

    UsageWindow current;
    std::string why;
    if (!usage_window_from_json(raw, current, &why)) {
      // Unreadable state cannot be reconciled; start over rather than wedge admission.
      log_error("governor", "current window unreadable (" + why + "), opening a new one");
      UsageWindow fresh = open_window(now, nullptr);
      const std::string json = usage_window_to_json(fresh);
      const StoreStatus cas = store_->compare_and_swap(kWindowKey, raw, json);
      if (cas == StoreStatus::ok) {
        out.window = std::move(fresh);
        out.raw = json;
        return StoreStatus::ok;
      }
      if (cas == StoreStatus::unavailable) return cas;
      continue;
    }

    if (!current.elapsed_at(now)) {
      out.window = std::move(current);
      out.raw = std::move(raw);
      return StoreStatus::ok;
    }

    UsageWindow next = open_window(now, &current);
    const std::string json = usage_window_to_json(next);
    const StoreStatus cas = store_->compare_and_swap(kWindowKey, raw, json);
    if (cas == StoreStatus::unavailable) return cas;
    if (cas == StoreStatus::conflict) {
      global_orchestrator_stats().store_conflicts.fetch_add(1, std::memory_order_relaxed);
      continue;
    }

    current.closed_at_unix_ms = now;
    append_history(current);
    log_info("governor", "rolled window " + current.window_id + " -> " + next.window_id + " (" +
                             std::to_string(current.total_recorded_units()) + " units recorded)");
    emit_governor_event(EventKind::window_rollover, current.window_id, "", "closed", "", ErrorCode::none,
                        current.total_recorded_units(), 0, now);
    out.window = std::move(next);
    out.raw = json;
    return StoreStatus::ok;
  }
  return StoreStatus::conflict;
}

StoreStatus ResourceGovernor::mutate_window(const std::function<bool(UsageWindow&)>& fn, UsageWindow& out) {
  for (uint32_t attempt = 0; attempt < policy_.max_cas_attempts; ++attempt) {
    Snapshot snap;
    const StoreStatus st = load_current(clock_->now_unix_ms(), snap);
    if (st != StoreStatus::ok) return st;

    UsageWindow next = snap.window;
    if (!fn(next)) {
      out = std::move(next);
      return StoreStatus::ok;
    }
    const StoreStatus cas = store_->compare_and_swap(kWindowKey, snap.raw, usage_window_to_json(next));
    if (cas == StoreStatus::ok) {
      out = std::move(next);
      return StoreStatus::ok;
    }
    if (cas == StoreStatus::unavailable) return cas;
    global_orchestrator_stats().store_conflicts.fetch_add(1, std::memory_order_relaxed);
  }
  log_warn("governor", "window update abandoned after " + std::to_string(policy_.max_cas_attempts) +
                           " conflicting attempts");
  return StoreStatus::conflict;
}

std::vector<UsageWindow> ResourceGovernor::read_history(StoreStatus* status) {
  std::string raw;
  const StoreStatus st = store_->get(kHistoryKey, raw);
  if (status) *status = st;
  if (st != StoreStatus::ok) return {};
  return history_from_json(raw);
}

void ResourceGovernor::append_history(const UsageWindow& closed) {
  for (uint32_t attempt = 0; attempt < policy_.max_cas_attempts; ++attempt) {
    std::string raw;
    const StoreStatus st = store_->get(kHistoryKey, raw);
    if (st == StoreStatus::unavailable) break;
    std::vector<UsageWindow> windows = st == StoreStatus::ok ? history_from_json(raw) : std::vector<UsageWindow>{};
    windows.push_back(closed);
    if (policy_.history_retention > 0 && windows.size() > policy_.history_retention) {
      windows.erase(windows.begin(),
                    windows.begin() + static_cast<std::ptrdiff_t>(windows.size() - policy_.history_retention));
    }
    const std::optional<std::string> expected =
        st == StoreStatus::ok ? std::optional<std::string>(raw) : std::nullopt;
    const StoreStatus cas = store_->compare_and_swap(kHistoryKey, expected, history_to_json(windows));
    if (cas == StoreStatus::ok) return;
    if (cas == StoreStatus::unavailable) break;
  }
  log_error("governor", "failed to archive window " + closed.window_id);
}

std::optional<Reservation> ResourceGovernor::find_closed_reservation(const std::string& task_id) {
  auto history = read_history(nullptr);
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    auto r = it->reservations.find(task_id);
    if (r != it->reservations.end()) return r->second;
  }
  return std::nullopt;
}

ResourceAllocation ResourceGovernor::request_resources(const TaskResourceRequest& req) {
  ResourceAllocation alloc;
  std::string invalid;
  if (!validate_request(req, &invalid)) {
    alloc.decision = AdmissionDecision::rejected;
    alloc.error_code = ErrorCode::malformed_request;
    alloc.reason = invalid;
    return alloc;
  }

  uint64_t duration_ns = 0;
  UsageWindow written;
  StoreStatus st;
  {
    ScopeTimer timer(duration_ns);
    std::lock_guard<std::mutex> lk(mu_);
    const uint64_t now = clock_->now_unix_ms();
    st = mutate_window(
        [&](UsageWindow& w) {
          alloc = ResourceAllocation{};
          // A repeated request for the same task replaces its earlier reservation.
          auto prior = w.reservations.find(req.task_id);
          if (prior != w.reservations.end()) {
            uint64_t& counter = tier_counter(w, prior->second.tier);
            counter = sat_sub(counter, prior->second.units);
            w.reservations.erase(prior);
          }

          const BudgetStatus status = status_from_window(w, policy_, now);
          alloc.zone = status.health;
          alloc.window_id = w.window_id;
          const uint64_t wait_ms = status.ms_remaining_in_window;

          auto deny = [&](AdmissionDecision decision, const std::string& reason) {
            alloc.allocated = false;
            alloc.decision = decision;
            alloc.error_code = ErrorCode::admission_denied;
            alloc.reason = reason;
            alloc.retry_after_ms = wait_ms;
            alloc.retry_at_unix_ms = now + wait_ms;
            alloc.tier = req.mandatory_high_tier ? Tier::high_capability : Tier::economical;
          };
          auto admit = [&](Tier tier, double confidence, const std::string& reason) {
            alloc.allocated = true;
            alloc.decision = AdmissionDecision::admitted;
            alloc.tier = tier;
            alloc.router_confidence = confidence;
            alloc.reason = reason;
          };

          if (status.remaining_units == 0) {
            deny(AdmissionDecision::rejected, "budget exhausted for window " + w.window_id);
          } else if (status.health == BudgetHealth::normal) {
            const RoutingDecision d = router_.route_task(req, status);
            admit(d.tier, d.confidence, d.reasoning);
          } else if (req.mandatory_high_tier) {
            deny(AdmissionDecision::queued,
                 "mandatory high-capability task queued while budget is " + to_string(status.health));
          } else if (status.health == BudgetHealth::throttled) {
            admit(Tier::economical, 0.7, status.manual_throttle && !status.throttle_reason.empty()
                                             ? "throttled (" + status.throttle_reason + "): economical tier"
                                             : "throttled: economical tier");
          } else if (req.priority >= policy_.critical_min_priority) {
            admit(Tier::economical, 0.7, "critical zone: priority " + std::to_string(req.priority) + " admitted");
          } else {
            deny(AdmissionDecision::rejected, "critical zone: priority " + std::to_string(req.priority) +
                                                  " below " + std::to_string(policy_.critical_min_priority));
          }

          if (alloc.allocated) {
            const uint64_t units = std::min(req.estimated_units, status.remaining_units);
            tier_counter(w, alloc.tier) += units;
            Reservation r;
            r.task_id = req.task_id;
            r.project_id = req.project_id;
            r.tier = alloc.tier;
            r.units = units;
            r.reserved_at_unix_ms = now;
            r.worker_id = global_worker_identity().worker_id;
            w.reservations[req.task_id] = std::move(r);
            alloc.reserved_units = units;
            ++w.admitted_count;
          } else if (alloc.decision == AdmissionDecision::queued) {
            ++w.queued_count;
          } else {
            ++w.rejected_count;
          }
          if (status.health != BudgetHealth::normal) ++w.throttle_events;
          return true;
        },
        written);
  }

  if (st != StoreStatus::ok) {
    alloc = ResourceAllocation{};
    alloc.decision = AdmissionDecision::rejected;
    alloc.error_code = st == StoreStatus::conflict ? ErrorCode::state_store_conflict
                                                   : ErrorCode::state_store_unavailable;
    alloc.reason = "governor state " + to_string(st);
    alloc.retry_after_ms = 1000;
    alloc.retry_at_unix_ms = clock_->now_unix_ms() + alloc.retry_after_ms;
    log_warn("governor", "admission for " + req.task_id + " failed: " + alloc.reason);
  }

  emit_governor_event(EventKind::admission, req.task_id, req.project_id, to_string(alloc.decision),
                      to_string(alloc.tier), alloc.error_code, alloc.reserved_units, duration_ns,
                      clock_->now_unix_ms());
  return alloc;
}

UsageAck ResourceGovernor::record_usage(const std::string& task_id, Tier tier, uint64_t actual_units) {
  UsageAck ack;
  if (task_id.empty()) {
    ack.error_code = ErrorCode::malformed_request;
    ack.reason = "task_id is required";
    return ack;
  }

  std::lock_guard<std::mutex> lk(mu_);

  Snapshot snap;
  StoreStatus st = load_current(clock_->now_unix_ms(), snap);
  std::optional<Reservation> closed;
  if (st == StoreStatus::ok && snap.window.reservations.count(task_id) == 0) {
    closed = find_closed_reservation(task_id);
  }

  UsageWindow written;
  if (st == StoreStatus::ok) {
    st = mutate_window(
        [&](UsageWindow& w) {
          ack = UsageAck{};
          ack.actual_units = actual_units;
          ack.window_id = w.window_id;
          uint64_t charge = actual_units;

          auto it = w.reservations.find(task_id);
          if (it != w.reservations.end()) {
            ack.had_reservation = true;
            ack.reserved_units = it->second.units;
            uint64_t& counter = tier_counter(w, it->second.tier);
            counter = sat_sub(counter, it->second.units);
            w.reservations.erase(it);
          } else if (closed) {
            ack.had_reservation = true;
            ack.reservation_in_closed_window = true;
            ack.reserved_units = closed->units;
            charge = sat_sub(actual_units, closed->units);
          }

          const uint64_t booked = std::min(charge, w.remaining_units());
          tier_counter(w, tier) += booked;
          ack.overage_units = charge - booked;
          w.overage_units += ack.overage_units;
          ack.correction_units = static_cast<int64_t>(actual_units) - static_cast<int64_t>(ack.reserved_units);
          ack.ok = true;
          return true;
        },
        written);
  }

  if (st != StoreStatus::ok) {
    ack = UsageAck{};
    ack.actual_units = actual_units;
    ack.error_code = st == StoreStatus::conflict ? ErrorCode::state_store_conflict
                                                 : ErrorCode::state_store_unavailable;
    ack.reason = "governor state " + to_string(st);
    log_warn("governor", "usage for " + task_id + " not recorded: " + ack.reason);
    return ack;
  }

  if (ack.overage_units > 0) {
    log_warn("governor", task_id + " exceeded the window ceiling by " + std::to_string(ack.overage_units) +
                             " units");
  }
  emit_governor_event(EventKind::usage_recorded, task_id, "", ack.had_reservation ? "reconciled" : "direct",
                      to_string(tier), ErrorCode::none, actual_units, 0, clock_->now_unix_ms());
  return ack;
}

BudgetStatus ResourceGovernor::budget_status() {
  std::lock_guard<std::mutex> lk(mu_);
  const uint64_t now = clock_->now_unix_ms();
  Snapshot snap;
  if (load_current(now, snap) != StoreStatus::ok) {
    log_warn("governor", "budget status unavailable");
    return BudgetStatus{};
  }
  return status_from_window(snap.window, policy_, now);
}

std::optional<UsageWindow> ResourceGovernor::current_window() {
  std::lock_guard<std::mutex> lk(mu_);
  Snapshot snap;
  if (load_current(clock_->now_unix_ms(), snap) != StoreStatus::ok) return std::nullopt;
  return snap.window;
}

UsageMetrics ResourceGovernor::usage_metrics() {
  UsageMetrics m;
  const uint64_t now = clock_->now_unix_ms();
  std::vector<UsageWindow> history;
  {
    std::lock_guard<std::mutex> lk(mu_);
    Snapshot snap;
    if (load_current(now, snap) != StoreStatus::ok) return m;
    const UsageWindow& w = snap.window;
    m.window_id = w.window_id;

    const double used = static_cast<double>(w.used_units());
    const double high = static_cast<double>(w.high_units);
    const double econ = static_cast<double>(w.economical_units);
    // At least one minute of elapsed time so a fresh window does not extrapolate wildly.
    const double hours = static_cast<double>(std::max<uint64_t>(sat_sub(now, w.start_unix_ms), 60000)) / 3600000.0;
    m.units_per_hour = used / hours;
    if (used > 0) {
      m.high_pct = 100.0 * high / used;
      m.economical_pct = 100.0 * econ / used;
    }
    m.cost_efficiency_pct = m.economical_pct;
    m.weighted_cost_units = high * policy_.high_tier_cost_multiplier + econ * policy_.economical_tier_cost_multiplier;
    m.all_high_cost_units = used * policy_.high_tier_cost_multiplier;
    m.admitted_count = w.admitted_count;
    m.queued_count = w.queued_count;
    m.rejected_count = w.rejected_count;
    m.throttle_events = w.throttle_events;
    m.overage_units = w.overage_units;
    history = read_history(nullptr);
  }
  m.windows_in_history = history.size();
  for (const auto& h : history) m.history_total_units += h.total_recorded_units();
  return m;
}

std::vector<UsageWindow> ResourceGovernor::window_history(size_t limit) {
  std::lock_guard<std::mutex> lk(mu_);
  Snapshot snap;
  // Any pending rollover lands in history before it is read.
  (void)load_current(clock_->now_unix_ms(), snap);
  auto history = read_history(nullptr);
  std::reverse(history.begin(), history.end());
  if (limit > 0 && history.size() > limit) history.resize(limit);
  return history;
}

bool ResourceGovernor::force_throttle(const std::string& reason) {
  std::lock_guard<std::mutex> lk(mu_);
  UsageWindow written;
  const StoreStatus st = mutate_window(
      [&](UsageWindow& w) {
        w.manual_throttle = true;
        w.throttle_reason = reason;
        return true;
      },
      written);
  if (st == StoreStatus::ok) log_info("governor", "manual throttle engaged: " + reason);
  return st == StoreStatus::ok;
}

bool ResourceGovernor::clear_throttle() {
  std::lock_guard<std::mutex> lk(mu_);
  UsageWindow written;
  const StoreStatus st = mutate_window(
      [&](UsageWindow& w) {
        if (!w.manual_throttle) return false;
        w.manual_throttle = false;
        w.throttle_reason.clear();
        return true;
      },
      written);
  if (st == StoreStatus::ok) log_info("governor", "manual throttle cleared");
  return st == StoreStatus::ok;
}

std::string ResourceGovernor::health_to_json() {
  const BudgetStatus s = budget_status();
  jsonlite::Object o;
  o["available"] = jsonlite::Value{!s.window_id.empty()};
  o["backend"] = jsonlite::Value{store_->backend_id()};
  o["zone"] = jsonlite::Value{to_string(s.health)};
  o["utilization_pct"] = jsonlite::Value{s.utilization_pct};
  o["remaining_units"] = jsonlite::Value{s.remaining_units};
  o["manual_throttle"] = jsonlite::Value{s.manual_throttle};
  o["window_id"] = jsonlite::Value{s.window_id};
  return jsonlite::to_json(o);
}

}  // namespace helios

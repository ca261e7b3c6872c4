#include "helios/scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>

#include "helios/jsonlite.hpp"
#include "helios/observability.hpp"
#include "helios/worker.hpp"

namespace helios {

namespace {

constexpr uint64_t kHourMs = 60ull * 60 * 1000;
constexpr double kBlendedCostMultiplier = 1.5;
constexpr uint64_t kStoreRetryMs = 1000;

using jsonlite::Object;
using jsonlite::Value;

void emit_task_event(const Task& t, const std::string& outcome, uint64_t now, uint64_t duration_ns = 0) {
  OrchestratorEvent ev;
  ev.kind = EventKind::task_transition;
  ev.subject_id = t.id;
  ev.project_id = t.project_id;
  ev.outcome = outcome;
  ev.tier = t.allocated_tier ? to_string(*t.allocated_tier) : "";
  ev.error_code = t.error_code == ErrorCode::none ? "" : to_string(t.error_code);
  ev.units = t.actual_units;
  ev.duration_ns = duration_ns;
  ev.timestamp_unix_ms = now;
  ev.worker_id = global_worker_identity().worker_id;
  emit_event(ev);
}

void emit_project_event(EventKind kind, const std::string& project_id, const std::string& outcome, uint64_t units,
                        uint64_t now) {
  OrchestratorEvent ev;
  ev.kind = kind;
  ev.subject_id = project_id;
  ev.project_id = project_id;
  ev.outcome = outcome;
  ev.units = units;
  ev.timestamp_unix_ms = now;
  ev.worker_id = global_worker_identity().worker_id;
  emit_event(ev);
}

// Orders a wave: dynamic priority desc, then id.
void order_wave(std::vector<std::string>& wave, const TaskDAG& dag, const std::map<std::string, size_t>& index,
                uint64_t now) {
  std::sort(wave.begin(), wave.end(), [&](const std::string& a, const std::string& b) {
    const double pa = HybridScheduler::dynamic_priority(dag.tasks[index.at(a)], now);
    const double pb = HybridScheduler::dynamic_priority(dag.tasks[index.at(b)], now);
    if (pa != pb) return pa > pb;
    return a < b;
  });
}

}  // namespace

// ---------------------------------------------------------------------------
// WorkerPool
// ---------------------------------------------------------------------------

WorkerPool::WorkerPool(size_t threads) {
  if (threads == 0) threads = 1;
  threads_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) threads_.emplace_back([this]() { worker_loop(); });
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::submit(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
}

void WorkerPool::worker_loop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this]() { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) return;  // stopping and drained
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    busy_.fetch_add(1, std::memory_order_relaxed);
    job();
    busy_.fetch_sub(1, std::memory_order_relaxed);
  }
}

// ---------------------------------------------------------------------------
// ExecutorWatchdog
// ---------------------------------------------------------------------------

ExecutorWatchdog::~ExecutorWatchdog() {
  std::vector<std::pair<std::shared_ptr<Call>, std::thread>> pending;
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending.swap(overdue_);
  }
  if (!pending.empty()) {
    log_warn("scheduler", "waiting for " + std::to_string(pending.size()) + " overdue executor calls");
  }
  for (auto& [call, th] : pending) {
    if (th.joinable()) th.join();
  }
}

std::optional<ExecutorResult> ExecutorWatchdog::run(const Task& task, uint64_t timeout_ms) {
  auto call = std::make_shared<Call>();
  std::thread th([this, call, task]() {
    ExecutorResult r;
    try {
      r = executor_.execute(task);
    } catch (const std::exception& e) {
      r = ExecutorResult{};
      r.error = std::string("executor threw: ") + e.what();
    }
    {
      std::lock_guard<std::mutex> lk(call->mu);
      call->result = std::move(r);
      call->done = true;
    }
    call->cv.notify_all();
  });

  bool done = false;
  {
    std::unique_lock<std::mutex> lk(call->mu);
    if (timeout_ms == 0) {
      call->cv.wait(lk, [&]() { return call->done; });
      done = true;
    } else {
      done = call->cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&]() { return call->done; });
    }
  }
  if (done) {
    th.join();
    return std::move(call->result);
  }

  std::lock_guard<std::mutex> lk(mu_);
  reap_locked();
  overdue_.emplace_back(std::move(call), std::move(th));
  log_warn("scheduler", "executor call for " + task.id + " abandoned after " + std::to_string(timeout_ms) + " ms");
  return std::nullopt;
}

void ExecutorWatchdog::reap_locked() {
  for (auto it = overdue_.begin(); it != overdue_.end();) {
    bool done = false;
    {
      std::lock_guard<std::mutex> clk(it->first->mu);
      done = it->first->done;
    }
    if (done) {
      it->second.join();
      it = overdue_.erase(it);
    } else {
      ++it;
    }
  }
}

size_t ExecutorWatchdog::overdue() const {
  std::lock_guard<std::mutex> lk(mu_);
  size_t n = 0;
  for (const auto& entry : overdue_) {
    std::lock_guard<std::mutex> clk(entry.first->mu);
    if (!entry.first->done) ++n;
  }
  return n;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

std::string execution_plan_to_json(const ExecutionPlan& plan) {
  jsonlite::Array waves;
  for (const auto& wave : plan.waves) {
    jsonlite::Array ids;
    for (const auto& id : wave) ids.push_back(Value{id});
    waves.push_back(Value{std::move(ids)});
  }
  Object wave_of;
  for (const auto& [id, w] : plan.wave_of) wave_of[id] = Value{static_cast<uint64_t>(w)};
  jsonlite::Array critical;
  for (const auto& id : plan.critical_path) critical.push_back(Value{id});

  Object o;
  o["project_id"] = Value{plan.project_id};
  o["waves"] = Value{std::move(waves)};
  o["wave_of"] = Value{std::move(wave_of)};
  o["critical_path"] = Value{std::move(critical)};
  o["critical_path_length"] = Value{static_cast<uint64_t>(plan.critical_path.size())};
  o["task_count"] = Value{static_cast<uint64_t>(plan.task_count)};
  o["estimated_cost_units"] = Value{plan.estimated_cost_units};
  o["estimated_duration_ms"] = Value{plan.estimated_duration_ms};
  return jsonlite::to_json(o);
}

std::string project_status_to_json(const ProjectStatus& s, bool include_tasks) {
  Object counts;
  counts["pending"] = Value{static_cast<uint64_t>(s.pending)};
  counts["queued"] = Value{static_cast<uint64_t>(s.queued)};
  counts["running"] = Value{static_cast<uint64_t>(s.running)};
  counts["completed"] = Value{static_cast<uint64_t>(s.completed)};
  counts["failed"] = Value{static_cast<uint64_t>(s.failed)};
  counts["blocked"] = Value{static_cast<uint64_t>(s.blocked)};
  counts["cancelled"] = Value{static_cast<uint64_t>(s.cancelled_tasks)};

  Object o;
  o["project_id"] = Value{s.project_id};
  o["executing"] = Value{s.executing};
  o["finished"] = Value{s.finished};
  o["cancelled"] = Value{s.cancelled};
  o["total"] = Value{static_cast<uint64_t>(s.total)};
  o["counts"] = Value{std::move(counts)};
  o["completion_rate"] = Value{s.completion_rate};
  o["success_rate"] = Value{s.success_rate};
  o["started_at"] = Value{s.started_at_unix_ms};
  o["finished_at"] = Value{s.finished_at_unix_ms};
  o["elapsed_ms"] = Value{s.elapsed_ms};
  o["cache_hits"] = Value{static_cast<uint64_t>(s.cache_hits)};
  o["total_actual_units"] = Value{s.total_actual_units};
  o["total_retries"] = Value{s.total_retries};
  o["admission_denials"] = Value{s.admission_denials};
  if (include_tasks) {
    jsonlite::Array tasks;
    for (const auto& t : s.tasks) tasks.push_back(Value{task_to_object(t)});
    o["tasks"] = Value{std::move(tasks)};
  }
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// HybridScheduler
// ---------------------------------------------------------------------------

HybridScheduler::HybridScheduler(ResourceGovernor& governor, EconomicRouter& router, CacheManager& cache,
                                 IExecutor& executor, SchedulerPolicy policy, std::shared_ptr<const Clock> clock)
    : governor_(governor),
      router_(router),
      cache_(cache),
      executor_(executor),
      policy_(policy),
      clock_(std::move(clock)),
      watchdog_(executor),
      pool_(policy.global_max_concurrency) {}

HybridScheduler::~HybridScheduler() {
  std::lock_guard<std::mutex> lk(projects_mu_);
  for (auto& [id, run] : projects_) {
    std::lock_guard<std::mutex> rlk(run->mu);
    if (run->executing && !run->finished) log_warn("scheduler", "shutting down with project " + id + " running");
  }
}

double HybridScheduler::dynamic_priority(const Task& task, uint64_t now_unix_ms) {
  double p = static_cast<double>(task.priority);
  if (task.deadline_unix_ms != 0) {
    const uint64_t left = task.deadline_unix_ms > now_unix_ms ? task.deadline_unix_ms - now_unix_ms : 0;
    if (left < kHourMs) p += 5.0;
    else if (left < 6 * kHourMs) p += 3.0;
    else if (left < 24 * kHourMs) p += 1.5;
    else if (left < 48 * kHourMs) p += 0.5;
  }
  p -= 0.5 * static_cast<double>(task.retry_count);
  return std::max(1.0, p);
}

uint64_t HybridScheduler::retry_backoff_ms(uint32_t retry_count) const {
  uint64_t delay = policy_.backoff_base_ms;
  for (uint32_t i = 1; i < retry_count && delay < policy_.backoff_max_ms; ++i) delay *= 2;
  return std::min(delay, policy_.backoff_max_ms);
}

std::shared_ptr<HybridScheduler::ProjectRun> HybridScheduler::find(const std::string& project_id) const {
  std::lock_guard<std::mutex> lk(projects_mu_);
  auto it = projects_.find(project_id);
  return it == projects_.end() ? nullptr : it->second;
}

ExecutionPlan HybridScheduler::build_plan(const TaskDAG& dag, const std::map<std::string, size_t>& index,
                                          const std::vector<std::vector<std::string>>& waves, uint64_t now) const {
  ExecutionPlan plan;
  plan.project_id = dag.project_id;
  plan.waves = waves;
  plan.task_count = dag.tasks.size();
  for (size_t w = 0; w < plan.waves.size(); ++w) {
    order_wave(plan.waves[w], dag, index, now);
    for (const auto& id : plan.waves[w]) plan.wave_of[id] = w;
  }

  const double high_multiplier = governor_.policy().high_tier_cost_multiplier;
  for (const auto& t : dag.tasks) {
    plan.estimated_cost_units +=
        static_cast<double>(t.estimated_units) * (t.mandatory_high_tier ? high_multiplier : kBlendedCostMultiplier);
  }
  plan.estimated_duration_ms = static_cast<uint64_t>(plan.waves.size()) * policy_.average_task_ms;

  // Walk back from a deepest task through a dependency in the previous wave.
  if (!plan.waves.empty()) {
    std::string cur = plan.waves.back().front();
    plan.critical_path.push_back(cur);
    while (plan.wave_of.at(cur) > 0) {
      const Task& t = dag.tasks[index.at(cur)];
      const size_t want = plan.wave_of.at(cur) - 1;
      auto dep = std::find_if(t.depends_on.begin(), t.depends_on.end(),
                              [&](const std::string& d) { return plan.wave_of.at(d) == want; });
      if (dep == t.depends_on.end()) break;
      cur = *dep;
      plan.critical_path.push_back(cur);
    }
    std::reverse(plan.critical_path.begin(), plan.critical_path.end());
  }
  return plan;
}

ScheduleResult HybridScheduler::schedule_project(TaskDAG dag) {
  ScheduleResult r;
  auto reject = [&](ErrorCode code, const std::string& why) {
    r.ok = false;
    r.error_code = code;
    r.error = why;
    log_info("scheduler", "rejected project " + dag.project_id + ": " + why);
    return r;
  };

  if (dag.project_id.empty()) return reject(ErrorCode::malformed_request, "project_id is required");
  if (dag.tasks.empty()) return reject(ErrorCode::malformed_request, "project has no tasks");

  std::map<std::string, size_t> index;
  for (size_t i = 0; i < dag.tasks.size(); ++i) {
    Task& t = dag.tasks[i];
    t.project_id = dag.project_id;
    if (t.id.empty()) return reject(ErrorCode::malformed_request, "task id is required");
    if (!index.emplace(t.id, i).second) return reject(ErrorCode::malformed_request, "duplicate task id " + t.id);
    if (t.task_type.empty()) return reject(ErrorCode::malformed_request, "task " + t.id + " has no task_type");
    if (t.priority < 0 || t.priority > 10) {
      return reject(ErrorCode::malformed_request, "task " + t.id + " priority must be 0..10");
    }
    if (t.estimated_units == 0) {
      return reject(ErrorCode::malformed_request, "task " + t.id + " estimated_units must be positive");
    }
  }

  std::map<std::string, std::vector<std::string>> dependents;
  std::map<std::string, size_t> indegree;
  for (const auto& t : dag.tasks) {
    indegree[t.id];
    std::set<std::string> seen;
    for (const auto& dep : t.depends_on) {
      if (dep == t.id) return reject(ErrorCode::malformed_request, "task " + t.id + " depends on itself");
      if (index.count(dep) == 0) {
        return reject(ErrorCode::malformed_request, "task " + t.id + " depends on unknown task " + dep);
      }
      if (!seen.insert(dep).second) continue;
      dependents[dep].push_back(t.id);
      ++indegree[t.id];
    }
  }

  // Kahn's algorithm, level by level.
  std::vector<std::vector<std::string>> waves;
  std::vector<std::string> current;
  for (const auto& [id, deg] : indegree) {
    if (deg == 0) current.push_back(id);
  }
  size_t placed = 0;
  while (!current.empty()) {
    placed += current.size();
    std::vector<std::string> next;
    for (const auto& id : current) {
      for (const auto& d : dependents[id]) {
        if (--indegree[d] == 0) next.push_back(d);
      }
    }
    waves.push_back(std::move(current));
    current = std::move(next);
  }
  if (placed != dag.tasks.size()) {
    std::ostringstream oss;
    oss << "cyclic dependency among:";
    for (const auto& [id, deg] : indegree) {
      if (deg > 0) oss << " " << id;
    }
    return reject(ErrorCode::cyclic_dependency, oss.str());
  }

  const uint64_t now = clock_->now_unix_ms();
  auto run = std::make_shared<ProjectRun>();
  run->plan = build_plan(dag, index, waves, now);
  for (auto& t : dag.tasks) {
    t.status = TaskStatus::pending;
    t.wave = run->plan.wave_of.at(t.id);
  }
  run->dag = std::move(dag);
  run->index = std::move(index);
  run->dependents = std::move(dependents);

  {
    std::lock_guard<std::mutex> lk(projects_mu_);
    auto it = projects_.find(run->dag.project_id);
    if (it != projects_.end()) {
      std::lock_guard<std::mutex> rlk(it->second->mu);
      if (it->second->executing && !it->second->finished) {
        r.error_code = ErrorCode::project_active;
        r.error = "project " + run->dag.project_id + " is executing";
        return r;
      }
    }
    projects_[run->dag.project_id] = run;
  }

  log_info("scheduler", "scheduled project " + run->plan.project_id + ": " + std::to_string(run->plan.task_count) +
                            " tasks in " + std::to_string(run->plan.waves.size()) + " waves");
  emit_project_event(EventKind::project_scheduled, run->plan.project_id, "scheduled", run->plan.task_count, now);
  r.ok = true;
  r.plan = run->plan;
  return r;
}

void HybridScheduler::transition(ProjectRun& run, Task& task, TaskStatus to, const std::string& outcome,
                                 uint64_t now) {
  (void)run;
  task.status = to;
  if (is_terminal(to)) task.completed_at_unix_ms = now;
  emit_task_event(task, outcome, now);
}

void HybridScheduler::fail_terminal(ProjectRun& run, Task& task, ErrorCode code, const std::string& error,
                                    uint64_t now) {
  task.error_code = code;
  task.error = error;
  transition(run, task, TaskStatus::failed, "failed", now);
  log_warn("scheduler", "task " + task.id + " failed: " + error);

  std::vector<std::string> frontier = run.dependents[task.id];
  while (!frontier.empty()) {
    const std::string id = frontier.back();
    frontier.pop_back();
    Task& dep = run.task(id);
    if (is_terminal(dep.status)) continue;
    dep.error_code = ErrorCode::dependency_failed;
    dep.error = "dependency " + task.id + " failed";
    transition(run, dep, TaskStatus::blocked, "blocked", now);
    const auto& more = run.dependents[id];
    frontier.insert(frontier.end(), more.begin(), more.end());
  }
}

void HybridScheduler::promote_ready(ProjectRun& run, uint64_t now) {
  for (auto& t : run.dag.tasks) {
    if (t.status != TaskStatus::pending) continue;
    const bool ready = std::all_of(t.depends_on.begin(), t.depends_on.end(), [&](const std::string& dep) {
      return run.task(dep).status == TaskStatus::completed;
    });
    if (!ready) continue;
    t.queued_at_unix_ms = now;
    t.next_eligible_at_unix_ms = now;
    transition(run, t, TaskStatus::queued, "queued", now);
  }
}

void HybridScheduler::expire_deadlines(ProjectRun& run, uint64_t now) {
  for (auto& t : run.dag.tasks) {
    if (t.status != TaskStatus::queued || t.deadline_unix_ms == 0 || now < t.deadline_unix_ms) continue;
    if (run.in_flight.count(t.id) > 0) continue;
    fail_terminal(run, t, ErrorCode::deadline_exceeded, "deadline passed while queued", now);
  }
}

bool HybridScheduler::all_terminal(const ProjectRun& run) const {
  return std::all_of(run.dag.tasks.begin(), run.dag.tasks.end(),
                     [](const Task& t) { return is_terminal(t.status); });
}

void HybridScheduler::dispatch(const std::shared_ptr<ProjectRun>& run, uint64_t now) {
  if (run->in_flight.size() >= policy_.max_parallel_per_project) return;

  std::vector<const Task*> ready;
  for (const auto& t : run->dag.tasks) {
    if (t.status == TaskStatus::queued && t.next_eligible_at_unix_ms <= now && run->in_flight.count(t.id) == 0) {
      ready.push_back(&t);
    }
  }
  std::sort(ready.begin(), ready.end(), [now](const Task* a, const Task* b) {
    const double pa = dynamic_priority(*a, now);
    const double pb = dynamic_priority(*b, now);
    if (pa != pb) return pa > pb;
    if (a->wave != b->wave) return a->wave < b->wave;
    return a->id < b->id;
  });

  for (const Task* t : ready) {
    if (run->in_flight.size() >= policy_.max_parallel_per_project) break;
    const std::string id = t->id;
    run->in_flight.insert(id);
    pool_.submit([this, run, id]() { run_attempt(run, id); });
  }
}

ProjectStatus HybridScheduler::execute_project(const std::string& project_id) {
  auto run = find(project_id);
  if (!run) {
    ProjectStatus s;
    s.project_id = project_id;
    return s;
  }

  std::unique_lock<std::mutex> lk(run->mu);
  if (run->executing) {
    // Another caller drives this project; wait for it.
    run->cv.wait(lk, [&]() { return run->finished; });
    return snapshot(*run);
  }
  run->executing = true;
  run->started_at_unix_ms = clock_->now_unix_ms();
  log_info("scheduler", "executing project " + project_id);

  while (true) {
    const uint64_t now = clock_->now_unix_ms();
    if (!run->cancelled) {
      promote_ready(*run, now);
      expire_deadlines(*run, now);
    }
    if (all_terminal(*run)) break;
    if (!run->cancelled) dispatch(run, now);
    run->cv.wait_for(lk, std::chrono::milliseconds(std::max<uint64_t>(policy_.poll_interval_ms, 1)));
  }

  run->finished = true;
  run->finished_at_unix_ms = clock_->now_unix_ms();
  ProjectStatus status = snapshot(*run);
  run->cv.notify_all();
  lk.unlock();

  log_info("scheduler", "project " + project_id + " finished: " + std::to_string(status.completed) + " completed, " +
                            std::to_string(status.failed) + " failed, " + std::to_string(status.blocked) +
                            " blocked, " + std::to_string(status.cancelled_tasks) + " cancelled");
  emit_project_event(EventKind::project_finished, project_id, status.cancelled ? "cancelled" : "finished",
                     status.total_actual_units, status.finished_at_unix_ms);
  return status;
}

bool HybridScheduler::cancel_project(const std::string& project_id) {
  auto run = find(project_id);
  if (!run) return false;
  {
    std::lock_guard<std::mutex> lk(run->mu);
    run->cancelled = true;
    const uint64_t now = clock_->now_unix_ms();
    for (auto& t : run->dag.tasks) {
      if (is_terminal(t.status)) continue;
      t.error_code = ErrorCode::cancelled;
      t.error = "project cancelled";
      transition(*run, t, TaskStatus::cancelled, "cancelled", now);
    }
  }
  run->cv.notify_all();
  log_info("scheduler", "cancelled project " + project_id);
  return true;
}

void HybridScheduler::run_attempt(const std::shared_ptr<ProjectRun>& run, const std::string& task_id) {
  auto release = [&](std::unique_lock<std::mutex>& lk) {
    run->in_flight.erase(task_id);
    lk.unlock();
    run->cv.notify_all();
  };

  Task task;
  {
    std::unique_lock<std::mutex> lk(run->mu);
    Task& t = run->task(task_id);
    if (run->cancelled || t.status != TaskStatus::queued) {
      release(lk);
      return;
    }
    task = t;
  }

  // 1. Cache. A hit completes the task without the governor.
  if (task.cacheable) {
    CacheQuery q;
    q.input = task.input;
    q.task_type = task.task_type;
    q.context_prefix = task.context_prefix;
    const CacheLookupResult hit = cache_.lookup(q);
    if (hit.hit) {
      std::unique_lock<std::mutex> lk(run->mu);
      Task& t = run->task(task_id);
      if (!run->cancelled && t.status == TaskStatus::queued) {
        t.result = hit.response;
        t.cache_tier_hit = to_string(hit.tier);
        t.actual_units = 0;
        t.error_code = ErrorCode::none;
        t.error.clear();
        transition(*run, t, TaskStatus::completed, "completed", clock_->now_unix_ms());
      }
      release(lk);
      return;
    }
  }

  // 2. Admission.
  TaskResourceRequest req;
  req.task_id = task.id;
  req.project_id = task.project_id;
  req.task_type = task.task_type;
  req.estimated_units = task.estimated_units;
  req.priority = task.priority;
  req.mandatory_high_tier = task.mandatory_high_tier;
  req.deadline_unix_ms = task.deadline_unix_ms;
  const ResourceAllocation alloc = governor_.request_resources(req);

  if (!alloc.allocated) {
    std::unique_lock<std::mutex> lk(run->mu);
    Task& t = run->task(task_id);
    const uint64_t now = clock_->now_unix_ms();
    if (!run->cancelled && t.status == TaskStatus::queued) {
      ++t.admission_denials;
      if (t.deadline_unix_ms != 0 && now >= t.deadline_unix_ms) {
        fail_terminal(*run, t, ErrorCode::deadline_exceeded, "deadline passed awaiting admission: " + alloc.reason,
                      now);
      } else {
        const uint64_t hint = alloc.retry_after_ms > 0 ? alloc.retry_after_ms : kStoreRetryMs;
        t.next_eligible_at_unix_ms = now + std::min(hint, policy_.requeue_delay_cap_ms);
        t.error_code = alloc.error_code;
        t.error = alloc.reason;
        emit_task_event(t, "requeued", now);
      }
    }
    release(lk);
    return;
  }

  // 3. Run.
  {
    std::unique_lock<std::mutex> lk(run->mu);
    Task& t = run->task(task_id);
    if (run->cancelled || t.status != TaskStatus::queued) {
      lk.unlock();
      // Give the reservation back.
      const UsageAck ack = governor_.record_usage(task_id, alloc.tier, 0);
      if (!ack.ok) log_warn("scheduler", "reservation of " + task_id + " not released: " + ack.reason);
      lk.lock();
      release(lk);
      return;
    }
    t.allocated_tier = alloc.tier;
    t.started_at_unix_ms = clock_->now_unix_ms();
    transition(*run, t, TaskStatus::running, "running", t.started_at_unix_ms);
    task = t;
  }

  ExecutorResult er;
  bool overran = false;
  uint64_t duration_ns = 0;
  {
    ScopeTimer timer(duration_ns);
    if (auto r = watchdog_.run(task, policy_.executor_timeout_ms)) {
      er = std::move(*r);
    } else {
      overran = true;
    }
  }
  const uint64_t elapsed_ms = duration_ns / 1000000;
  const bool timed_out = overran || er.timed_out ||
                         (policy_.executor_timeout_ms > 0 && elapsed_ms > policy_.executor_timeout_ms);
  const bool success = er.success && !timed_out;
  // An abandoned call is charged its full reservation.
  const uint64_t used_units = overran ? alloc.reserved_units : er.actual_units;
  emit_task_event(task, overran ? "timed_out" : "executed", clock_->now_unix_ms(), duration_ns);

  // Usage and learning are recorded even when the result is discarded.
  const UsageAck ack = governor_.record_usage(task_id, alloc.tier, used_units);
  if (!ack.ok) log_warn("scheduler", "usage for " + task_id + " not recorded: " + ack.reason);
  router_.record_outcome(task.task_type, alloc.tier, success);

  std::unique_lock<std::mutex> lk(run->mu);
  Task& t = run->task(task_id);
  const uint64_t now = clock_->now_unix_ms();
  t.actual_units += used_units;
  if (run->cancelled || t.status != TaskStatus::running) {
    log_debug("scheduler", "discarding result of " + task_id + " after cancellation");
    release(lk);
    return;
  }

  if (success) {
    if (t.cacheable) {
      const auto& gp = governor_.policy();
      CacheStoreRequest store;
      store.query.input = t.input;
      store.query.task_type = t.task_type;
      store.query.context_prefix = t.context_prefix;
      store.response = er.result;
      store.cost_units = static_cast<double>(er.actual_units) * (alloc.tier == Tier::high_capability
                                                                     ? gp.high_tier_cost_multiplier
                                                                     : gp.economical_tier_cost_multiplier);
      const CacheStoreResult stored = cache_.store(store);
      if (!stored.ok) log_warn("scheduler", "result of " + task_id + " not cached");
    }
    t.result = er.result;
    t.error_code = ErrorCode::none;
    t.error.clear();
    transition(*run, t, TaskStatus::completed, "completed", now);
  } else {
    ++t.retry_count;
    t.error_code = timed_out ? ErrorCode::executor_timeout : ErrorCode::executor_failure;
    t.error = timed_out && er.error.empty() ? "executor exceeded " + std::to_string(policy_.executor_timeout_ms) + " ms"
                                            : er.error;
    const uint32_t max_retries = t.max_retries.value_or(policy_.max_retries);
    if (t.retry_count > max_retries) {
      fail_terminal(*run, t, t.error_code, t.error, now);
    } else {
      t.next_eligible_at_unix_ms = now + retry_backoff_ms(t.retry_count);
      t.status = TaskStatus::queued;
      emit_task_event(t, "retry", now);
    }
  }
  release(lk);
}

ProjectStatus HybridScheduler::snapshot(const ProjectRun& run) const {
  ProjectStatus s;
  s.project_id = run.dag.project_id;
  s.known = true;
  s.executing = run.executing && !run.finished;
  s.finished = run.finished;
  s.cancelled = run.cancelled;
  s.total = run.dag.tasks.size();
  for (const auto& t : run.dag.tasks) {
    switch (t.status) {
      case TaskStatus::pending: ++s.pending; break;
      case TaskStatus::queued: ++s.queued; break;
      case TaskStatus::running: ++s.running; break;
      case TaskStatus::completed: ++s.completed; break;
      case TaskStatus::failed: ++s.failed; break;
      case TaskStatus::blocked: ++s.blocked; break;
      case TaskStatus::cancelled: ++s.cancelled_tasks; break;
    }
    if (!t.cache_tier_hit.empty()) ++s.cache_hits;
    s.total_actual_units += t.actual_units;
    s.total_retries += t.retry_count;
    s.admission_denials += t.admission_denials;
  }
  s.tasks = run.dag.tasks;
  if (s.total > 0) s.completion_rate = static_cast<double>(s.completed) / static_cast<double>(s.total);
  if (s.completed + s.failed > 0) {
    s.success_rate = static_cast<double>(s.completed) / static_cast<double>(s.completed + s.failed);
  }
  s.started_at_unix_ms = run.started_at_unix_ms;
  s.finished_at_unix_ms = run.finished_at_unix_ms;
  if (run.started_at_unix_ms != 0) {
    const uint64_t end = run.finished ? run.finished_at_unix_ms : clock_->now_unix_ms();
    s.elapsed_ms = end > run.started_at_unix_ms ? end - run.started_at_unix_ms : 0;
  }
  return s;
}

std::optional<ProjectStatus> HybridScheduler::project_status(const std::string& project_id) const {
  auto run = find(project_id);
  if (!run) return std::nullopt;
  std::lock_guard<std::mutex> lk(run->mu);
  return snapshot(*run);
}

std::optional<ExecutionPlan> HybridScheduler::execution_plan(const std::string& project_id) const {
  auto run = find(project_id);
  if (!run) return std::nullopt;
  std::lock_guard<std::mutex> lk(run->mu);
  return run->plan;
}

std::vector<std::string> HybridScheduler::list_projects() const {
  std::lock_guard<std::mutex> lk(projects_mu_);
  std::vector<std::string> ids;
  ids.reserve(projects_.size());
  for (const auto& [id, run] : projects_) ids.push_back(id);
  return ids;
}

}  // namespace helios

#pragma once

// helios/scheduler.hpp — Hybrid Scheduler: DAG planning and parallel execution.
//
// TASK STATE MACHINE:
//   pending --(deps completed)--> queued --(admitted)--> running
//   running --> completed
//           --> queued      executor failure/timeout, retry_count <= max_retries,
//                           next_eligible_at = now + base * 2^(retry_count-1)
//           --> failed      retries exhausted
//   queued  --> queued      admission denied, next_eligible_at = now + retry hint
//           --> completed   cache hit (governor never consulted)
//           --> failed      deadline passed (deadline_exceeded)
//   any non-terminal --> blocked    a dependency failed terminally
//   any non-terminal --> cancelled  cancel_project()
//
// CONCURRENCY:
//   One WorkerPool per scheduler (global_max_concurrency threads) is shared by
//   every executing project. execute_project() runs a coordinator loop on the
//   caller's thread that promotes and dispatches tasks; attempts run on pool
//   threads. A project never has more than max_parallel_per_project attempts
//   in flight. All task state of a project is guarded by its ProjectRun::mu,
//   and a task has at most one attempt in flight. Each executor call runs on
//   its own thread and the attempt waits at most executor_timeout_ms for it;
//   an overrunning call is abandoned (its result is discarded) and joined once
//   the executor returns.
//
// INVARIANTS:
//   1. schedule_project() either accepts the whole graph or creates nothing.
//   2. A task starts only after every dependency is completed.
//   3. Each task's wave index is strictly greater than its dependencies'.
//   4. failed, blocked and cancelled stay distinct in every status report.
//   5. Results of attempts that finish after cancellation are discarded and
//      never cached; their usage is still recorded with the governor.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "helios/cache.hpp"
#include "helios/clock.hpp"
#include "helios/config.hpp"
#include "helios/executor.hpp"
#include "helios/governor.hpp"
#include "helios/router.hpp"
#include "helios/types.hpp"

namespace helios {

// Fixed-size thread pool. Jobs must not throw.
class WorkerPool {
 public:
  explicit WorkerPool(size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void submit(std::function<void()> job);
  size_t size() const { return threads_.size(); }
  size_t busy() const { return busy_.load(std::memory_order_relaxed); }

 private:
  void worker_loop();

  std::vector<std::thread> threads_;
  std::deque<std::function<void()>> jobs_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_{false};
  std::atomic<size_t> busy_{0};
};

// Bounds IExecutor::execute() by a timeout. Calls that overrun keep their
// thread until the executor returns; finished ones are reaped on later calls
// and the destructor joins the rest.
class ExecutorWatchdog {
 public:
  explicit ExecutorWatchdog(IExecutor& executor) : executor_(executor) {}
  ~ExecutorWatchdog();

  ExecutorWatchdog(const ExecutorWatchdog&) = delete;
  ExecutorWatchdog& operator=(const ExecutorWatchdog&) = delete;

  // nullopt when the call did not return within timeout_ms (0 = no limit).
  std::optional<ExecutorResult> run(const Task& task, uint64_t timeout_ms);

  // Abandoned calls whose executor has not returned yet.
  size_t overdue() const;

 private:
  struct Call {
    std::mutex mu;
    std::condition_variable cv;
    bool done{false};
    ExecutorResult result;
  };

  void reap_locked();

  IExecutor& executor_;
  mutable std::mutex mu_;
  std::vector<std::pair<std::shared_ptr<Call>, std::thread>> overdue_;
};

struct ExecutionPlan {
  std::string project_id;
  std::vector<std::vector<std::string>> waves;  // each ordered by dynamic priority, then id
  std::map<std::string, size_t> wave_of;
  std::vector<std::string> critical_path;
  size_t task_count{0};
  double estimated_cost_units{0.0};
  uint64_t estimated_duration_ms{0};
};

std::string execution_plan_to_json(const ExecutionPlan& plan);

struct ScheduleResult {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string error;
  ExecutionPlan plan;
};

struct ProjectStatus {
  std::string project_id;
  bool known{false};
  bool executing{false};
  bool finished{false};
  bool cancelled{false};

  size_t total{0};
  size_t pending{0};
  size_t queued{0};
  size_t running{0};
  size_t completed{0};
  size_t failed{0};
  size_t blocked{0};
  size_t cancelled_tasks{0};

  double completion_rate{0.0};  // completed / total
  double success_rate{0.0};     // completed / (completed + failed)
  uint64_t started_at_unix_ms{0};
  uint64_t finished_at_unix_ms{0};
  uint64_t elapsed_ms{0};
  size_t cache_hits{0};
  uint64_t total_actual_units{0};
  uint64_t total_retries{0};
  uint64_t admission_denials{0};
  std::vector<Task> tasks;
};

std::string project_status_to_json(const ProjectStatus& s, bool include_tasks = true);

class HybridScheduler {
 public:
  HybridScheduler(ResourceGovernor& governor, EconomicRouter& router, CacheManager& cache, IExecutor& executor,
                  SchedulerPolicy policy, std::shared_ptr<const Clock> clock);
  ~HybridScheduler();

  HybridScheduler(const HybridScheduler&) = delete;
  HybridScheduler& operator=(const HybridScheduler&) = delete;

  ScheduleResult schedule_project(TaskDAG dag);

  // Blocks until every task of the project is terminal. An unknown project
  // returns a status with known = false.
  ProjectStatus execute_project(const std::string& project_id);

  // Non-blocking. Returns false for unknown projects.
  bool cancel_project(const std::string& project_id);

  std::optional<ProjectStatus> project_status(const std::string& project_id) const;
  std::optional<ExecutionPlan> execution_plan(const std::string& project_id) const;
  std::vector<std::string> list_projects() const;

  // priority + deadline bonus - 0.5 * retry_count, floored at 1.
  static double dynamic_priority(const Task& task, uint64_t now_unix_ms);
  uint64_t retry_backoff_ms(uint32_t retry_count) const;

  const SchedulerPolicy& policy() const { return policy_; }
  size_t overdue_executor_calls() const { return watchdog_.overdue(); }

 private:
  struct ProjectRun {
    mutable std::mutex mu;
    std::condition_variable cv;
    TaskDAG dag;
    std::map<std::string, size_t> index;
    std::map<std::string, std::vector<std::string>> dependents;
    ExecutionPlan plan;
    std::set<std::string> in_flight;
    bool executing{false};
    bool finished{false};
    bool cancelled{false};
    uint64_t started_at_unix_ms{0};
    uint64_t finished_at_unix_ms{0};

    Task& task(const std::string& id) { return dag.tasks[index.at(id)]; }
  };

  std::shared_ptr<ProjectRun> find(const std::string& project_id) const;
  ExecutionPlan build_plan(const TaskDAG& dag, const std::map<std::string, size_t>& index,
                           const std::vector<std::vector<std::string>>& waves, uint64_t now) const;

  // Caller holds run.mu.
  void promote_ready(ProjectRun& run, uint64_t now);
  void expire_deadlines(ProjectRun& run, uint64_t now);
  void dispatch(const std::shared_ptr<ProjectRun>& run, uint64_t now);
  void transition(ProjectRun& run, Task& task, TaskStatus to, const std::string& outcome, uint64_t now);
  void fail_terminal(ProjectRun& run, Task& task, ErrorCode code, const std::string& error, uint64_t now);
  bool all_terminal(const ProjectRun& run) const;
  ProjectStatus snapshot(const ProjectRun& run) const;

  // Pool thread: one attempt of one task.
  void run_attempt(const std::shared_ptr<ProjectRun>& run, const std::string& task_id);

  ResourceGovernor& governor_;
  EconomicRouter& router_;
  CacheManager& cache_;
  IExecutor& executor_;
  SchedulerPolicy policy_;
  std::shared_ptr<const Clock> clock_;

  mutable std::mutex projects_mu_;
  std::map<std::string, std::shared_ptr<ProjectRun>> projects_;

  // Destroyed after pool_, so attempts still waiting on it have finished.
  ExecutorWatchdog watchdog_;

  // Last member: joined first on destruction, while everything above is alive.
  WorkerPool pool_;
};

}  // namespace helios

#pragma once

// helios/types.hpp — Core data model of the Helios orchestration core.
//
// OWNERSHIP:
//   - UsageWindow and its history are owned by the ResourceGovernor and live in
//     the shared state store. Values here are snapshots.
//   - Task / TaskDAG are owned by the HybridScheduler for the projects it is
//     running. Callers hand a TaskDAG over by value at schedule time.
//   - BudgetStatus is derived on demand and never stored.
//
// MEMORY OWNERSHIP:
//   All members are value-owned. No raw pointer members in any public type.
//
// SERIALIZATION:
//   Every persisted or API-visible type has a *_to_json / *_from_json pair.
//   Persisted records carry "format" = version::STATE_FORMAT_VERSION.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "helios/jsonlite.hpp"

namespace helios {

enum class ErrorCode {
  none,
  admission_denied,
  deadline_exceeded,
  cyclic_dependency,
  executor_failure,
  executor_timeout,
  dependency_failed,
  cache_unavailable,
  malformed_request,
  unknown_project,
  project_active,
  state_store_unavailable,
  state_store_conflict,
  config_invalid,
  cancelled,
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// Tier — backend capability/cost level.
// ---------------------------------------------------------------------------
enum class Tier {
  high_capability,
  economical,
};

std::string to_string(Tier tier);
std::optional<Tier> tier_from_string(const std::string& s);

enum class BudgetHealth {
  normal,     // utilization < throttle threshold
  throttled,  // throttle threshold <= utilization <= critical threshold
  critical,   // utilization > critical threshold
};

std::string to_string(BudgetHealth health);

enum class AdmissionDecision {
  admitted,
  queued,    // not admitted, not rejected: retry at the hinted time
  rejected,
};

std::string to_string(AdmissionDecision decision);

enum class TaskStatus {
  pending,
  queued,
  running,
  completed,
  failed,
  blocked,
  cancelled,
};

std::string to_string(TaskStatus status);
bool is_terminal(TaskStatus status);

// ---------------------------------------------------------------------------
// Reservation — provisional charge made at admission, reconciled by
// ResourceGovernor::record_usage().
// ---------------------------------------------------------------------------
struct Reservation {
  std::string task_id;
  std::string project_id;
  Tier tier{Tier::economical};
  uint64_t units{0};
  uint64_t reserved_at_unix_ms{0};
  std::string worker_id;
};

// ---------------------------------------------------------------------------
// UsageWindow — one fixed-duration accounting period.
// ---------------------------------------------------------------------------
// INVARIANTS:
//   1. high_units + economical_units <= ceiling_units at all times. Usage that
//      arrives beyond the ceiling is accounted in overage_units.
//   2. A closed window (closed_at_unix_ms != 0) is never modified again.
//   3. Open reservations are counted in the tier counters until reconciled.
struct UsageWindow {
  std::string window_id;
  uint64_t start_unix_ms{0};
  uint64_t duration_ms{0};
  uint64_t ceiling_units{0};

  uint64_t high_units{0};
  uint64_t economical_units{0};
  uint64_t overage_units{0};

  uint64_t admitted_count{0};
  uint64_t queued_count{0};
  uint64_t rejected_count{0};
  uint64_t throttle_events{0};

  // Operator override (force_throttle). Carried over on rollover.
  bool manual_throttle{false};
  std::string throttle_reason;

  uint64_t closed_at_unix_ms{0};
  std::map<std::string, Reservation> reservations;

  uint64_t used_units() const { return high_units + economical_units; }
  uint64_t remaining_units() const {
    return used_units() >= ceiling_units ? 0 : ceiling_units - used_units();
  }
  uint64_t end_unix_ms() const { return start_unix_ms + duration_ms; }
  bool elapsed_at(uint64_t now_unix_ms) const {
    return now_unix_ms >= start_unix_ms && now_unix_ms - start_unix_ms >= duration_ms;
  }
  // Total usage attributed to this window, including overage.
  uint64_t total_recorded_units() const { return used_units() + overage_units; }
};

jsonlite::Object usage_window_to_object(const UsageWindow& w);
std::string usage_window_to_json(const UsageWindow& w);
bool usage_window_from_object(const jsonlite::Object& obj, UsageWindow& out, std::string* error);
bool usage_window_from_json(const std::string& text, UsageWindow& out, std::string* error);

// ---------------------------------------------------------------------------
// BudgetStatus — derived, read-only snapshot of the current window.
// ---------------------------------------------------------------------------
struct BudgetStatus {
  std::string window_id;
  uint64_t ceiling_units{0};
  uint64_t used_units{0};
  uint64_t high_units{0};
  uint64_t economical_units{0};
  uint64_t overage_units{0};
  uint64_t remaining_units{0};
  double utilization_pct{0.0};
  BudgetHealth health{BudgetHealth::normal};
  bool is_throttling{false};
  bool manual_throttle{false};
  std::string throttle_reason;
  uint64_t window_start_unix_ms{0};
  uint64_t window_end_unix_ms{0};
  uint64_t ms_remaining_in_window{0};
  size_t open_reservations{0};
};

std::string budget_status_to_json(const BudgetStatus& s);

// ---------------------------------------------------------------------------
// TaskResourceRequest — admission request.
// ---------------------------------------------------------------------------
struct TaskResourceRequest {
  std::string task_id;
  std::string project_id;
  std::string task_type;
  uint64_t estimated_units{1};
  int priority{5};                    // 0..10
  bool mandatory_high_tier{false};
  uint64_t deadline_unix_ms{0};       // 0 = no deadline
};

// Returns false (with *error set) for missing ids, priority outside 0..10 or
// zero estimated units.
bool validate_request(const TaskResourceRequest& req, std::string* error);
bool request_from_object(const jsonlite::Object& obj, TaskResourceRequest& out, std::string* error);
std::string request_to_json(const TaskResourceRequest& req);

// ---------------------------------------------------------------------------
// ResourceAllocation — the governor's decision. Callers branch on `allocated`.
// ---------------------------------------------------------------------------
struct ResourceAllocation {
  bool allocated{false};
  AdmissionDecision decision{AdmissionDecision::rejected};
  Tier tier{Tier::economical};
  std::string reason;
  ErrorCode error_code{ErrorCode::none};
  uint64_t retry_after_ms{0};
  uint64_t retry_at_unix_ms{0};
  uint64_t reserved_units{0};
  BudgetHealth zone{BudgetHealth::normal};
  std::string window_id;
  double router_confidence{0.0};
};

std::string allocation_to_json(const ResourceAllocation& a);

// ---------------------------------------------------------------------------
// UsageAck — result of ResourceGovernor::record_usage().
// ---------------------------------------------------------------------------
struct UsageAck {
  bool ok{false};
  bool had_reservation{false};
  bool reservation_in_closed_window{false};
  uint64_t reserved_units{0};
  uint64_t actual_units{0};
  int64_t correction_units{0};   // actual - reserved
  uint64_t overage_units{0};     // part of this record beyond the ceiling
  std::string window_id;
  ErrorCode error_code{ErrorCode::none};
  std::string reason;
};

std::string usage_ack_to_json(const UsageAck& a);

// ---------------------------------------------------------------------------
// UsageMetrics — current-window consumption report.
// ---------------------------------------------------------------------------
struct UsageMetrics {
  std::string window_id;
  double units_per_hour{0.0};
  double high_pct{0.0};
  double economical_pct{0.0};
  double cost_efficiency_pct{0.0};   // economical share of used units
  double weighted_cost_units{0.0};   // tier-multiplied cost
  double all_high_cost_units{0.0};   // cost had every unit run on the high tier
  uint64_t admitted_count{0};
  uint64_t queued_count{0};
  uint64_t rejected_count{0};
  uint64_t throttle_events{0};
  uint64_t overage_units{0};
  size_t windows_in_history{0};
  uint64_t history_total_units{0};
};

std::string usage_metrics_to_json(const UsageMetrics& m);

// ---------------------------------------------------------------------------
// Task — schedulable unit. Mutated only by the scheduler, one writer per task.
// ---------------------------------------------------------------------------
struct Task {
  std::string id;
  std::string project_id;
  std::string name;
  std::string task_type;            // agent / executor type
  std::string input;                // opaque payload, also the cache key input
  std::string context_prefix;       // optional reusable context for L1
  uint64_t estimated_units{1};
  int priority{5};
  bool mandatory_high_tier{false};
  bool cacheable{true};
  std::vector<std::string> depends_on;
  uint64_t deadline_unix_ms{0};
  std::optional<uint32_t> max_retries;  // unset = scheduler policy

  // Runtime state.
  TaskStatus status{TaskStatus::pending};
  uint32_t retry_count{0};
  uint32_t admission_denials{0};
  std::optional<Tier> allocated_tier;
  std::string result;
  std::string error;
  ErrorCode error_code{ErrorCode::none};
  std::string cache_tier_hit;       // "" when executed
  uint64_t actual_units{0};
  uint64_t queued_at_unix_ms{0};
  uint64_t started_at_unix_ms{0};
  uint64_t completed_at_unix_ms{0};
  uint64_t next_eligible_at_unix_ms{0};
  size_t wave{0};
};

bool task_from_object(const jsonlite::Object& obj, Task& out, std::string* error);
jsonlite::Object task_to_object(const Task& t);

// ---------------------------------------------------------------------------
// TaskDAG — a project's tasks (arena) plus dependency edges as id lists.
// ---------------------------------------------------------------------------
// INVARIANT: the edge set is acyclic. Enforced by
// HybridScheduler::schedule_project(), which rejects the whole graph otherwise.
struct TaskDAG {
  std::string project_id;
  std::vector<Task> tasks;

  Task& add_task(Task t);
};

bool dag_from_json(const std::string& text, TaskDAG& out, std::string* error);
bool dag_from_object(const jsonlite::Object& obj, TaskDAG& out, std::string* error);

}  // namespace helios

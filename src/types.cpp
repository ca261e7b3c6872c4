#include "helios/types.hpp"

#include <cmath>
#include <sstream>

#include "helios/version.hpp"

namespace helios {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

Value str(const std::string& s) { return Value{s}; }
Value u64(uint64_t v) { return Value{v}; }
Value dbl(double v) { return Value{v}; }
Value flag(bool v) { return Value{v}; }

// Integer in [lo, hi] from a JSON number (uint64 or integral double).
bool read_int(const Object& obj, const std::string& key, int lo, int hi, int& out,
              std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  double d = 0.0;
  if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    d = static_cast<double>(std::get<std::uint64_t>(it->second.v));
  } else if (std::holds_alternative<double>(it->second.v)) {
    d = std::get<double>(it->second.v);
  } else {
    if (error) *error = key + " must be a number";
    return false;
  }
  if (d != std::floor(d) || d < lo || d > hi) {
    if (error) *error = key + " must be an integer in [" + std::to_string(lo) + "," + std::to_string(hi) + "]";
    return false;
  }
  out = static_cast<int>(d);
  return true;
}

Object reservation_to_object(const Reservation& r) {
  Object o;
  o["task_id"] = str(r.task_id);
  o["project_id"] = str(r.project_id);
  o["tier"] = str(to_string(r.tier));
  o["units"] = u64(r.units);
  o["reserved_at"] = u64(r.reserved_at_unix_ms);
  o["worker_id"] = str(r.worker_id);
  return o;
}

Reservation reservation_from_object(const Object& o) {
  Reservation r;
  r.task_id = jsonlite::get_string(o, "task_id");
  r.project_id = jsonlite::get_string(o, "project_id");
  r.tier = tier_from_string(jsonlite::get_string(o, "tier")).value_or(Tier::economical);
  r.units = jsonlite::get_u64(o, "units");
  r.reserved_at_unix_ms = jsonlite::get_u64(o, "reserved_at");
  r.worker_id = jsonlite::get_string(o, "worker_id");
  return r;
}

}  // namespace

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::admission_denied: return "admission_denied";
    case ErrorCode::deadline_exceeded: return "deadline_exceeded";
    case ErrorCode::cyclic_dependency: return "cyclic_dependency";
    case ErrorCode::executor_failure: return "executor_failure";
    case ErrorCode::executor_timeout: return "executor_timeout";
    case ErrorCode::dependency_failed: return "dependency_failed";
    case ErrorCode::cache_unavailable: return "cache_unavailable";
    case ErrorCode::malformed_request: return "malformed_request";
    case ErrorCode::unknown_project: return "unknown_project";
    case ErrorCode::project_active: return "project_active";
    case ErrorCode::state_store_unavailable: return "state_store_unavailable";
    case ErrorCode::state_store_conflict: return "state_store_conflict";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::cancelled: return "cancelled";
  }
  return "";
}

std::string to_string(Tier tier) {
  return tier == Tier::high_capability ? "high_capability" : "economical";
}

std::optional<Tier> tier_from_string(const std::string& s) {
  if (s == "high_capability" || s == "high") return Tier::high_capability;
  if (s == "economical" || s == "economy") return Tier::economical;
  return std::nullopt;
}

std::string to_string(BudgetHealth health) {
  switch (health) {
    case BudgetHealth::normal: return "normal";
    case BudgetHealth::throttled: return "throttled";
    case BudgetHealth::critical: return "critical";
  }
  return "normal";
}

std::string to_string(AdmissionDecision decision) {
  switch (decision) {
    case AdmissionDecision::admitted: return "admitted";
    case AdmissionDecision::queued: return "queued";
    case AdmissionDecision::rejected: return "rejected";
  }
  return "rejected";
}

std::string to_string(TaskStatus status) {
  switch (status) {
    case TaskStatus::pending: return "pending";
    case TaskStatus::queued: return "queued";
    case TaskStatus::running: return "running";
    case TaskStatus::completed: return "completed";
    case TaskStatus::failed: return "failed";
    case TaskStatus::blocked: return "blocked";
    case TaskStatus::cancelled: return "cancelled";
  }
  return "pending";
}

bool is_terminal(TaskStatus status) {
  return status == TaskStatus::completed || status == TaskStatus::failed ||
         status == TaskStatus::blocked || status == TaskStatus::cancelled;
}

// ---------------------------------------------------------------------------
// UsageWindow
// ---------------------------------------------------------------------------

Object usage_window_to_object(const UsageWindow& w) {
  Object o;
  o["format"] = u64(version::STATE_FORMAT_VERSION);
  o["window_id"] = str(w.window_id);
  o["start"] = u64(w.start_unix_ms);
  o["duration_ms"] = u64(w.duration_ms);
  o["ceiling"] = u64(w.ceiling_units);
  o["high_units"] = u64(w.high_units);
  o["economical_units"] = u64(w.economical_units);
  o["overage_units"] = u64(w.overage_units);
  o["admitted"] = u64(w.admitted_count);
  o["queued"] = u64(w.queued_count);
  o["rejected"] = u64(w.rejected_count);
  o["throttle_events"] = u64(w.throttle_events);
  o["manual_throttle"] = flag(w.manual_throttle);
  o["throttle_reason"] = str(w.throttle_reason);
  o["closed_at"] = u64(w.closed_at_unix_ms);
  Object res;
  for (const auto& [id, r] : w.reservations) res[id] = Value{reservation_to_object(r)};
  o["reservations"] = Value{std::move(res)};
  return o;
}

std::string usage_window_to_json(const UsageWindow& w) {
  return jsonlite::to_json(usage_window_to_object(w));
}

bool usage_window_from_object(const Object& obj, UsageWindow& out, std::string* error) {
  const auto format = jsonlite::get_u64(obj, "format", 0);
  if (format == 0 || format > version::STATE_FORMAT_VERSION) {
    if (error) *error = "unsupported window format " + std::to_string(format);
    return false;
  }
  UsageWindow w;
  w.window_id = jsonlite::get_string(obj, "window_id");
  if (w.window_id.empty()) {
    if (error) *error = "window record missing window_id";
    return false;
  }
  w.start_unix_ms = jsonlite::get_u64(obj, "start");
  w.duration_ms = jsonlite::get_u64(obj, "duration_ms");
  w.ceiling_units = jsonlite::get_u64(obj, "ceiling");
  w.high_units = jsonlite::get_u64(obj, "high_units");
  w.economical_units = jsonlite::get_u64(obj, "economical_units");
  w.overage_units = jsonlite::get_u64(obj, "overage_units");
  w.admitted_count = jsonlite::get_u64(obj, "admitted");
  w.queued_count = jsonlite::get_u64(obj, "queued");
  w.rejected_count = jsonlite::get_u64(obj, "rejected");
  w.throttle_events = jsonlite::get_u64(obj, "throttle_events");
  w.manual_throttle = jsonlite::get_bool(obj, "manual_throttle");
  w.throttle_reason = jsonlite::get_string(obj, "throttle_reason");
  w.closed_at_unix_ms = jsonlite::get_u64(obj, "closed_at");
  for (const auto& [id, v] : jsonlite::get_object(obj, "reservations")) {
    if (std::holds_alternative<Object>(v.v)) {
      w.reservations[id] = reservation_from_object(std::get<Object>(v.v));
    }
  }
  out = std::move(w);
  return true;
}

bool usage_window_from_json(const std::string& text, UsageWindow& out, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const Object obj = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return false;
  }
  return usage_window_from_object(obj, out, error);
}

// ---------------------------------------------------------------------------
// BudgetStatus / allocation / ack / metrics
// ---------------------------------------------------------------------------

std::string budget_status_to_json(const BudgetStatus& s) {
  Object o;
  o["window_id"] = str(s.window_id);
  o["ceiling_units"] = u64(s.ceiling_units);
  o["used_units"] = u64(s.used_units);
  o["high_units"] = u64(s.high_units);
  o["economical_units"] = u64(s.economical_units);
  o["overage_units"] = u64(s.overage_units);
  o["remaining_units"] = u64(s.remaining_units);
  o["utilization_pct"] = dbl(s.utilization_pct);
  o["health"] = str(to_string(s.health));
  o["is_throttling"] = flag(s.is_throttling);
  o["manual_throttle"] = flag(s.manual_throttle);
  o["throttle_reason"] = str(s.throttle_reason);
  o["window_start"] = u64(s.window_start_unix_ms);
  o["window_end"] = u64(s.window_end_unix_ms);
  o["ms_remaining_in_window"] = u64(s.ms_remaining_in_window);
  o["open_reservations"] = u64(s.open_reservations);
  return jsonlite::to_json(o);
}

bool validate_request(const TaskResourceRequest& req, std::string* error) {
  if (req.task_id.empty()) {
    if (error) *error = "task_id is required";
    return false;
  }
  if (req.project_id.empty()) {
    if (error) *error = "project_id is required";
    return false;
  }
  if (req.priority < 0 || req.priority > 10) {
    if (error) *error = "priority must be in [0,10]";
    return false;
  }
  if (req.estimated_units == 0) {
    if (error) *error = "estimated_units must be >= 1";
    return false;
  }
  return true;
}

bool request_from_object(const Object& obj, TaskResourceRequest& out, std::string* error) {
  TaskResourceRequest r;
  r.task_id = jsonlite::get_string(obj, "task_id");
  r.project_id = jsonlite::get_string(obj, "project_id");
  r.task_type = jsonlite::get_string(obj, "task_type");
  r.estimated_units = jsonlite::get_u64(obj, "estimated_units", 1);
  if (!read_int(obj, "priority", 0, 10, r.priority, error)) return false;
  r.mandatory_high_tier = jsonlite::get_bool(obj, "mandatory_high_tier");
  r.deadline_unix_ms = jsonlite::get_u64(obj, "deadline_unix_ms");
  if (!validate_request(r, error)) return false;
  out = std::move(r);
  return true;
}

std::string request_to_json(const TaskResourceRequest& req) {
  Object o;
  o["task_id"] = str(req.task_id);
  o["project_id"] = str(req.project_id);
  o["task_type"] = str(req.task_type);
  o["estimated_units"] = u64(req.estimated_units);
  o["priority"] = u64(static_cast<uint64_t>(req.priority));
  o["mandatory_high_tier"] = flag(req.mandatory_high_tier);
  o["deadline_unix_ms"] = u64(req.deadline_unix_ms);
  return jsonlite::to_json(o);
}

std::string allocation_to_json(const ResourceAllocation& a) {
  Object o;
  o["allocated"] = flag(a.allocated);
  o["decision"] = str(to_string(a.decision));
  o["tier"] = str(to_string(a.tier));
  o["reason"] = str(a.reason);
  o["error_code"] = str(to_string(a.error_code));
  o["retry_after_ms"] = u64(a.retry_after_ms);
  o["retry_at"] = u64(a.retry_at_unix_ms);
  o["reserved_units"] = u64(a.reserved_units);
  o["zone"] = str(to_string(a.zone));
  o["window_id"] = str(a.window_id);
  o["router_confidence"] = dbl(a.router_confidence);
  return jsonlite::to_json(o);
}

std::string usage_ack_to_json(const UsageAck& a) {
  std::ostringstream o;
  o << "{"
    << "\"ok\":" << (a.ok ? "true" : "false")
    << ",\"had_reservation\":" << (a.had_reservation ? "true" : "false")
    << ",\"reservation_in_closed_window\":" << (a.reservation_in_closed_window ? "true" : "false")
    << ",\"reserved_units\":" << a.reserved_units
    << ",\"actual_units\":" << a.actual_units
    << ",\"correction_units\":" << a.correction_units
    << ",\"overage_units\":" << a.overage_units
    << ",\"window_id\":\"" << jsonlite::escape(a.window_id) << "\""
    << ",\"error_code\":\"" << to_string(a.error_code) << "\""
    << ",\"reason\":\"" << jsonlite::escape(a.reason) << "\""
    << "}";
  return o.str();
}

std::string usage_metrics_to_json(const UsageMetrics& m) {
  Object o;
  o["window_id"] = str(m.window_id);
  o["units_per_hour"] = dbl(m.units_per_hour);
  Object mix;
  mix["high_capability_pct"] = dbl(m.high_pct);
  mix["economical_pct"] = dbl(m.economical_pct);
  o["tier_mix"] = Value{std::move(mix)};
  o["cost_efficiency_pct"] = dbl(m.cost_efficiency_pct);
  o["weighted_cost_units"] = dbl(m.weighted_cost_units);
  o["all_high_cost_units"] = dbl(m.all_high_cost_units);
  o["admitted"] = u64(m.admitted_count);
  o["queued"] = u64(m.queued_count);
  o["rejected"] = u64(m.rejected_count);
  o["throttle_events"] = u64(m.throttle_events);
  o["overage_units"] = u64(m.overage_units);
  o["windows_in_history"] = u64(m.windows_in_history);
  o["history_total_units"] = u64(m.history_total_units);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// Task / TaskDAG
// ---------------------------------------------------------------------------

bool task_from_object(const Object& obj, Task& out, std::string* error) {
  Task t;
  t.id = jsonlite::get_string(obj, "id");
  if (t.id.empty()) {
    if (error) *error = "task id is required";
    return false;
  }
  t.project_id = jsonlite::get_string(obj, "project_id");
  t.name = jsonlite::get_string(obj, "name", t.id);
  t.task_type = jsonlite::get_string(obj, "task_type", jsonlite::get_string(obj, "agent_type"));
  t.input = jsonlite::get_string(obj, "input");
  t.context_prefix = jsonlite::get_string(obj, "context_prefix");
  t.estimated_units = jsonlite::get_u64(obj, "estimated_units", 1);
  if (!read_int(obj, "priority", 0, 10, t.priority, error)) {
    if (error) *error = "task " + t.id + ": " + *error;
    return false;
  }
  t.mandatory_high_tier = jsonlite::get_bool(obj, "mandatory_high_tier");
  t.cacheable = jsonlite::get_bool(obj, "cacheable", true);
  t.depends_on = jsonlite::get_string_array(obj, "depends_on");
  t.deadline_unix_ms = jsonlite::get_u64(obj, "deadline_unix_ms");
  if (jsonlite::has_key(obj, "max_retries")) {
    t.max_retries = static_cast<uint32_t>(jsonlite::get_u64(obj, "max_retries"));
  }
  out = std::move(t);
  return true;
}

Object task_to_object(const Task& t) {
  Object o;
  o["id"] = str(t.id);
  o["project_id"] = str(t.project_id);
  o["name"] = str(t.name);
  o["task_type"] = str(t.task_type);
  o["estimated_units"] = u64(t.estimated_units);
  o["priority"] = u64(static_cast<uint64_t>(t.priority));
  o["mandatory_high_tier"] = flag(t.mandatory_high_tier);
  Array deps;
  for (const auto& d : t.depends_on) deps.push_back(str(d));
  o["depends_on"] = Value{std::move(deps)};
  o["deadline_unix_ms"] = u64(t.deadline_unix_ms);
  o["status"] = str(to_string(t.status));
  o["retry_count"] = u64(t.retry_count);
  o["admission_denials"] = u64(t.admission_denials);
  o["tier"] = t.allocated_tier ? str(to_string(*t.allocated_tier)) : Value{nullptr};
  o["result"] = str(t.result);
  o["error"] = str(t.error);
  o["error_code"] = str(to_string(t.error_code));
  o["cache_tier_hit"] = str(t.cache_tier_hit);
  o["actual_units"] = u64(t.actual_units);
  o["started_at"] = u64(t.started_at_unix_ms);
  o["completed_at"] = u64(t.completed_at_unix_ms);
  o["wave"] = u64(t.wave);
  return o;
}

Task& TaskDAG::add_task(Task t) {
  if (t.project_id.empty()) t.project_id = project_id;
  tasks.push_back(std::move(t));
  return tasks.back();
}

bool dag_from_object(const Object& obj, TaskDAG& out, std::string* error) {
  TaskDAG dag;
  dag.project_id = jsonlite::get_string(obj, "project_id");
  if (dag.project_id.empty()) {
    if (error) *error = "project_id is required";
    return false;
  }
  auto it = obj.find("tasks");
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) {
    if (error) *error = "tasks must be an array";
    return false;
  }
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (!std::holds_alternative<Object>(item.v)) {
      if (error) *error = "each task must be an object";
      return false;
    }
    Task t;
    if (!task_from_object(std::get<Object>(item.v), t, error)) return false;
    dag.add_task(std::move(t));
  }
  out = std::move(dag);
  return true;
}

bool dag_from_json(const std::string& text, TaskDAG& out, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const Object obj = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return false;
  }
  return dag_from_object(obj, out, error);
}

}  // namespace helios

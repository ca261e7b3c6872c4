#include "helios/service.hpp"

#include <algorithm>
#include <exception>

#include "helios/hash.hpp"
#include "helios/jsonlite.hpp"
#include "helios/observability.hpp"
#include "helios/process_executor.hpp"
#include "helios/version.hpp"
#include "helios/worker.hpp"

namespace helios {

namespace {

using jsonlite::Object;
using jsonlite::Value;

// Thrown inside dispatch() for request-level failures; handle() turns it into
// an error response.
struct RequestError {
  std::string code;
  std::string message;
};

[[noreturn]] void fail(ErrorCode code, const std::string& message) {
  throw RequestError{to_string(code), message};
}

std::string ok_response(const std::string& result_json) {
  return "{\"ok\":true,\"result\":" + result_json + "}";
}

std::string error_response(const std::string& code, const std::string& message) {
  Object err;
  err["code"] = Value{code};
  err["message"] = Value{message};
  Object o;
  o["ok"] = Value{false};
  o["error"] = Value{std::move(err)};
  return jsonlite::to_json(o);
}

std::string require_string(const Object& body, const std::string& key) {
  const std::string v = jsonlite::get_string(body, key);
  if (v.empty()) fail(ErrorCode::malformed_request, key + " is required");
  return v;
}

TaskResourceRequest request_from_body(const Object& body) {
  TaskResourceRequest req;
  std::string err;
  if (!request_from_object(body, req, &err)) fail(ErrorCode::malformed_request, err);
  return req;
}

CacheQuery query_from_body(const Object& body) {
  CacheQuery q;
  q.task_type = require_string(body, "task_type");
  q.input = jsonlite::get_string(body, "input");
  q.context_prefix = jsonlite::get_string(body, "context_prefix");
  q.embedding = jsonlite::get_double_array(body, "embedding");
  return q;
}

}  // namespace

const std::vector<std::string>& HeliosService::operations() {
  static const std::vector<std::string> ops = {
      "budget.status",   "resources.request", "resources.record_usage", "cache.lookup",
      "cache.store",     "cache.invalidate",  "cache.metrics",          "project.schedule",
      "project.execute", "project.status",    "project.cancel",         "project.plan",
      "project.list",    "router.explain",    "router.stats",           "usage.metrics",
      "governor.history", "governor.throttle", "governor.clear_throttle", "stats",
      "health",          "config",
  };
  return ops;
}

HeliosService::HeliosService(HeliosConfig config, ServiceDependencies deps)
    : config_(std::move(config)),
      clock_(deps.clock ? deps.clock : make_system_clock()),
      store_(deps.store),
      executor_(deps.executor) {
  if (!store_) {
    store_ = make_state_store(config_.store.backend, config_.store.root, clock_,
                              config_.store.compress_threshold_bytes);
  }
  if (!executor_) executor_ = std::make_shared<ProcessExecutor>(config_.executor);
  router_ = std::make_unique<EconomicRouter>(store_, config_.router);
  governor_ = std::make_unique<ResourceGovernor>(store_, *router_, config_.governor, clock_);
  cache_ = std::make_unique<CacheManager>(store_, config_.cache, clock_, deps.embedder);
  scheduler_ = std::make_unique<HybridScheduler>(*governor_, *router_, *cache_, *executor_, config_.scheduler,
                                                 clock_);
  log_info("service", "ready: store=" + store_->backend_id() + " executor=" + executor_->executor_id());
}

std::string HeliosService::handle(const std::string& op, const std::string& body_json) {
  std::optional<jsonlite::JsonError> err;
  const Object body = body_json.empty() ? Object{} : jsonlite::parse(body_json, &err);
  if (err) return error_response(to_string(ErrorCode::malformed_request), err->message);

  try {
    return ok_response(dispatch(op, body));
  } catch (const RequestError& e) {
    return error_response(e.code, e.message);
  } catch (const std::exception& e) {
    log_error("service", op + " failed: " + e.what());
    return error_response("internal_error", e.what());
  }
}

std::string HeliosService::handle_line(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  const Object req = jsonlite::parse(line, &err);
  if (err) return error_response(to_string(ErrorCode::malformed_request), err->message);

  const std::string op = jsonlite::get_string(req, "op");
  const std::string body = jsonlite::has_key(req, "body") ? jsonlite::to_json(jsonlite::get_object(req, "body")) : "";
  std::string resp = op.empty() ? error_response(to_string(ErrorCode::malformed_request), "op is required")
                                : handle(op, body);
  const std::string id = jsonlite::get_string(req, "id");
  if (!id.empty()) resp = "{\"id\":" + jsonlite::to_json(Value{id}) + "," + resp.substr(1);
  return resp;
}

std::string HeliosService::dispatch(const std::string& op, const Object& body) {
  // Governor / router
  if (op == "budget.status") {
    const BudgetStatus s = governor_->budget_status();
    if (s.window_id.empty()) fail(ErrorCode::state_store_unavailable, "budget window unavailable");
    return budget_status_to_json(s);
  }
  if (op == "resources.request") {
    const ResourceAllocation a = governor_->request_resources(request_from_body(body));
    if (a.error_code == ErrorCode::malformed_request) fail(a.error_code, a.reason);
    return allocation_to_json(a);
  }
  if (op == "resources.record_usage") {
    const std::string task_id = require_string(body, "task_id");
    const auto tier = tier_from_string(jsonlite::get_string(body, "tier"));
    if (!tier) fail(ErrorCode::malformed_request, "tier must be high_capability or economical");
    if (!jsonlite::has_key(body, "actual_units")) fail(ErrorCode::malformed_request, "actual_units is required");
    const UsageAck ack = governor_->record_usage(task_id, *tier, jsonlite::get_u64(body, "actual_units"));
    if (!ack.ok) fail(ack.error_code, ack.reason);
    return usage_ack_to_json(ack);
  }
  if (op == "usage.metrics") return usage_metrics_to_json(governor_->usage_metrics());
  if (op == "governor.history") {
    std::string out = "{\"windows\":[";
    bool first = true;
    for (const auto& w : governor_->window_history(jsonlite::get_u64(body, "limit", 0))) {
      if (!first) out += ",";
      first = false;
      out += usage_window_to_json(w);
    }
    return out + "]}";
  }
  if (op == "governor.throttle") {
    const std::string reason = jsonlite::get_string(body, "reason", "operator");
    if (!governor_->force_throttle(reason)) fail(ErrorCode::state_store_unavailable, "could not engage throttle");
    return budget_status_to_json(governor_->budget_status());
  }
  if (op == "governor.clear_throttle") {
    if (!governor_->clear_throttle()) fail(ErrorCode::state_store_unavailable, "could not clear throttle");
    return budget_status_to_json(governor_->budget_status());
  }
  if (op == "router.explain") {
    const TaskResourceRequest req = request_from_body(body);
    return decision_explanation_to_json(router_->explain_decision(req, governor_->budget_status()));
  }
  if (op == "router.stats") return router_->routing_stats_to_json();

  // Cache
  if (op == "cache.lookup") {
    const CacheLookupResult r = cache_->lookup(query_from_body(body));
    if (r.error_code == ErrorCode::malformed_request) fail(r.error_code, r.error);
    return cache_lookup_to_json(r);
  }
  if (op == "cache.store") {
    CacheStoreRequest req;
    req.query = query_from_body(body);
    if (!jsonlite::has_key(body, "response")) fail(ErrorCode::malformed_request, "response is required");
    req.response = jsonlite::get_string(body, "response");
    req.cost_units = jsonlite::get_double(body, "cost_units", 0.0);
    if (jsonlite::has_key(body, "ttl_ms")) req.ttl_ms = jsonlite::get_u64(body, "ttl_ms");
    if (jsonlite::has_key(body, "tiers")) {
      const auto tiers = jsonlite::get_string_array(body, "tiers");
      auto has = [&](const char* t) { return std::find(tiers.begin(), tiers.end(), t) != tiers.end(); };
      req.allow_l1 = has("l1");
      req.allow_l2 = has("l2");
      req.allow_l3 = has("l3");
    }
    return cache_store_to_json(cache_->store(req));
  }
  if (op == "cache.invalidate") {
    const std::string task_type = jsonlite::get_string(body, "task_type");
    const CacheInvalidateResult r = cache_->invalidate(task_type);
    if (!r.ok) fail(ErrorCode::cache_unavailable, r.error);
    Object o;
    o["removed"] = Value{static_cast<uint64_t>(r.removed)};
    o["scope"] = Value{task_type.empty() ? std::string("all") : task_type};
    return jsonlite::to_json(o);
  }
  if (op == "cache.metrics") return cache_metrics_to_json(cache_->metrics());

  // Scheduler
  if (op == "project.schedule") {
    TaskDAG dag;
    std::string err;
    if (!dag_from_object(body, dag, &err)) fail(ErrorCode::malformed_request, err);
    const ScheduleResult r = scheduler_->schedule_project(std::move(dag));
    if (!r.ok) fail(r.error_code, r.error);
    return execution_plan_to_json(r.plan);
  }
  if (op == "project.execute") {
    const std::string id = require_string(body, "project_id");
    const ProjectStatus s = scheduler_->execute_project(id);
    if (!s.known) fail(ErrorCode::unknown_project, "unknown project " + id);
    return project_status_to_json(s);
  }
  if (op == "project.status") {
    const std::string id = require_string(body, "project_id");
    const auto s = scheduler_->project_status(id);
    if (!s) fail(ErrorCode::unknown_project, "unknown project " + id);
    return project_status_to_json(*s, jsonlite::get_bool(body, "include_tasks", true));
  }
  if (op == "project.cancel") {
    const std::string id = require_string(body, "project_id");
    if (!scheduler_->cancel_project(id)) fail(ErrorCode::unknown_project, "unknown project " + id);
    return "{\"cancelled\":true,\"project_id\":" + jsonlite::to_json(Value{id}) + "}";
  }
  if (op == "project.plan") {
    const std::string id = require_string(body, "project_id");
    const auto plan = scheduler_->execution_plan(id);
    if (!plan) fail(ErrorCode::unknown_project, "unknown project " + id);
    return execution_plan_to_json(*plan);
  }
  if (op == "project.list") {
    jsonlite::Array ids;
    for (const auto& id : scheduler_->list_projects()) ids.push_back(Value{id});
    Object o;
    o["projects"] = Value{std::move(ids)};
    return jsonlite::to_json(o);
  }

  // Diagnostics
  if (op == "stats") return global_orchestrator_stats().to_json();
  if (op == "health") return health_json();
  if (op == "config") return config_to_json(config_);

  fail(ErrorCode::malformed_request, "unknown op " + op);
}

std::string HeliosService::health_json() {
  const auto hash = hash_runtime_info();
  const std::string governor = governor_->health_to_json();
  const bool available = !governor_->budget_status().window_id.empty();
  std::string out = "{\"status\":\"";
  out += available ? "ok" : "degraded";
  out += "\",\"version\":" + jsonlite::to_json(Value{std::string(version::kSemver)});
  out += ",\"hash_primitive\":" + jsonlite::to_json(Value{hash.primitive});
  out += ",\"hash_available\":";
  out += hash.blake3_available ? "true" : "false";
  out += ",\"store\":" + jsonlite::to_json(Value{store_->backend_id()});
  out += ",\"executor\":" + jsonlite::to_json(Value{executor_->executor_id()});
  out += ",\"governor\":" + governor;
  out += ",\"worker\":" + worker_identity_to_json(global_worker_identity());
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// LineServer
// ---------------------------------------------------------------------------

LineServer::LineServer(HeliosService& service, Sink sink) : service_(service), sink_(std::move(sink)) {}

LineServer::~LineServer() { drain(); }

bool LineServer::runs_detached(const std::string& op) { return op == "project.execute"; }

void LineServer::submit(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  const Object req = jsonlite::parse(line, &err);
  if (err || !runs_detached(jsonlite::get_string(req, "op"))) {
    write(service_.handle_line(line));
    return;
  }

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread th([this, line, done]() {
    write(service_.handle_line(line));
    done->store(true);
  });
  std::lock_guard<std::mutex> lk(mu_);
  reap_locked();
  workers_.push_back(Worker{std::move(th), std::move(done)});
}

void LineServer::drain() {
  std::vector<Worker> pending;
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending.swap(workers_);
  }
  for (auto& w : pending) {
    if (w.thread.joinable()) w.thread.join();
  }
}

size_t LineServer::outstanding() const {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<size_t>(std::count_if(workers_.begin(), workers_.end(),
                                           [](const Worker& w) { return !w.done->load(); }));
}

void LineServer::write(const std::string& response) {
  std::lock_guard<std::mutex> lk(write_mu_);
  sink_(response);
}

void LineServer::reap_locked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace helios

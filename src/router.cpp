#include "helios/router.hpp"

#include <algorithm>
#include <sstream>

#include "helios/jsonlite.hpp"
#include "helios/observability.hpp"
#include "helios/version.hpp"

namespace helios {

namespace {

constexpr const char* kPerformanceKey = "helios:router:performance";
constexpr uint32_t kMaxCasAttempts = 32;

using jsonlite::Object;
using jsonlite::Value;

std::map<std::string, TaskTypePerformance> table_from_json(const std::string& text) {
  std::map<std::string, TaskTypePerformance> out;
  std::optional<jsonlite::JsonError> err;
  const Object root = jsonlite::parse(text, &err);
  if (err) {
    log_warn("router", "discarding unreadable performance table: " + err->message);
    return out;
  }
  for (const auto& [type, v] : jsonlite::get_object(root, "types")) {
    if (!std::holds_alternative<Object>(v.v)) continue;
    const auto& o = std::get<Object>(v.v);
    TaskTypePerformance p;
    p.high_success_rate = jsonlite::get_double(o, "high", 0.5);
    p.economical_success_rate = jsonlite::get_double(o, "economical", 0.5);
    p.high_samples = jsonlite::get_u64(o, "high_samples");
    p.economical_samples = jsonlite::get_u64(o, "economical_samples");
    out[type] = p;
  }
  return out;
}

Object performance_to_object(const TaskTypePerformance& p) {
  Object o;
  o["high"] = Value{p.high_success_rate};
  o["economical"] = Value{p.economical_success_rate};
  o["high_samples"] = Value{p.high_samples};
  o["economical_samples"] = Value{p.economical_samples};
  return o;
}

std::string table_to_json(const std::map<std::string, TaskTypePerformance>& table) {
  Object types;
  for (const auto& [type, p] : table) types[type] = Value{performance_to_object(p)};
  Object root;
  root["format"] = Value{static_cast<std::uint64_t>(version::STATE_FORMAT_VERSION)};
  root["types"] = Value{std::move(types)};
  return jsonlite::to_json(root);
}

Object factors_to_object(const RoutingFactors& f) {
  Object o;
  o["complexity"] = Value{f.complexity};
  o["complexity_level"] = Value{f.complexity_level};
  o["budget"] = Value{f.budget};
  o["history"] = Value{f.history};
  o["priority"] = Value{f.priority};
  o["known_task_type"] = Value{f.known_task_type};
  o["high_success_rate"] = Value{f.performance.high_success_rate};
  o["economical_success_rate"] = Value{f.performance.economical_success_rate};
  return o;
}

Object decision_to_object(const RoutingDecision& d) {
  Object o;
  o["tier"] = Value{to_string(d.tier)};
  o["confidence"] = Value{d.confidence};
  o["decision_score"] = Value{d.decision_score};
  o["mandatory_override"] = Value{d.mandatory_override};
  o["factors"] = Value{factors_to_object(d.factors)};
  o["reasoning"] = Value{d.reasoning};
  return o;
}

}  // namespace

std::string routing_decision_to_json(const RoutingDecision& d) {
  return jsonlite::to_json(decision_to_object(d));
}

std::string decision_explanation_to_json(const DecisionExplanation& e) {
  Object weights;
  weights["complexity"] = Value{e.policy.complexity_weight};
  weights["budget"] = Value{e.policy.budget_weight};
  weights["history"] = Value{e.policy.history_weight};
  weights["priority"] = Value{e.policy.priority_weight};
  Object contributions;
  const auto& f = e.decision.factors;
  contributions["complexity"] = Value{f.complexity * e.policy.complexity_weight};
  contributions["budget"] = Value{f.budget * e.policy.budget_weight};
  contributions["history"] = Value{f.history * e.policy.history_weight};
  contributions["priority"] = Value{f.priority * e.policy.priority_weight};
  Object thresholds;
  thresholds["high_tier"] = Value{e.policy.high_tier_threshold};
  thresholds["economical"] = Value{e.policy.economical_threshold};
  thresholds["ample_headroom_pct"] = Value{e.policy.ample_headroom_pct};

  Object o = decision_to_object(e.decision);
  o["weights"] = Value{std::move(weights)};
  o["contributions"] = Value{std::move(contributions)};
  o["thresholds"] = Value{std::move(thresholds)};
  o["utilization_pct"] = Value{e.utilization_pct};
  o["is_throttling"] = Value{e.is_throttling};
  return jsonlite::to_json(o);
}

EconomicRouter::EconomicRouter(std::shared_ptr<IStateStore> store, RouterPolicy policy)
    : store_(std::move(store)), policy_(std::move(policy)) {}

double EconomicRouter::complexity_score(const TaskResourceRequest& req) const {
  double score = 5.0;
  auto it = policy_.task_type_complexity.find(req.task_type);
  if (it != policy_.task_type_complexity.end()) {
    score += (it->second - 5.0) * 0.4;
  }

  if (req.estimated_units <= 5) score -= 0.9;
  else if (req.estimated_units <= 20) score -= 0.3;
  else if (req.estimated_units <= 50) score += 0.3;
  else score += 0.9;

  if (req.priority >= 8) score += 0.1;
  else if (req.priority <= 3) score -= 0.1;

  return std::clamp(score, 1.0, 10.0);
}

std::string EconomicRouter::complexity_level(double score) {
  if (score < 3.0) return "trivial";
  if (score < 5.0) return "simple";
  if (score < 7.0) return "moderate";
  if (score < 9.0) return "complex";
  return "very_complex";
}

double EconomicRouter::budget_factor(double utilization_pct) {
  if (utilization_pct < 40.0) return 9.0;
  if (utilization_pct < 60.0) return 7.0;
  if (utilization_pct < 80.0) return 5.0;
  if (utilization_pct < 95.0) return 2.0;
  return 0.0;
}

double EconomicRouter::history_factor(const TaskTypePerformance& perf) {
  const double diff = perf.high_success_rate - perf.economical_success_rate;
  if (diff > 0.2) return 8.0;
  if (diff > 0.1) return 6.5;
  if (diff > -0.1) return 5.0;
  if (diff > -0.2) return 3.5;
  return 2.0;
}

RoutingDecision EconomicRouter::decide(const TaskResourceRequest& req, const BudgetStatus& status,
                                       const std::map<std::string, TaskTypePerformance>& table) const {
  RoutingDecision d;
  auto& f = d.factors;
  f.complexity = complexity_score(req);
  f.complexity_level = complexity_level(f.complexity);
  f.budget = budget_factor(status.utilization_pct);
  f.priority = static_cast<double>(std::clamp(req.priority, 0, 10));
  auto it = table.find(req.task_type);
  if (it != table.end()) {
    f.known_task_type = true;
    f.performance = it->second;
    f.history = history_factor(it->second);
  } else {
    f.performance.high_success_rate = policy_.initial_success_rate;
    f.performance.economical_success_rate = policy_.initial_success_rate;
    f.history = 5.0;
  }

  d.decision_score = f.complexity * policy_.complexity_weight + f.budget * policy_.budget_weight +
                     f.history * policy_.history_weight + f.priority * policy_.priority_weight;

  if (req.mandatory_high_tier) {
    d.tier = Tier::high_capability;
    d.confidence = 1.0;
    d.mandatory_override = true;
    d.reasoning = "mandatory high-capability task";
    return d;
  }

  std::ostringstream why;
  const double s = d.decision_score;
  if (s >= policy_.high_tier_threshold) {
    if (status.is_throttling) {
      d.tier = Tier::economical;
      d.confidence = 0.7;
      why << "score " << jsonlite::format_double(s) << " qualifies for high capability but budget is throttling";
    } else {
      d.tier = Tier::high_capability;
      const double span = std::max(10.0 - policy_.high_tier_threshold, 0.1);
      d.confidence = std::min(1.0, (s - policy_.high_tier_threshold) / span + 0.6);
      why << "score " << jsonlite::format_double(s) << " >= " << jsonlite::format_double(policy_.high_tier_threshold)
          << " (" << f.complexity_level << " task)";
    }
  } else if (s <= policy_.economical_threshold) {
    d.tier = Tier::economical;
    const double span = std::max(policy_.economical_threshold, 0.1);
    d.confidence = std::min(1.0, (policy_.economical_threshold - s) / span + 0.6);
    why << "score " << jsonlite::format_double(s) << " <= " << jsonlite::format_double(policy_.economical_threshold);
  } else if (status.utilization_pct < policy_.ample_headroom_pct && !status.is_throttling) {
    d.tier = Tier::high_capability;
    d.confidence = 0.55;
    why << "middle band with ample headroom (" << jsonlite::format_double(status.utilization_pct) << "% used)";
  } else {
    d.tier = Tier::economical;
    d.confidence = 0.65;
    why << "middle band, conserving budget (" << jsonlite::format_double(status.utilization_pct) << "% used)";
  }
  d.reasoning = why.str();
  return d;
}

std::map<std::string, TaskTypePerformance> EconomicRouter::performance_table() const {
  std::string raw;
  const StoreStatus st = store_->get(kPerformanceKey, raw);
  if (st == StoreStatus::unavailable) {
    log_warn("router", "performance table unavailable, routing with neutral history");
  }
  if (st != StoreStatus::ok) return {};
  return table_from_json(raw);
}

RoutingDecision EconomicRouter::route_task(const TaskResourceRequest& req, const BudgetStatus& status) {
  RoutingDecision d = decide(req, status, performance_table());
  if (d.mandatory_override) mandatory_overrides_.fetch_add(1, std::memory_order_relaxed);
  if (d.tier == Tier::high_capability) {
    routed_high_.fetch_add(1, std::memory_order_relaxed);
  } else {
    routed_economical_.fetch_add(1, std::memory_order_relaxed);
    if (status.is_throttling && d.decision_score >= policy_.high_tier_threshold) {
      throttle_downgrades_.fetch_add(1, std::memory_order_relaxed);
    }
  }
  log_debug("router", req.task_id + " -> " + to_string(d.tier) + ": " + d.reasoning);
  return d;
}

DecisionExplanation EconomicRouter::explain_decision(const TaskResourceRequest& req,
                                                     const BudgetStatus& status) const {
  DecisionExplanation e;
  e.decision = decide(req, status, performance_table());
  e.policy = policy_;
  e.utilization_pct = status.utilization_pct;
  e.is_throttling = status.is_throttling;
  return e;
}

bool EconomicRouter::record_outcome(const std::string& task_type, Tier tier, bool success) {
  const double sample = success ? 1.0 : 0.0;
  for (uint32_t attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    std::string raw;
    const StoreStatus st = store_->get(kPerformanceKey, raw);
    if (st == StoreStatus::unavailable) {
      log_warn("router", "cannot record outcome for " + task_type + ": store unavailable");
      return false;
    }
    auto table = st == StoreStatus::ok ? table_from_json(raw) : std::map<std::string, TaskTypePerformance>{};
    auto it = table.find(task_type);
    if (it == table.end()) {
      TaskTypePerformance seed;
      seed.high_success_rate = policy_.initial_success_rate;
      seed.economical_success_rate = policy_.initial_success_rate;
      it = table.emplace(task_type, seed).first;
    }
    auto& p = it->second;
    if (tier == Tier::high_capability) {
      p.high_success_rate = (1.0 - policy_.ema_alpha) * p.high_success_rate + policy_.ema_alpha * sample;
      ++p.high_samples;
    } else {
      p.economical_success_rate = (1.0 - policy_.ema_alpha) * p.economical_success_rate + policy_.ema_alpha * sample;
      ++p.economical_samples;
    }

    const std::optional<std::string> expected =
        st == StoreStatus::ok ? std::optional<std::string>(raw) : std::nullopt;
    const StoreStatus cas = store_->compare_and_swap(kPerformanceKey, expected, table_to_json(table));
    if (cas == StoreStatus::ok) return true;
    if (cas == StoreStatus::unavailable) return false;
    global_orchestrator_stats().store_conflicts.fetch_add(1, std::memory_order_relaxed);
  }
  log_warn("router", "gave up recording outcome for " + task_type + " after repeated conflicts");
  return false;
}

std::string EconomicRouter::routing_stats_to_json() const {
  const uint64_t high = routed_high_.load(std::memory_order_relaxed);
  const uint64_t econ = routed_economical_.load(std::memory_order_relaxed);
  const uint64_t total = high + econ;
  Object types;
  for (const auto& [type, p] : performance_table()) types[type] = Value{performance_to_object(p)};
  Object o;
  o["total_decisions"] = Value{total};
  o["high_capability"] = Value{high};
  o["economical"] = Value{econ};
  o["economical_pct"] = Value{total > 0 ? 100.0 * static_cast<double>(econ) / static_cast<double>(total) : 0.0};
  o["mandatory_overrides"] = Value{mandatory_overrides_.load(std::memory_order_relaxed)};
  o["throttle_downgrades"] = Value{throttle_downgrades_.load(std::memory_order_relaxed)};
  o["performance"] = Value{std::move(types)};
  return jsonlite::to_json(o);
}

}  // namespace helios

#pragma once

// helios/router.hpp — Economic Router: backend tier recommendation.
//
// DECISION MODEL:
//   decision_score = complexity * w_c + budget * w_b + history * w_h + priority * w_p
//   (defaults 0.4 / 0.3 / 0.2 / 0.1, every factor on a 0..10 scale)
//
//   complexity  1..10 from the task-type base table, estimated units and priority.
//   budget      headroom factor from window utilization (9 when mostly unused,
//               0 when nearly exhausted).
//   history     relative success of the high tier over the economical tier for
//               this task type; 5 (neutral, 50%) for unknown types.
//   priority    caller-declared priority 0..10.
//
//   score >= high_tier_threshold    -> high capability (economical while throttling)
//   score <= economical_threshold   -> economical
//   otherwise                       -> economical unless utilization is below
//                                      ample_headroom_pct and not throttling
//   mandatory_high_tier             -> high capability, scoring bypassed
//
// LEARNING:
//   record_outcome() updates an EMA (alpha 0.2, seeded at 0.5) of success rate
//   per task type and tier. The table lives in the shared state store under
//   "helios:router:performance" and is updated by compare-and-swap, so every
//   worker process routes from the same history.

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "helios/config.hpp"
#include "helios/state_store.hpp"
#include "helios/types.hpp"

namespace helios {

struct TaskTypePerformance {
  double high_success_rate{0.5};
  double economical_success_rate{0.5};
  uint64_t high_samples{0};
  uint64_t economical_samples{0};
};

struct RoutingFactors {
  double complexity{5.0};
  std::string complexity_level;
  double budget{0.0};
  double history{5.0};
  double priority{5.0};
  bool known_task_type{false};
  TaskTypePerformance performance;
};

struct RoutingDecision {
  Tier tier{Tier::economical};
  double confidence{0.0};
  double decision_score{0.0};
  bool mandatory_override{false};
  RoutingFactors factors;
  std::string reasoning;
};

std::string routing_decision_to_json(const RoutingDecision& d);

// Observability only: the factors, weights and thresholds behind a decision.
struct DecisionExplanation {
  RoutingDecision decision;
  RouterPolicy policy;
  double utilization_pct{0.0};
  bool is_throttling{false};
};

std::string decision_explanation_to_json(const DecisionExplanation& e);

class EconomicRouter {
 public:
  EconomicRouter(std::shared_ptr<IStateStore> store, RouterPolicy policy);

  // Recommend a tier. Counts the decision in routing stats.
  RoutingDecision route_task(const TaskResourceRequest& req, const BudgetStatus& status);

  // Update the success-rate EMA for (task_type, tier). Returns false when the
  // shared table could not be updated.
  bool record_outcome(const std::string& task_type, Tier tier, bool success);

  // Same computation as route_task() without side effects.
  DecisionExplanation explain_decision(const TaskResourceRequest& req,
                                       const BudgetStatus& status) const;

  std::map<std::string, TaskTypePerformance> performance_table() const;
  std::string routing_stats_to_json() const;

  // Exposed for tests and explain output.
  double complexity_score(const TaskResourceRequest& req) const;
  static std::string complexity_level(double score);
  static double budget_factor(double utilization_pct);
  static double history_factor(const TaskTypePerformance& perf);

  const RouterPolicy& policy() const { return policy_; }

 private:
  RoutingDecision decide(const TaskResourceRequest& req, const BudgetStatus& status,
                         const std::map<std::string, TaskTypePerformance>& table) const;

  std::shared_ptr<IStateStore> store_;
  RouterPolicy policy_;

  alignas(64) std::atomic<uint64_t> routed_high_{0};
  alignas(64) std::atomic<uint64_t> routed_economical_{0};
  alignas(64) std::atomic<uint64_t> mandatory_overrides_{0};
  alignas(64) std::atomic<uint64_t> throttle_downgrades_{0};
};

}  // namespace helios

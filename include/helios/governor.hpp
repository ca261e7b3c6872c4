#pragma once

// helios/governor.hpp — Resource Governor: rolling usage window and admission.
//
// STATE (shared state store):
//   helios:governor:window    current UsageWindow JSON, open reservations included
//   helios:governor:history   {"format":2,"windows":[...]} closed windows, newest last
//
// ADMISSION ZONES (utilization = used / ceiling):
//   normal     < throttle_threshold_pct       router picks the tier
//   throttled  throttle .. critical, inclusive non-mandatory -> economical, admitted
//                                             mandatory high tier -> queued
//   critical   > critical_threshold_pct       priority >= critical_min_priority admitted
//                                             (economical); mandatory -> queued;
//                                             everything else rejected
//   exhausted  remaining == 0                 every request rejected
//   A manual throttle (force_throttle) lifts a normal zone to throttled.
//   Denials carry retry_after_ms = time left in the current window.
//
// INVARIANTS:
//   1. "read status, compare, reserve" is one compare-and-swap against the
//      store, serialized in-process by mu_. Two workers can never reserve the
//      same remaining units.
//   2. A reservation is min(estimate, remaining), so high + economical never
//      exceeds the ceiling. record_usage() books anything beyond the ceiling as
//      overage_units.
//   3. Rollover happens lazily on any operation once now - start >= duration.
//      Only the CAS winner appends the closed window to history.
//   4. Closed windows are immutable. Usage for a reservation made in a closed
//      window charges only the units above that reservation to the current one.
//   5. Denials are values, never exceptions. Callers branch on `allocated`.

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "helios/clock.hpp"
#include "helios/config.hpp"
#include "helios/router.hpp"
#include "helios/state_store.hpp"
#include "helios/types.hpp"

namespace helios {

class ResourceGovernor {
 public:
  ResourceGovernor(std::shared_ptr<IStateStore> store, EconomicRouter& router, GovernorPolicy policy,
                   std::shared_ptr<const Clock> clock);

  ResourceAllocation request_resources(const TaskResourceRequest& req);
  UsageAck record_usage(const std::string& task_id, Tier tier, uint64_t actual_units);

  // Store failures surface as a status with an empty window_id.
  BudgetStatus budget_status();
  UsageMetrics usage_metrics();

  // Closed windows, newest first. limit 0 = all retained.
  std::vector<UsageWindow> window_history(size_t limit = 0);

  bool force_throttle(const std::string& reason);
  bool clear_throttle();

  std::optional<UsageWindow> current_window();
  std::string health_to_json();

  const GovernorPolicy& policy() const { return policy_; }

  static BudgetStatus status_from_window(const UsageWindow& w, const GovernorPolicy& policy,
                                         uint64_t now_unix_ms);

 private:
  struct Snapshot {
    UsageWindow window;
    std::optional<std::string> raw;  // nullopt when the key was absent
  };

  // Reads the current window, opening or rolling it over as needed.
  StoreStatus load_current(uint64_t now, Snapshot& out);

  // Runs fn on a copy of the current window and CASes the result back when fn
  // returns true. Retries on conflict up to policy_.max_cas_attempts.
  StoreStatus mutate_window(const std::function<bool(UsageWindow&)>& fn, UsageWindow& out);

  UsageWindow open_window(uint64_t now, const UsageWindow* previous) const;
  void append_history(const UsageWindow& closed);
  std::vector<UsageWindow> read_history(StoreStatus* status);
  std::optional<Reservation> find_closed_reservation(const std::string& task_id);

  std::shared_ptr<IStateStore> store_;
  EconomicRouter& router_;
  GovernorPolicy policy_;
  std::shared_ptr<const Clock> clock_;
  std::mutex mu_;
};

}  // namespace helios

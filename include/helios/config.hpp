#pragma once

// helios/config.hpp — Tunable policy for every orchestration component.
//
// LOADING ORDER:
//   1. Compiled-in defaults (default_config()).
//   2. Optional JSON policy file (load_config(path)); absent keys keep defaults.
//   3. HELIOS_* environment overrides (apply_env_overrides()).
//   validate_config() runs last; the CLI refuses to start on errors.
//
// POLICY FILE SHAPE:
//   {
//     "governor":  { "window_ceiling_units": 900, "window_duration_ms": 18000000, ... },
//     "router":    { "high_tier_threshold": 6.5, "task_type_complexity": {"code_generation": 8}, ... },
//     "cache":     { "similarity_threshold": 0.85, ... },
//     "scheduler": { "global_max_concurrency": 10, ... },
//     "store":     { "backend": "file", "root": ".helios/state" },
//     "executor":  { "command": "/usr/local/bin/agent", "args": [], "timeout_ms": 600000 }
//   }

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace helios {

struct GovernorPolicy {
  uint64_t window_ceiling_units{900};
  uint64_t window_duration_ms{5ull * 60 * 60 * 1000};  // 5 hours
  size_t history_retention{24};
  double throttle_threshold_pct{80.0};
  double critical_threshold_pct{95.0};
  int critical_min_priority{8};
  // Relative cost of one unit per tier (5:1 by default).
  double high_tier_cost_multiplier{5.0};
  double economical_tier_cost_multiplier{1.0};
  // Bounded retries of the store compare-and-swap loop before giving up.
  uint32_t max_cas_attempts{64};
};

struct RouterPolicy {
  double complexity_weight{0.4};
  double budget_weight{0.3};
  double history_weight{0.2};
  double priority_weight{0.1};
  double high_tier_threshold{6.5};
  double economical_threshold{4.5};
  // Middle band resolves to the high tier only below this utilization.
  double ample_headroom_pct{40.0};
  double ema_alpha{0.2};
  double initial_success_rate{0.5};
  std::map<std::string, double> task_type_complexity;

  static RouterPolicy default_policy();
};

struct CachePolicy {
  uint64_t l1_min_prefix_tokens{1024};
  uint64_t l1_ttl_ms{5ull * 60 * 1000};
  uint64_t l2_ttl_ms{60ull * 60 * 1000};
  uint64_t l2_max_ttl_ms{24ull * 60 * 60 * 1000};
  uint64_t l3_ttl_ms{24ull * 60 * 60 * 1000};
  uint64_t l3_max_ttl_ms{7ull * 24 * 60 * 60 * 1000};
  double similarity_threshold{0.85};
  double similarity_ema_alpha{0.3};
  size_t embedding_dimension{256};
  // Cost multiplier applied to stored entries when the caller gives no cost.
  double default_entry_cost_units{1.0};
  // Minimum spacing between expired-entry sweeps triggered by cache writes.
  // 0 sweeps on every write.
  uint64_t purge_interval_ms{60ull * 1000};
};

struct SchedulerPolicy {
  size_t global_max_concurrency{10};
  size_t max_parallel_per_project{10};
  uint32_t max_retries{3};
  uint64_t backoff_base_ms{2000};
  uint64_t backoff_max_ms{60000};
  uint64_t requeue_delay_cap_ms{60000};
  uint64_t executor_timeout_ms{600000};
  uint64_t poll_interval_ms{50};
  uint64_t average_task_ms{30000};  // plan duration estimate per wave
};

struct StoreConfig {
  std::string backend{"memory"};  // "memory" | "file"
  std::string root{".helios/state"};
  size_t compress_threshold_bytes{1024};
};

struct ExecutorConfig {
  std::string command;
  std::vector<std::string> args;
  uint64_t timeout_ms{600000};
  size_t max_output_bytes{1 << 20};
};

struct HeliosConfig {
  GovernorPolicy governor;
  RouterPolicy router{RouterPolicy::default_policy()};
  CachePolicy cache;
  SchedulerPolicy scheduler;
  StoreConfig store;
  ExecutorConfig executor;
  std::string log_level{"warn"};
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

HeliosConfig default_config();

// Overlay a JSON policy document onto `base`. Returns false with *error on a
// parse failure; unknown keys are ignored.
bool config_from_json(const std::string& text, HeliosConfig& base, std::string* error);

// Read and overlay a policy file. Missing file is an error.
bool load_config(const std::string& path, HeliosConfig& base, std::string* error);

void apply_env_overrides(HeliosConfig& cfg);

ConfigValidationResult validate_config(const HeliosConfig& cfg);
std::string config_validation_to_json(const ConfigValidationResult& r);

std::string config_to_json(const HeliosConfig& cfg);

}  // namespace helios

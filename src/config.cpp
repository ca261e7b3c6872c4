#include "helios/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "helios/jsonlite.hpp"

namespace helios {

namespace {

using jsonlite::Object;
using jsonlite::Value;

const char* env(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? v : nullptr;
}

void env_u64(const char* name, uint64_t& out) {
  if (const char* v = env(name)) {
    char* end = nullptr;
    const unsigned long long n = std::strtoull(v, &end, 10);
    if (end && *end == '\0') out = n;
  }
}

void env_size(const char* name, size_t& out) {
  uint64_t n = out;
  env_u64(name, n);
  out = static_cast<size_t>(n);
}

void env_double(const char* name, double& out) {
  if (const char* v = env(name)) {
    char* end = nullptr;
    const double d = std::strtod(v, &end);
    if (end && *end == '\0') out = d;
  }
}

void read_u64(const Object& o, const char* key, uint64_t& out) {
  out = jsonlite::get_u64(o, key, out);
}

void read_size(const Object& o, const char* key, size_t& out) {
  out = static_cast<size_t>(jsonlite::get_u64(o, key, out));
}

void read_double(const Object& o, const char* key, double& out) {
  out = jsonlite::get_double(o, key, out);
}

Value u64(uint64_t v) { return Value{v}; }
Value dbl(double v) { return Value{v}; }
Value str(const std::string& s) { return Value{s}; }

}  // namespace

RouterPolicy RouterPolicy::default_policy() {
  RouterPolicy p;
  p.task_type_complexity = {
      {"prd_generation", 7.0},
      {"code_generation", 8.0},
      {"code_review", 6.0},
      {"documentation", 4.0},
      {"testing", 5.0},
      {"refactoring", 7.0},
      {"market_analysis", 6.0},
      {"content_generation", 5.0},
      {"lead_scoring", 4.0},
  };
  return p;
}

HeliosConfig default_config() {
  return HeliosConfig{};
}

bool config_from_json(const std::string& text, HeliosConfig& base, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const Object root = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return false;
  }

  const Object g = jsonlite::get_object(root, "governor");
  read_u64(g, "window_ceiling_units", base.governor.window_ceiling_units);
  read_u64(g, "window_duration_ms", base.governor.window_duration_ms);
  read_size(g, "history_retention", base.governor.history_retention);
  read_double(g, "throttle_threshold_pct", base.governor.throttle_threshold_pct);
  read_double(g, "critical_threshold_pct", base.governor.critical_threshold_pct);
  base.governor.critical_min_priority = static_cast<int>(
      jsonlite::get_u64(g, "critical_min_priority", static_cast<uint64_t>(base.governor.critical_min_priority)));
  read_double(g, "high_tier_cost_multiplier", base.governor.high_tier_cost_multiplier);
  read_double(g, "economical_tier_cost_multiplier", base.governor.economical_tier_cost_multiplier);
  base.governor.max_cas_attempts = static_cast<uint32_t>(
      jsonlite::get_u64(g, "max_cas_attempts", base.governor.max_cas_attempts));

  const Object r = jsonlite::get_object(root, "router");
  read_double(r, "complexity_weight", base.router.complexity_weight);
  read_double(r, "budget_weight", base.router.budget_weight);
  read_double(r, "history_weight", base.router.history_weight);
  read_double(r, "priority_weight", base.router.priority_weight);
  read_double(r, "high_tier_threshold", base.router.high_tier_threshold);
  read_double(r, "economical_threshold", base.router.economical_threshold);
  read_double(r, "ample_headroom_pct", base.router.ample_headroom_pct);
  read_double(r, "ema_alpha", base.router.ema_alpha);
  read_double(r, "initial_success_rate", base.router.initial_success_rate);
  for (const auto& [type, v] : jsonlite::get_object(r, "task_type_complexity")) {
    if (std::holds_alternative<double>(v.v)) {
      base.router.task_type_complexity[type] = std::get<double>(v.v);
    } else if (std::holds_alternative<std::uint64_t>(v.v)) {
      base.router.task_type_complexity[type] = static_cast<double>(std::get<std::uint64_t>(v.v));
    }
  }

  const Object c = jsonlite::get_object(root, "cache");
  read_u64(c, "l1_min_prefix_tokens", base.cache.l1_min_prefix_tokens);
  read_u64(c, "l1_ttl_ms", base.cache.l1_ttl_ms);
  read_u64(c, "l2_ttl_ms", base.cache.l2_ttl_ms);
  read_u64(c, "l2_max_ttl_ms", base.cache.l2_max_ttl_ms);
  read_u64(c, "l3_ttl_ms", base.cache.l3_ttl_ms);
  read_u64(c, "l3_max_ttl_ms", base.cache.l3_max_ttl_ms);
  read_double(c, "similarity_threshold", base.cache.similarity_threshold);
  read_double(c, "similarity_ema_alpha", base.cache.similarity_ema_alpha);
  read_size(c, "embedding_dimension", base.cache.embedding_dimension);
  read_double(c, "default_entry_cost_units", base.cache.default_entry_cost_units);
  read_u64(c, "purge_interval_ms", base.cache.purge_interval_ms);

  const Object s = jsonlite::get_object(root, "scheduler");
  read_size(s, "global_max_concurrency", base.scheduler.global_max_concurrency);
  read_size(s, "max_parallel_per_project", base.scheduler.max_parallel_per_project);
  base.scheduler.max_retries = static_cast<uint32_t>(
      jsonlite::get_u64(s, "max_retries", base.scheduler.max_retries));
  read_u64(s, "backoff_base_ms", base.scheduler.backoff_base_ms);
  read_u64(s, "backoff_max_ms", base.scheduler.backoff_max_ms);
  read_u64(s, "requeue_delay_cap_ms", base.scheduler.requeue_delay_cap_ms);
  read_u64(s, "executor_timeout_ms", base.scheduler.executor_timeout_ms);
  read_u64(s, "poll_interval_ms", base.scheduler.poll_interval_ms);
  read_u64(s, "average_task_ms", base.scheduler.average_task_ms);

  const Object st = jsonlite::get_object(root, "store");
  base.store.backend = jsonlite::get_string(st, "backend", base.store.backend);
  base.store.root = jsonlite::get_string(st, "root", base.store.root);
  read_size(st, "compress_threshold_bytes", base.store.compress_threshold_bytes);

  const Object ex = jsonlite::get_object(root, "executor");
  base.executor.command = jsonlite::get_string(ex, "command", base.executor.command);
  if (jsonlite::has_key(ex, "args")) base.executor.args = jsonlite::get_string_array(ex, "args");
  read_u64(ex, "timeout_ms", base.executor.timeout_ms);
  read_size(ex, "max_output_bytes", base.executor.max_output_bytes);

  base.log_level = jsonlite::get_string(root, "log_level", base.log_level);
  return true;
}

bool load_config(const std::string& path, HeliosConfig& base, std::string* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (error) *error = "cannot open config file: " + path;
    return false;
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  return config_from_json(ss.str(), base, error);
}

void apply_env_overrides(HeliosConfig& cfg) {
  env_u64("HELIOS_WINDOW_CEILING", cfg.governor.window_ceiling_units);
  env_u64("HELIOS_WINDOW_DURATION_MS", cfg.governor.window_duration_ms);
  env_double("HELIOS_THROTTLE_PCT", cfg.governor.throttle_threshold_pct);
  env_double("HELIOS_CRITICAL_PCT", cfg.governor.critical_threshold_pct);
  env_double("HELIOS_SIMILARITY_THRESHOLD", cfg.cache.similarity_threshold);
  env_size("HELIOS_MAX_CONCURRENCY", cfg.scheduler.global_max_concurrency);
  uint64_t retries = cfg.scheduler.max_retries;
  env_u64("HELIOS_MAX_RETRIES", retries);
  cfg.scheduler.max_retries = static_cast<uint32_t>(retries);
  if (const char* v = env("HELIOS_STATE_DIR")) {
    cfg.store.backend = "file";
    cfg.store.root = v;
  }
  if (const char* v = env("HELIOS_EXECUTOR_CMD")) cfg.executor.command = v;
  if (const char* v = env("HELIOS_LOG_LEVEL")) cfg.log_level = v;
}

ConfigValidationResult validate_config(const HeliosConfig& cfg) {
  ConfigValidationResult r;
  const auto& g = cfg.governor;
  if (g.window_ceiling_units == 0) r.errors.push_back("governor.window_ceiling_units must be > 0");
  if (g.window_duration_ms == 0) r.errors.push_back("governor.window_duration_ms must be > 0");
  if (g.history_retention == 0) r.errors.push_back("governor.history_retention must be > 0");
  if (!(g.throttle_threshold_pct > 0.0 && g.throttle_threshold_pct <= g.critical_threshold_pct &&
        g.critical_threshold_pct <= 100.0)) {
    r.errors.push_back("governor thresholds must satisfy 0 < throttle <= critical <= 100");
  }
  if (g.critical_min_priority < 0 || g.critical_min_priority > 10) {
    r.errors.push_back("governor.critical_min_priority must be in [0,10]");
  }
  if (g.high_tier_cost_multiplier < g.economical_tier_cost_multiplier) {
    r.warnings.push_back("high tier cost multiplier is below the economical multiplier");
  }

  const auto& rt = cfg.router;
  const double wsum = rt.complexity_weight + rt.budget_weight + rt.history_weight + rt.priority_weight;
  if (wsum < 0.999 || wsum > 1.001) {
    r.warnings.push_back("router weights sum to " + jsonlite::format_double(wsum) + ", expected 1.0");
  }
  if (rt.economical_threshold > rt.high_tier_threshold) {
    r.errors.push_back("router.economical_threshold must be <= router.high_tier_threshold");
  }
  if (rt.ema_alpha <= 0.0 || rt.ema_alpha > 1.0) r.errors.push_back("router.ema_alpha must be in (0,1]");

  const auto& c = cfg.cache;
  if (c.similarity_threshold <= 0.0 || c.similarity_threshold > 1.0) {
    r.errors.push_back("cache.similarity_threshold must be in (0,1]");
  }
  if (c.embedding_dimension == 0) r.errors.push_back("cache.embedding_dimension must be > 0");
  if (c.l2_ttl_ms > c.l2_max_ttl_ms) r.warnings.push_back("cache.l2_ttl_ms exceeds l2_max_ttl_ms and will be capped");
  if (c.l3_ttl_ms > c.l3_max_ttl_ms) r.warnings.push_back("cache.l3_ttl_ms exceeds l3_max_ttl_ms and will be capped");
  if (c.l1_ttl_ms > c.l2_ttl_ms || c.l2_ttl_ms > c.l3_ttl_ms) {
    r.warnings.push_back("cache TTLs are expected to grow from L1 to L3");
  }

  const auto& s = cfg.scheduler;
  if (s.global_max_concurrency == 0) r.errors.push_back("scheduler.global_max_concurrency must be > 0");
  if (s.max_parallel_per_project == 0) r.errors.push_back("scheduler.max_parallel_per_project must be > 0");
  if (s.poll_interval_ms == 0) r.errors.push_back("scheduler.poll_interval_ms must be > 0");
  if (s.backoff_base_ms > s.backoff_max_ms) r.warnings.push_back("scheduler.backoff_base_ms exceeds backoff_max_ms");

  if (cfg.store.backend != "memory" && cfg.store.backend != "file") {
    r.errors.push_back("store.backend must be \"memory\" or \"file\"");
  }
  if (cfg.store.backend == "file" && cfg.store.root.empty()) {
    r.errors.push_back("store.root is required for the file backend");
  }
  if (cfg.log_level != "debug" && cfg.log_level != "info" && cfg.log_level != "warn" &&
      cfg.log_level != "error") {
    r.errors.push_back("log_level must be one of debug, info, warn, error");
  }

  r.ok = r.errors.empty();
  return r;
}

std::string config_validation_to_json(const ConfigValidationResult& r) {
  jsonlite::Array errors;
  jsonlite::Array warnings;
  for (const auto& e : r.errors) errors.push_back(str(e));
  for (const auto& w : r.warnings) warnings.push_back(str(w));
  Object o;
  o["ok"] = Value{r.ok};
  o["errors"] = Value{std::move(errors)};
  o["warnings"] = Value{std::move(warnings)};
  return jsonlite::to_json(o);
}

std::string config_to_json(const HeliosConfig& cfg) {
  Object g;
  g["window_ceiling_units"] = u64(cfg.governor.window_ceiling_units);
  g["window_duration_ms"] = u64(cfg.governor.window_duration_ms);
  g["history_retention"] = u64(cfg.governor.history_retention);
  g["throttle_threshold_pct"] = dbl(cfg.governor.throttle_threshold_pct);
  g["critical_threshold_pct"] = dbl(cfg.governor.critical_threshold_pct);
  g["critical_min_priority"] = u64(static_cast<uint64_t>(cfg.governor.critical_min_priority));
  g["high_tier_cost_multiplier"] = dbl(cfg.governor.high_tier_cost_multiplier);
  g["economical_tier_cost_multiplier"] = dbl(cfg.governor.economical_tier_cost_multiplier);
  g["max_cas_attempts"] = u64(cfg.governor.max_cas_attempts);

  Object complexity;
  for (const auto& [k, v] : cfg.router.task_type_complexity) complexity[k] = dbl(v);
  Object r;
  r["complexity_weight"] = dbl(cfg.router.complexity_weight);
  r["budget_weight"] = dbl(cfg.router.budget_weight);
  r["history_weight"] = dbl(cfg.router.history_weight);
  r["priority_weight"] = dbl(cfg.router.priority_weight);
  r["high_tier_threshold"] = dbl(cfg.router.high_tier_threshold);
  r["economical_threshold"] = dbl(cfg.router.economical_threshold);
  r["ample_headroom_pct"] = dbl(cfg.router.ample_headroom_pct);
  r["ema_alpha"] = dbl(cfg.router.ema_alpha);
  r["initial_success_rate"] = dbl(cfg.router.initial_success_rate);
  r["task_type_complexity"] = Value{std::move(complexity)};

  Object c;
  c["l1_min_prefix_tokens"] = u64(cfg.cache.l1_min_prefix_tokens);
  c["l1_ttl_ms"] = u64(cfg.cache.l1_ttl_ms);
  c["l2_ttl_ms"] = u64(cfg.cache.l2_ttl_ms);
  c["l2_max_ttl_ms"] = u64(cfg.cache.l2_max_ttl_ms);
  c["l3_ttl_ms"] = u64(cfg.cache.l3_ttl_ms);
  c["l3_max_ttl_ms"] = u64(cfg.cache.l3_max_ttl_ms);
  c["similarity_threshold"] = dbl(cfg.cache.similarity_threshold);
  c["similarity_ema_alpha"] = dbl(cfg.cache.similarity_ema_alpha);
  c["embedding_dimension"] = u64(cfg.cache.embedding_dimension);
  c["default_entry_cost_units"] = dbl(cfg.cache.default_entry_cost_units);
  c["purge_interval_ms"] = u64(cfg.cache.purge_interval_ms);

  Object s;
  s["global_max_concurrency"] = u64(cfg.scheduler.global_max_concurrency);
  s["max_parallel_per_project"] = u64(cfg.scheduler.max_parallel_per_project);
  s["max_retries"] = u64(cfg.scheduler.max_retries);
  s["backoff_base_ms"] = u64(cfg.scheduler.backoff_base_ms);
  s["backoff_max_ms"] = u64(cfg.scheduler.backoff_max_ms);
  s["requeue_delay_cap_ms"] = u64(cfg.scheduler.requeue_delay_cap_ms);
  s["executor_timeout_ms"] = u64(cfg.scheduler.executor_timeout_ms);
  s["poll_interval_ms"] = u64(cfg.scheduler.poll_interval_ms);
  s["average_task_ms"] = u64(cfg.scheduler.average_task_ms);

  Object st;
  st["backend"] = str(cfg.store.backend);
  st["root"] = str(cfg.store.root);
  st["compress_threshold_bytes"] = u64(cfg.store.compress_threshold_bytes);

  jsonlite::Array args;
  for (const auto& a : cfg.executor.args) args.push_back(str(a));
  Object ex;
  ex["command"] = str(cfg.executor.command);
  ex["args"] = Value{std::move(args)};
  ex["timeout_ms"] = u64(cfg.executor.timeout_ms);
  ex["max_output_bytes"] = u64(cfg.executor.max_output_bytes);

  Object root;
  root["governor"] = Value{std::move(g)};
  root["router"] = Value{std::move(r)};
  root["cache"] = Value{std::move(c)};
  root["scheduler"] = Value{std::move(s)};
  root["store"] = Value{std::move(st)};
  root["executor"] = Value{std::move(ex)};
  root["log_level"] = str(cfg.log_level);
  return jsonlite::to_json(root);
}

}  // namespace helios

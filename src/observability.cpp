#include "helios/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "helios/jsonlite.hpp"

namespace helios {

namespace {

// bit_width gives the bucket index in O(1) (BSR/CLZ).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

LogLevel initial_log_level() {
  const char* v = std::getenv("HELIOS_LOG_LEVEL");
  return parse_log_level(v ? v : "", LogLevel::warn);
}

std::atomic<int> g_log_level{static_cast<int>(initial_log_level())};
std::mutex g_log_mu;
std::atomic<EventHook> g_event_hook{nullptr};

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "warn";
}

void append_u64(std::string& out, const char* key, uint64_t v, bool first = false) {
  if (!first) out += ',';
  out += '"';
  out += key;
  out += "\":";
  out += std::to_string(v);
}

void append_rate(std::string& out, const char* key, uint64_t num, uint64_t den) {
  char buf[32];
  const double r = den > 0 ? static_cast<double>(num) / static_cast<double>(den) : 0.0;
  std::snprintf(buf, sizeof(buf), "%.6f", r);
  out += ",\"";
  out += key;
  out += "\":";
  out += buf;
}

}  // namespace

// ---------------------------------------------------------------------------
// Diagnostics log
// ---------------------------------------------------------------------------

LogLevel parse_log_level(const std::string& s, LogLevel def) {
  if (s == "debug") return LogLevel::debug;
  if (s == "info") return LogLevel::info;
  if (s == "warn" || s == "warning") return LogLevel::warn;
  if (s == "error") return LogLevel::error;
  return def;
}

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

void log_message(LogLevel level, const std::string& component, const std::string& message) {
  if (static_cast<int>(level) < g_log_level.load(std::memory_order_relaxed)) return;
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << "[helios:" << component << "] " << level_name(level) << ": " << message << "\n";
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::admission: return "admission";
    case EventKind::usage_recorded: return "usage_recorded";
    case EventKind::window_rollover: return "window_rollover";
    case EventKind::cache_lookup: return "cache_lookup";
    case EventKind::cache_store: return "cache_store";
    case EventKind::cache_invalidate: return "cache_invalidate";
    case EventKind::task_transition: return "task_transition";
    case EventKind::project_scheduled: return "project_scheduled";
    case EventKind::project_finished: return "project_finished";
  }
  return "unknown";
}

std::string event_to_json(const OrchestratorEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"kind\":\"";
  line += to_string(ev.kind);
  line += "\",\"subject_id\":\"";
  line += jsonlite::escape(ev.subject_id);
  line += "\",\"project_id\":\"";
  line += jsonlite::escape(ev.project_id);
  line += "\",\"outcome\":\"";
  line += jsonlite::escape(ev.outcome);
  line += "\",\"tier\":\"";
  line += ev.tier;
  line += "\",\"error_code\":\"";
  line += ev.error_code;
  line += "\"";
  append_u64(line, "units", ev.units);
  append_u64(line, "duration_ns", ev.duration_ns);
  append_u64(line, "ts", ev.timestamp_unix_ms);
  line += ",\"worker_id\":\"";
  line += jsonlite::escape(ev.worker_id);
  line += "\"}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "{\"count\":%llu,\"mean_us\":%.2f,\"p50_us\":%.2f,\"p95_us\":%.2f,\"p99_us\":%.2f}",
                static_cast<unsigned long long>(count()), mean_us(), percentile(0.50),
                percentile(0.95), percentile(0.99));
  return buf;
}

// ---------------------------------------------------------------------------
// OrchestratorStats
// ---------------------------------------------------------------------------

void OrchestratorStats::record(const OrchestratorEvent& ev) {
  switch (ev.kind) {
    case EventKind::admission:
      if (ev.outcome == "admitted") admissions_granted.fetch_add(1, std::memory_order_relaxed);
      else if (ev.outcome == "queued") admissions_queued.fetch_add(1, std::memory_order_relaxed);
      else admissions_rejected.fetch_add(1, std::memory_order_relaxed);
      admission_latency.record(ev.duration_ns);
      break;
    case EventKind::usage_recorded:
      usage_records.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::window_rollover:
      window_rollovers.fetch_add(1, std::memory_order_relaxed);
      break;
    case EventKind::cache_lookup:
      cache_lookups.fetch_add(1, std::memory_order_relaxed);
      if (ev.outcome.size() > 4 && ev.outcome.compare(ev.outcome.size() - 4, 4, "_hit") == 0) {
        cache_hits.fetch_add(1, std::memory_order_relaxed);
      }
      if (ev.error_code == "cache_unavailable") cache_degraded.fetch_add(1, std::memory_order_relaxed);
      cache_lookup_latency.record(ev.duration_ns);
      break;
    case EventKind::task_transition:
      if (ev.outcome == "completed") tasks_completed.fetch_add(1, std::memory_order_relaxed);
      else if (ev.outcome == "failed") tasks_failed.fetch_add(1, std::memory_order_relaxed);
      else if (ev.outcome == "blocked") tasks_blocked.fetch_add(1, std::memory_order_relaxed);
      else if (ev.outcome == "cancelled") tasks_cancelled.fetch_add(1, std::memory_order_relaxed);
      else if (ev.outcome == "retry") task_retries.fetch_add(1, std::memory_order_relaxed);
      else if (ev.outcome == "executed") {
        executor_calls.fetch_add(1, std::memory_order_relaxed);
        executor_latency.record(ev.duration_ns);
      }
      break;
    default:
      break;
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::vector<OrchestratorEvent> OrchestratorStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Oldest first.
  std::vector<OrchestratorEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % kMaxRecentEvents]);
  }
  return out;
}

void OrchestratorStats::reset_for_testing() {
  for (auto* c : {&admissions_granted, &admissions_queued, &admissions_rejected, &usage_records,
                  &window_rollovers, &store_conflicts, &tasks_completed, &tasks_failed,
                  &tasks_blocked, &tasks_cancelled, &task_retries, &executor_calls,
                  &cache_lookups, &cache_hits, &cache_degraded}) {
    c->store(0, std::memory_order_relaxed);
  }
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_buffer_.clear();
  ring_head_ = 0;
}

std::string OrchestratorStats::to_json() const {
  std::string out;
  out.reserve(1024);
  const uint64_t granted = admissions_granted.load(std::memory_order_relaxed);
  const uint64_t queued = admissions_queued.load(std::memory_order_relaxed);
  const uint64_t rejected = admissions_rejected.load(std::memory_order_relaxed);
  const uint64_t lookups = cache_lookups.load(std::memory_order_relaxed);
  const uint64_t hits = cache_hits.load(std::memory_order_relaxed);

  out += "{\"governor\":{";
  append_u64(out, "admissions_granted", granted, true);
  append_u64(out, "admissions_queued", queued);
  append_u64(out, "admissions_rejected", rejected);
  append_rate(out, "admission_rate", granted, granted + queued + rejected);
  append_u64(out, "usage_records", usage_records.load(std::memory_order_relaxed));
  append_u64(out, "window_rollovers", window_rollovers.load(std::memory_order_relaxed));
  append_u64(out, "store_conflicts", store_conflicts.load(std::memory_order_relaxed));
  out += ",\"latency\":";
  out += admission_latency.to_json();
  out += "},\"scheduler\":{";
  append_u64(out, "tasks_completed", tasks_completed.load(std::memory_order_relaxed), true);
  append_u64(out, "tasks_failed", tasks_failed.load(std::memory_order_relaxed));
  append_u64(out, "tasks_blocked", tasks_blocked.load(std::memory_order_relaxed));
  append_u64(out, "tasks_cancelled", tasks_cancelled.load(std::memory_order_relaxed));
  append_u64(out, "task_retries", task_retries.load(std::memory_order_relaxed));
  append_u64(out, "executor_calls", executor_calls.load(std::memory_order_relaxed));
  out += ",\"executor_latency\":";
  out += executor_latency.to_json();
  out += "},\"cache\":{";
  append_u64(out, "lookups", lookups, true);
  append_u64(out, "hits", hits);
  append_rate(out, "hit_rate", hits, lookups);
  append_u64(out, "degraded", cache_degraded.load(std::memory_order_relaxed));
  out += ",\"latency\":";
  out += cache_lookup_latency.to_json();
  out += "}}";
  return out;
}

OrchestratorStats& global_orchestrator_stats() {
  static OrchestratorStats inst;
  return inst;
}

void set_event_hook(EventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_event(const OrchestratorEvent& ev) {
  global_orchestrator_stats().record(ev);

  EventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: HELIOS_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("HELIOS_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';
  // O_APPEND is atomic for writes < PIPE_BUF on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace helios

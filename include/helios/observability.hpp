#pragma once

// helios/observability.hpp — Structured events, counters and diagnostics log.
//
// DESIGN:
//   OrchestratorEvent is the canonical observable unit. Admission decisions,
//   usage reconciliation, window rollovers, cache lookups/stores and every task
//   state transition emit one event, which is:
//     1. Counted into the process-wide OrchestratorStats (atomics, histograms).
//     2. Kept in a bounded ring buffer (last kMaxRecentEvents).
//     3. Forwarded to an installed hook if one is set, otherwise
//     4. Appended as one JSON line to $HELIOS_EVENT_LOG when that is set.
//
//   Human diagnostics go to stderr as "[helios:<component>] <message>" lines,
//   filtered by the process log level ($HELIOS_LOG_LEVEL, default "warn").
//
// INVARIANT:
//   Emission never throws and never blocks on anything but the ring mutex.
//   Events carry ids, tiers, units and codes only, never task payloads.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace helios {

// ---------------------------------------------------------------------------
// Diagnostics log
// ---------------------------------------------------------------------------
enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

LogLevel parse_log_level(const std::string& s, LogLevel def = LogLevel::warn);
void set_log_level(LogLevel level);
LogLevel log_level();
void log_message(LogLevel level, const std::string& component, const std::string& message);

inline void log_debug(const std::string& c, const std::string& m) { log_message(LogLevel::debug, c, m); }
inline void log_info(const std::string& c, const std::string& m) { log_message(LogLevel::info, c, m); }
inline void log_warn(const std::string& c, const std::string& m) { log_message(LogLevel::warn, c, m); }
inline void log_error(const std::string& c, const std::string& m) { log_message(LogLevel::error, c, m); }

// ---------------------------------------------------------------------------
// OrchestratorEvent
// ---------------------------------------------------------------------------
enum class EventKind {
  admission,
  usage_recorded,
  window_rollover,
  cache_lookup,
  cache_store,
  cache_invalidate,
  task_transition,
  project_scheduled,
  project_finished,
};

std::string to_string(EventKind kind);

struct OrchestratorEvent {
  EventKind kind{EventKind::admission};
  std::string subject_id;   // task id, window id or project id
  std::string project_id;
  std::string outcome;      // e.g. "admitted", "l2_hit", "completed"
  std::string tier;
  std::string error_code;
  uint64_t units{0};
  uint64_t duration_ns{0};
  uint64_t timestamp_unix_ms{0};
  std::string worker_id;
};

std::string event_to_json(const OrchestratorEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);
  double percentile(double p) const;  // microseconds
  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;
  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// OrchestratorStats — process-wide counters. Thread-safe.
// ---------------------------------------------------------------------------
class OrchestratorStats {
 public:
  void record(const OrchestratorEvent& ev);
  std::string to_json() const;
  std::vector<OrchestratorEvent> recent_events_snapshot() const;
  void reset_for_testing();

  // Governor
  alignas(64) std::atomic<uint64_t> admissions_granted{0};
  alignas(64) std::atomic<uint64_t> admissions_queued{0};
  alignas(64) std::atomic<uint64_t> admissions_rejected{0};
  alignas(64) std::atomic<uint64_t> usage_records{0};
  alignas(64) std::atomic<uint64_t> window_rollovers{0};
  alignas(64) std::atomic<uint64_t> store_conflicts{0};

  // Scheduler
  alignas(64) std::atomic<uint64_t> tasks_completed{0};
  alignas(64) std::atomic<uint64_t> tasks_failed{0};
  alignas(64) std::atomic<uint64_t> tasks_blocked{0};
  alignas(64) std::atomic<uint64_t> tasks_cancelled{0};
  alignas(64) std::atomic<uint64_t> task_retries{0};
  alignas(64) std::atomic<uint64_t> executor_calls{0};

  // Cache
  alignas(64) std::atomic<uint64_t> cache_lookups{0};
  alignas(64) std::atomic<uint64_t> cache_hits{0};
  alignas(64) std::atomic<uint64_t> cache_degraded{0};

  LatencyHistogram admission_latency;
  LatencyHistogram cache_lookup_latency;
  LatencyHistogram executor_latency;

  static constexpr size_t kMaxRecentEvents = 1000;

 private:
  mutable std::mutex ring_mu_;
  std::vector<OrchestratorEvent> ring_buffer_;
  size_t ring_head_{0};  // next slot to overwrite once full
};

OrchestratorStats& global_orchestrator_stats();

// Record + forward one event. Fire-and-forget.
void emit_event(const OrchestratorEvent& ev);

using EventHook = void (*)(const OrchestratorEvent&);
void set_event_hook(EventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace helios

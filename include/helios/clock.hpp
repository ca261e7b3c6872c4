#pragma once

// helios/clock.hpp — Injectable wall clock.
//
// Every time-dependent component (window rollover, TTL expiry, deadlines,
// retry backoff) reads time through a Clock so tests can drive it with a
// ManualClock. Times are Unix epoch milliseconds.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace helios {

class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t now_unix_ms() const = 0;
};

class SystemClock final : public Clock {
 public:
  uint64_t now_unix_ms() const override {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  }
};

// Deterministic clock for tests. Thread-safe.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(uint64_t start_unix_ms = 1700000000000ull) : now_ms_(start_unix_ms) {}

  uint64_t now_unix_ms() const override { return now_ms_.load(std::memory_order_acquire); }
  void set(uint64_t unix_ms) { now_ms_.store(unix_ms, std::memory_order_release); }
  void advance(uint64_t ms) { now_ms_.fetch_add(ms, std::memory_order_acq_rel); }

 private:
  std::atomic<uint64_t> now_ms_;
};

inline std::shared_ptr<Clock> make_system_clock() {
  return std::make_shared<SystemClock>();
}

}  // namespace helios

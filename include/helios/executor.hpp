#pragma once

// helios/executor.hpp — Boundary to whatever actually performs a task.
//
// The scheduler calls execute() from pool worker threads, concurrently, one
// call per task attempt. Implementations must be thread-safe and must return
// (never throw) on backend failure. Network-level retry is the executor's own
// concern; the scheduler retries at task level.

#include <cstdint>
#include <string>

#include "helios/types.hpp"

namespace helios {

struct ExecutorResult {
  std::string result;
  uint64_t actual_units{0};
  bool success{false};
  bool timed_out{false};
  std::string error;
};

class IExecutor {
 public:
  virtual ~IExecutor() = default;
  virtual ExecutorResult execute(const Task& task) = 0;
  virtual std::string executor_id() const = 0;
};

}  // namespace helios

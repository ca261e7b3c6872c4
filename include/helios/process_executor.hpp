#pragma once

// helios/process_executor.hpp — Runs each task as a child process.
//
// PROTOCOL:
//   stdin   task JSON (task_to_object) followed by EOF.
//   stdout  either {"result": ..., "actual_units": N} or any text, which is
//           taken verbatim as the result with actual_units = estimated_units.
//   exit 0  success; anything else is an executor failure carrying stderr.
//   env     HELIOS_TASK_ID, HELIOS_PROJECT_ID, HELIOS_TASK_TYPE, HELIOS_TIER
//           plus PATH and HOME from the parent.
//
// The child runs in its own session; on timeout the whole process group is
// killed and the attempt reports timed_out.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "helios/config.hpp"
#include "helios/executor.hpp"

namespace helios {

struct ProcessSpec {
  std::string command;
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  std::string cwd;
  std::string stdin_text;
  uint64_t timeout_ms{5000};
  size_t max_output_bytes{4096};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // "spawn_failed" when fork/pipe failed
};

ProcessResult run_process(const ProcessSpec& spec);

class ProcessExecutor : public IExecutor {
 public:
  explicit ProcessExecutor(ExecutorConfig config);

  ExecutorResult execute(const Task& task) override;
  std::string executor_id() const override { return "process:" + config_.command; }

 private:
  ExecutorConfig config_;
};

}  // namespace helios

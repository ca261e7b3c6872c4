#include "helios/process_executor.hpp"

#include <algorithm>
#include <cstdlib>

#include "helios/jsonlite.hpp"
#include "helios/observability.hpp"

#ifndef _WIN32
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <mutex>
#include <thread>
#endif

namespace helios {

#ifndef _WIN32

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n, size_t limit, bool& truncated) {
  if (n <= 0) return;
  const size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const size_t take = std::min<size_t>(static_cast<size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<size_t>(n)) truncated = true;
}

void close_fd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

}  // namespace

ProcessResult run_process(const ProcessSpec& spec) {
  // A child that exits before reading its stdin must not kill us with SIGPIPE.
  static std::once_flag sigpipe_once;
  std::call_once(sigpipe_once, []() { signal(SIGPIPE, SIG_IGN); });

  ProcessResult result;
  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
    for (int* p : {in_pipe, out_pipe, err_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    result.error_message = "spawn_failed";
    return result;
  }

  // Everything the child needs is built before fork().
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  for (const auto& [k, v] : spec.env) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    for (int* p : {in_pipe, out_pipe, err_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    result.error_message = "spawn_failed";
    return result;
  }

  if (pid == 0) {
    setsid();
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(in_pipe[0]);
    close(in_pipe[1]);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) _exit(127);
    execve(spec.command.c_str(), argv.data(), envp.data());
    _exit(127);
  }

  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  fcntl(in_pipe[1], F_SETFL, O_NONBLOCK);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  size_t written = 0;
  if (spec.stdin_text.empty()) close_fd(in_pipe[1]);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  char buf[4096];
  int status = 0;
  while (true) {
    if (in_pipe[1] >= 0) {
      const ssize_t w = write(in_pipe[1], spec.stdin_text.data() + written, spec.stdin_text.size() - written);
      if (w > 0) written += static_cast<size_t>(w);
      if (written >= spec.stdin_text.size() || (w < 0 && errno != EAGAIN && errno != EINTR)) {
        close_fd(in_pipe[1]);
      }
    }
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
    n = read(err_pipe[0], buf, sizeof(buf));
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);

    if (waitpid(pid, &status, WNOHANG) == pid) break;
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  close_fd(in_pipe[1]);

  while (true) {
    const ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    if (n <= 0) break;
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
  }
  while (true) {
    const ssize_t n = read(err_pipe[0], buf, sizeof(buf));
    if (n <= 0) break;
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);
  }
  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

#else

ProcessResult run_process(const ProcessSpec&) {
  ProcessResult result;
  result.exit_code = 127;
  result.error_message = "spawn_failed";
  return result;
}

#endif

ProcessExecutor::ProcessExecutor(ExecutorConfig config) : config_(std::move(config)) {}

ExecutorResult ProcessExecutor::execute(const Task& task) {
  ExecutorResult out;
  if (config_.command.empty()) {
    out.error = "no executor command configured";
    return out;
  }

  ProcessSpec spec;
  spec.command = config_.command;
  spec.argv = config_.args;
  spec.timeout_ms = config_.timeout_ms;
  spec.max_output_bytes = config_.max_output_bytes;
  for (const char* name : {"PATH", "HOME"}) {
    if (const char* v = std::getenv(name)) spec.env[name] = v;
  }
  spec.env["HELIOS_TASK_ID"] = task.id;
  spec.env["HELIOS_PROJECT_ID"] = task.project_id;
  spec.env["HELIOS_TASK_TYPE"] = task.task_type;
  spec.env["HELIOS_TIER"] = task.allocated_tier ? to_string(*task.allocated_tier) : "";
  spec.stdin_text = jsonlite::to_json(task_to_object(task));

  const ProcessResult pr = run_process(spec);
  if (!pr.error_message.empty()) {
    out.error = pr.error_message;
    log_error("executor", "failed to spawn " + config_.command + " for " + task.id);
    return out;
  }
  if (pr.timed_out) {
    out.timed_out = true;
    out.error = "executor timed out after " + std::to_string(config_.timeout_ms) + " ms";
    return out;
  }
  if (pr.exit_code != 0) {
    out.error = "exit " + std::to_string(pr.exit_code) + (pr.stderr_text.empty() ? "" : ": " + pr.stderr_text);
    return out;
  }
  if (pr.stdout_truncated) log_warn("executor", "output of " + task.id + " truncated");

  out.success = true;
  out.actual_units = task.estimated_units;
  out.result = pr.stdout_text;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object obj = jsonlite::parse(pr.stdout_text, &err);
  if (!err && jsonlite::has_key(obj, "result")) {
    const jsonlite::Value& v = obj.at("result");
    out.result = std::holds_alternative<std::string>(v.v) ? std::get<std::string>(v.v) : jsonlite::to_json(v);
    out.actual_units = jsonlite::get_u64(obj, "actual_units", task.estimated_units);
  }
  return out;
}

}  // namespace helios

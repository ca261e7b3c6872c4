#include "helios/worker.hpp"

#include <cstdlib>
#include <mutex>
#include <sstream>
#include <unistd.h>  // getpid, gethostname

#include "helios/clock.hpp"
#include "helios/jsonlite.hpp"

namespace helios {

namespace {

WorkerIdentity g_worker_identity;
std::mutex g_init_mu;
bool g_initialized{false};

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0) return buf;
  return "unknown-host";
}

std::string env_or(const char* name, const std::string& fallback) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : fallback;
}

}  // namespace

WorkerIdentity init_worker_identity(const std::string& worker_id, const std::string& node_id) {
  std::lock_guard<std::mutex> lk(g_init_mu);
  if (g_initialized) return g_worker_identity;

  g_worker_identity.pid = static_cast<int>(::getpid());
  g_worker_identity.worker_id = worker_id.empty()
      ? env_or("HELIOS_WORKER_ID", "w-" + std::to_string(g_worker_identity.pid))
      : worker_id;
  g_worker_identity.node_id = node_id.empty() ? env_or("HELIOS_NODE_ID", get_hostname()) : node_id;
  g_worker_identity.started_at_unix_ms = SystemClock().now_unix_ms();
  g_initialized = true;
  return g_worker_identity;
}

const WorkerIdentity& global_worker_identity() {
  {
    std::lock_guard<std::mutex> lk(g_init_mu);
    if (g_initialized) return g_worker_identity;
  }
  init_worker_identity();
  return g_worker_identity;
}

std::string worker_identity_to_json(const WorkerIdentity& w) {
  std::ostringstream o;
  o << "{"
    << "\"worker_id\":\"" << jsonlite::escape(w.worker_id) << "\""
    << ",\"node_id\":\"" << jsonlite::escape(w.node_id) << "\""
    << ",\"pid\":" << w.pid
    << ",\"started_at\":" << w.started_at_unix_ms
    << "}";
  return o.str();
}

}  // namespace helios

#pragma once

// helios/service.hpp — Transport-agnostic request/response API.
//
// HeliosService owns one instance of every component, wired from a
// HeliosConfig:
//   store -> router -> governor(router) -> cache -> scheduler(governor, router, cache, executor)
//
// FRAMING:
//   handle(op, body_json) -> response_json
//     {"ok":true,"result":{...}}
//     {"ok":false,"error":{"code":"<ErrorCode>","message":"..."}}
//   handle_line(line) accepts {"op":"...","body":{...},"id":"..."} and echoes
//   "id" in the response.
//   LineServer drives handle_line() for `helios serve` (NDJSON over stdio).
//
// Admission denials and cache misses are successful responses; callers read
// `allocated` / `hit` from the result. Only malformed input, unknown projects
// and store failures produce ok=false.

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "helios/cache.hpp"
#include "helios/clock.hpp"
#include "helios/config.hpp"
#include "helios/executor.hpp"
#include "helios/governor.hpp"
#include "helios/jsonlite.hpp"
#include "helios/router.hpp"
#include "helios/scheduler.hpp"
#include "helios/state_store.hpp"

namespace helios {

struct ServiceDependencies {
  std::shared_ptr<const Clock> clock;                // default: system clock
  std::shared_ptr<IStateStore> store;                // default: from config.store
  std::shared_ptr<IExecutor> executor;               // default: ProcessExecutor(config.executor)
  std::shared_ptr<const IEmbeddingProvider> embedder;  // default: hashing provider
};

class HeliosService {
 public:
  explicit HeliosService(HeliosConfig config, ServiceDependencies deps = {});

  std::string handle(const std::string& op, const std::string& body_json);
  std::string handle_line(const std::string& line);

  static const std::vector<std::string>& operations();

  const HeliosConfig& config() const { return config_; }
  IStateStore& store() { return *store_; }
  EconomicRouter& router() { return *router_; }
  ResourceGovernor& governor() { return *governor_; }
  CacheManager& cache() { return *cache_; }
  HybridScheduler& scheduler() { return *scheduler_; }

 private:
  std::string dispatch(const std::string& op, const jsonlite::Object& body);
  std::string health_json();

  HeliosConfig config_;
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<IStateStore> store_;
  std::shared_ptr<IExecutor> executor_;
  std::unique_ptr<EconomicRouter> router_;
  std::unique_ptr<ResourceGovernor> governor_;
  std::unique_ptr<CacheManager> cache_;
  std::unique_ptr<HybridScheduler> scheduler_;
};

// Serves NDJSON request lines against one HeliosService. Blocking operations
// (project.execute) run on their own thread, so later lines such as
// project.cancel or project.status are answered while a project executes.
// Responses may therefore arrive out of order; clients match them by "id".
// Every response is passed to `sink` whole, one call at a time.
class LineServer {
 public:
  using Sink = std::function<void(const std::string&)>;

  LineServer(HeliosService& service, Sink sink);
  ~LineServer();  // drain()

  LineServer(const LineServer&) = delete;
  LineServer& operator=(const LineServer&) = delete;

  void submit(const std::string& line);

  // Waits for every request still running.
  void drain();

  size_t outstanding() const;

  static bool runs_detached(const std::string& op);

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void write(const std::string& response);
  void reap_locked();

  HeliosService& service_;
  Sink sink_;
  std::mutex write_mu_;
  mutable std::mutex mu_;
  std::vector<Worker> workers_;
};

}  // namespace helios

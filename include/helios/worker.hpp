#pragma once

// helios/worker.hpp — Identity of this orchestrator process.
//
// DESIGN:
//   Several orchestrator processes may share one state store (one governor
//   window, one cache). Each process gets a WorkerIdentity at startup; the id
//   is stamped on every reservation and event so shared state stays
//   attributable to the process that wrote it.
//
//   worker_id: $HELIOS_WORKER_ID, else "w-<pid>".
//   node_id:   $HELIOS_NODE_ID, else the hostname.
//
// INVARIANT: identity is fixed after the first call to init_worker_identity()
// or global_worker_identity().

#include <cstdint>
#include <string>

namespace helios {

struct WorkerIdentity {
  std::string worker_id;
  std::string node_id;
  uint64_t started_at_unix_ms{0};
  int pid{0};
};

WorkerIdentity init_worker_identity(const std::string& worker_id = "",
                                    const std::string& node_id = "");

const WorkerIdentity& global_worker_identity();

std::string worker_identity_to_json(const WorkerIdentity& w);

}  // namespace helios

#pragma once

// helios/version.hpp — Version manifest for every persisted or framed surface.
//
// PURPOSE:
//   Window records, cache entries, file-store objects and API frames all carry
//   a format version. Readers compare against these constants before trusting
//   stored data.
//
// INVARIANT:
//   All version constants are compile-time. A record written with a newer
//   format than the running build is treated as unreadable (fail-closed),
//   never reinterpreted.

#include <cstdint>
#include <string>

namespace helios {
namespace version {

// Semantic version of the orchestration core.
constexpr const char* kSemver = "1.3.0";

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256 with domain prefixes ("l1:", "l2:", "type:", "key:",
// "blob:"). Changing a prefix invalidates every stored cache key.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// STATE_FORMAT_VERSION
// Schema of governor window/history records, router performance table and
// cache entries as stored in the shared state store.
// ---------------------------------------------------------------------------
constexpr uint32_t STATE_FORMAT_VERSION = 2;

// ---------------------------------------------------------------------------
// FILE_STORE_FORMAT_VERSION
// On-disk layout of FileStateStore: objects/AB/CD/<digest> with a JSON header
// line followed by the (optionally zstd-compressed) payload.
// ---------------------------------------------------------------------------
constexpr uint32_t FILE_STORE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// API_FRAMING_VERSION
// NDJSON request/response frames of `helios serve`.
// ---------------------------------------------------------------------------
constexpr uint32_t API_FRAMING_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t state_format{STATE_FORMAT_VERSION};
  uint32_t file_store_format{FILE_STORE_FORMAT_VERSION};
  uint32_t api_framing{API_FRAMING_VERSION};
  std::string semver;
  std::string hash_primitive;
  std::string hash_library_version;
  bool zstd_enabled{false};
  std::string build_timestamp;
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace helios

#include "helios/version.hpp"

#include <sstream>

#include "helios/hash.hpp"

namespace helios {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver = kSemver;
  const HashRuntimeInfo info = hash_runtime_info();
  m.hash_primitive = info.primitive;
  m.hash_library_version = info.version;
#if defined(HELIOS_WITH_ZSTD)
  m.zstd_enabled = true;
#endif
  // Build timestamp from preprocessor macros, stable within a single build.
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"semver\":\"" << m.semver << "\""
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"state_format\":" << m.state_format
    << ",\"file_store_format\":" << m.file_store_format
    << ",\"api_framing\":" << m.api_framing
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_library_version\":\"" << m.hash_library_version << "\""
    << ",\"zstd_enabled\":" << (m.zstd_enabled ? "true" : "false")
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace helios

#include "helios/hash.hpp"

// Hash authority for cache keys and file-store object names.
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for nibble
// encoding; for 32-byte digests this is ~3x faster than snprintf("%02x").

#include <array>

extern "C" {
#include <blake3.h>
}

namespace helios {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";
constexpr std::size_t kTypeTagChars = 16;

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  const char* v = blake3_version();
  info.version = v ? v : "unknown";
  info.blake3_available = true;
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_domain_parts(std::string_view domain,
                              const std::vector<std::string_view>& parts) {
  static const char kSep = '\0';
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  for (const auto& p : parts) {
    blake3_hasher_update(&hasher, p.data(), p.size());
    blake3_hasher_update(&hasher, &kSep, 1);
  }
  return finalize_hex(hasher);
}

std::string task_type_tag(std::string_view task_type) {
  return hash_domain("type:", task_type).substr(0, kTypeTagChars);
}

std::string store_object_digest(std::string_view key) {
  return hash_domain("key:", key);
}

std::string store_blob_hash(std::string_view stored_bytes) {
  return hash_domain("blob:", stored_bytes);
}

}  // namespace helios

#pragma once

// helios/hash.hpp — BLAKE3 hashing with domain separation.
//
// DESIGN INVARIANTS:
//   1. BLAKE3-256 is the only hash primitive. Digests are 64-char lowercase hex.
//   2. Every digest used as a key is domain separated by a fixed prefix:
//        "l1:"   cache L1 key (task type, context prefix, input)
//        "l2:"   cache L2 key (task type, normalized input)
//        "l3:"   cache L3 entry key (task type, normalized input)
//        "emb:"  HashingEmbeddingProvider token bucket
//        "type:" task-type tag embedded in cache keys
//        "key:"  FileStateStore object name for a store key
//        "blob:" FileStateStore payload integrity hash
//      These prefixes are part of the key schema (HASH_ALGORITHM_VERSION).
//   3. Multi-part keys feed each part followed by a 0x00 separator, so
//      ("ab","c") and ("a","bc") never collide.

#include <string>
#include <string_view>
#include <vector>

namespace helios {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  bool blake3_available{false};
};

HashRuntimeInfo hash_runtime_info();

std::string blake3_hex(std::string_view payload);

// BLAKE3(domain || payload) as hex.
std::string hash_domain(std::string_view domain, std::string_view payload);

// BLAKE3(domain || part0 || 0x00 || part1 || 0x00 ...) as hex.
std::string hash_domain_parts(std::string_view domain,
                              const std::vector<std::string_view>& parts);

// Short (16 hex chars) tag for a task type. Used as a key path segment so that
// invalidation by task type is a prefix scan.
std::string task_type_tag(std::string_view task_type);

std::string store_object_digest(std::string_view key);
std::string store_blob_hash(std::string_view stored_bytes);

}  // namespace helios

#pragma once

// helios/state_store.hpp — Shared state store interface and implementations.
//
// The governor window, its history, the router performance table and every
// cache entry live behind IStateStore. Several orchestrator processes may share
// one store, so all read-modify-write sequences go through compare_and_swap().
//
// DESIGN INVARIANTS (must hold for every implementation):
//   1. compare_and_swap() is atomic with respect to every other mutation of
//      the same key, across threads AND (for shared backends) processes.
//   2. An expired entry is indistinguishable from an absent one: get() returns
//      not_found (and drops the entry) and compare_and_swap() treats it as
//      absent. purge_expired() sweeps the rest.
//   3. Failures are reported as StoreStatus::unavailable, never thrown.
//   4. Values are opaque byte strings; the store never interprets them.
//
// EXTENSION_POINT: networked_store
//   A Redis-style backend maps get/set/remove directly, compare_and_swap to a
//   WATCH/MULTI transaction (or a server-side script), and TTL to native key
//   expiry. Invariant: expiry must be enforced by the server, not the client.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "helios/clock.hpp"

namespace helios {

enum class StoreStatus {
  ok,
  not_found,
  conflict,     // compare_and_swap expectation did not match
  unavailable,  // backend failure
};

std::string to_string(StoreStatus status);

class IStateStore {
 public:
  virtual ~IStateStore() = default;

  // Read a live value. expires_at (optional) receives the absolute expiry in
  // Unix ms, 0 when the entry never expires.
  virtual StoreStatus get(const std::string& key, std::string& out,
                          uint64_t* expires_at = nullptr) const = 0;

  // Unconditional write. ttl_ms = 0 means no expiry.
  virtual StoreStatus set(const std::string& key, const std::string& value,
                          uint64_t ttl_ms = 0) = 0;

  // Write `desired` only if the current live value equals *expected, or, when
  // expected is nullopt, only if the key is absent. Returns conflict otherwise.
  virtual StoreStatus compare_and_swap(const std::string& key,
                                       const std::optional<std::string>& expected,
                                       const std::string& desired,
                                       uint64_t ttl_ms = 0) = 0;

  // Returns ok when removed, not_found when there was nothing live to remove.
  virtual StoreStatus remove(const std::string& key) = 0;

  // Keys of live entries starting with `prefix`, sorted.
  virtual std::vector<std::string> scan_keys(const std::string& prefix) const = 0;

  virtual size_t purge_expired() = 0;
  virtual size_t size() const = 0;
  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// MemoryStateStore — single-process store. Thread-safe via one mutex.
// ---------------------------------------------------------------------------
class MemoryStateStore : public IStateStore {
 public:
  explicit MemoryStateStore(std::shared_ptr<const Clock> clock = make_system_clock());

  StoreStatus get(const std::string& key, std::string& out,
                  uint64_t* expires_at = nullptr) const override;
  StoreStatus set(const std::string& key, const std::string& value,
                  uint64_t ttl_ms = 0) override;
  StoreStatus compare_and_swap(const std::string& key,
                               const std::optional<std::string>& expected,
                               const std::string& desired, uint64_t ttl_ms = 0) override;
  StoreStatus remove(const std::string& key) override;
  std::vector<std::string> scan_keys(const std::string& prefix) const override;
  size_t purge_expired() override;
  size_t size() const override;
  std::string backend_id() const override { return "memory"; }

 private:
  struct Entry {
    std::string value;
    uint64_t expires_at{0};
  };

  bool live(const Entry& e, uint64_t now) const { return e.expires_at == 0 || now < e.expires_at; }
  uint64_t expiry_for(uint64_t ttl_ms) const;

  std::shared_ptr<const Clock> clock_;
  mutable std::mutex mu_;
  mutable std::map<std::string, Entry> entries_;  // get() erases expired entries
};

// ---------------------------------------------------------------------------
// FileStateStore — durable store shared by processes on one host.
// ---------------------------------------------------------------------------
// Layout:
//   <root>/objects/AB/CD/<BLAKE3("key:" + key)>   one file per key
//   <root>/store.lock                             advisory lock (flock)
//
// Object file: one JSON header line, then the payload bytes.
//   {"format":1,"key":"...","expires_at":0,"encoding":"identity",
//    "original_size":N,"stored_size":M,"blob_hash":"<BLAKE3(\"blob:\"+payload)>"}
//
// Writes are atomic (tmp file + rename on the same filesystem). Mutations take
// the in-process mutex and then an exclusive flock on store.lock, so
// compare_and_swap is atomic across processes. Reads verify blob_hash; an
// integrity failure reads as not_found and is logged.
//
// When built with HELIOS_WITH_ZSTD, payloads of at least
// compress_threshold_bytes are stored zstd-compressed (encoding "zstd").
class FileStateStore : public IStateStore {
 public:
  explicit FileStateStore(std::string root,
                          std::shared_ptr<const Clock> clock = make_system_clock(),
                          size_t compress_threshold_bytes = 1024);

  StoreStatus get(const std::string& key, std::string& out,
                  uint64_t* expires_at = nullptr) const override;
  StoreStatus set(const std::string& key, const std::string& value,
                  uint64_t ttl_ms = 0) override;
  StoreStatus compare_and_swap(const std::string& key,
                               const std::optional<std::string>& expected,
                               const std::string& desired, uint64_t ttl_ms = 0) override;
  StoreStatus remove(const std::string& key) override;
  std::vector<std::string> scan_keys(const std::string& prefix) const override;
  size_t purge_expired() override;
  size_t size() const override;
  std::string backend_id() const override { return "file"; }

  const std::string& root() const { return root_; }

 private:
  struct Header {
    std::string key;
    uint64_t expires_at{0};
    std::string encoding{"identity"};
    size_t original_size{0};
    size_t stored_size{0};
    std::string blob_hash;
  };

  std::string object_path(const std::string& key) const;
  std::string lock_path() const;

  // Reads header (+ payload when `payload` is non-null). Returns not_found for
  // missing, expired or corrupt objects.
  StoreStatus read_object(const std::string& path, Header& header, std::string* payload) const;
  StoreStatus write_object(const std::string& key, const std::string& value, uint64_t ttl_ms);
  StoreStatus read_live_locked(const std::string& key, std::string& out) const;
  void drop_if_expired(const std::string& key) const;
  std::vector<std::string> object_files() const;

  std::string root_;
  std::shared_ptr<const Clock> clock_;
  size_t compress_threshold_bytes_;
  mutable std::mutex mu_;
};

// Build the backend named by `backend` ("memory" or "file").
std::shared_ptr<IStateStore> make_state_store(const std::string& backend, const std::string& root,
                                              std::shared_ptr<const Clock> clock,
                                              size_t compress_threshold_bytes);

}  // namespace helios

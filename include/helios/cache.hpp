#pragma once

// helios/cache.hpp — Three-tier response cache.
//
// TIERS (closed set, one ICacheTier each, waterfall order):
//   l1_prefix    exact (task_type, context prefix, input). Only for prefixes of
//                at least l1_min_prefix_tokens (length / 4). TTL 5 min.
//   l2_exact     exact (task_type, normalized input). TTL 1 h, max 24 h.
//   l3_semantic  nearest stored embedding of the same task type with cosine
//                similarity >= similarity_threshold. TTL 24 h, max 7 d.
//
// KEYS:
//   helios:cache:<l1|l2|l3>:<task_type_tag>:<BLAKE3 digest>
//   task_type_tag scopes scans and invalidation to one type. Each entry also
//   stores its task_type verbatim, and invalidate() checks it, so a tag
//   collision can never remove another type's entries.
//
// DEGRADATION:
//   A store failure in any tier reads as a miss with degraded = true and
//   error_code = cache_unavailable. Lookup never fails a task.
//
// EXTENSION_POINT: embedding_provider
//   IEmbeddingProvider supplies L3 vectors. HashingEmbeddingProvider is a
//   deterministic hashed bag-of-words; a model-backed provider plugs in here.
//   Callers may also pass a precomputed embedding with the request.

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "helios/clock.hpp"
#include "helios/config.hpp"
#include "helios/jsonlite.hpp"
#include "helios/state_store.hpp"
#include "helios/types.hpp"

namespace helios {

enum class CacheTier {
  l1_prefix,
  l2_exact,
  l3_semantic,
};

// "l1" / "l2" / "l3".
std::string to_string(CacheTier tier);

// Trim, lowercase and collapse runs of whitespace to one space.
std::string normalize_cache_input(const std::string& input);

// 0 when either vector is empty, zero-length or the dimensions differ.
double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b);

// ---------------------------------------------------------------------------
// Embeddings
// ---------------------------------------------------------------------------
class IEmbeddingProvider {
 public:
  virtual ~IEmbeddingProvider() = default;
  virtual std::vector<double> embed(const std::string& text) const = 0;
  virtual size_t dimension() const = 0;
  virtual std::string provider_id() const = 0;
};

// Lowercased alphanumeric tokens hashed (BLAKE3) into `dimension` signed
// buckets, then L2-normalized. Same text, same vector, in every process.
class HashingEmbeddingProvider : public IEmbeddingProvider {
 public:
  explicit HashingEmbeddingProvider(size_t dimension = 256);

  std::vector<double> embed(const std::string& text) const override;
  size_t dimension() const override { return dimension_; }
  std::string provider_id() const override { return "hashing-bow-v1"; }

 private:
  size_t dimension_;
};

// ---------------------------------------------------------------------------
// Requests / results
// ---------------------------------------------------------------------------
struct CacheQuery {
  std::string input;
  std::string task_type;
  std::string context_prefix;
  std::vector<double> embedding;  // empty = computed by the L3 tier when needed
};

struct CacheLookupResult {
  bool hit{false};
  CacheTier tier{CacheTier::l2_exact};
  std::string response;
  double confidence{0.0};
  double similarity{0.0};          // L3 only
  double cost_avoided_units{0.0};
  uint64_t latency_us{0};
  bool degraded{false};
  ErrorCode error_code{ErrorCode::none};
  std::string error;
  std::string key;
};

std::string cache_lookup_to_json(const CacheLookupResult& r);

struct CacheStoreRequest {
  CacheQuery query;
  std::string response;
  double cost_units{0.0};               // 0 = policy default
  std::optional<uint64_t> ttl_ms;       // capped at the tier maximum
  bool allow_l1{true};
  bool allow_l2{true};
  bool allow_l3{true};
};

struct CacheTierWrite {
  CacheTier tier{CacheTier::l2_exact};
  bool eligible{false};
  bool stored{false};
  std::string key;
  std::string error;
};

struct CacheStoreResult {
  bool ok{false};  // at least one tier stored
  std::vector<CacheTierWrite> tiers;
};

std::string cache_store_to_json(const CacheStoreResult& r);

struct CacheInvalidateResult {
  bool ok{true};
  size_t removed{0};
  std::string error;
};

struct CacheTierMetrics {
  CacheTier tier{CacheTier::l2_exact};
  uint64_t lookups{0};
  uint64_t hits{0};
  uint64_t stores{0};
  uint64_t store_errors{0};
  double hit_rate{0.0};
  size_t entries{0};
};

struct CacheMetrics {
  std::vector<CacheTierMetrics> tiers;
  uint64_t lookups{0};
  uint64_t hits{0};
  uint64_t degraded_lookups{0};
  uint64_t invalidated{0};
  uint64_t purged{0};  // expired store entries swept by cache writes
  double hit_rate{0.0};
  double cost_saved_units{0.0};
  double l3_avg_similarity{0.0};
};

std::string cache_metrics_to_json(const CacheMetrics& m);

// ---------------------------------------------------------------------------
// ICacheTier
// ---------------------------------------------------------------------------
struct TierProbe {
  StoreStatus status{StoreStatus::not_found};  // ok = hit
  std::string response;
  double confidence{0.0};
  double cost_units{0.0};
  std::string key;
};

class ICacheTier {
 public:
  virtual ~ICacheTier() = default;
  virtual CacheTier tier() const = 0;
  virtual bool eligible(const CacheQuery& q) const = 0;
  virtual TierProbe lookup(CacheQuery& q) = 0;
  virtual StoreStatus store(const CacheQuery& q, const std::string& response, double cost_units,
                            std::optional<uint64_t> ttl_ms, std::string* key_out) = 0;
  virtual std::string key_prefix(const std::string& task_type) const = 0;
};

class CacheTierBase : public ICacheTier {
 public:
  CacheTierBase(std::shared_ptr<IStateStore> store, const CachePolicy& policy,
                std::shared_ptr<const Clock> clock)
      : store_(std::move(store)), policy_(policy), clock_(std::move(clock)) {}

  std::string key_prefix(const std::string& task_type) const override;

 protected:
  std::string key_for(const std::string& task_type, const std::string& digest) const;
  uint64_t capped_ttl(std::optional<uint64_t> requested, uint64_t def, uint64_t max) const;
  TierProbe read_exact(const std::string& key, const std::string& task_type);
  StoreStatus write_entry(const std::string& key, const CacheQuery& q, const std::string& response,
                          double cost_units, uint64_t ttl_ms, const std::vector<double>* embedding);
  // Bumps access_count on a hit entry read as `raw`, keeping its remaining TTL.
  void record_access(const std::string& key, const std::string& raw, uint64_t expires_at,
                     jsonlite::Object entry);

  std::shared_ptr<IStateStore> store_;
  CachePolicy policy_;
  std::shared_ptr<const Clock> clock_;
};

class PrefixCacheTier final : public CacheTierBase {
 public:
  using CacheTierBase::CacheTierBase;
  CacheTier tier() const override { return CacheTier::l1_prefix; }
  bool eligible(const CacheQuery& q) const override;
  TierProbe lookup(CacheQuery& q) override;
  StoreStatus store(const CacheQuery& q, const std::string& response, double cost_units,
                    std::optional<uint64_t> ttl_ms, std::string* key_out) override;

 private:
  std::string digest(const CacheQuery& q) const;
};

class ExactCacheTier final : public CacheTierBase {
 public:
  using CacheTierBase::CacheTierBase;
  CacheTier tier() const override { return CacheTier::l2_exact; }
  bool eligible(const CacheQuery&) const override { return true; }
  TierProbe lookup(CacheQuery& q) override;
  StoreStatus store(const CacheQuery& q, const std::string& response, double cost_units,
                    std::optional<uint64_t> ttl_ms, std::string* key_out) override;

 private:
  std::string digest(const CacheQuery& q) const;
};

class SemanticCacheTier final : public CacheTierBase {
 public:
  SemanticCacheTier(std::shared_ptr<IStateStore> store, const CachePolicy& policy,
                    std::shared_ptr<const Clock> clock, std::shared_ptr<const IEmbeddingProvider> embedder);

  CacheTier tier() const override { return CacheTier::l3_semantic; }
  bool eligible(const CacheQuery&) const override { return true; }
  TierProbe lookup(CacheQuery& q) override;
  StoreStatus store(const CacheQuery& q, const std::string& response, double cost_units,
                    std::optional<uint64_t> ttl_ms, std::string* key_out) override;

 private:
  std::string digest(const CacheQuery& q) const;
  void record_hit(const std::string& key, double similarity);

  std::shared_ptr<const IEmbeddingProvider> embedder_;
};

// ---------------------------------------------------------------------------
// CacheManager — waterfall orchestration + metrics. Thread-safe.
// ---------------------------------------------------------------------------
class CacheManager {
 public:
  CacheManager(std::shared_ptr<IStateStore> store, CachePolicy policy, std::shared_ptr<const Clock> clock,
               std::shared_ptr<const IEmbeddingProvider> embedder = nullptr);

  CacheLookupResult lookup(const CacheQuery& query);
  CacheStoreResult store(const CacheStoreRequest& req);

  // Empty task_type removes every cache entry.
  CacheInvalidateResult invalidate(const std::string& task_type = "");

  CacheMetrics metrics() const;
  const CachePolicy& policy() const { return policy_; }

 private:
  // Runs IStateStore::purge_expired() at most once per purge_interval_ms.
  void sweep_expired();

  struct TierCounters {
    std::atomic<uint64_t> lookups{0};
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> stores{0};
    std::atomic<uint64_t> store_errors{0};
  };

  std::shared_ptr<IStateStore> store_;
  CachePolicy policy_;
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<const IEmbeddingProvider> embedder_;
  std::vector<std::unique_ptr<ICacheTier>> tiers_;  // waterfall order
  TierCounters counters_[3];

  alignas(64) std::atomic<uint64_t> lookups_{0};
  alignas(64) std::atomic<uint64_t> hits_{0};
  alignas(64) std::atomic<uint64_t> degraded_{0};
  alignas(64) std::atomic<uint64_t> invalidated_{0};
  alignas(64) std::atomic<uint64_t> purged_{0};
  std::atomic<uint64_t> last_sweep_ms_{0};

  mutable std::mutex savings_mu_;
  double cost_saved_units_{0.0};
  double l3_similarity_sum_{0.0};
  uint64_t l3_hits_{0};
};

}  // namespace helios

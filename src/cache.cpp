#include "helios/cache.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <future>
#include <utility>

#include "helios/hash.hpp"
#include "helios/jsonlite.hpp"
#include "helios/observability.hpp"
#include "helios/version.hpp"
#include "helios/worker.hpp"

namespace helios {

namespace {

constexpr const char* kCacheRoot = "helios:cache:";

using jsonlite::Object;
using jsonlite::Value;

size_t tier_index(CacheTier tier) { return static_cast<size_t>(tier); }

bool parse_entry(const std::string& raw, Object& out) {
  std::optional<jsonlite::JsonError> err;
  out = jsonlite::parse(raw, &err);
  return !err.has_value();
}

void emit_cache_event(const std::string& outcome, const std::string& task_type, const std::string& tier,
                      bool degraded, uint64_t duration_ns, uint64_t now) {
  OrchestratorEvent ev;
  ev.kind = EventKind::cache_lookup;
  ev.subject_id = task_type;
  ev.outcome = outcome;
  ev.tier = tier;
  ev.error_code = degraded ? to_string(ErrorCode::cache_unavailable) : "";
  ev.duration_ns = duration_ns;
  ev.timestamp_unix_ms = now;
  ev.worker_id = global_worker_identity().worker_id;
  emit_event(ev);
}

}  // namespace

std::string to_string(CacheTier tier) {
  switch (tier) {
    case CacheTier::l1_prefix: return "l1";
    case CacheTier::l2_exact: return "l2";
    case CacheTier::l3_semantic: return "l3";
  }
  return "unknown";
}

std::string normalize_cache_input(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  bool pending_space = false;
  for (unsigned char c : input) {
    if (std::isspace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b) {
  if (a.empty() || a.size() != b.size()) return 0.0;
  double dot = 0.0, na = 0.0, nb = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += a[i] * b[i];
    na += a[i] * a[i];
    nb += b[i] * b[i];
  }
  if (na <= 0.0 || nb <= 0.0) return 0.0;
  return dot / (std::sqrt(na) * std::sqrt(nb));
}

// ---------------------------------------------------------------------------
// HashingEmbeddingProvider
// ---------------------------------------------------------------------------

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension)
    : dimension_(dimension == 0 ? 1 : dimension) {}

std::vector<double> HashingEmbeddingProvider::embed(const std::string& text) const {
  std::vector<double> v(dimension_, 0.0);
  std::string token;
  auto flush = [&]() {
    if (token.empty()) return;
    const std::string h = hash_domain("emb:", token);
    const uint64_t bucket = std::stoull(h.substr(0, 12), nullptr, 16) % dimension_;
    const double sign = (std::stoul(h.substr(12, 1), nullptr, 16) & 1u) ? -1.0 : 1.0;
    v[bucket] += sign;
    token.clear();
  };
  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      token.push_back(static_cast<char>(std::tolower(c)));
    } else {
      flush();
    }
  }
  flush();

  double norm = 0.0;
  for (double x : v) norm += x * x;
  if (norm > 0.0) {
    norm = std::sqrt(norm);
    for (double& x : v) x /= norm;
  }
  return v;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

std::string cache_lookup_to_json(const CacheLookupResult& r) {
  Object o;
  o["hit"] = Value{r.hit};
  if (r.hit) {
    o["tier"] = Value{to_string(r.tier)};
    o["response"] = Value{r.response};
    o["confidence"] = Value{r.confidence};
    o["cost_avoided_units"] = Value{r.cost_avoided_units};
    if (r.tier == CacheTier::l3_semantic) o["similarity"] = Value{r.similarity};
  }
  o["latency_us"] = Value{r.latency_us};
  o["degraded"] = Value{r.degraded};
  if (r.error_code != ErrorCode::none) {
    o["error_code"] = Value{to_string(r.error_code)};
    o["error"] = Value{r.error};
  }
  return jsonlite::to_json(o);
}

std::string cache_store_to_json(const CacheStoreResult& r) {
  Object tiers;
  for (const auto& w : r.tiers) {
    Object t;
    t["eligible"] = Value{w.eligible};
    t["stored"] = Value{w.stored};
    if (!w.error.empty()) t["error"] = Value{w.error};
    tiers[to_string(w.tier)] = Value{std::move(t)};
  }
  Object o;
  o["ok"] = Value{r.ok};
  o["tiers"] = Value{std::move(tiers)};
  return jsonlite::to_json(o);
}

std::string cache_metrics_to_json(const CacheMetrics& m) {
  Object tiers;
  for (const auto& t : m.tiers) {
    Object o;
    o["lookups"] = Value{t.lookups};
    o["hits"] = Value{t.hits};
    o["hit_rate"] = Value{t.hit_rate};
    o["stores"] = Value{t.stores};
    o["store_errors"] = Value{t.store_errors};
    o["entries"] = Value{static_cast<uint64_t>(t.entries)};
    tiers[to_string(t.tier)] = Value{std::move(o)};
  }
  Object o;
  o["tiers"] = Value{std::move(tiers)};
  o["lookups"] = Value{m.lookups};
  o["hits"] = Value{m.hits};
  o["hit_rate"] = Value{m.hit_rate};
  o["degraded_lookups"] = Value{m.degraded_lookups};
  o["invalidated"] = Value{m.invalidated};
  o["purged"] = Value{m.purged};
  o["cost_saved_units"] = Value{m.cost_saved_units};
  o["l3_avg_similarity"] = Value{m.l3_avg_similarity};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// CacheTierBase
// ---------------------------------------------------------------------------

std::string CacheTierBase::key_prefix(const std::string& task_type) const {
  return std::string(kCacheRoot) + to_string(tier()) + ":" + task_type_tag(task_type) + ":";
}

std::string CacheTierBase::key_for(const std::string& task_type, const std::string& digest) const {
  return key_prefix(task_type) + digest;
}

uint64_t CacheTierBase::capped_ttl(std::optional<uint64_t> requested, uint64_t def, uint64_t max) const {
  if (!requested || *requested == 0) return def;
  return std::min(*requested, max);
}

TierProbe CacheTierBase::read_exact(const std::string& key, const std::string& task_type) {
  TierProbe p;
  p.key = key;
  std::string raw;
  uint64_t expires_at = 0;
  p.status = store_->get(key, raw, &expires_at);
  if (p.status != StoreStatus::ok) return p;

  Object entry;
  if (!parse_entry(raw, entry) || jsonlite::get_string(entry, "task_type") != task_type) {
    p.status = StoreStatus::not_found;
    return p;
  }
  p.response = jsonlite::get_string(entry, "response");
  p.cost_units = jsonlite::get_double(entry, "cost_units", policy_.default_entry_cost_units);
  p.confidence = 1.0;
  record_access(key, raw, expires_at, std::move(entry));
  return p;
}

void CacheTierBase::record_access(const std::string& key, const std::string& raw, uint64_t expires_at,
                                  Object entry) {
  const uint64_t now = clock_->now_unix_ms();
  if (expires_at != 0 && expires_at <= now) return;
  entry["access_count"] = Value{static_cast<std::uint64_t>(jsonlite::get_u64(entry, "access_count") + 1)};
  entry["last_access_at"] = Value{now};
  const uint64_t ttl = expires_at == 0 ? 0 : expires_at - now;
  // A lost race only drops one access-count update.
  if (store_->compare_and_swap(key, raw, jsonlite::to_json(entry), ttl) != StoreStatus::ok) {
    log_debug("cache", "skipped hit bookkeeping for " + key);
  }
}

StoreStatus CacheTierBase::write_entry(const std::string& key, const CacheQuery& q, const std::string& response,
                                       double cost_units, uint64_t ttl_ms, const std::vector<double>* embedding) {
  Object o;
  o["format"] = Value{static_cast<std::uint64_t>(version::STATE_FORMAT_VERSION)};
  o["tier"] = Value{to_string(tier())};
  o["task_type"] = Value{q.task_type};
  o["input"] = Value{q.input};
  o["response"] = Value{response};
  o["cost_units"] = Value{cost_units};
  o["created_at"] = Value{clock_->now_unix_ms()};
  o["access_count"] = Value{static_cast<std::uint64_t>(0)};
  if (embedding) {
    jsonlite::Array arr;
    arr.reserve(embedding->size());
    for (double x : *embedding) arr.push_back(Value{x});
    o["embedding"] = Value{std::move(arr)};
    o["similarity_ema"] = Value{0.0};
  }
  return store_->set(key, jsonlite::to_json(o), ttl_ms);
}

// ---------------------------------------------------------------------------
// L1 — context prefix
// ---------------------------------------------------------------------------

bool PrefixCacheTier::eligible(const CacheQuery& q) const {
  return !q.context_prefix.empty() && q.context_prefix.size() / 4 >= policy_.l1_min_prefix_tokens;
}

std::string PrefixCacheTier::digest(const CacheQuery& q) const {
  return hash_domain_parts("l1:", {q.task_type, q.context_prefix, q.input});
}

TierProbe PrefixCacheTier::lookup(CacheQuery& q) {
  return read_exact(key_for(q.task_type, digest(q)), q.task_type);
}

StoreStatus PrefixCacheTier::store(const CacheQuery& q, const std::string& response, double cost_units,
                                   std::optional<uint64_t> ttl_ms, std::string* key_out) {
  const std::string key = key_for(q.task_type, digest(q));
  if (key_out) *key_out = key;
  return write_entry(key, q, response, cost_units, capped_ttl(ttl_ms, policy_.l1_ttl_ms, policy_.l1_ttl_ms),
                     nullptr);
}

// ---------------------------------------------------------------------------
// L2 — exact normalized input
// ---------------------------------------------------------------------------

std::string ExactCacheTier::digest(const CacheQuery& q) const {
  return hash_domain_parts("l2:", {q.task_type, normalize_cache_input(q.input)});
}

TierProbe ExactCacheTier::lookup(CacheQuery& q) {
  return read_exact(key_for(q.task_type, digest(q)), q.task_type);
}

StoreStatus ExactCacheTier::store(const CacheQuery& q, const std::string& response, double cost_units,
                                  std::optional<uint64_t> ttl_ms, std::string* key_out) {
  const std::string key = key_for(q.task_type, digest(q));
  if (key_out) *key_out = key;
  return write_entry(key, q, response, cost_units, capped_ttl(ttl_ms, policy_.l2_ttl_ms, policy_.l2_max_ttl_ms),
                     nullptr);
}

// ---------------------------------------------------------------------------
// L3 — semantic
// ---------------------------------------------------------------------------

SemanticCacheTier::SemanticCacheTier(std::shared_ptr<IStateStore> store, const CachePolicy& policy,
                                     std::shared_ptr<const Clock> clock,
                                     std::shared_ptr<const IEmbeddingProvider> embedder)
    : CacheTierBase(std::move(store), policy, std::move(clock)), embedder_(std::move(embedder)) {}

std::string SemanticCacheTier::digest(const CacheQuery& q) const {
  return hash_domain_parts("l3:", {q.task_type, normalize_cache_input(q.input)});
}

TierProbe SemanticCacheTier::lookup(CacheQuery& q) {
  TierProbe best;
  const auto keys = store_->scan_keys(key_prefix(q.task_type));
  if (keys.empty()) return best;
  if (q.embedding.empty()) q.embedding = embedder_->embed(q.input);

  double best_similarity = -1.0;
  for (const auto& key : keys) {
    std::string raw;
    const StoreStatus st = store_->get(key, raw);
    if (st == StoreStatus::unavailable) {
      best.status = st;
      return best;
    }
    if (st != StoreStatus::ok) continue;  // expired between scan and read
    Object entry;
    if (!parse_entry(raw, entry) || jsonlite::get_string(entry, "task_type") != q.task_type) continue;
    const double sim = cosine_similarity(q.embedding, jsonlite::get_double_array(entry, "embedding"));
    if (sim >= policy_.similarity_threshold && sim > best_similarity) {
      best_similarity = sim;
      best.status = StoreStatus::ok;
      best.key = key;
      best.response = jsonlite::get_string(entry, "response");
      best.cost_units = jsonlite::get_double(entry, "cost_units", policy_.default_entry_cost_units);
      best.confidence = sim;
    }
  }
  if (best.status == StoreStatus::ok) record_hit(best.key, best_similarity);
  return best;
}

void SemanticCacheTier::record_hit(const std::string& key, double similarity) {
  std::string raw;
  uint64_t expires_at = 0;
  if (store_->get(key, raw, &expires_at) != StoreStatus::ok) return;
  Object entry;
  if (!parse_entry(raw, entry)) return;

  const uint64_t count = jsonlite::get_u64(entry, "access_count");
  const double ema = jsonlite::get_double(entry, "similarity_ema");
  entry["similarity_ema"] = Value{count == 0 ? similarity
                                             : (1.0 - policy_.similarity_ema_alpha) * ema +
                                                   policy_.similarity_ema_alpha * similarity};
  record_access(key, raw, expires_at, std::move(entry));
}

StoreStatus SemanticCacheTier::store(const CacheQuery& q, const std::string& response, double cost_units,
                                     std::optional<uint64_t> ttl_ms, std::string* key_out) {
  const std::string key = key_for(q.task_type, digest(q));
  if (key_out) *key_out = key;
  const std::vector<double> embedding = q.embedding.empty() ? embedder_->embed(q.input) : q.embedding;
  return write_entry(key, q, response, cost_units, capped_ttl(ttl_ms, policy_.l3_ttl_ms, policy_.l3_max_ttl_ms),
                     &embedding);
}

// ---------------------------------------------------------------------------
// CacheManager
// ---------------------------------------------------------------------------

CacheManager::CacheManager(std::shared_ptr<IStateStore> store, CachePolicy policy,
                           std::shared_ptr<const Clock> clock,
                           std::shared_ptr<const IEmbeddingProvider> embedder)
    : store_(std::move(store)), policy_(std::move(policy)), clock_(std::move(clock)), embedder_(std::move(embedder)) {
  if (!embedder_) embedder_ = std::make_shared<HashingEmbeddingProvider>(policy_.embedding_dimension);
  tiers_.push_back(std::make_unique<PrefixCacheTier>(store_, policy_, clock_));
  tiers_.push_back(std::make_unique<ExactCacheTier>(store_, policy_, clock_));
  tiers_.push_back(std::make_unique<SemanticCacheTier>(store_, policy_, clock_, embedder_));
}

CacheLookupResult CacheManager::lookup(const CacheQuery& query) {
  CacheLookupResult r;
  if (query.task_type.empty()) {
    r.error_code = ErrorCode::malformed_request;
    r.error = "task_type is required";
    return r;
  }

  uint64_t duration_ns = 0;
  {
    ScopeTimer timer(duration_ns);
    CacheQuery q = query;
    for (const auto& tier : tiers_) {
      if (!tier->eligible(q)) continue;
      auto& c = counters_[tier_index(tier->tier())];
      c.lookups.fetch_add(1, std::memory_order_relaxed);
      const TierProbe p = tier->lookup(q);
      if (p.status == StoreStatus::unavailable) {
        r.degraded = true;
        continue;
      }
      if (p.status != StoreStatus::ok) continue;

      c.hits.fetch_add(1, std::memory_order_relaxed);
      r.hit = true;
      r.tier = tier->tier();
      r.response = p.response;
      r.confidence = p.confidence;
      r.cost_avoided_units = p.cost_units;
      r.key = p.key;
      if (r.tier == CacheTier::l3_semantic) r.similarity = p.confidence;
      break;
    }
  }
  r.latency_us = duration_ns / 1000;

  lookups_.fetch_add(1, std::memory_order_relaxed);
  if (r.degraded) {
    degraded_.fetch_add(1, std::memory_order_relaxed);
    if (!r.hit) {
      r.error_code = ErrorCode::cache_unavailable;
      r.error = "state store unavailable, treated as miss";
      log_warn("cache", "degraded lookup for task type " + query.task_type);
    }
  }
  if (r.hit) {
    hits_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(savings_mu_);
    cost_saved_units_ += r.cost_avoided_units;
    if (r.tier == CacheTier::l3_semantic) {
      l3_similarity_sum_ += r.similarity;
      ++l3_hits_;
    }
  }

  emit_cache_event(r.hit ? to_string(r.tier) + "_hit" : "miss", query.task_type, r.hit ? to_string(r.tier) : "",
                   r.degraded && !r.hit, duration_ns, clock_->now_unix_ms());
  return r;
}

CacheStoreResult CacheManager::store(const CacheStoreRequest& req) {
  CacheStoreResult result;
  if (req.query.task_type.empty()) {
    CacheTierWrite w;
    w.error = "task_type is required";
    result.tiers.push_back(w);
    return result;
  }

  CacheQuery q = req.query;
  if (req.allow_l3 && q.embedding.empty()) q.embedding = embedder_->embed(q.input);
  const double cost = req.cost_units > 0.0 ? req.cost_units : policy_.default_entry_cost_units;
  const bool allowed[3] = {req.allow_l1, req.allow_l2, req.allow_l3};

  std::vector<std::pair<size_t, std::future<std::pair<StoreStatus, std::string>>>> pending;
  result.tiers.resize(tiers_.size());
  for (size_t i = 0; i < tiers_.size(); ++i) {
    auto& w = result.tiers[i];
    w.tier = tiers_[i]->tier();
    w.eligible = allowed[i] && tiers_[i]->eligible(q);
    if (!w.eligible) continue;
    ICacheTier* tier = tiers_[i].get();
    pending.emplace_back(i, std::async(std::launch::async, [tier, &q, &req, cost]() {
                           std::string key;
                           const StoreStatus st = tier->store(q, req.response, cost, req.ttl_ms, &key);
                           return std::make_pair(st, key);
                         }));
  }

  for (auto& [i, fut] : pending) {
    auto& w = result.tiers[i];
    auto& c = counters_[tier_index(w.tier)];
    const auto [status, key] = fut.get();
    w.key = key;
    if (status == StoreStatus::ok) {
      w.stored = true;
      result.ok = true;
      c.stores.fetch_add(1, std::memory_order_relaxed);
    } else {
      w.error = "store " + to_string(status);
      c.store_errors.fetch_add(1, std::memory_order_relaxed);
      log_warn("cache", to_string(w.tier) + " write failed for task type " + q.task_type + ": " + w.error);
    }
  }

  sweep_expired();

  OrchestratorEvent ev;
  ev.kind = EventKind::cache_store;
  ev.subject_id = q.task_type;
  ev.outcome = result.ok ? "stored" : "failed";
  ev.timestamp_unix_ms = clock_->now_unix_ms();
  ev.worker_id = global_worker_identity().worker_id;
  emit_event(ev);
  return result;
}

void CacheManager::sweep_expired() {
  const uint64_t now = clock_->now_unix_ms();
  uint64_t last = last_sweep_ms_.load(std::memory_order_relaxed);
  if (last != 0 && now < last + policy_.purge_interval_ms) return;
  if (!last_sweep_ms_.compare_exchange_strong(last, now)) return;  // another writer is sweeping
  const size_t n = store_->purge_expired();
  if (n == 0) return;
  purged_.fetch_add(n, std::memory_order_relaxed);
  log_debug("cache", "purged " + std::to_string(n) + " expired store entries");
}

CacheInvalidateResult CacheManager::invalidate(const std::string& task_type) {
  CacheInvalidateResult r;
  auto finish = [&]() {
    invalidated_.fetch_add(r.removed, std::memory_order_relaxed);
    if (r.ok) {
      log_info("cache", "invalidated " + std::to_string(r.removed) + " entries" +
                            (task_type.empty() ? std::string() : " for task type " + task_type));
    } else {
      log_warn("cache", "invalidation stopped after " + std::to_string(r.removed) + " entries: " + r.error);
    }

    OrchestratorEvent ev;
    ev.kind = EventKind::cache_invalidate;
    ev.subject_id = task_type.empty() ? "*" : task_type;
    ev.outcome = r.ok ? "invalidated" : "partial";
    ev.units = r.removed;
    ev.timestamp_unix_ms = clock_->now_unix_ms();
    ev.worker_id = global_worker_identity().worker_id;
    emit_event(ev);
    return r;
  };
  auto outage = [&]() {
    r.ok = false;
    r.error = "state store unavailable";
    return finish();
  };

  std::vector<std::string> prefixes;
  if (task_type.empty()) {
    prefixes.push_back(kCacheRoot);
  } else {
    for (const auto& tier : tiers_) prefixes.push_back(tier->key_prefix(task_type));
  }

  for (const auto& prefix : prefixes) {
    for (const auto& key : store_->scan_keys(prefix)) {
      if (!task_type.empty()) {
        std::string raw;
        const StoreStatus st = store_->get(key, raw);
        if (st == StoreStatus::unavailable) return outage();
        Object entry;
        if (st != StoreStatus::ok || !parse_entry(raw, entry) ||
            jsonlite::get_string(entry, "task_type") != task_type) {
          continue;
        }
      }
      const StoreStatus st = store_->remove(key);
      if (st == StoreStatus::unavailable) return outage();
      if (st == StoreStatus::ok) ++r.removed;
    }
  }
  return finish();
}

CacheMetrics CacheManager::metrics() const {
  CacheMetrics m;
  for (const auto& tier : tiers_) {
    const auto& c = counters_[tier_index(tier->tier())];
    CacheTierMetrics t;
    t.tier = tier->tier();
    t.lookups = c.lookups.load(std::memory_order_relaxed);
    t.hits = c.hits.load(std::memory_order_relaxed);
    t.stores = c.stores.load(std::memory_order_relaxed);
    t.store_errors = c.store_errors.load(std::memory_order_relaxed);
    t.hit_rate = t.lookups > 0 ? static_cast<double>(t.hits) / static_cast<double>(t.lookups) : 0.0;
    t.entries = store_->scan_keys(std::string(kCacheRoot) + to_string(t.tier) + ":").size();
    m.tiers.push_back(t);
  }
  m.lookups = lookups_.load(std::memory_order_relaxed);
  m.hits = hits_.load(std::memory_order_relaxed);
  m.degraded_lookups = degraded_.load(std::memory_order_relaxed);
  m.invalidated = invalidated_.load(std::memory_order_relaxed);
  m.purged = purged_.load(std::memory_order_relaxed);
  m.hit_rate = m.lookups > 0 ? static_cast<double>(m.hits) / static_cast<double>(m.lookups) : 0.0;
  std::lock_guard<std::mutex> lk(savings_mu_);
  m.cost_saved_units = cost_saved_units_;
  m.l3_avg_similarity = l3_hits_ > 0 ? l3_similarity_sum_ / static_cast<double>(l3_hits_) : 0.0;
  return m;
}

}  // namespace helios

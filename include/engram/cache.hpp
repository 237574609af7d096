#pragma once

#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <engram/config.hpp>
#include <engram/context.hpp>
#include <engram/types.hpp>

namespace engram {

struct CacheStats {
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t evictions = 0;     // capacity pressure
  uint64_t expirations = 0;   // TTL, found lazily on Get
  uint64_t invalidations = 0; // entries removed by Invalidate()
  size_t size = 0;
  size_t capacity = 0;
};

struct CacheEntryMeta {
  uint64_t created_at_us = 0;
  uint64_t ttl_us = 0;  // 0 = never expires
  uint64_t last_access_us = 0;
  uint64_t access_count = 0;
};

/**
 * Bounded key/value cache with per-entry TTL and least-recently-used
 * eviction.
 *
 * - TTL is checked lazily on Get; an expired entry is removed and counts as
 *   a miss.
 * - Every Get hit bumps access_count and last_access and moves the entry to
 *   the most-recently-used end.
 * - Inserting a new key into a full cache evicts exactly one entry, the
 *   least recently used.
 * - Invalidate() bumps a generation counter. A Put carrying an older
 *   observed generation was computed before the invalidation and is
 *   dropped, so a racing sweep never leaves a stale entry behind.
 *
 * All operations take one mutex; values are copied in and out.
 */
template <typename V>
class TtlLruCache {
 public:
  using Predicate = std::function<bool(const std::string& key, const V& value)>;

  TtlLruCache(size_t capacity, uint64_t default_ttl_us, std::shared_ptr<Clock> clock)
      : capacity_(capacity), default_ttl_us_(default_ttl_us), clock_(std::move(clock)) {}

  bool Get(const std::string& key, V* out) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      ++stats_.misses;
      return false;
    }
    const uint64_t now = clock_->WallClockMicros();
    Entry& e = *it->second;
    if (e.meta.ttl_us != 0 && now >= e.meta.created_at_us &&
        now - e.meta.created_at_us >= e.meta.ttl_us) {
      lru_.erase(it->second);
      map_.erase(it);
      ++stats_.expirations;
      ++stats_.misses;
      return false;
    }
    e.meta.access_count++;
    e.meta.last_access_us = now;
    lru_.splice(lru_.begin(), lru_, it->second);
    ++stats_.hits;
    *out = e.value;
    return true;
  }

  /**
   * Insert or replace. ttl_us overrides the default TTL (0 = never expires).
   * Returns false when the put was dropped because an invalidation happened
   * after observed_generation.
   */
  bool Put(const std::string& key, V value,
           std::optional<uint64_t> ttl_us = std::nullopt,
           std::optional<uint64_t> observed_generation = std::nullopt) {
    std::lock_guard<std::mutex> lock(mu_);
    if (capacity_ == 0) return false;
    if (observed_generation && *observed_generation < generation_) {
      return false;
    }

    const uint64_t now = clock_->WallClockMicros();
    auto it = map_.find(key);
    if (it != map_.end()) {
      lru_.erase(it->second);
      map_.erase(it);
    } else if (map_.size() >= capacity_) {
      map_.erase(lru_.back().key);
      lru_.pop_back();
      ++stats_.evictions;
    }

    Entry e;
    e.key = key;
    e.value = std::move(value);
    e.meta.created_at_us = now;
    e.meta.ttl_us = ttl_us ? *ttl_us : default_ttl_us_;
    e.meta.last_access_us = now;
    lru_.push_front(std::move(e));
    map_[key] = lru_.begin();
    return true;
  }

  // Removes every entry matching pred. Returns the number removed.
  size_t Invalidate(const Predicate& pred) {
    std::lock_guard<std::mutex> lock(mu_);
    ++generation_;
    size_t removed = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
      if (pred(it->key, it->value)) {
        map_.erase(it->key);
        it = lru_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    stats_.invalidations += removed;
    return removed;
  }

  bool Erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = map_.find(key);
    if (it == map_.end()) return false;
    lru_.erase(it->second);
    map_.erase(it);
    return true;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mu_);
    ++generation_;
    lru_.clear();
    map_.clear();
  }

  // Entry metadata without touching recency or counters.
  bool Peek(const std::string& key, CacheEntryMeta* out) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = map_.find(key);
    if (it == map_.end()) return false;
    *out = it->second->meta;
    return true;
  }

  uint64_t Generation() const {
    std::lock_guard<std::mutex> lock(mu_);
    return generation_;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return map_.size();
  }

  CacheStats Stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    CacheStats s = stats_;
    s.size = map_.size();
    s.capacity = capacity_;
    return s;
  }

 private:
  struct Entry {
    std::string key;
    V value;
    CacheEntryMeta meta;
  };

  const size_t capacity_;
  const uint64_t default_ttl_us_;
  std::shared_ptr<Clock> clock_;

  mutable std::mutex mu_;
  std::list<Entry> lru_;  // front = most recently used
  std::unordered_map<std::string, typename std::list<Entry>::iterator> map_;
  uint64_t generation_ = 0;
  CacheStats stats_;
};

/** Query-cache value: the resolved results and the scope they came from. */
struct CachedQuery {
  std::vector<std::string> scope;  // collections the query ran against
  bool unscoped = false;
  std::vector<RecallHit> hits;
};

/**
 * The two caches in front of the expensive collaborators.
 *
 *  - embeddings: SHA-256(text) -> vector, long TTL
 *  - queries: SHA-256(normalized query | sorted scope | top_k) -> results,
 *    short TTL
 *
 * Neither is ever the only copy of anything; both can be dropped at will.
 */
class CacheLayer {
 public:
  CacheLayer(const CacheConfig& config, const Context& ctx);

  bool GetEmbedding(std::string_view text, std::vector<float>* out);
  void PutEmbedding(std::string_view text, std::vector<float> embedding);

  static std::string QueryKey(std::string_view query,
                              std::vector<std::string> scope, size_t top_k,
                              bool allow_restricted);

  bool GetQuery(const std::string& key, CachedQuery* out);

  // Read before running the query; pass to PutQuery afterwards.
  uint64_t QueryGeneration() const { return queries_.Generation(); }
  bool PutQuery(const std::string& key, CachedQuery value, uint64_t observed_generation);

  // Drops unscoped queries and queries whose scope includes collection.
  size_t InvalidateForCollection(const std::string& collection);

  // Drops queries whose results reference frame_id.
  size_t InvalidateForFrame(const std::string& frame_id);

  void Clear();

  CacheStats EmbeddingStats() const { return embeddings_.Stats(); }
  CacheStats QueryStats() const { return queries_.Stats(); }

  TtlLruCache<std::vector<float>>& embeddings() { return embeddings_; }
  TtlLruCache<CachedQuery>& queries() { return queries_; }

 private:
  Context ctx_;
  TtlLruCache<std::vector<float>> embeddings_;
  TtlLruCache<CachedQuery> queries_;
};

}  // namespace engram

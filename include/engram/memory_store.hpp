#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <engram/cache.hpp>
#include <engram/config.hpp>
#include <engram/context.hpp>
#include <engram/crypto.hpp>
#include <engram/embedder.hpp>
#include <engram/privacy.hpp>
#include <engram/raw_store.hpp>
#include <engram/reconciler.hpp>
#include <engram/semantic_index.hpp>
#include <engram/status.hpp>
#include <engram/types.hpp>
#include <engram/vector_search.hpp>

namespace engram {

struct StoreOptions {
  // Declared privacy; overrides anything the classifier detects.
  std::optional<PrivacyClass> hint;
  MemoryType memory_type = MemoryType::kConversation;
};

/**
 * Outcome of MemoryStore::Store. The call succeeds whenever the raw append
 * succeeds; `searchable` reports whether the index step did too.
 */
struct StoreResult {
  std::string frame_id;
  std::string record_id;   // empty for private content
  std::string collection;  // empty for private content
  PrivacyClass privacy_class = PrivacyClass::kPublic;
  uint64_t sequence_no = 0;
  bool searchable = false;
  Status index_status;  // why searchable is false, OK otherwise
};

struct RecallOptions {
  size_t top_k = 0;  // 0 = IndexConfig::default_top_k
  // Restrict to one collection. Unset = every unrestricted collection.
  std::optional<std::string> collection;
  // Caller is entitled to the restricted collection.
  bool allow_restricted = false;
  const CancellationToken* cancel = nullptr;
};

struct RecallResult {
  std::vector<RecallHit> hits;
  bool from_cache = false;
  // Served by the lexical raw-store scan because the index was unavailable.
  bool degraded = false;
  // Index hits whose frame was deleted or unreadable.
  size_t dropped = 0;
};

struct HealthReport {
  RawStoreStats raw;
  std::map<std::string, size_t> records_per_collection;
  CacheStats embedding_cache;
  CacheStats query_cache;
  uint64_t last_reconciled_sequence = 0;
  bool reconciler_running = false;
  std::string embedder;
};

/**
 * Entry point of the memory subsystem. Owns the raw store, the semantic
 * index, the caches and the reconciler.
 *
 * Layout under Config::storage.data_dir:
 *   frames.log   raw store
 *   index/       RocksDB semantic index
 *   engram.key   key material (unless crypto.key_file is absolute)
 *
 * Thread-safe: Store, Recall and Forget may be called concurrently.
 */
class MemoryStore {
 public:
  /**
   * Validates config (ConfigError), loads or creates key material, opens
   * the raw store and index, and brings the index up to date with the raw
   * store before returning.
   */
  static Status Open(const Config& config, const Context& ctx,
                     std::unique_ptr<Embedder> embedder,
                     std::unique_ptr<VectorSearch> vector_search,
                     std::unique_ptr<MemoryStore>* out);

  // Embedder and vector search chosen by config.index (embedder,
  // vector_search and their settings). ConfigError when the chosen backend
  // is not built in or its model cannot be loaded.
  static Status Open(const Config& config, const Context& ctx,
                     std::unique_ptr<MemoryStore>* out);

  ~MemoryStore();

  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;

  /**
   * Classify, append durably, then index when the class allows it.
   * Raw-store failures (IntegrityError, IOError) fail the call. Index
   * failures only clear result->searchable.
   */
  Status Store(std::string_view content, const StoreOptions& opt, StoreResult* result);

  /**
   * Ranked hits for query. Hits are resolved against the raw store; a hit
   * whose frame is gone or corrupt is dropped. When the index is
   * unavailable the raw store is scanned lexically and result->degraded is
   * set. A cancelled call returns Cancelled and no hits.
   */
  Status Recall(std::string_view query, const RecallOptions& opt, RecallResult* result);

  /** Tombstone a frame and drop its index record and cached queries. */
  Status Forget(const std::string& frame_id);

  /** Forget every frame older than storage.retention_days (0 = keep all). */
  Status SweepRetention(uint64_t* forgotten);

  /** Direct raw access; the only way to read private content back. */
  Status GetFrame(const std::string& frame_id, Frame* out) const;

  HealthReport GetHealth() const;

  Reconciler& reconciler() { return *reconciler_; }
  SemanticIndex& index() { return *index_; }
  RawStore& raw_store() { return *raw_; }
  CacheLayer& cache() { return *cache_; }
  const PrivacyClassifier& classifier() const { return classifier_; }
  const Config& config() const { return config_; }

  void Close();

 private:
  MemoryStore(const Config& config, const Context& ctx);

  Status LexicalRecall(std::string_view query, const std::vector<std::string>& scope,
                       size_t top_k, const CancellationToken* cancel,
                       RecallResult* result) const;

  Config config_;
  Context ctx_;
  PrivacyClassifier classifier_;

  std::unique_ptr<CacheLayer> cache_;
  std::unique_ptr<RawStore> raw_;
  std::unique_ptr<SemanticIndex> index_;
  std::unique_ptr<Reconciler> reconciler_;
};

}  // namespace engram

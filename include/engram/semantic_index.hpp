#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/options.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/transaction_db.h>

#include <engram/cache.hpp>
#include <engram/config.hpp>
#include <engram/context.hpp>
#include <engram/embedder.hpp>
#include <engram/status.hpp>
#include <engram/types.hpp>
#include <engram/vector_search.hpp>

namespace engram {

struct SemanticIndexOptions {
  // Shared RocksDB block cache for all column families.
  size_t block_cache_bytes = 32ull * 1024 * 1024;
  int bloom_bits_per_key = 10;
};

/**
 * Searchable projection of the raw store.
 *
 * Records, their embeddings and frame back-references persist in RocksDB
 * (one column family each); the vector-search collaborator holds the
 * nearest-neighbour structure and is re-populated from RocksDB at open.
 * The index never owns raw content and can be rebuilt from the raw store at
 * any time.
 *
 * Column families:
 *   - engram_records:     record_id -> JSON body (collection, text, metadata,
 *                         source frame, privacy, created_at)
 *   - engram_embeddings:  record_id -> float32 LE vector
 *   - engram_frame_refs:  frame_id  -> record_id
 *   - default:            reconciliation checkpoint
 *
 * Index/Delete on the same record id are serialized; different ids proceed
 * concurrently.
 */
class SemanticIndex {
 public:
  /**
   * @param cache optional; when set, embeddings are looked up and stored by
   *        content hash so identical text is embedded once. Must outlive the
   *        index.
   */
  static Status Open(const std::string& db_path, const IndexConfig& config,
                     const Context& ctx, std::shared_ptr<Embedder> embedder,
                     std::shared_ptr<VectorSearch> vector_search,
                     CacheLayer* cache, const SemanticIndexOptions& opt,
                     std::unique_ptr<SemanticIndex>* out);

  ~SemanticIndex();

  SemanticIndex(const SemanticIndex&) = delete;
  SemanticIndex& operator=(const SemanticIndex&) = delete;

  /**
   * Insert or overwrite a record.
   *
   * @return Rejected for private records, for sensitive records outside the
   *         restricted collection, for unknown collections, and for an
   *         existing id whose collection differs (membership is immutable;
   *         delete and reinsert instead), and for text the embedder
   *         reports as unembeddable.
   *         CollaboratorUnavailable when embedding or vector search fails.
   *
   * An empty record.id is derived from source_frame_id. An empty embedding
   * is computed from text. created_at_us of 0 means now.
   */
  Status Index(MemoryRecord record);

  /**
   * Nearest records to text, best first; ties by created_at (older first),
   * then id.
   *
   * collection unset: union of every unrestricted collection.
   * collection set: that collection only. Naming the restricted collection
   * requires allow_restricted, otherwise Rejected.
   * Unembeddable query text yields no hits.
   */
  Status Query(std::string_view text, const std::optional<std::string>& collection,
               size_t top_k, bool allow_restricted,
               std::vector<ScoredRecord>* out) const;

  /** Collections a Query with these arguments would search. */
  Status ResolveScope(const std::optional<std::string>& collection,
                      bool allow_restricted, std::vector<std::string>* scope) const;

  Status Delete(const std::string& record_id);

  Status Get(const std::string& record_id, MemoryRecord* out) const;

  // Record derived from frame_id, NotFound if none.
  Status FindByFrame(const std::string& frame_id, std::string* record_id) const;

  size_t Count(const std::string& collection) const;

  Status ListRecordIds(std::vector<std::string>* out) const;

  // Reconciliation checkpoint (0 when never saved).
  Status LoadCheckpoint(uint64_t* sequence_no) const;
  Status SaveCheckpoint(uint64_t sequence_no);

  const IndexConfig& config() const { return config_; }
  const Embedder& embedder() const { return *embedder_; }

  void Close();

 private:
  SemanticIndex(const IndexConfig& config, const Context& ctx,
                std::shared_ptr<Embedder> embedder,
                std::shared_ptr<VectorSearch> vector_search, CacheLayer* cache);

  Status Rebuild();
  Status EmbedText(std::string_view text, std::vector<float>* out) const;
  Status ReadRecord(const std::string& record_id, MemoryRecord* out,
                    bool with_embedding) const;
  bool IsKnownCollection(const std::string& name) const;
  std::mutex& StripeFor(const std::string& record_id);

  IndexConfig config_;
  Context ctx_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<VectorSearch> vector_search_;
  CacheLayer* cache_;

  rocksdb::TransactionDB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;
  rocksdb::ColumnFamilyHandle* default_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* records_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* embeddings_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* frame_refs_cf_ = nullptr;

  static constexpr size_t kStripes = 64;
  std::array<std::mutex, kStripes> stripes_;
};

// Map a RocksDB status onto engram's taxonomy.
Status FromRocks(const rocksdb::Status& s);

// Longest prefix of text that fits in max_bytes without splitting a UTF-8
// sequence.
std::string_view TruncateUtf8(std::string_view text, size_t max_bytes);

}  // namespace engram

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <engram/types.hpp>

namespace engram {

/** Thrown by Config loading and validation; fatal at startup. */
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Raw Store settings.
 */
struct StorageConfig {
  std::string data_dir;
  int64_t retention_days = 0;  // 0 = keep forever
  bool sync_writes = true;     // fsync after every append
};

/**
 * Cache Layer settings. TTLs are in seconds.
 */
struct CacheConfig {
  // Embeddings of identical text never change, so this is long.
  // 0 = never expires.
  int64_t embedding_ttl_seconds = 7 * 24 * 3600;
  int64_t embedding_capacity = 10000;

  // Query results go stale as soon as new content lands.
  int64_t query_ttl_seconds = 300;
  int64_t query_capacity = 1000;
};

/**
 * Semantic Index settings.
 */
struct IndexConfig {
  int64_t embedding_dimensions = 384;
  int64_t default_top_k = 10;
  int64_t max_index_text_bytes = 8192;

  // Collection routing for public content
  std::string conversation_collection = "conversations";
  std::string technical_collection = "technical";
  std::string insight_collection = "insights";
  std::string pattern_collection = "patterns";
  std::string fact_collection = "facts";

  // Sensitive content is indexed here only. Never part of unscoped queries.
  std::string restricted_collection = "private";

  // Embedding collaborator: "hashing" (no model files) or "onnx".
  std::string embedder = "hashing";
  // ONNX model file and its WordPiece vocabulary. An empty vocab_path means
  // vocab.txt in the model's directory.
  std::string model_path;
  std::string vocab_path;
  std::string model_type = "minilm";  // minilm, bge-small or bge-large
  int64_t embedder_threads = 0;       // 0 = onnxruntime default

  // Vector search: "flat" (exact scan) or "hnsw".
  std::string vector_search = "flat";

  // HNSW parameters (used when the HNSW vector search is selected)
  int64_t hnsw_m = 16;
  int64_t hnsw_ef_construction = 200;
  int64_t hnsw_ef_search = 50;

  /** Collection for content of this class and type. Empty for private. */
  std::string CollectionFor(PrivacyClass privacy, MemoryType type) const;

  /** Every configured collection, restricted one last. */
  std::vector<std::string> AllCollections() const;

  /** Collections included in an unscoped query. */
  std::vector<std::string> UnrestrictedCollections() const;
};

struct CryptoConfig {
  // Location of the key material (secret + obfuscation seed).
  // Relative paths resolve against storage.data_dir.
  std::string key_file = "engram.key";
};

/**
 * Complete engram configuration.
 */
struct Config {
  StorageConfig storage;
  CacheConfig cache;
  IndexConfig index;
  CryptoConfig crypto;
  std::string log_level = "info";

  /**
   * Load configuration from a YAML-like file:
   *
   *   section:
   *     key: value
   *
   * @throws ConfigError if the file cannot be read, a key is unknown or a
   *         value does not parse. Does not call Validate().
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Validate ranges and cross-field constraints.
   * @throws ConfigError on the first invalid value.
   */
  void Validate() const;

  /** storage.data_dir joined with crypto.key_file when it is relative. */
  std::string KeyFilePath() const;
};

}  // namespace engram

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace engram {

// Result of embedding computation
struct EmbeddingResult {
  std::vector<float> embedding;  // L2-normalized on success
  bool success = false;
  // The input has nothing the model can embed (empty, punctuation or
  // stopwords only). Retrying the same text cannot succeed.
  bool unembeddable = false;
  std::string error_message;
};

// Supported ONNX model types
enum class EmbedderModelType {
  kMiniLM,    // all-MiniLM-L6-v2 (384 dimensions)
  kBGESmall,  // BGE-small-en-v1.5 (384 dimensions)
  kBGELarge   // BGE-large-en-v1.5 (1024 dimensions)
};

// "minilm", "bge-small" or "bge-large". False for anything else.
bool ParseEmbedderModelType(std::string_view name, EmbedderModelType* out);

/**
 * Embedding collaborator: text -> fixed-length vector.
 *
 * Implementations must be safe to call from several threads at once and must
 * report failure through EmbeddingResult, never by returning a zero vector.
 * Timeouts are the implementation's concern; a timed-out call is a failure.
 */
class Embedder {
 public:
  virtual ~Embedder() = default;

  // Input is assumed to be UTF-8 text
  virtual EmbeddingResult Embed(std::string_view text) const = 0;

  virtual size_t Dimension() const = 0;

  // Stable identifier, logged at open ("hashing-384", "onnx-minilm", ...)
  virtual std::string Name() const = 0;
};

/**
 * Feature-hashing embedder with no model files.
 *
 * Lowercased word tokens (stopwords dropped) and their character trigrams
 * are hashed into `dimension` signed buckets and L2-normalized. Texts that
 * share words score high. Deterministic across processes.
 */
std::unique_ptr<Embedder> NewHashingEmbedder(size_t dimension = 384);

/**
 * ONNX sentence-embedding model with a WordPiece tokenizer.
 * An empty vocab_path means vocab.txt in the same directory as the model.
 * num_threads: 0 = onnxruntime default.
 * Returns nullptr on failure, sets error_out if provided. Always fails when
 * built without ENGRAM_ENABLE_SEMANTIC.
 */
std::unique_ptr<Embedder> NewOnnxEmbedder(const std::string& model_path,
                                          const std::string& vocab_path,
                                          EmbedderModelType type,
                                          int num_threads = 0,
                                          std::string* error_out = nullptr);

}  // namespace engram

#include <engram/embedder.hpp>

#include <engram/internal.hpp>
#include <engram/normalize.hpp>

namespace engram {

namespace {

constexpr float kWordWeight = 1.0f;
constexpr float kTrigramWeight = 0.5f;

// FNV-1a 64-bit
uint64_t Fnv1a(std::string_view s, uint64_t seed) {
  uint64_t h = 14695981039346656037ULL ^ seed;
  for (char c : s) {
    h ^= static_cast<uint8_t>(c);
    h *= 1099511628211ULL;
  }
  return h;
}

class HashingEmbedder : public Embedder {
 public:
  explicit HashingEmbedder(size_t dimension) : dimension_(dimension) {}

  EmbeddingResult Embed(std::string_view text) const override {
    EmbeddingResult result;
    if (dimension_ == 0) {
      result.error_message = "dimension must be positive";
      return result;
    }

    result.embedding.assign(dimension_, 0.0f);
    for (const auto& token : internal::Tokenize(text)) {
      if (internal::IsStopword(token)) continue;
      AddFeature(token, kWordWeight, &result.embedding);

      const std::string padded = "#" + token + "#";
      for (size_t i = 0; i + 3 <= padded.size(); ++i) {
        AddFeature(std::string_view(padded).substr(i, 3), kTrigramWeight,
                   &result.embedding);
      }
    }

    if (!internal::L2Normalize(&result.embedding)) {
      result.embedding.clear();
      result.unembeddable = true;
      result.error_message = "no embeddable tokens";
      return result;
    }
    result.success = true;
    return result;
  }

  size_t Dimension() const override { return dimension_; }

  std::string Name() const override {
    return "hashing-" + std::to_string(dimension_);
  }

 private:
  void AddFeature(std::string_view feature, float weight,
                  std::vector<float>* v) const {
    uint64_t h = Fnv1a(feature, 0);
    size_t bucket = static_cast<size_t>(h % dimension_);
    float sign = ((h >> 63) & 1) ? -1.0f : 1.0f;
    (*v)[bucket] += sign * weight;
  }

  size_t dimension_;
};

}  // namespace

std::unique_ptr<Embedder> NewHashingEmbedder(size_t dimension) {
  return std::make_unique<HashingEmbedder>(dimension);
}

}  // namespace engram

#include <engram/cache.hpp>

#include <engram/internal.hpp>
#include <engram/normalize.hpp>

#include <algorithm>

namespace engram {

namespace {

constexpr uint64_t kMicrosPerSecond = 1000000ULL;

}  // namespace

CacheLayer::CacheLayer(const CacheConfig& config, const Context& ctx)
    : ctx_(ctx.WithDefaults()),
      embeddings_(static_cast<size_t>(config.embedding_capacity),
                  static_cast<uint64_t>(config.embedding_ttl_seconds) * kMicrosPerSecond,
                  ctx_.clock),
      queries_(static_cast<size_t>(config.query_capacity),
               static_cast<uint64_t>(config.query_ttl_seconds) * kMicrosPerSecond,
               ctx_.clock) {}

bool CacheLayer::GetEmbedding(std::string_view text, std::vector<float>* out) {
  bool hit = embeddings_.Get(internal::Sha256Hex(text), out);
  ctx_.EmitCounter(hit ? "engram.cache.embedding.hit" : "engram.cache.embedding.miss");
  return hit;
}

void CacheLayer::PutEmbedding(std::string_view text, std::vector<float> embedding) {
  embeddings_.Put(internal::Sha256Hex(text), std::move(embedding));
}

std::string CacheLayer::QueryKey(std::string_view query,
                                 std::vector<std::string> scope, size_t top_k,
                                 bool allow_restricted) {
  std::sort(scope.begin(), scope.end());
  std::string material = internal::Normalize(query, NormalizationMode::kASCII);
  material.push_back('\0');
  for (const auto& c : scope) {
    material += c;
    material.push_back(',');
  }
  material.push_back('\0');
  material += std::to_string(top_k);
  material.push_back(allow_restricted ? 'r' : '-');
  return internal::Sha256Hex(material);
}

bool CacheLayer::GetQuery(const std::string& key, CachedQuery* out) {
  bool hit = queries_.Get(key, out);
  ctx_.EmitCounter(hit ? "engram.cache.query.hit" : "engram.cache.query.miss");
  return hit;
}

bool CacheLayer::PutQuery(const std::string& key, CachedQuery value,
                          uint64_t observed_generation) {
  bool stored = queries_.Put(key, std::move(value), std::nullopt, observed_generation);
  if (!stored) ctx_.EmitCounter("engram.cache.query.stale_put");
  return stored;
}

size_t CacheLayer::InvalidateForCollection(const std::string& collection) {
  size_t n = queries_.Invalidate([&](const std::string&, const CachedQuery& q) {
    return q.unscoped ||
           std::find(q.scope.begin(), q.scope.end(), collection) != q.scope.end();
  });
  ctx_.EmitCounter("engram.cache.query.invalidated", n);
  return n;
}

size_t CacheLayer::InvalidateForFrame(const std::string& frame_id) {
  size_t n = queries_.Invalidate([&](const std::string&, const CachedQuery& q) {
    return std::any_of(q.hits.begin(), q.hits.end(),
                       [&](const RecallHit& h) { return h.frame_id == frame_id; });
  });
  ctx_.EmitCounter("engram.cache.query.invalidated", n);
  return n;
}

void CacheLayer::Clear() {
  embeddings_.Clear();
  queries_.Clear();
}

}  // namespace engram

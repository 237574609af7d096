#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <engram/status.hpp>
#include <engram/types.hpp>

namespace engram {

// Query hit: record id + cosine similarity (higher = closer)
struct VectorHit {
  std::string id;
  float score = 0.0f;
};

/**
 * Vector-search collaborator. Collections are isolated namespaces; a query
 * never crosses collections.
 *
 * Failures (including internal timeouts) are reported as
 * CollaboratorUnavailable. Querying an unknown collection yields no hits.
 */
class VectorSearch {
 public:
  virtual ~VectorSearch() = default;

  // Insert or replace the vector stored under id.
  virtual Status Upsert(const std::string& collection, const std::string& id,
                        const std::vector<float>& vec,
                        const Metadata& metadata) = 0;

  // Up to top_k hits sorted by score descending.
  virtual Status Query(const std::string& collection,
                       const std::vector<float>& vec, size_t top_k,
                       std::vector<VectorHit>* out) const = 0;

  // NotFound if id is not in collection.
  virtual Status Delete(const std::string& collection, const std::string& id) = 0;

  virtual size_t Size(const std::string& collection) const = 0;
  virtual size_t Dimension() const = 0;
};

// Exact brute-force cosine search. Fine up to tens of thousands of records.
std::unique_ptr<VectorSearch> NewFlatVectorSearch(size_t dimension);

#ifdef ENGRAM_ENABLE_SEMANTIC
// One hnswlib HNSW graph per collection (L2 space over unit vectors).
// - m: max connections per node
// - ef_construction: build-time search depth
// - ef_search: query-time search depth
std::unique_ptr<VectorSearch> NewHnswVectorSearch(size_t dimension, int m = 16,
                                                  int ef_construction = 200,
                                                  int ef_search = 50);
#endif

}  // namespace engram

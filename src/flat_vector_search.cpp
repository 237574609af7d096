#include <engram/vector_search.hpp>

#include <engram/internal.hpp>

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace engram {

namespace {

class FlatVectorSearch : public VectorSearch {
 public:
  explicit FlatVectorSearch(size_t dimension) : dimension_(dimension) {}

  Status Upsert(const std::string& collection, const std::string& id,
                const std::vector<float>& vec, const Metadata& metadata) override {
    if (vec.size() != dimension_) {
      return Status::InvalidArgument("vector dimension " + std::to_string(vec.size()) +
                                     " != " + std::to_string(dimension_));
    }
    std::unique_lock<std::shared_mutex> lock(mu_);
    collections_[collection][id] = Entry{vec, metadata};
    return Status::OK();
  }

  Status Query(const std::string& collection, const std::vector<float>& vec,
               size_t top_k, std::vector<VectorHit>* out) const override {
    out->clear();
    if (vec.size() != dimension_) {
      return Status::InvalidArgument("query dimension mismatch");
    }
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return Status::OK();

    out->reserve(cit->second.size());
    for (const auto& [id, entry] : cit->second) {
      out->push_back({id, internal::CosineSimilarity(vec, entry.vec)});
    }
    lock.unlock();

    auto by_score = [](const VectorHit& a, const VectorHit& b) {
      if (a.score != b.score) return a.score > b.score;
      return a.id < b.id;
    };
    if (out->size() > top_k) {
      std::partial_sort(out->begin(), out->begin() + static_cast<std::ptrdiff_t>(top_k),
                        out->end(), by_score);
      out->resize(top_k);
    } else {
      std::sort(out->begin(), out->end(), by_score);
    }
    return Status::OK();
  }

  Status Delete(const std::string& collection, const std::string& id) override {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto cit = collections_.find(collection);
    if (cit == collections_.end() || cit->second.erase(id) == 0) {
      return Status::NotFound(collection + "/" + id);
    }
    return Status::OK();
  }

  size_t Size(const std::string& collection) const override {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto cit = collections_.find(collection);
    return cit == collections_.end() ? 0 : cit->second.size();
  }

  size_t Dimension() const override { return dimension_; }

 private:
  struct Entry {
    std::vector<float> vec;
    Metadata metadata;
  };

  const size_t dimension_;
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::unordered_map<std::string, Entry>> collections_;
};

}  // namespace

std::unique_ptr<VectorSearch> NewFlatVectorSearch(size_t dimension) {
  return std::make_unique<FlatVectorSearch>(dimension);
}

}  // namespace engram

#include <engram/vector_search.hpp>

#ifdef ENGRAM_ENABLE_SEMANTIC

#include <engram/internal.hpp>

#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace engram {

namespace {

constexpr size_t kInitialCapacity = 1024;

// One HNSW graph. Labels are sequential; replacing an id marks the old
// label deleted and inserts a fresh one.
class HnswCollection {
 public:
  HnswCollection(size_t dimension, int m, int ef_construction, int ef_search)
      : space_(std::make_unique<hnswlib::L2Space>(dimension)),
        index_(std::make_unique<hnswlib::HierarchicalNSW<float>>(
            space_.get(), kInitialCapacity, static_cast<size_t>(m),
            static_cast<size_t>(ef_construction))),
        capacity_(kInitialCapacity) {
    index_->setEf(static_cast<size_t>(ef_search));
  }

  void Upsert(const std::string& id, const std::vector<float>& vec) {
    auto it = id_to_label_.find(id);
    if (it != id_to_label_.end()) {
      index_->markDelete(it->second);
      label_to_id_.erase(it->second);
      id_to_label_.erase(it);
    }
    if (next_label_ >= capacity_) {
      capacity_ *= 2;
      index_->resizeIndex(capacity_);
    }
    hnswlib::labeltype label = next_label_++;
    index_->addPoint(vec.data(), label);
    id_to_label_[id] = label;
    label_to_id_[label] = id;
  }

  void Query(const std::vector<float>& vec, size_t top_k,
             std::vector<VectorHit>* out) const {
    size_t k = std::min(top_k, id_to_label_.size());
    if (k == 0) return;
    auto result = index_->searchKnn(vec.data(), k);
    while (!result.empty()) {
      auto [distance, label] = result.top();
      result.pop();
      auto it = label_to_id_.find(label);
      if (it != label_to_id_.end()) {
        out->push_back({it->second, internal::SquaredL2ToCosine(distance)});
      }
    }
  }

  bool Delete(const std::string& id) {
    auto it = id_to_label_.find(id);
    if (it == id_to_label_.end()) return false;
    index_->markDelete(it->second);
    label_to_id_.erase(it->second);
    id_to_label_.erase(it);
    return true;
  }

  size_t Size() const { return id_to_label_.size(); }

 private:
  std::unique_ptr<hnswlib::L2Space> space_;
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> index_;
  size_t capacity_;
  hnswlib::labeltype next_label_ = 0;
  std::unordered_map<std::string, hnswlib::labeltype> id_to_label_;
  std::unordered_map<hnswlib::labeltype, std::string> label_to_id_;
};

class HnswVectorSearch : public VectorSearch {
 public:
  HnswVectorSearch(size_t dimension, int m, int ef_construction, int ef_search)
      : dimension_(dimension),
        m_(m),
        ef_construction_(ef_construction),
        ef_search_(ef_search) {}

  Status Upsert(const std::string& collection, const std::string& id,
                const std::vector<float>& vec, const Metadata& /*metadata*/) override {
    if (vec.size() != dimension_) {
      return Status::InvalidArgument("vector dimension mismatch");
    }
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = collections_.find(collection);
    try {
      if (it == collections_.end()) {
        it = collections_
                 .emplace(collection, std::make_unique<HnswCollection>(
                                          dimension_, m_, ef_construction_, ef_search_))
                 .first;
      }
      it->second->Upsert(id, vec);
    } catch (const std::exception& e) {
      return Status::CollaboratorUnavailable(std::string("hnsw upsert: ") + e.what());
    }
    return Status::OK();
  }

  Status Query(const std::string& collection, const std::vector<float>& vec,
               size_t top_k, std::vector<VectorHit>* out) const override {
    out->clear();
    if (vec.size() != dimension_) {
      return Status::InvalidArgument("query dimension mismatch");
    }
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) return Status::OK();
    try {
      it->second->Query(vec, top_k, out);
    } catch (const std::exception& e) {
      out->clear();
      return Status::CollaboratorUnavailable(std::string("hnsw query: ") + e.what());
    }
    std::sort(out->begin(), out->end(), [](const VectorHit& a, const VectorHit& b) {
      if (a.score != b.score) return a.score > b.score;
      return a.id < b.id;
    });
    return Status::OK();
  }

  Status Delete(const std::string& collection, const std::string& id) override {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = collections_.find(collection);
    try {
      if (it == collections_.end() || !it->second->Delete(id)) {
        return Status::NotFound(collection + "/" + id);
      }
    } catch (const std::exception& e) {
      return Status::CollaboratorUnavailable(std::string("hnsw delete: ") + e.what());
    }
    return Status::OK();
  }

  size_t Size(const std::string& collection) const override {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = collections_.find(collection);
    return it == collections_.end() ? 0 : it->second->Size();
  }

  size_t Dimension() const override { return dimension_; }

 private:
  const size_t dimension_;
  const int m_;
  const int ef_construction_;
  const int ef_search_;

  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::unique_ptr<HnswCollection>> collections_;
};

}  // namespace

std::unique_ptr<VectorSearch> NewHnswVectorSearch(size_t dimension, int m,
                                                  int ef_construction,
                                                  int ef_search) {
  return std::make_unique<HnswVectorSearch>(dimension, m, ef_construction, ef_search);
}

}  // namespace engram

#endif  // ENGRAM_ENABLE_SEMANTIC

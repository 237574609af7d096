#include <engram/memory_store.hpp>

#include <engram/internal.hpp>
#include <engram/normalize.hpp>
#include <engram/version.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <unordered_set>

namespace engram {

namespace {

constexpr const char* kRawStoreFile = "frames.log";
constexpr const char* kIndexDir = "index";
constexpr uint64_t kMicrosPerDay = 86400ULL * 1000000ULL;

bool Cancelled(const CancellationToken* cancel) {
  return cancel && cancel->IsCancelled();
}

std::unordered_set<std::string> QueryTokens(std::string_view text) {
  std::unordered_set<std::string> out;
  for (auto& tok : internal::Tokenize(text)) {
    if (!internal::IsStopword(tok)) out.insert(std::move(tok));
  }
  return out;
}

// The embedder and vector search named by the index settings.
Status NewCollaborators(const IndexConfig& config, std::unique_ptr<Embedder>* embedder,
                        std::unique_ptr<VectorSearch>* vectors) {
  const size_t dims = config.embedding_dimensions > 0
                          ? static_cast<size_t>(config.embedding_dimensions)
                          : internal::kDefaultEmbeddingDimensions;

  if (config.embedder == "onnx") {
    EmbedderModelType type = EmbedderModelType::kMiniLM;
    if (!ParseEmbedderModelType(config.model_type, &type)) {
      return Status::ConfigError("unknown index.model_type " + config.model_type);
    }
    std::string error;
    *embedder = NewOnnxEmbedder(config.model_path, config.vocab_path, type,
                                static_cast<int>(config.embedder_threads), &error);
    if (!*embedder) return Status::ConfigError("cannot load embedding model: " + error);
  } else {
    *embedder = NewHashingEmbedder(dims);
  }

  if (config.vector_search == "hnsw") {
#ifdef ENGRAM_ENABLE_SEMANTIC
    *vectors = NewHnswVectorSearch(dims, static_cast<int>(config.hnsw_m),
                                   static_cast<int>(config.hnsw_ef_construction),
                                   static_cast<int>(config.hnsw_ef_search));
#else
    return Status::ConfigError(
        "index.vector_search hnsw is not built; rebuild with ENGRAM_ENABLE_SEMANTIC=ON");
#endif
  } else {
    *vectors = NewFlatVectorSearch(dims);
  }
  return Status::OK();
}

}  // namespace

MemoryStore::MemoryStore(const Config& config, const Context& ctx)
    : config_(config), ctx_(ctx.WithDefaults()) {}

MemoryStore::~MemoryStore() { Close(); }

Status MemoryStore::Open(const Config& config, const Context& ctx,
                         std::unique_ptr<MemoryStore>* out) {
  if (!out) return Status::InvalidArgument("out is null");
  out->reset();
  try {
    config.Validate();
  } catch (const ConfigError& e) {
    return Status::ConfigError(e.what());
  }

  std::unique_ptr<Embedder> embedder;
  std::unique_ptr<VectorSearch> vectors;
  Status s = NewCollaborators(config.index, &embedder, &vectors);
  if (!s.ok()) return s;
  return Open(config, ctx, std::move(embedder), std::move(vectors), out);
}

Status MemoryStore::Open(const Config& config, const Context& ctx,
                         std::unique_ptr<Embedder> embedder,
                         std::unique_ptr<VectorSearch> vector_search,
                         std::unique_ptr<MemoryStore>* out) {
  if (!out) return Status::InvalidArgument("out is null");
  out->reset();

  try {
    config.Validate();
  } catch (const ConfigError& e) {
    return Status::ConfigError(e.what());
  }

  auto store = std::unique_ptr<MemoryStore>(new MemoryStore(config, ctx));
  // A private copy sharing the caller's sinks, so log_level stays local to
  // this store and never touches the process-wide "engram" logger.
  auto logger = store->ctx_.logger->clone(store->ctx_.logger->name());
  logger->set_level(spdlog::level::from_str(config.log_level));
  store->ctx_.logger = std::move(logger);

  std::error_code ec;
  std::filesystem::create_directories(config.storage.data_dir, ec);
  if (ec) {
    return Status::IOError("create " + config.storage.data_dir + ": " + ec.message());
  }

  KeyMaterial key;
  Status s = KeyMaterial::LoadOrCreate(config.KeyFilePath(), &key);
  if (!s.ok()) return s;

  store->cache_ = std::make_unique<CacheLayer>(config.cache, store->ctx_);

  RawStoreOptions raw_opt;
  raw_opt.sync_writes = config.storage.sync_writes;
  const auto data_dir = std::filesystem::path(config.storage.data_dir);
  s = RawStore::Open((data_dir / kRawStoreFile).string(), key, store->ctx_, raw_opt,
                     &store->raw_);
  if (!s.ok()) return s;

  s = SemanticIndex::Open((data_dir / kIndexDir).string(), config.index, store->ctx_,
                          std::shared_ptr<Embedder>(std::move(embedder)),
                          std::shared_ptr<VectorSearch>(std::move(vector_search)),
                          store->cache_.get(), SemanticIndexOptions(), &store->index_);
  if (!s.ok()) return s;

  store->reconciler_ = std::make_unique<Reconciler>(store->raw_.get(), store->index_.get(),
                                                    store->cache_.get(), store->ctx_);

  // Catch up on frames appended after the last reconciled sequence (for
  // example a crash between append and index). A collaborator failure here
  // leaves the index behind but does not prevent opening.
  ReconcileStats stats;
  s = store->reconciler_->Resume(&stats);
  if (!s.ok()) {
    store->ctx_.logger->warn("startup reconcile incomplete: {}", s.ToString());
  } else if (stats.indexed > 0) {
    store->ctx_.logger->info("startup reconcile indexed {} frames", stats.indexed);
  }

  store->ctx_.logger->info("engram {} open at {} ({} live frames)", Version(),
                           config.storage.data_dir, store->raw_->Stats().live_frames);
  *out = std::move(store);
  return Status::OK();
}

void MemoryStore::Close() {
  if (reconciler_) {
    reconciler_->Stop();
    reconciler_.reset();
  }
  if (index_) {
    index_->Close();
    index_.reset();
  }
  if (raw_) {
    raw_->Close();
    raw_.reset();
  }
}

Status MemoryStore::Store(std::string_view content, const StoreOptions& opt,
                          StoreResult* result) {
  if (!result) return Status::InvalidArgument("result is null");
  *result = StoreResult();
  if (!raw_) return Status::InvalidArgument("store is closed");

  auto span = ctx_.StartSpan("engram.store");
  const uint64_t start = ctx_.Monotonic();
  auto finish = [&](const Status& s) {
    ctx_.EmitHistogram("engram.store.latency_us", ctx_.Monotonic() - start);
    if (span) span->End(s);
    return s;
  };

  // 1. Classify
  PrivacySignals signals;
  PrivacyClass privacy = classifier_.ClassifyWithSignals(content, opt.hint, &signals);
  if (!signals.detections.empty()) {
    ctx_.logger->debug("classified as {} (detected: {})", PrivacyClassName(privacy),
                       signals.detections.front());
  }

  // 2. Durable append; failures here fail the call
  Frame frame;
  Status s = raw_->Append(content, privacy, opt.memory_type, &frame);
  if (!s.ok()) {
    if (s.IsIntegrityError()) {
      ctx_.logger->error("append rejected: {}", s.ToString());
      ctx_.EmitCounter("engram.store.integrity_error");
    }
    ctx_.EmitCounter("engram.store.failed");
    return finish(s);
  }
  ctx_.EmitCounter("engram.store.appended");

  result->frame_id = frame.id;
  result->sequence_no = frame.sequence_no;
  // A re-append returns the frame's current class: the original one, or the
  // hint's when that was stricter.
  result->privacy_class = frame.privacy_class;
  if (span) {
    span->SetAttribute("privacy", PrivacyClassName(frame.privacy_class));
    span->SetAttribute("sequence_no", frame.sequence_no);
  }

  // A reclassified frame may still have a record under its old class.
  Status rs = RetireStaleRecord(frame, index_.get(), cache_.get());
  if (!rs.ok()) {
    ctx_.logger->warn("frame {} reclassified but old record remains: {}", frame.id,
                      rs.ToString());
    ctx_.EmitCounter("engram.store.degraded");
    result->index_status = rs;
    return finish(Status::OK());
  }

  // 3. Index when the class allows it; failures only degrade searchability
  MemoryRecord record;
  if (!RecordForFrame(frame, config_.index, &record)) {
    ctx_.logger->debug("frame {} is private, not indexed", frame.id);
    ctx_.EmitCounter("engram.store.private");
    result->index_status = Status::Rejected("private content is not indexed");
    return finish(Status::OK());
  }
  result->record_id = record.id;
  result->collection = record.collection;

  Status is = index_->Index(std::move(record));
  if (!is.ok()) {
    if (is.IsRejected()) {
      ctx_.logger->debug("index rejected frame {}: {}", frame.id, is.ToString());
    } else {
      ctx_.logger->warn("frame {} stored but not searchable: {}", frame.id,
                        is.ToString());
      ctx_.EmitCounter("engram.store.degraded");
    }
    result->index_status = is;
    return finish(Status::OK());
  }
  result->searchable = true;

  // 4. Invalidate queries that could now see this record
  cache_->InvalidateForCollection(result->collection);
  ctx_.EmitCounter("engram.store.indexed");
  return finish(Status::OK());
}

Status MemoryStore::Recall(std::string_view query, const RecallOptions& opt,
                           RecallResult* result) {
  if (!result) return Status::InvalidArgument("result is null");
  *result = RecallResult();
  if (!index_) return Status::InvalidArgument("store is closed");

  auto span = ctx_.StartSpan("engram.recall");
  const uint64_t start = ctx_.Monotonic();
  auto finish = [&](const Status& s) {
    if (!s.ok()) result->hits.clear();
    ctx_.EmitHistogram("engram.recall.latency_us", ctx_.Monotonic() - start);
    if (span) {
      span->SetAttribute("hits", static_cast<uint64_t>(result->hits.size()));
      span->End(s);
    }
    return s;
  };

  const size_t top_k =
      opt.top_k > 0 ? opt.top_k : static_cast<size_t>(config_.index.default_top_k);

  std::vector<std::string> scope;
  Status s = index_->ResolveScope(opt.collection, opt.allow_restricted, &scope);
  if (!s.ok()) return finish(s);

  // Stage 1: query cache
  if (Cancelled(opt.cancel)) return finish(Status::Cancelled("recall cancelled"));
  const std::string key = CacheLayer::QueryKey(query, scope, top_k, opt.allow_restricted);
  const uint64_t generation = cache_->QueryGeneration();
  CachedQuery cached;
  if (cache_->GetQuery(key, &cached)) {
    result->hits = std::move(cached.hits);
    result->from_cache = true;
    ctx_.EmitCounter("engram.recall.cache_hit");
    return finish(Status::OK());
  }

  // Stage 2: semantic index
  if (Cancelled(opt.cancel)) return finish(Status::Cancelled("recall cancelled"));
  std::vector<ScoredRecord> scored;
  s = index_->Query(query, opt.collection, top_k, opt.allow_restricted, &scored);
  if (s.IsCollaboratorUnavailable()) {
    ctx_.logger->warn("index unavailable, falling back to raw-store scan: {}",
                      s.ToString());
    ctx_.EmitCounter("engram.recall.degraded");
    return finish(LexicalRecall(query, scope, top_k, opt.cancel, result));
  }
  if (!s.ok()) return finish(s);

  // Stage 3: resolve frames
  if (Cancelled(opt.cancel)) return finish(Status::Cancelled("recall cancelled"));
  for (const auto& sr : scored) {
    Frame frame;
    Status fs = raw_->Get(sr.record.source_frame_id, &frame);
    if (!fs.ok()) {
      if (fs.IsCorruption()) {
        ctx_.logger->warn("dropping hit {}: frame corrupt: {}", sr.record.id,
                          fs.ToString());
      } else if (!fs.IsNotFound()) {
        return finish(fs);
      }
      result->dropped++;
      continue;
    }
    // The frame's current class must still route it to this record's
    // collection; a stale record can outlive a failed cleanup.
    MemoryRecord current;
    if (!RecordForFrame(frame, config_.index, &current) ||
        current.collection != sr.record.collection) {
      result->dropped++;
      continue;
    }
    RecallHit hit;
    hit.record_id = sr.record.id;
    hit.frame_id = frame.id;
    hit.collection = sr.record.collection;
    hit.text = std::move(frame.payload);
    hit.metadata = sr.record.metadata;
    hit.privacy_class = frame.privacy_class;
    hit.memory_type = frame.memory_type;
    hit.created_at_us = frame.created_at_us;
    hit.score = sr.score;
    result->hits.push_back(std::move(hit));
  }
  if (result->dropped > 0) ctx_.EmitCounter("engram.recall.dropped", result->dropped);
  if (Cancelled(opt.cancel)) return finish(Status::Cancelled("recall cancelled"));

  // Stage 4: populate cache
  CachedQuery entry;
  entry.scope = scope;
  entry.unscoped = !opt.collection.has_value();
  entry.hits = result->hits;
  cache_->PutQuery(key, std::move(entry), generation);
  return finish(Status::OK());
}

Status MemoryStore::LexicalRecall(std::string_view query,
                                  const std::vector<std::string>& scope, size_t top_k,
                                  const CancellationToken* cancel,
                                  RecallResult* result) const {
  result->degraded = true;
  const auto query_tokens = QueryTokens(query);
  if (query_tokens.empty() || top_k == 0) return Status::OK();

  auto it = raw_->Iterate(0);
  for (; it->Valid(); it->Next()) {
    if (Cancelled(cancel)) return Status::Cancelled("recall cancelled");
    const Frame& frame = it->frame();
    MemoryRecord record;
    if (!RecordForFrame(frame, config_.index, &record)) continue;
    if (std::find(scope.begin(), scope.end(), record.collection) == scope.end()) {
      continue;
    }
    size_t overlap = 0;
    for (const auto& tok : QueryTokens(frame.payload)) {
      overlap += query_tokens.count(tok);
    }
    if (overlap == 0) continue;

    RecallHit hit;
    hit.record_id = record.id;
    hit.frame_id = frame.id;
    hit.collection = record.collection;
    hit.text = frame.payload;
    hit.metadata = std::move(record.metadata);
    hit.privacy_class = frame.privacy_class;
    hit.memory_type = frame.memory_type;
    hit.created_at_us = frame.created_at_us;
    hit.score = static_cast<float>(overlap) / static_cast<float>(query_tokens.size());
    result->hits.push_back(std::move(hit));
  }
  if (!it->status().ok()) return it->status();

  std::sort(result->hits.begin(), result->hits.end(),
            [](const RecallHit& a, const RecallHit& b) {
              if (a.score != b.score) return a.score > b.score;
              if (a.created_at_us != b.created_at_us) {
                return a.created_at_us < b.created_at_us;
              }
              return a.record_id < b.record_id;
            });
  if (result->hits.size() > top_k) result->hits.resize(top_k);
  return Status::OK();
}

Status MemoryStore::Forget(const std::string& frame_id) {
  if (!raw_) return Status::InvalidArgument("store is closed");
  Status s = raw_->Tombstone(frame_id);
  if (!s.ok()) return s;
  ctx_.EmitCounter("engram.forget.tombstoned");

  std::string record_id;
  s = index_->FindByFrame(frame_id, &record_id);
  if (s.ok()) {
    s = index_->Delete(record_id);
    if (!s.ok() && !s.IsNotFound()) {
      // The orphan is removed by the next PruneOrphans pass; recall already
      // drops hits whose frame is tombstoned.
      ctx_.logger->warn("forgot frame {} but could not drop record {}: {}", frame_id,
                        record_id, s.ToString());
    }
  } else if (!s.IsNotFound()) {
    ctx_.logger->warn("forgot frame {} but record lookup failed: {}", frame_id,
                      s.ToString());
  }
  cache_->InvalidateForFrame(frame_id);
  return Status::OK();
}

Status MemoryStore::SweepRetention(uint64_t* forgotten) {
  uint64_t local = 0;
  if (!forgotten) forgotten = &local;
  *forgotten = 0;
  if (!raw_) return Status::InvalidArgument("store is closed");
  if (config_.storage.retention_days == 0) return Status::OK();

  const uint64_t window = static_cast<uint64_t>(config_.storage.retention_days) * kMicrosPerDay;
  const uint64_t now = ctx_.Now();
  if (now <= window) return Status::OK();
  const uint64_t cutoff = now - window;

  for (const auto& info : raw_->ListLive()) {
    if (info.created_at_us >= cutoff) continue;
    Status s = Forget(info.id);
    if (s.IsNotFound()) continue;  // forgotten concurrently
    if (!s.ok()) return s;
    (*forgotten)++;
  }
  if (*forgotten > 0) {
    ctx_.logger->info("retention sweep forgot {} frames older than {} days", *forgotten,
                      config_.storage.retention_days);
    ctx_.EmitCounter("engram.retention.forgotten", *forgotten);
  }
  return Status::OK();
}

Status MemoryStore::GetFrame(const std::string& frame_id, Frame* out) const {
  if (!raw_) return Status::InvalidArgument("store is closed");
  return raw_->Get(frame_id, out);
}

HealthReport MemoryStore::GetHealth() const {
  HealthReport h;
  if (!raw_ || !index_) return h;
  h.raw = raw_->Stats();
  for (const auto& c : config_.index.AllCollections()) {
    h.records_per_collection[c] = index_->Count(c);
  }
  h.embedding_cache = cache_->EmbeddingStats();
  h.query_cache = cache_->QueryStats();
  Status s = index_->LoadCheckpoint(&h.last_reconciled_sequence);
  if (!s.ok()) {
    ctx_.logger->warn("health: checkpoint unreadable: {}", s.ToString());
  }
  h.reconciler_running = reconciler_ && reconciler_->running();
  h.embedder = index_->embedder().Name();
  return h;
}

}  // namespace engram

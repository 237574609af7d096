#include <engram/semantic_index.hpp>

#include <engram/internal.hpp>

#include <json/json.h>
#include <rocksdb/cache.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <sstream>

namespace engram {

namespace {

constexpr const char* kRecordsCF = "engram_records";
constexpr const char* kEmbeddingsCF = "engram_embeddings";
constexpr const char* kFrameRefsCF = "engram_frame_refs";
constexpr const char* kCheckpointKey = "reconcile.checkpoint";

rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

Json::Value MetadataToJson(const Metadata& metadata) {
  Json::Value obj(Json::objectValue);
  for (const auto& [key, value] : metadata) {
    if (const auto* b = std::get_if<bool>(&value)) {
      obj[key] = *b;
    } else if (const auto* i = std::get_if<int64_t>(&value)) {
      obj[key] = static_cast<Json::Int64>(*i);
    } else if (const auto* d = std::get_if<double>(&value)) {
      obj[key] = *d;
    } else {
      obj[key] = std::get<std::string>(value);
    }
  }
  return obj;
}

bool MetadataFromJson(const Json::Value& obj, Metadata* out) {
  out->clear();
  if (obj.isNull()) return true;
  if (!obj.isObject()) return false;
  for (const auto& key : obj.getMemberNames()) {
    const Json::Value& v = obj[key];
    switch (v.type()) {
      case Json::booleanValue:
        (*out)[key] = v.asBool();
        break;
      case Json::intValue:
      case Json::uintValue:
        (*out)[key] = static_cast<int64_t>(v.asInt64());
        break;
      case Json::realValue:
        (*out)[key] = v.asDouble();
        break;
      case Json::stringValue:
        (*out)[key] = v.asString();
        break;
      default:
        return false;
    }
  }
  return true;
}

std::string EncodeRecordBody(const MemoryRecord& r) {
  Json::Value body;
  body["collection"] = r.collection;
  body["text"] = r.text;
  body["metadata"] = MetadataToJson(r.metadata);
  body["source_frame_id"] = r.source_frame_id;
  body["privacy"] = std::string(PrivacyClassName(r.privacy_class));
  body["created_at_us"] = static_cast<Json::UInt64>(r.created_at_us);

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, body);
}

bool DecodeRecordBody(const std::string& raw, MemoryRecord* r) {
  Json::Value body;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::istringstream stream(raw);
  if (!Json::parseFromStream(builder, stream, &body, &errors) || !body.isObject()) {
    return false;
  }
  if (!body["collection"].isString() || !body["text"].isString() ||
      !body["privacy"].isString() || !body["created_at_us"].isUInt64()) {
    return false;
  }
  r->collection = body["collection"].asString();
  r->text = body["text"].asString();
  r->source_frame_id = body.get("source_frame_id", "").asString();
  r->created_at_us = body["created_at_us"].asUInt64();
  if (!ParsePrivacyClass(body["privacy"].asString(), &r->privacy_class)) return false;
  return MetadataFromJson(body["metadata"], &r->metadata);
}

}  // namespace

Status FromRocks(const rocksdb::Status& s) {
  if (s.ok()) return Status::OK();
  if (s.IsNotFound()) return Status::NotFound(s.ToString());
  if (s.IsCorruption()) return Status::Corruption(s.ToString());
  if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
  return Status::IOError(s.ToString());
}

std::string_view TruncateUtf8(std::string_view text, size_t max_bytes) {
  if (text.size() <= max_bytes) return text;
  size_t end = max_bytes;
  // Back up over continuation bytes (10xxxxxx) to a sequence start.
  while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
    --end;
  }
  return text.substr(0, end);
}

SemanticIndex::SemanticIndex(const IndexConfig& config, const Context& ctx,
                             std::shared_ptr<Embedder> embedder,
                             std::shared_ptr<VectorSearch> vector_search,
                             CacheLayer* cache)
    : config_(config),
      ctx_(ctx.WithDefaults()),
      embedder_(std::move(embedder)),
      vector_search_(std::move(vector_search)),
      cache_(cache) {}

SemanticIndex::~SemanticIndex() { Close(); }

Status SemanticIndex::Open(const std::string& db_path, const IndexConfig& config,
                           const Context& ctx, std::shared_ptr<Embedder> embedder,
                           std::shared_ptr<VectorSearch> vector_search,
                           CacheLayer* cache, const SemanticIndexOptions& opt,
                           std::unique_ptr<SemanticIndex>* out) {
  if (!out) return Status::InvalidArgument("out is null");
  out->reset();
  if (!embedder || !vector_search) {
    return Status::InvalidArgument("embedder and vector search are required");
  }
  const size_t dims = static_cast<size_t>(config.embedding_dimensions);
  if (embedder->Dimension() != dims || vector_search->Dimension() != dims) {
    return Status::ConfigError(
        "embedding dimension mismatch: config " + std::to_string(dims) +
        ", embedder " + std::to_string(embedder->Dimension()) + ", vector search " +
        std::to_string(vector_search->Dimension()));
  }

  std::error_code ec;
  std::filesystem::create_directories(db_path, ec);
  if (ec) return Status::IOError("create " + db_path + ": " + ec.message());

  auto index = std::unique_ptr<SemanticIndex>(
      new SemanticIndex(config, ctx, std::move(embedder), std::move(vector_search), cache));

  rocksdb::Options options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  rocksdb::TransactionDBOptions txn_opts;

  // Shared cache for all CFs
  auto block_cache = rocksdb::NewLRUCache(opt.block_cache_bytes);

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName,
                   MakeCFOptions(block_cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kRecordsCF, MakeCFOptions(block_cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kEmbeddingsCF, MakeCFOptions(block_cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kFrameRefsCF, MakeCFOptions(block_cache, opt.bloom_bits_per_key));

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::TransactionDB* db = nullptr;

  rocksdb::Status s =
      rocksdb::TransactionDB::Open(options, txn_opts, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    return FromRocks(s);
  }

  index->db_ = db;
  index->handles_ = std::move(handles);

  // Descriptor order = handle order
  index->default_cf_ = index->handles_[0];
  index->records_cf_ = index->handles_[1];
  index->embeddings_cf_ = index->handles_[2];
  index->frame_refs_cf_ = index->handles_[3];

  Status rs = index->Rebuild();
  if (!rs.ok()) return rs;

  index->ctx_.logger->info("semantic index open at {} (embedder {}, {} dims)", db_path,
                           index->embedder_->Name(), dims);
  *out = std::move(index);
  return Status::OK();
}

void SemanticIndex::Close() {
  if (!db_) return;
  for (auto* h : handles_) delete h;
  handles_.clear();
  delete db_;
  db_ = nullptr;
  default_cf_ = records_cf_ = embeddings_cf_ = frame_refs_cf_ = nullptr;
}

Status SemanticIndex::Rebuild() {
  std::unique_ptr<rocksdb::Iterator> it(
      db_->NewIterator(rocksdb::ReadOptions(), records_cf_));
  size_t loaded = 0;
  size_t skipped = 0;
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    const std::string id = it->key().ToString();
    MemoryRecord record;
    if (!DecodeRecordBody(it->value().ToString(), &record)) {
      ctx_.logger->warn("index record {} has an unreadable body, skipping", id);
      ++skipped;
      continue;
    }
    std::string raw;
    rocksdb::Status gs = db_->Get(rocksdb::ReadOptions(), embeddings_cf_, id, &raw);
    std::vector<float> embedding;
    if (!gs.ok() || !internal::DeserializeEmbedding(raw, &embedding) ||
        embedding.size() != vector_search_->Dimension()) {
      ctx_.logger->warn("index record {} has no usable embedding, skipping", id);
      ++skipped;
      continue;
    }
    Status us = vector_search_->Upsert(record.collection, id, embedding, record.metadata);
    if (!us.ok()) return us;
    ++loaded;
  }
  if (!it->status().ok()) return FromRocks(it->status());
  if (loaded > 0 || skipped > 0) {
    ctx_.logger->info("semantic index rebuilt: {} records loaded, {} skipped", loaded,
                      skipped);
  }
  return Status::OK();
}

bool SemanticIndex::IsKnownCollection(const std::string& name) const {
  auto all = config_.AllCollections();
  return std::find(all.begin(), all.end(), name) != all.end();
}

std::mutex& SemanticIndex::StripeFor(const std::string& record_id) {
  return stripes_[std::hash<std::string>{}(record_id) % kStripes];
}

Status SemanticIndex::EmbedText(std::string_view text, std::vector<float>* out) const {
  if (cache_ && cache_->GetEmbedding(text, out)) return Status::OK();

  const uint64_t start = ctx_.Monotonic();
  EmbeddingResult r = embedder_->Embed(text);
  ctx_.EmitHistogram("engram.embed.latency_us", ctx_.Monotonic() - start);
  if (!r.success && r.unembeddable) {
    ctx_.EmitCounter("engram.embed.unembeddable");
    return Status::Rejected("nothing to embed: " + r.error_message);
  }
  if (!r.success) {
    ctx_.EmitCounter("engram.embed.failure");
    return Status::CollaboratorUnavailable("embedder: " + r.error_message);
  }
  if (r.embedding.size() != static_cast<size_t>(config_.embedding_dimensions)) {
    ctx_.EmitCounter("engram.embed.failure");
    return Status::CollaboratorUnavailable(
        "embedder returned " + std::to_string(r.embedding.size()) + " dims, expected " +
        std::to_string(config_.embedding_dimensions));
  }
  if (!internal::L2Normalize(&r.embedding)) {
    ctx_.EmitCounter("engram.embed.failure");
    return Status::CollaboratorUnavailable("embedder returned a zero vector");
  }
  if (cache_) cache_->PutEmbedding(text, r.embedding);
  *out = std::move(r.embedding);
  return Status::OK();
}

Status SemanticIndex::Index(MemoryRecord record) {
  if (!db_) return Status::InvalidArgument("index is closed");

  if (record.privacy_class == PrivacyClass::kPrivate) {
    ctx_.logger->debug("refusing to index private record (frame {})",
                       record.source_frame_id);
    ctx_.EmitCounter("engram.index.rejected");
    return Status::Rejected("private content is never indexed");
  }
  if (!IsKnownCollection(record.collection)) {
    ctx_.EmitCounter("engram.index.rejected");
    return Status::Rejected("unknown collection '" + record.collection + "'");
  }
  if (record.privacy_class == PrivacyClass::kSensitive &&
      record.collection != config_.restricted_collection) {
    ctx_.EmitCounter("engram.index.rejected");
    return Status::Rejected("sensitive content belongs in '" +
                            config_.restricted_collection + "'");
  }
  if (record.id.empty()) {
    if (record.source_frame_id.empty()) {
      return Status::InvalidArgument("record needs an id or a source frame");
    }
    record.id = RecordIdForFrame(record.source_frame_id);
  }

  const size_t max_text = static_cast<size_t>(config_.max_index_text_bytes);
  if (record.text.size() > max_text) {
    record.text = std::string(TruncateUtf8(record.text, max_text));
    ctx_.EmitCounter("engram.index.truncated");
  }

  if (record.embedding.empty()) {
    Status es = EmbedText(record.text, &record.embedding);
    if (!es.ok()) return es;
  } else {
    if (record.embedding.size() != vector_search_->Dimension()) {
      return Status::CollaboratorUnavailable("embedding dimension mismatch");
    }
    if (!internal::L2Normalize(&record.embedding)) {
      return Status::CollaboratorUnavailable("zero-norm embedding");
    }
  }
  if (record.created_at_us == 0) record.created_at_us = ctx_.Now();

  std::lock_guard<std::mutex> lock(StripeFor(record.id));

  rocksdb::WriteOptions wo;
  rocksdb::TransactionOptions to;
  std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
  if (!txn) return Status::IOError("BeginTransaction returned null");

  // Lock the record key and detect overwrite
  rocksdb::ReadOptions ro;
  std::string old_raw;
  MemoryRecord old;
  bool had_old = false;
  rocksdb::Status s = txn->GetForUpdate(ro, records_cf_, record.id, &old_raw);
  if (s.ok()) {
    if (!DecodeRecordBody(old_raw, &old)) {
      return Status::Corruption("index record " + record.id + " is unreadable");
    }
    had_old = true;
    if (old.collection != record.collection) {
      ctx_.EmitCounter("engram.index.rejected");
      return Status::Rejected("record " + record.id + " belongs to '" + old.collection +
                              "'; delete it before re-adding elsewhere");
    }
  } else if (!s.IsNotFound()) {
    return FromRocks(s);
  }

  std::vector<float> old_embedding;
  if (had_old) {
    std::string raw;
    if (txn->Get(ro, embeddings_cf_, record.id, &raw).ok() &&
        !internal::DeserializeEmbedding(raw, &old_embedding)) {
      old_embedding.clear();
    }
  }

  Status vs = vector_search_->Upsert(record.collection, record.id, record.embedding,
                                     record.metadata);
  if (!vs.ok()) {
    ctx_.EmitCounter("engram.vector.failure");
    if (vs.IsCollaboratorUnavailable()) return vs;
    return Status::CollaboratorUnavailable("vector upsert: " + vs.ToString());
  }

  s = txn->Put(records_cf_, record.id, EncodeRecordBody(record));
  if (s.ok()) {
    s = txn->Put(embeddings_cf_, record.id, internal::SerializeEmbedding(record.embedding));
  }
  if (s.ok() && had_old && !old.source_frame_id.empty() &&
      old.source_frame_id != record.source_frame_id) {
    s = txn->Delete(frame_refs_cf_, old.source_frame_id);
  }
  if (s.ok() && !record.source_frame_id.empty()) {
    s = txn->Put(frame_refs_cf_, record.source_frame_id, record.id);
  }
  if (s.ok()) s = txn->Commit();

  if (!s.ok()) {
    // Put the vector store back the way it was.
    Status undo = had_old && !old_embedding.empty()
                      ? vector_search_->Upsert(old.collection, record.id, old_embedding,
                                               old.metadata)
                      : vector_search_->Delete(record.collection, record.id);
    if (!undo.ok()) {
      ctx_.logger->error("index write for {} failed and vector rollback failed: {}",
                         record.id, undo.ToString());
    }
    return FromRocks(s);
  }

  ctx_.EmitCounter("engram.index.upsert");
  return Status::OK();
}

Status SemanticIndex::ResolveScope(const std::optional<std::string>& collection,
                                   bool allow_restricted,
                                   std::vector<std::string>* scope) const {
  scope->clear();
  if (!collection) {
    *scope = config_.UnrestrictedCollections();
    if (allow_restricted) scope->push_back(config_.restricted_collection);
    return Status::OK();
  }
  if (!IsKnownCollection(*collection)) {
    return Status::InvalidArgument("unknown collection '" + *collection + "'");
  }
  if (*collection == config_.restricted_collection && !allow_restricted) {
    return Status::Rejected("collection '" + *collection + "' is restricted");
  }
  scope->push_back(*collection);
  return Status::OK();
}

Status SemanticIndex::Query(std::string_view text,
                            const std::optional<std::string>& collection,
                            size_t top_k, bool allow_restricted,
                            std::vector<ScoredRecord>* out) const {
  out->clear();
  if (!db_) return Status::InvalidArgument("index is closed");

  std::vector<std::string> scope;
  Status s = ResolveScope(collection, allow_restricted, &scope);
  if (!s.ok()) return s;
  if (top_k == 0) return Status::OK();

  std::vector<float> query_vec;
  s = EmbedText(TruncateUtf8(text, static_cast<size_t>(config_.max_index_text_bytes)),
                &query_vec);
  // A query with no embeddable content matches nothing.
  if (s.IsRejected()) return Status::OK();
  if (!s.ok()) return s;

  const uint64_t start = ctx_.Monotonic();
  for (const auto& c : scope) {
    // Widen the fetch until every hit tied with the k-th score is in hand,
    // so the created_at tie-break below sees all candidates at the cutoff.
    std::vector<VectorHit> hits;
    size_t fetch = top_k;
    Status qs;
    while (true) {
      qs = vector_search_->Query(c, query_vec, fetch, &hits);
      if (!qs.ok() || hits.size() < fetch || hits.back().score < hits[top_k - 1].score) {
        break;
      }
      fetch *= 2;
    }
    if (!qs.ok()) {
      out->clear();
      ctx_.EmitCounter("engram.vector.failure");
      if (qs.IsCollaboratorUnavailable()) return qs;
      return Status::CollaboratorUnavailable("vector query: " + qs.ToString());
    }
    for (const auto& hit : hits) {
      ScoredRecord sr;
      Status rs = ReadRecord(hit.id, &sr.record, /*with_embedding=*/false);
      if (rs.IsNotFound()) continue;  // deleted after the vector query
      if (!rs.ok()) return rs;
      if (sr.record.privacy_class == PrivacyClass::kPrivate) continue;
      sr.score = hit.score;
      out->push_back(std::move(sr));
    }
  }
  ctx_.EmitHistogram("engram.vector.query_latency_us", ctx_.Monotonic() - start);

  std::sort(out->begin(), out->end(), [](const ScoredRecord& a, const ScoredRecord& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.record.created_at_us != b.record.created_at_us) {
      return a.record.created_at_us < b.record.created_at_us;
    }
    return a.record.id < b.record.id;
  });
  if (out->size() > top_k) out->resize(top_k);
  return Status::OK();
}

Status SemanticIndex::Delete(const std::string& record_id) {
  if (!db_) return Status::InvalidArgument("index is closed");
  std::lock_guard<std::mutex> lock(StripeFor(record_id));

  MemoryRecord record;
  Status s = ReadRecord(record_id, &record, /*with_embedding=*/false);
  if (!s.ok()) return s;

  Status vs = vector_search_->Delete(record.collection, record_id);
  if (!vs.ok() && !vs.IsNotFound()) {
    ctx_.EmitCounter("engram.vector.failure");
    return Status::CollaboratorUnavailable("vector delete: " + vs.ToString());
  }

  rocksdb::WriteBatch batch;
  batch.Delete(records_cf_, record_id);
  batch.Delete(embeddings_cf_, record_id);
  if (!record.source_frame_id.empty()) {
    batch.Delete(frame_refs_cf_, record.source_frame_id);
  }
  rocksdb::Status ws = db_->Write(rocksdb::WriteOptions(), &batch);
  if (!ws.ok()) return FromRocks(ws);

  ctx_.EmitCounter("engram.index.delete");
  return Status::OK();
}

Status SemanticIndex::ReadRecord(const std::string& record_id, MemoryRecord* out,
                                 bool with_embedding) const {
  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), records_cf_, record_id, &raw);
  if (s.IsNotFound()) return Status::NotFound("record " + record_id);
  if (!s.ok()) return FromRocks(s);

  MemoryRecord r;
  if (!DecodeRecordBody(raw, &r)) {
    return Status::Corruption("index record " + record_id + " is unreadable");
  }
  r.id = record_id;
  if (with_embedding) {
    std::string emb;
    s = db_->Get(rocksdb::ReadOptions(), embeddings_cf_, record_id, &emb);
    if (!s.ok() && !s.IsNotFound()) return FromRocks(s);
    if (s.ok() && !internal::DeserializeEmbedding(emb, &r.embedding)) {
      return Status::Corruption("embedding for " + record_id + " is unreadable");
    }
  }
  *out = std::move(r);
  return Status::OK();
}

Status SemanticIndex::Get(const std::string& record_id, MemoryRecord* out) const {
  if (!db_) return Status::InvalidArgument("index is closed");
  return ReadRecord(record_id, out, /*with_embedding=*/true);
}

Status SemanticIndex::FindByFrame(const std::string& frame_id,
                                  std::string* record_id) const {
  if (!db_) return Status::InvalidArgument("index is closed");
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), frame_refs_cf_, frame_id, record_id);
  if (s.IsNotFound()) return Status::NotFound("no record for frame " + frame_id);
  return FromRocks(s);
}

size_t SemanticIndex::Count(const std::string& collection) const {
  return vector_search_->Size(collection);
}

Status SemanticIndex::ListRecordIds(std::vector<std::string>* out) const {
  out->clear();
  if (!db_) return Status::InvalidArgument("index is closed");
  std::unique_ptr<rocksdb::Iterator> it(
      db_->NewIterator(rocksdb::ReadOptions(), records_cf_));
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    out->push_back(it->key().ToString());
  }
  return FromRocks(it->status());
}

Status SemanticIndex::LoadCheckpoint(uint64_t* sequence_no) const {
  *sequence_no = 0;
  if (!db_) return Status::InvalidArgument("index is closed");
  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), default_cf_, kCheckpointKey, &raw);
  if (s.IsNotFound()) return Status::OK();
  if (!s.ok()) return FromRocks(s);
  if (!internal::DecodeU64LE(raw, sequence_no)) {
    return Status::Corruption("reconcile checkpoint is unreadable");
  }
  return Status::OK();
}

Status SemanticIndex::SaveCheckpoint(uint64_t sequence_no) {
  if (!db_) return Status::InvalidArgument("index is closed");
  rocksdb::WriteOptions wo;
  wo.sync = true;
  return FromRocks(db_->Put(wo, default_cf_, kCheckpointKey,
                            internal::EncodeU64LE(sequence_no)));
}

}  // namespace engram

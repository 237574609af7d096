#include <engram/reconciler.hpp>

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace engram {

bool RecordForFrame(const Frame& frame, const IndexConfig& config, MemoryRecord* out) {
  if (frame.privacy_class == PrivacyClass::kPrivate) return false;
  MemoryRecord r;
  r.id = RecordIdForFrame(frame.id);
  r.collection = config.CollectionFor(frame.privacy_class, frame.memory_type);
  r.text = frame.payload;
  r.source_frame_id = frame.id;
  r.privacy_class = frame.privacy_class;
  r.created_at_us = frame.created_at_us;
  r.metadata["memory_type"] = std::string(MemoryTypeName(frame.memory_type));
  r.metadata["sequence_no"] = static_cast<int64_t>(frame.sequence_no);
  *out = std::move(r);
  return true;
}

Status RetireStaleRecord(const Frame& frame, SemanticIndex* index, CacheLayer* cache) {
  std::string record_id;
  Status s = index->FindByFrame(frame.id, &record_id);
  if (s.IsNotFound()) return Status::OK();
  if (!s.ok()) return s;

  MemoryRecord current;
  s = index->Get(record_id, &current);
  if (s.IsNotFound()) return Status::OK();
  if (!s.ok() && !s.IsCorruption()) return s;

  MemoryRecord wanted;
  if (s.ok() && RecordForFrame(frame, index->config(), &wanted) &&
      wanted.collection == current.collection &&
      wanted.privacy_class == current.privacy_class) {
    return Status::OK();
  }

  s = index->Delete(record_id);
  if (!s.ok() && !s.IsNotFound()) return s;
  if (cache) cache->InvalidateForFrame(frame.id);
  return Status::OK();
}

Reconciler::Reconciler(RawStore* raw, SemanticIndex* index, CacheLayer* cache,
                       const Context& ctx)
    : raw_(raw), index_(index), cache_(cache), ctx_(ctx.WithDefaults()) {}

Reconciler::~Reconciler() { Stop(); }

Status Reconciler::Run(uint64_t since, ReconcileStats* stats,
                       const CancellationToken* cancel) {
  ReconcileStats local;
  if (!stats) stats = &local;
  *stats = ReconcileStats();
  stats->last_sequence = since;

  std::lock_guard<std::mutex> lock(run_mu_);
  auto span = ctx_.StartSpan("engram.reconcile");
  const uint64_t start = ctx_.Monotonic();

  auto finish = [&](const Status& s) {
    ctx_.EmitHistogram("engram.reconcile.latency_us", ctx_.Monotonic() - start);
    ctx_.EmitCounter("engram.reconcile.indexed", stats->indexed);
    if (span) {
      span->SetAttribute("indexed", stats->indexed);
      span->SetAttribute("last_sequence", stats->last_sequence);
      span->End(s);
    }
    return s;
  };

  auto it = raw_->Iterate(since);
  for (; it->Valid(); it->Next()) {
    if (cancel && cancel->IsCancelled()) {
      stats->corrupt_skipped = it->skipped_corrupt();
      return finish(Status::Cancelled("reconcile cancelled"));
    }
    const Frame& frame = it->frame();
    stats->scanned++;

    // A frame reclassified to a stricter class leaves its old record behind.
    Status rs = RetireStaleRecord(frame, index_, cache_);
    if (!rs.ok()) {
      ctx_.logger->warn("reconcile stopped at frame {} (seq {}): {}", frame.id,
                        frame.sequence_no, rs.ToString());
      stats->corrupt_skipped = it->skipped_corrupt();
      ctx_.EmitCounter("engram.reconcile.failed");
      return finish(rs);
    }

    MemoryRecord record;
    if (!RecordForFrame(frame, index_->config(), &record)) {
      stats->skipped_private++;
    } else {
      Status s = index_->Index(std::move(record));
      if (s.ok()) {
        stats->indexed++;
        if (cache_) {
          cache_->InvalidateForCollection(
              index_->config().CollectionFor(frame.privacy_class, frame.memory_type));
        }
      } else if (s.IsRejected()) {
        stats->rejected++;
        ctx_.logger->debug("reconcile: frame {} rejected: {}", frame.id, s.ToString());
      } else {
        ctx_.logger->warn("reconcile stopped at frame {} (seq {}): {}", frame.id,
                          frame.sequence_no, s.ToString());
        stats->corrupt_skipped = it->skipped_corrupt();
        ctx_.EmitCounter("engram.reconcile.failed");
        return finish(s);
      }
    }

    Status cs = index_->SaveCheckpoint(frame.sequence_no);
    if (!cs.ok()) return finish(cs);
    stats->last_sequence = frame.sequence_no;
  }
  stats->corrupt_skipped = it->skipped_corrupt();
  if (stats->corrupt_skipped > 0) {
    ctx_.logger->warn("reconcile skipped {} corrupt frames", stats->corrupt_skipped);
  }
  if (!it->status().ok()) return finish(it->status());

  ctx_.logger->debug("reconcile: scanned {} frames, indexed {}, last seq {}",
                     stats->scanned, stats->indexed, stats->last_sequence);
  return finish(Status::OK());
}

Status Reconciler::Resume(ReconcileStats* stats, const CancellationToken* cancel) {
  uint64_t since = 0;
  Status s = index_->LoadCheckpoint(&since);
  if (!s.ok()) return s;
  return Run(since, stats, cancel);
}

Status Reconciler::PruneOrphans(uint64_t* pruned) {
  uint64_t local = 0;
  if (!pruned) pruned = &local;
  *pruned = 0;

  std::lock_guard<std::mutex> lock(run_mu_);

  // Records first, live frames second: a record listed here was derived from
  // a frame that was already durable, so it shows up in ListLive() unless it
  // has since been deleted.
  std::vector<std::string> record_ids;
  Status s = index_->ListRecordIds(&record_ids);
  if (!s.ok()) return s;

  std::unordered_set<std::string> live;
  for (const auto& info : raw_->ListLive()) live.insert(info.id);

  for (const auto& id : record_ids) {
    MemoryRecord record;
    s = index_->Get(id, &record);
    if (s.IsNotFound()) continue;
    if (!s.ok() && !s.IsCorruption()) return s;
    if (s.ok() && live.count(record.source_frame_id) > 0) continue;

    s = index_->Delete(id);
    if (s.IsNotFound()) continue;
    if (!s.ok()) return s;
    (*pruned)++;
    if (cache_ && !record.source_frame_id.empty()) {
      cache_->InvalidateForFrame(record.source_frame_id);
    }
  }

  if (*pruned > 0) {
    ctx_.logger->info("pruned {} orphaned index records", *pruned);
    ctx_.EmitCounter("engram.reconcile.pruned", *pruned);
  }
  return Status::OK();
}

void Reconciler::Start(std::chrono::milliseconds interval) {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) return;
  stop_requested_.store(false);
  thread_ = std::thread([this, interval] { Loop(interval); });
}

void Reconciler::Stop() {
  {
    std::lock_guard<std::mutex> lock(cv_mu_);
    stop_requested_.store(true);
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_.store(false);
}

void Reconciler::Loop(std::chrono::milliseconds interval) {
  ctx_.logger->debug("reconciler started (interval {} ms)", interval.count());
  while (true) {
    {
      std::unique_lock<std::mutex> lock(cv_mu_);
      if (cv_.wait_for(lock, interval, [this] { return stop_requested_.load(); })) {
        break;
      }
    }
    ReconcileStats stats;
    Status s = Resume(&stats);
    if (!s.ok()) {
      ctx_.logger->warn("background reconcile failed: {}", s.ToString());
    }
    uint64_t pruned = 0;
    s = PruneOrphans(&pruned);
    if (!s.ok()) {
      ctx_.logger->warn("background prune failed: {}", s.ToString());
    }
  }
  ctx_.logger->debug("reconciler stopped");
}

}  // namespace engram

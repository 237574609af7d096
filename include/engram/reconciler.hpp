#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include <engram/cache.hpp>
#include <engram/context.hpp>
#include <engram/raw_store.hpp>
#include <engram/semantic_index.hpp>
#include <engram/status.hpp>
#include <engram/types.hpp>

namespace engram {

struct ReconcileStats {
  uint64_t scanned = 0;          // live frames visited
  uint64_t indexed = 0;
  uint64_t skipped_private = 0;
  uint64_t rejected = 0;
  uint64_t corrupt_skipped = 0;  // frames the iterator could not read
  uint64_t last_sequence = 0;    // last frame fully processed
};

/**
 * Derive the index record for a frame: id from the frame id, collection from
 * privacy class and memory type, text from the payload. The derived record
 * depends only on the frame, so re-deriving it is an exact overwrite.
 * Returns false for private frames, which have no record.
 */
bool RecordForFrame(const Frame& frame, const IndexConfig& config, MemoryRecord* out);

/**
 * Delete the index record derived from `frame` when the frame's current
 * class no longer places it there: the frame became private, or its class
 * routes it to a different collection. Cached results that may mention the
 * frame are invalidated. OK when there is nothing to delete; cache may be
 * null.
 */
Status RetireStaleRecord(const Frame& frame, SemanticIndex* index, CacheLayer* cache);

/**
 * Keeps the Semantic Index a faithful projection of the Raw Store.
 *
 * Run() walks frames in sequence order and (re)indexes each eligible one,
 * saving a checkpoint after every frame. A crash between frames loses no
 * work; the frame in flight is processed again on Resume() and overwrites
 * its own record.
 */
class Reconciler {
 public:
  // raw and index must outlive the reconciler; cache may be null.
  Reconciler(RawStore* raw, SemanticIndex* index, CacheLayer* cache, const Context& ctx);
  ~Reconciler();

  Reconciler(const Reconciler&) = delete;
  Reconciler& operator=(const Reconciler&) = delete;

  /**
   * Index every live, non-private frame with sequence_no > since.
   * Rejected frames are counted and passed over. Any other failure stops
   * the pass (the checkpoint stays at the last frame that was processed) so
   * a later Resume() retries from there.
   */
  Status Run(uint64_t since, ReconcileStats* stats,
             const CancellationToken* cancel = nullptr);

  // Run() from the saved checkpoint.
  Status Resume(ReconcileStats* stats, const CancellationToken* cancel = nullptr);

  // Delete records whose source frame is no longer live.
  Status PruneOrphans(uint64_t* pruned);

  // Resume() + PruneOrphans() every interval on a background thread.
  void Start(std::chrono::milliseconds interval);
  void Stop();
  bool running() const { return running_.load(); }

 private:
  void Loop(std::chrono::milliseconds interval);

  RawStore* raw_;
  SemanticIndex* index_;
  CacheLayer* cache_;
  Context ctx_;

  // One pass at a time, foreground or background.
  std::mutex run_mu_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex cv_mu_;
  std::condition_variable cv_;
  std::thread thread_;
};

}  // namespace engram

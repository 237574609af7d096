#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <engram/context.hpp>
#include <engram/crypto.hpp>
#include <engram/status.hpp>
#include <engram/types.hpp>

namespace engram {

struct RawStoreOptions {
  // fsync after every append/tombstone before it is acknowledged
  bool sync_writes = true;
};

struct RawStoreStats {
  uint64_t live_frames = 0;
  uint64_t tombstoned_frames = 0;
  uint64_t corrupt_records = 0;
  uint64_t file_bytes = 0;
  uint64_t last_sequence = 0;
};

/** Plaintext metadata of a live frame (no decryption involved). */
struct FrameInfo {
  std::string id;
  PrivacyClass privacy_class = PrivacyClass::kPublic;
  MemoryType memory_type = MemoryType::kConversation;
  uint64_t created_at_us = 0;
  uint64_t sequence_no = 0;
};

class RawStore;

/**
 * Forward-only cursor over live frames with sequence_no > since.
 *
 * The upper bound is the store's last sequence number when the iterator was
 * created, so iteration is finite even under concurrent appends. Tombstoned,
 * superseded and corrupt frames are skipped. The RawStore must outlive the
 * iterator.
 *
 *   auto it = store->Iterate(0);
 *   for (; it->Valid(); it->Next()) Use(it->frame());
 *   if (!it->status().ok()) ...
 */
class FrameIterator {
 public:
  bool Valid() const { return valid_; }
  const Frame& frame() const { return frame_; }
  void Next();

  // Non-OK only for I/O failures; corrupt frames are skipped, not reported.
  const Status& status() const { return status_; }

  // Number of frames skipped because they failed checksum or authentication.
  uint64_t skipped_corrupt() const { return skipped_corrupt_; }

 private:
  friend class RawStore;
  FrameIterator(const RawStore* store, uint64_t since, uint64_t bound);

  const RawStore* store_;
  uint64_t cursor_;
  uint64_t bound_;
  bool valid_ = false;
  Frame frame_;
  Status status_;
  uint64_t skipped_corrupt_ = 0;
};

/**
 * Append-only, encrypted, content-addressed log of frames.
 *
 * File layout:
 *
 *   [file header: "ENGRAWST" | version:u32]
 *   [record]*
 *
 *   record = [magic:u32 | sequence_no:u64 | body_len:u32 | checksum:8 | body]
 *
 * The checksum is the first 8 bytes of SHA-256(sequence_no | body_len | body).
 * Committed bytes are never rewritten; deletion appends a tombstone record.
 * A trailing record whose declared length runs past end of file is an
 * interrupted write: it is ignored and cut off at open.
 *
 * Concurrency: appends and tombstones are serialized by a writer mutex that
 * covers sequence assignment and the durable write. Readers take a shared
 * lock on the in-memory index only long enough to copy a slot, then read the
 * file with pread.
 */
class RawStore {
 public:
  static constexpr uint32_t kFormatVersion = 1;

  /**
   * Open (or create) the log at `path`. Takes an exclusive flock on the
   * file; a second process opening the same log gets IOError.
   */
  static Status Open(const std::string& path, const KeyMaterial& key,
                     const Context& ctx, const RawStoreOptions& opt,
                     std::unique_ptr<RawStore>* out);

  ~RawStore();

  RawStore(const RawStore&) = delete;
  RawStore& operator=(const RawStore&) = delete;

  /**
   * Append payload as a new frame. The frame id is the hex SHA-256 of the
   * payload.
   *
   * Re-appending content that is already live returns the existing frame
   * unchanged (same sequence number) unless `privacy` is stricter than the
   * stored class. In that case the content is written again as a new frame
   * (new sequence number) under the stricter class, keeping its memory type
   * and creation time, and the old record is superseded. A looser class
   * never downgrades a frame.
   * If the stored bytes for that id no longer decrypt to `payload`, returns
   * IntegrityError and writes nothing.
   */
  Status Append(std::string_view payload, PrivacyClass privacy,
                MemoryType memory_type, Frame* out);

  /**
   * Fetch and decrypt a frame.
   * @return NotFound if unknown or tombstoned, Corruption if the record
   *         fails its checksum or authentication.
   */
  Status Get(const std::string& frame_id, Frame* out) const;

  /** Logically delete a live frame. NotFound if unknown or already deleted. */
  Status Tombstone(const std::string& frame_id);

  /** Lazy iteration over live frames with sequence_no > since. */
  std::unique_ptr<FrameIterator> Iterate(uint64_t since) const;

  /** Metadata of every live, uncorrupted frame in sequence order. */
  std::vector<FrameInfo> ListLive() const;

  RawStoreStats Stats() const;
  uint64_t LastSequence() const;

  const std::string& path() const { return path_; }

  void Close();

 private:
  friend class FrameIterator;

  enum class RecordKind : uint8_t { kFrame = 1, kTombstone = 2 };

  struct Slot {
    uint64_t sequence_no = 0;
    uint64_t offset = 0;
    uint32_t record_len = 0;
    PrivacyClass privacy_class = PrivacyClass::kPublic;
    MemoryType memory_type = MemoryType::kConversation;
    uint64_t created_at_us = 0;
    bool tombstoned = false;
    bool corrupt = false;
  };

  RawStore(std::string path, const KeyMaterial& key, Context ctx,
           RawStoreOptions opt);

  Status Recover();
  void ApplyRecord(uint64_t offset, std::string_view record, bool checksum_ok);
  Status WriteRecord(uint64_t seq, const std::string& body, uint64_t* offset,
                     uint32_t* record_len);
  Status ReadFrame(const std::string& frame_id, const Slot& slot,
                   Frame* out) const;

  // Next live frame with sequence_no in (after, bound]. NotFound when done.
  Status NextFrame(uint64_t after, uint64_t bound, Frame* out,
                   uint64_t* skipped_corrupt) const;

  std::string path_;
  FrameCipher cipher_;
  Context ctx_;
  RawStoreOptions opt_;
  int fd_ = -1;

  std::mutex write_mu_;

  mutable std::shared_mutex index_mu_;
  std::unordered_map<std::string, Slot> slots_;
  // (sequence_no, frame_id) of every frame record, ascending
  std::vector<std::pair<uint64_t, std::string>> frame_log_;
  uint64_t last_seq_ = 0;
  uint64_t end_offset_ = 0;
  uint64_t corrupt_records_ = 0;
};

}  // namespace engram

#include <engram/raw_store.hpp>

#include <engram/internal.hpp>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace engram {

namespace {

constexpr char kFileMagic[] = "ENGRAWST";
constexpr size_t kFileMagicBytes = 8;
constexpr size_t kFileHeaderBytes = kFileMagicBytes + 4;

constexpr uint32_t kRecordMagic = 0x46524745;  // "EGRF"
constexpr size_t kRecordHeaderBytes = 4 + 8 + 4 + 8;
constexpr size_t kChecksumBytes = 8;

// kind, privacy, memory_type, reserved, created_at, frame id (raw sha256)
constexpr size_t kBodyFixedBytes = 4 + 8 + internal::Sha256::kDigestBytes;
// salt, nonce, tag, ciphertext length
constexpr size_t kSealedHeaderBytes = FrameCipher::kSaltBytes +
                                      FrameCipher::kNonceBytes +
                                      FrameCipher::kTagBytes + 4;

constexpr uint32_t kMaxBodyBytes = 256u << 20;

std::string Checksum(uint64_t seq, std::string_view body) {
  std::string covered = internal::EncodeU64LE(seq);
  covered += internal::EncodeU32LE(static_cast<uint32_t>(body.size()));
  covered.append(body.data(), body.size());
  auto d = internal::Sha256::Digest(covered);
  return internal::ToBytes(d.data(), kChecksumBytes);
}

struct RecordHeader {
  uint32_t magic = 0;
  uint64_t seq = 0;
  uint32_t body_len = 0;
  std::string_view checksum;
};

RecordHeader ParseHeader(std::string_view h) {
  RecordHeader out;
  internal::DecodeU32LE(h.substr(0, 4), &out.magic);
  internal::DecodeU64LE(h.substr(4, 8), &out.seq);
  internal::DecodeU32LE(h.substr(12, 4), &out.body_len);
  out.checksum = h.substr(16, kChecksumBytes);
  return out;
}

// Position of the next record header at or after `from` whose checksum
// verifies, or npos. Used to step over damaged bytes.
size_t FindNextRecord(const std::string& data, size_t from) {
  const std::string magic = internal::EncodeU32LE(kRecordMagic);
  size_t pos = from;
  while ((pos = data.find(magic, pos)) != std::string::npos) {
    if (data.size() - pos >= kRecordHeaderBytes) {
      RecordHeader h = ParseHeader(std::string_view(data).substr(pos, kRecordHeaderBytes));
      if (h.body_len <= kMaxBodyBytes &&
          data.size() - pos - kRecordHeaderBytes >= h.body_len) {
        std::string_view body =
            std::string_view(data).substr(pos + kRecordHeaderBytes, h.body_len);
        if (Checksum(h.seq, body) == h.checksum) return pos;
      }
    }
    ++pos;
  }
  return std::string::npos;
}

std::string FixedFields(uint8_t kind, PrivacyClass privacy, MemoryType type,
                        uint64_t created_at_us, std::string_view raw_id) {
  std::string out;
  out.reserve(kBodyFixedBytes);
  out.push_back(static_cast<char>(kind));
  out.push_back(static_cast<char>(privacy));
  out.push_back(static_cast<char>(type));
  out.push_back('\0');
  out += internal::EncodeU64LE(created_at_us);
  out.append(raw_id.data(), raw_id.size());
  return out;
}

bool ValidPrivacy(uint8_t v) { return v <= static_cast<uint8_t>(PrivacyClass::kPrivate); }
bool ValidMemoryType(uint8_t v) { return v <= static_cast<uint8_t>(MemoryType::kFact); }

Status PreadFull(int fd, uint64_t offset, size_t n, std::string* out) {
  out->assign(n, '\0');
  size_t done = 0;
  while (done < n) {
    ssize_t r = ::pread(fd, out->data() + done, n - done,
                        static_cast<off_t>(offset + done));
    if (r < 0) {
      if (errno == EINTR) continue;
      return Status::IOError(std::string("pread: ") + std::strerror(errno));
    }
    if (r == 0) break;
    done += static_cast<size_t>(r);
  }
  out->resize(done);
  return Status::OK();
}

Status PwriteFull(int fd, uint64_t offset, std::string_view data) {
  size_t done = 0;
  while (done < data.size()) {
    ssize_t w = ::pwrite(fd, data.data() + done, data.size() - done,
                         static_cast<off_t>(offset + done));
    if (w < 0) {
      if (errno == EINTR) continue;
      return Status::IOError(std::string("pwrite: ") + std::strerror(errno));
    }
    done += static_cast<size_t>(w);
  }
  return Status::OK();
}

}  // namespace

// ---------------------------------------------------------------------------
// FrameIterator
// ---------------------------------------------------------------------------

FrameIterator::FrameIterator(const RawStore* store, uint64_t since,
                             uint64_t bound)
    : store_(store), cursor_(since), bound_(bound) {
  Next();
}

void FrameIterator::Next() {
  Status s = store_->NextFrame(cursor_, bound_, &frame_, &skipped_corrupt_);
  if (s.ok()) {
    valid_ = true;
    cursor_ = frame_.sequence_no;
    return;
  }
  valid_ = false;
  if (!s.IsNotFound()) status_ = s;
}

// ---------------------------------------------------------------------------
// RawStore
// ---------------------------------------------------------------------------

RawStore::RawStore(std::string path, const KeyMaterial& key, Context ctx,
                   RawStoreOptions opt)
    : path_(std::move(path)),
      cipher_(key),
      ctx_(ctx.WithDefaults()),
      opt_(opt) {}

RawStore::~RawStore() { Close(); }

void RawStore::Close() {
  // Waits out an append or tombstone in flight.
  std::lock_guard<std::mutex> wlock(write_mu_);
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
}

Status RawStore::Open(const std::string& path, const KeyMaterial& key,
                      const Context& ctx, const RawStoreOptions& opt,
                      std::unique_ptr<RawStore>* out) {
  if (key.secret.size() != KeyMaterial::kSecretBytes) {
    return Status::InvalidArgument("key secret must be 32 bytes");
  }

  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return Status::IOError("create " + parent.string() + ": " + ec.message());
    }
  }

  std::unique_ptr<RawStore> store(new RawStore(path, key, ctx, opt));
  store->fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (store->fd_ < 0) {
    return Status::IOError("open " + path + ": " + std::strerror(errno));
  }
  if (::flock(store->fd_, LOCK_EX | LOCK_NB) != 0) {
    return Status::IOError("raw store " + path +
                           " is locked by another process");
  }

  Status s = store->Recover();
  if (!s.ok()) return s;

  store->ctx_.logger->info("raw store opened: {} ({} live frames, last seq {})",
                           path, store->Stats().live_frames, store->last_seq_);
  *out = std::move(store);
  return Status::OK();
}

Status RawStore::Recover() {
  struct stat st;
  if (::fstat(fd_, &st) != 0) {
    return Status::IOError("fstat " + path_ + ": " + std::strerror(errno));
  }
  const uint64_t size = static_cast<uint64_t>(st.st_size);

  std::string data;
  Status s = PreadFull(fd_, 0, size, &data);
  if (!s.ok()) return s;

  const std::string header = std::string(kFileMagic, kFileMagicBytes) +
                             internal::EncodeU32LE(kFormatVersion);

  if (data.size() < kFileHeaderBytes) {
    // Empty file or a header write that never completed.
    if (header.compare(0, data.size(), data) != 0) {
      return Status::Corruption(path_ + " is not an engram raw store");
    }
    if (::ftruncate(fd_, 0) != 0) {
      return Status::IOError("ftruncate " + path_ + ": " + std::strerror(errno));
    }
    s = PwriteFull(fd_, 0, header);
    if (!s.ok()) return s;
    if (::fsync(fd_) != 0) {
      return Status::IOError("fsync " + path_ + ": " + std::strerror(errno));
    }
    end_offset_ = kFileHeaderBytes;
    return Status::OK();
  }

  if (data.compare(0, kFileMagicBytes, kFileMagic) != 0) {
    return Status::Corruption(path_ + " is not an engram raw store");
  }
  uint32_t version = 0;
  internal::DecodeU32LE(std::string_view(data).substr(kFileMagicBytes, 4), &version);
  if (version != kFormatVersion) {
    return Status::Corruption("unsupported raw store version " +
                              std::to_string(version));
  }

  size_t pos = kFileHeaderBytes;
  size_t tail = data.size();
  while (pos < data.size()) {
    const size_t remaining = data.size() - pos;
    if (remaining < kRecordHeaderBytes) {
      tail = pos;
      break;
    }

    RecordHeader h = ParseHeader(std::string_view(data).substr(pos, kRecordHeaderBytes));
    if (h.magic != kRecordMagic) {
      size_t next = FindNextRecord(data, pos + 1);
      ++corrupt_records_;
      ctx_.logger->warn("raw store {}: damaged bytes at offset {}, resuming at {}",
                        path_, pos, next == std::string::npos ? data.size() : next);
      if (next == std::string::npos) break;
      pos = next;
      continue;
    }

    if (h.body_len > remaining - kRecordHeaderBytes) {
      // Either an interrupted append or a damaged length field. Only the
      // former may be cut off.
      size_t next = FindNextRecord(data, pos + 1);
      if (next == std::string::npos) {
        tail = pos;
        break;
      }
      ++corrupt_records_;
      ctx_.logger->warn("raw store {}: bad record length at offset {}", path_, pos);
      pos = next;
      continue;
    }

    std::string_view record =
        std::string_view(data).substr(pos, kRecordHeaderBytes + h.body_len);
    bool checksum_ok =
        Checksum(h.seq, record.substr(kRecordHeaderBytes)) == h.checksum;
    ApplyRecord(pos, record, checksum_ok);
    pos += kRecordHeaderBytes + h.body_len;
  }

  if (tail < data.size()) {
    ctx_.logger->warn("raw store {}: discarding {} bytes of interrupted write",
                      path_, data.size() - tail);
    if (::ftruncate(fd_, static_cast<off_t>(tail)) != 0) {
      return Status::IOError("ftruncate " + path_ + ": " + std::strerror(errno));
    }
  }
  end_offset_ = tail;
  return Status::OK();
}

void RawStore::ApplyRecord(uint64_t offset, std::string_view record,
                           bool checksum_ok) {
  RecordHeader h = ParseHeader(record.substr(0, kRecordHeaderBytes));
  last_seq_ = std::max(last_seq_, h.seq);

  std::string_view body = record.substr(kRecordHeaderBytes);
  if (body.size() < kBodyFixedBytes) {
    ++corrupt_records_;
    return;
  }

  auto kind = static_cast<uint8_t>(body[0]);
  auto privacy = static_cast<uint8_t>(body[1]);
  auto type = static_cast<uint8_t>(body[2]);
  uint64_t created_at = 0;
  internal::DecodeU64LE(body.substr(4, 8), &created_at);
  std::string id = internal::HexEncode(body.substr(12, internal::Sha256::kDigestBytes));

  if (!checksum_ok) {
    ++corrupt_records_;
    ctx_.logger->warn("raw store {}: checksum mismatch at seq {} (offset {})",
                      path_, h.seq, offset);
    auto it = slots_.find(id);
    if (kind == static_cast<uint8_t>(RecordKind::kTombstone)) {
      // A damaged tombstone still hides its frame.
      if (it != slots_.end()) it->second.tombstoned = true;
    } else if (kind == static_cast<uint8_t>(RecordKind::kFrame)) {
      Slot& slot = slots_[id];
      slot = Slot{};
      slot.sequence_no = h.seq;
      slot.offset = offset;
      slot.record_len = static_cast<uint32_t>(record.size());
      slot.corrupt = true;
    }
    return;
  }

  if (kind == static_cast<uint8_t>(RecordKind::kFrame)) {
    if (!ValidPrivacy(privacy) || !ValidMemoryType(type)) {
      ++corrupt_records_;
      return;
    }
    Slot slot;
    slot.sequence_no = h.seq;
    slot.offset = offset;
    slot.record_len = static_cast<uint32_t>(record.size());
    slot.privacy_class = static_cast<PrivacyClass>(privacy);
    slot.memory_type = static_cast<MemoryType>(type);
    slot.created_at_us = created_at;
    slots_[id] = slot;
    frame_log_.emplace_back(h.seq, id);
  } else if (kind == static_cast<uint8_t>(RecordKind::kTombstone)) {
    auto it = slots_.find(id);
    if (it != slots_.end()) {
      it->second.tombstoned = true;
    } else {
      ctx_.logger->debug("raw store {}: tombstone for unknown frame {}", path_, id);
    }
  } else {
    ++corrupt_records_;
  }
}

Status RawStore::WriteRecord(uint64_t seq, const std::string& body,
                             uint64_t* offset, uint32_t* record_len) {
  std::string record;
  record.reserve(kRecordHeaderBytes + body.size());
  record += internal::EncodeU32LE(kRecordMagic);
  record += internal::EncodeU64LE(seq);
  record += internal::EncodeU32LE(static_cast<uint32_t>(body.size()));
  record += Checksum(seq, body);
  record += body;

  const uint64_t at = end_offset_;
  Status s = PwriteFull(fd_, at, record);
  if (s.ok() && opt_.sync_writes && ::fsync(fd_) != 0) {
    s = Status::IOError("fsync " + path_ + ": " + std::strerror(errno));
  }
  if (!s.ok()) {
    // Drop whatever part of this record reached the file; nothing before
    // `at` is touched.
    if (::ftruncate(fd_, static_cast<off_t>(at)) != 0) {
      ctx_.logger->error("raw store {}: cannot cut failed append at {}: {}",
                         path_, at, std::strerror(errno));
    }
    return s;
  }

  *offset = at;
  *record_len = static_cast<uint32_t>(record.size());
  return Status::OK();
}

Status RawStore::Append(std::string_view payload, PrivacyClass privacy,
                        MemoryType memory_type, Frame* out) {
  if (payload.size() > kMaxBodyBytes - kBodyFixedBytes - kSealedHeaderBytes) {
    return Status::InvalidArgument("payload too large");
  }

  auto digest = internal::Sha256::Digest(payload);
  std::string raw_id = internal::ToBytes(digest.data(), digest.size());
  std::string id = internal::HexEncode(raw_id);

  std::lock_guard<std::mutex> wlock(write_mu_);
  if (fd_ < 0) return Status::IOError("raw store is closed");

  Slot existing;
  bool have = false;
  {
    std::shared_lock<std::shared_mutex> lock(index_mu_);
    auto it = slots_.find(id);
    if (it != slots_.end()) {
      existing = it->second;
      have = true;
    }
  }

  if (have && !existing.tombstoned) {
    if (existing.corrupt) {
      ctx_.logger->error("raw store {}: append of {} collides with a damaged record",
                         path_, id);
      return Status::IntegrityError("frame " + id + " exists but is unreadable");
    }
    Frame stored;
    Status s = ReadFrame(id, existing, &stored);
    if (s.IsCorruption()) {
      ctx_.logger->error("raw store {}: append of {} collides with unreadable bytes: {}",
                         path_, id, s.ToString());
      return Status::IntegrityError("frame " + id + " exists but is unreadable: " +
                                    s.message());
    }
    if (!s.ok()) return s;
    if (stored.payload != payload) {
      ctx_.logger->error("raw store {}: rewrite attempt for frame {}", path_, id);
      return Status::IntegrityError("frame " + id + " exists with different content");
    }
    if (privacy <= existing.privacy_class) {
      *out = std::move(stored);
      return Status::OK();
    }
    // A stricter class supersedes the live frame: the content is written
    // again under the new class and the later record wins on replay. Type
    // and creation time carry over.
    ctx_.logger->info("raw store {}: frame {} reclassified {} -> {}", path_, id,
                      PrivacyClassName(existing.privacy_class), PrivacyClassName(privacy));
    memory_type = existing.memory_type;
  }

  const uint64_t created_at =
      (have && !existing.tombstoned) ? existing.created_at_us : ctx_.Now();
  std::string body = FixedFields(static_cast<uint8_t>(RecordKind::kFrame),
                                 privacy, memory_type, created_at, raw_id);

  FrameCipher::Sealed sealed;
  Status s = cipher_.Seal(payload, body, &sealed);
  if (!s.ok()) return s;

  body += sealed.salt;
  body += sealed.nonce;
  body += sealed.tag;
  body += internal::EncodeU32LE(static_cast<uint32_t>(sealed.ciphertext.size()));
  body += sealed.ciphertext;

  const uint64_t seq = last_seq_ + 1;
  uint64_t offset = 0;
  uint32_t record_len = 0;
  s = WriteRecord(seq, body, &offset, &record_len);
  if (!s.ok()) return s;

  Slot slot;
  slot.sequence_no = seq;
  slot.offset = offset;
  slot.record_len = record_len;
  slot.privacy_class = privacy;
  slot.memory_type = memory_type;
  slot.created_at_us = created_at;
  {
    std::unique_lock<std::shared_mutex> lock(index_mu_);
    slots_[id] = slot;
    frame_log_.emplace_back(seq, id);
    last_seq_ = seq;
    end_offset_ = offset + record_len;
  }

  out->id = id;
  out->payload.assign(payload.data(), payload.size());
  out->privacy_class = privacy;
  out->memory_type = memory_type;
  out->created_at_us = created_at;
  out->sequence_no = seq;
  return Status::OK();
}

Status RawStore::ReadFrame(const std::string& frame_id, const Slot& slot,
                           Frame* out) const {
  std::string record;
  Status s = PreadFull(fd_, slot.offset, slot.record_len, &record);
  if (!s.ok()) return s;
  if (record.size() != slot.record_len) {
    return Status::Corruption("truncated record at seq " +
                              std::to_string(slot.sequence_no));
  }

  RecordHeader h = ParseHeader(std::string_view(record).substr(0, kRecordHeaderBytes));
  std::string_view body = std::string_view(record).substr(kRecordHeaderBytes);
  if (h.magic != kRecordMagic || h.seq != slot.sequence_no ||
      h.body_len != body.size()) {
    return Status::Corruption("bad record header at seq " +
                              std::to_string(slot.sequence_no));
  }
  if (Checksum(h.seq, body) != h.checksum) {
    return Status::Corruption("checksum mismatch at seq " + std::to_string(h.seq));
  }
  if (body.size() < kBodyFixedBytes + kSealedHeaderBytes ||
      static_cast<uint8_t>(body[0]) != static_cast<uint8_t>(RecordKind::kFrame)) {
    return Status::Corruption("malformed frame record at seq " + std::to_string(h.seq));
  }

  size_t p = kBodyFixedBytes;
  FrameCipher::Sealed sealed;
  sealed.salt = std::string(body.substr(p, FrameCipher::kSaltBytes));
  p += FrameCipher::kSaltBytes;
  sealed.nonce = std::string(body.substr(p, FrameCipher::kNonceBytes));
  p += FrameCipher::kNonceBytes;
  sealed.tag = std::string(body.substr(p, FrameCipher::kTagBytes));
  p += FrameCipher::kTagBytes;
  uint32_t ct_len = 0;
  internal::DecodeU32LE(body.substr(p, 4), &ct_len);
  p += 4;
  if (body.size() - p != ct_len) {
    return Status::Corruption("ciphertext length mismatch at seq " +
                              std::to_string(h.seq));
  }
  sealed.ciphertext = std::string(body.substr(p));

  std::string plaintext;
  s = cipher_.Open(sealed, body.substr(0, kBodyFixedBytes), &plaintext);
  if (!s.ok()) {
    if (s.IsCorruption()) {
      return Status::Corruption(s.message() + " at seq " + std::to_string(h.seq));
    }
    return s;
  }
  if (internal::Sha256Hex(plaintext) != frame_id) {
    return Status::Corruption("content hash mismatch at seq " + std::to_string(h.seq));
  }

  out->id = frame_id;
  out->payload = std::move(plaintext);
  out->privacy_class = static_cast<PrivacyClass>(body[1]);
  out->memory_type = static_cast<MemoryType>(body[2]);
  internal::DecodeU64LE(body.substr(4, 8), &out->created_at_us);
  out->sequence_no = h.seq;
  return Status::OK();
}

Status RawStore::Get(const std::string& frame_id, Frame* out) const {
  Slot slot;
  {
    std::shared_lock<std::shared_mutex> lock(index_mu_);
    auto it = slots_.find(frame_id);
    if (it == slots_.end() || it->second.tombstoned) {
      return Status::NotFound("frame " + frame_id);
    }
    slot = it->second;
  }
  if (slot.corrupt) {
    return Status::Corruption("checksum mismatch at seq " +
                              std::to_string(slot.sequence_no));
  }

  Status s = ReadFrame(frame_id, slot, out);
  if (s.IsCorruption()) {
    ctx_.logger->warn("raw store {}: frame {} unreadable: {}", path_, frame_id,
                      s.ToString());
  }
  return s;
}

Status RawStore::Tombstone(const std::string& frame_id) {
  std::lock_guard<std::mutex> wlock(write_mu_);
  if (fd_ < 0) return Status::IOError("raw store is closed");

  Slot slot;
  {
    std::shared_lock<std::shared_mutex> lock(index_mu_);
    auto it = slots_.find(frame_id);
    if (it == slots_.end() || it->second.tombstoned) {
      return Status::NotFound("frame " + frame_id);
    }
    slot = it->second;
  }

  std::string raw_id;
  if (!internal::HexDecode(frame_id, &raw_id) ||
      raw_id.size() != internal::Sha256::kDigestBytes) {
    return Status::InvalidArgument("bad frame id " + frame_id);
  }

  std::string body = FixedFields(static_cast<uint8_t>(RecordKind::kTombstone),
                                 slot.privacy_class, slot.memory_type,
                                 ctx_.Now(), raw_id);
  const uint64_t seq = last_seq_ + 1;
  uint64_t offset = 0;
  uint32_t record_len = 0;
  Status s = WriteRecord(seq, body, &offset, &record_len);
  if (!s.ok()) return s;

  {
    std::unique_lock<std::shared_mutex> lock(index_mu_);
    slots_[frame_id].tombstoned = true;
    last_seq_ = seq;
    end_offset_ = offset + record_len;
  }
  ctx_.logger->debug("raw store {}: tombstoned {} at seq {}", path_, frame_id, seq);
  return Status::OK();
}

Status RawStore::NextFrame(uint64_t after, uint64_t bound, Frame* out,
                           uint64_t* skipped_corrupt) const {
  while (true) {
    uint64_t seq = 0;
    std::string id;
    Slot slot;
    {
      std::shared_lock<std::shared_mutex> lock(index_mu_);
      auto it = std::upper_bound(
          frame_log_.begin(), frame_log_.end(), after,
          [](uint64_t v, const std::pair<uint64_t, std::string>& e) {
            return v < e.first;
          });
      if (it == frame_log_.end() || it->first > bound) {
        return Status::NotFound();
      }
      seq = it->first;
      id = it->second;
      auto sit = slots_.find(id);
      if (sit != slots_.end()) slot = sit->second;
    }
    after = seq;

    // Superseded by a later record for the same id, or deleted.
    if (slot.sequence_no != seq || slot.tombstoned) continue;
    if (slot.corrupt) {
      ++*skipped_corrupt;
      continue;
    }

    Status s = ReadFrame(id, slot, out);
    if (s.ok()) return s;
    if (s.IsCorruption()) {
      ++*skipped_corrupt;
      ctx_.logger->warn("raw store {}: skipping frame {}: {}", path_, id, s.ToString());
      continue;
    }
    return s;
  }
}

std::unique_ptr<FrameIterator> RawStore::Iterate(uint64_t since) const {
  return std::unique_ptr<FrameIterator>(new FrameIterator(this, since, LastSequence()));
}

std::vector<FrameInfo> RawStore::ListLive() const {
  std::vector<FrameInfo> out;
  std::shared_lock<std::shared_mutex> lock(index_mu_);
  for (const auto& [seq, id] : frame_log_) {
    auto it = slots_.find(id);
    if (it == slots_.end()) continue;
    const Slot& slot = it->second;
    if (slot.sequence_no != seq || slot.tombstoned || slot.corrupt) continue;
    FrameInfo info;
    info.id = id;
    info.privacy_class = slot.privacy_class;
    info.memory_type = slot.memory_type;
    info.created_at_us = slot.created_at_us;
    info.sequence_no = seq;
    out.push_back(std::move(info));
  }
  return out;
}

RawStoreStats RawStore::Stats() const {
  RawStoreStats stats;
  std::shared_lock<std::shared_mutex> lock(index_mu_);
  for (const auto& [id, slot] : slots_) {
    if (slot.tombstoned) {
      ++stats.tombstoned_frames;
    } else if (!slot.corrupt) {
      ++stats.live_frames;
    }
  }
  stats.corrupt_records = corrupt_records_;
  stats.file_bytes = end_offset_;
  stats.last_sequence = last_seq_;
  return stats;
}

uint64_t RawStore::LastSequence() const {
  std::shared_lock<std::shared_mutex> lock(index_mu_);
  return last_seq_;
}

}  // namespace engram

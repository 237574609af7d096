#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace engram {

/**
 * Sensitivity class of a piece of content. Ordered from least to most
 * restrictive so that std::max picks the safer class.
 */
enum class PrivacyClass : uint8_t {
  kPublic = 0,
  kSensitive = 1,
  kPrivate = 2,
};

/** What kind of memory a frame holds; routes public content to a collection. */
enum class MemoryType : uint8_t {
  kConversation = 0,
  kTechnical = 1,
  kInsight = 2,
  kPattern = 3,
  kFact = 4,
};

std::string_view PrivacyClassName(PrivacyClass c);
bool ParsePrivacyClass(std::string_view s, PrivacyClass* out);

std::string_view MemoryTypeName(MemoryType t);
bool ParseMemoryType(std::string_view s, MemoryType* out);

/**
 * An immutable raw record owned by the RawStore.
 *
 * `payload` holds the decrypted bytes when returned from RawStore::Get or a
 * FrameIterator; on disk it only ever exists encrypted.
 */
struct Frame {
  std::string id;          // hex SHA-256 of the payload
  std::string payload;
  PrivacyClass privacy_class = PrivacyClass::kPublic;
  MemoryType memory_type = MemoryType::kConversation;
  uint64_t created_at_us = 0;
  uint64_t sequence_no = 0;
};

/** Scalar metadata value attached to a MemoryRecord. */
using MetadataValue = std::variant<bool, int64_t, double, std::string>;
using Metadata = std::map<std::string, MetadataValue>;

/**
 * A Semantic Index entry. `source_frame_id` is a lookup-only back-reference
 * into the RawStore; the index never owns raw content.
 */
struct MemoryRecord {
  std::string id;
  std::string collection;
  std::vector<float> embedding;  // filled by the index when empty
  std::string text;
  Metadata metadata;
  std::string source_frame_id;
  PrivacyClass privacy_class = PrivacyClass::kPublic;
  uint64_t created_at_us = 0;
};

/** A query hit from the Semantic Index. */
struct ScoredRecord {
  MemoryRecord record;
  float score = 0.0f;  // cosine similarity, higher is closer
};

/** A recall result: an index hit resolved against its backing frame. */
struct RecallHit {
  std::string record_id;
  std::string frame_id;
  std::string collection;
  std::string text;  // frame payload, unmodified
  Metadata metadata;
  PrivacyClass privacy_class = PrivacyClass::kPublic;
  MemoryType memory_type = MemoryType::kConversation;
  uint64_t created_at_us = 0;
  float score = 0.0f;
};

/**
 * Cooperative cancellation flag. The caller keeps ownership and may flip it
 * from any thread; long operations poll it between stages.
 */
class CancellationToken {
 public:
  void Cancel() { cancelled_.store(true, std::memory_order_release); }
  bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }
  void Reset() { cancelled_.store(false, std::memory_order_release); }

 private:
  std::atomic<bool> cancelled_{false};
};

// Derived record id for a frame. Indexing the same frame twice yields the
// same id, which makes re-indexing an overwrite instead of a duplicate.
std::string RecordIdForFrame(std::string_view frame_id);

}  // namespace engram

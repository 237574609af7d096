// Crash harness for raw store durability
// Tests that committed frames survive interrupted writes and damaged bytes

#include <gtest/gtest.h>

#include <engram/raw_store.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace {

using engram::Frame;
using engram::KeyMaterial;
using engram::MemoryType;
using engram::PrivacyClass;
using engram::RawStore;
using engram::Status;

class CrashTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() /
                ("engram_crash_test_" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(test_dir_);
    ASSERT_TRUE(KeyMaterial::LoadOrCreate((test_dir_ / "engram.key").string(), &key_).ok());
  }

  void TearDown() override {
    store_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  std::string LogPath() const { return (test_dir_ / "frames.log").string(); }

  Status OpenStore() {
    store_.reset();
    return RawStore::Open(LogPath(), key_, engram::Context{}, engram::RawStoreOptions{},
                          &store_);
  }

  // Appends `payload` and returns the file size once it is durable.
  uint64_t AppendAndMark(const std::string& payload, Frame* out = nullptr) {
    Frame f;
    Status s = store_->Append(payload, PrivacyClass::kPublic, MemoryType::kConversation, &f);
    EXPECT_TRUE(s.ok()) << s.ToString();
    if (out) *out = f;
    return store_->Stats().file_bytes;
  }

  void FlipByte(uint64_t offset) {
    std::fstream f(LogPath(), std::ios::in | std::ios::out | std::ios::binary);
    ASSERT_TRUE(f.is_open());
    f.seekg(static_cast<std::streamoff>(offset));
    char c = 0;
    f.read(&c, 1);
    c = static_cast<char>(c ^ 0x5a);
    f.seekp(static_cast<std::streamoff>(offset));
    f.write(&c, 1);
  }

  void TruncateTo(uint64_t size) {
    std::filesystem::resize_file(LogPath(), size);
  }

  // Invariants every reopened store must satisfy.
  struct InvariantResult {
    bool passed = true;
    std::vector<std::string> violations;

    void AddViolation(const std::string& msg) {
      passed = false;
      violations.push_back(msg);
    }
  };

  InvariantResult CheckInvariants() {
    InvariantResult result;

    // Invariant 1: every listed live frame decrypts to content matching its id
    auto live = store_->ListLive();
    for (const auto& info : live) {
      Frame f;
      Status s = store_->Get(info.id, &f);
      if (!s.ok()) {
        result.AddViolation("Get(" + info.id + ") failed: " + s.ToString());
      } else if (f.sequence_no != info.sequence_no) {
        result.AddViolation("sequence mismatch for " + info.id);
      }
    }

    // Invariant 2: iteration yields exactly the live frames, ascending
    size_t iterated = 0;
    uint64_t last = 0;
    auto it = store_->Iterate(0);
    for (; it->Valid(); it->Next()) {
      if (it->frame().sequence_no <= last) result.AddViolation("iteration out of order");
      last = it->frame().sequence_no;
      ++iterated;
    }
    if (!it->status().ok()) result.AddViolation("iteration failed: " + it->status().ToString());
    if (iterated + it->skipped_corrupt() < live.size()) {
      result.AddViolation("iteration missed live frames");
    }

    // Invariant 3: stats agree with the listing
    if (store_->Stats().live_frames != live.size()) {
      result.AddViolation("Stats.live_frames mismatch");
    }
    return result;
  }

  std::filesystem::path test_dir_;
  KeyMaterial key_;
  std::unique_ptr<RawStore> store_;
};

// =============================================================================
// Interrupted Write Tests
// =============================================================================

TEST_F(CrashTest, UncleanClosePreservesCommittedFrames) {
  ASSERT_TRUE(OpenStore().ok());
  std::vector<Frame> frames(50);
  for (int i = 0; i < 50; ++i) AppendAndMark("frame " + std::to_string(i), &frames[i]);

  // Simulate crash: drop the handle without Close()
  store_.reset();

  ASSERT_TRUE(OpenStore().ok());
  auto invariants = CheckInvariants();
  EXPECT_TRUE(invariants.passed) << "Violations: "
      << (invariants.violations.empty() ? "none" : invariants.violations[0]);
  EXPECT_EQ(store_->Stats().live_frames, 50u);
  for (const auto& f : frames) {
    Frame got;
    ASSERT_TRUE(store_->Get(f.id, &got).ok());
    EXPECT_EQ(got.payload, f.payload);
  }
}

TEST_F(CrashTest, TruncatedTailRecordIsDiscarded) {
  ASSERT_TRUE(OpenStore().ok());
  Frame a;
  Frame b;
  Frame c;
  AppendAndMark("first", &a);
  const uint64_t after_b = AppendAndMark("second", &b);
  const uint64_t after_c = AppendAndMark("third", &c);
  store_.reset();

  // The third append was cut off partway through its body.
  TruncateTo(after_c - 5);

  ASSERT_TRUE(OpenStore().ok());
  Frame got;
  EXPECT_TRUE(store_->Get(a.id, &got).ok());
  EXPECT_TRUE(store_->Get(b.id, &got).ok());
  EXPECT_TRUE(store_->Get(c.id, &got).IsNotFound());

  auto stats = store_->Stats();
  EXPECT_EQ(stats.live_frames, 2u);
  EXPECT_EQ(stats.corrupt_records, 0u);
  EXPECT_EQ(stats.file_bytes, after_b);
  EXPECT_EQ(std::filesystem::file_size(LogPath()), after_b);

  // The log is writable again and the lost frame can be re-appended.
  Frame again;
  AppendAndMark("third", &again);
  EXPECT_EQ(again.sequence_no, 3u);
  EXPECT_TRUE(CheckInvariants().passed);
}

TEST_F(CrashTest, TruncatedRecordHeaderIsDiscarded) {
  ASSERT_TRUE(OpenStore().ok());
  const uint64_t after_a = AppendAndMark("first");
  AppendAndMark("second");
  store_.reset();

  TruncateTo(after_a + 10);

  ASSERT_TRUE(OpenStore().ok());
  EXPECT_EQ(store_->Stats().live_frames, 1u);
  EXPECT_EQ(store_->Stats().file_bytes, after_a);
}

TEST_F(CrashTest, InterruptedFileHeaderIsReinitialized) {
  {
    std::ofstream out(LogPath(), std::ios::binary);
    out << "ENGR";
  }
  ASSERT_TRUE(OpenStore().ok());
  EXPECT_EQ(store_->Stats().live_frames, 0u);
  AppendAndMark("fresh start");
  ASSERT_TRUE(OpenStore().ok());
  EXPECT_EQ(store_->Stats().live_frames, 1u);
}

// =============================================================================
// Damaged Byte Tests
// =============================================================================

TEST_F(CrashTest, FlippedPayloadByteIsCorruptionNotSilentData) {
  ASSERT_TRUE(OpenStore().ok());
  Frame a;
  Frame b;
  Frame c;
  AppendAndMark("alpha", &a);
  const uint64_t after_b = AppendAndMark("bravo", &b);
  AppendAndMark("charlie", &c);
  store_.reset();

  // Last ciphertext byte of the second record.
  FlipByte(after_b - 1);

  ASSERT_TRUE(OpenStore().ok());
  Frame got;
  EXPECT_TRUE(store_->Get(b.id, &got).IsCorruption());
  ASSERT_TRUE(store_->Get(a.id, &got).ok());
  EXPECT_EQ(got.payload, "alpha");
  ASSERT_TRUE(store_->Get(c.id, &got).ok());
  EXPECT_EQ(got.payload, "charlie");

  std::vector<std::string> payloads;
  auto it = store_->Iterate(0);
  for (; it->Valid(); it->Next()) payloads.push_back(it->frame().payload);
  EXPECT_TRUE(it->status().ok());
  EXPECT_EQ(payloads, (std::vector<std::string>{"alpha", "charlie"}));
  EXPECT_EQ(it->skipped_corrupt(), 1u);

  auto stats = store_->Stats();
  EXPECT_EQ(stats.corrupt_records, 1u);
  EXPECT_EQ(stats.live_frames, 2u);
  EXPECT_TRUE(CheckInvariants().passed);
}

TEST_F(CrashTest, ReappendOverDamagedFrameIsIntegrityError) {
  ASSERT_TRUE(OpenStore().ok());
  const uint64_t after_a = AppendAndMark("alpha");
  store_.reset();
  FlipByte(after_a - 1);

  ASSERT_TRUE(OpenStore().ok());
  const uint64_t bytes = store_->Stats().file_bytes;
  Frame f;
  Status s = store_->Append("alpha", PrivacyClass::kPublic, MemoryType::kConversation, &f);
  EXPECT_TRUE(s.IsIntegrityError()) << s.ToString();
  // Nothing was written.
  EXPECT_EQ(store_->Stats().file_bytes, bytes);
}

TEST_F(CrashTest, DamagedRecordMagicSkipsToNextRecord) {
  ASSERT_TRUE(OpenStore().ok());
  Frame a;
  Frame b;
  Frame c;
  const uint64_t after_a = AppendAndMark("alpha", &a);
  AppendAndMark("bravo", &b);
  AppendAndMark("charlie", &c);
  store_.reset();

  // First byte of the second record's magic.
  FlipByte(after_a);

  ASSERT_TRUE(OpenStore().ok());
  Frame got;
  EXPECT_TRUE(store_->Get(a.id, &got).ok());
  EXPECT_FALSE(store_->Get(b.id, &got).ok());
  ASSERT_TRUE(store_->Get(c.id, &got).ok());
  EXPECT_EQ(got.payload, "charlie");
  EXPECT_EQ(store_->Stats().corrupt_records, 1u);
  EXPECT_TRUE(CheckInvariants().passed);
}

TEST_F(CrashTest, DamagedTombstoneStillHidesFrame) {
  ASSERT_TRUE(OpenStore().ok());
  Frame a;
  const uint64_t after_a = AppendAndMark("forget me", &a);
  ASSERT_TRUE(store_->Tombstone(a.id).ok());
  store_.reset();

  // created_at field of the tombstone body: header (24) + kind/class/type/pad (4)
  FlipByte(after_a + 24 + 4);

  ASSERT_TRUE(OpenStore().ok());
  Frame got;
  EXPECT_TRUE(store_->Get(a.id, &got).IsNotFound());
  EXPECT_EQ(store_->Stats().live_frames, 0u);
}

// =============================================================================
// Repeated Crash Tests
// =============================================================================

TEST_F(CrashTest, MultipleCrashCycles) {
  std::vector<Frame> all;
  for (int cycle = 0; cycle < 5; ++cycle) {
    ASSERT_TRUE(OpenStore().ok());
    for (int i = 0; i < 10; ++i) {
      Frame f;
      AppendAndMark("cycle " + std::to_string(cycle) + " frame " + std::to_string(i), &f);
      all.push_back(f);
    }
    const uint64_t committed = store_->Stats().file_bytes;
    store_.reset();
    // Every cycle ends with a torn append of a few garbage bytes.
    {
      std::ofstream out(LogPath(), std::ios::binary | std::ios::app);
      out << std::string("EGRF\x01\x02", 6);
    }
    EXPECT_GT(std::filesystem::file_size(LogPath()), committed);
  }

  ASSERT_TRUE(OpenStore().ok());
  EXPECT_EQ(store_->Stats().live_frames, all.size());
  auto invariants = CheckInvariants();
  EXPECT_TRUE(invariants.passed) << "Violations: "
      << (invariants.violations.empty() ? "none" : invariants.violations[0]);
  for (const auto& f : all) {
    Frame got;
    ASSERT_TRUE(store_->Get(f.id, &got).ok()) << f.payload;
    EXPECT_EQ(got.sequence_no, f.sequence_no);
  }
}

}  // namespace

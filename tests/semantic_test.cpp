// Unit tests for the semantic layer
// Tests: Hashing embedder, flat vector search, SemanticIndex privacy rules,
//        scoping, ordering, truncation, persistence, collaborator failures

#include <gtest/gtest.h>

#include <engram/cache.hpp>
#include <engram/embedder.hpp>
#include <engram/internal.hpp>
#include <engram/semantic_index.hpp>
#include <engram/test_utils.hpp>
#include <engram/vector_search.hpp>

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace engram {
namespace {

using testing::CountingEmbedder;
using testing::DeterministicEmbedder;
using testing::FailingEmbedder;
using testing::FakeClock;
using testing::FlakyVectorSearch;
using testing::RecordingMetricsSink;

// =============================================================================
// Hashing Embedder Tests
// =============================================================================

class HashingEmbedderTest : public ::testing::Test {
 protected:
  float Similarity(const std::string& a, const std::string& b) {
    auto ea = embedder_->Embed(a);
    auto eb = embedder_->Embed(b);
    EXPECT_TRUE(ea.success) << a;
    EXPECT_TRUE(eb.success) << b;
    return internal::CosineSimilarity(ea.embedding, eb.embedding);
  }

  std::unique_ptr<Embedder> embedder_ = NewHashingEmbedder(384);
};

TEST_F(HashingEmbedderTest, ProducesUnitVectorOfConfiguredDimension) {
  auto r = embedder_->Embed("Chose Redis for session storage");
  ASSERT_TRUE(r.success) << r.error_message;
  ASSERT_EQ(r.embedding.size(), 384u);
  float norm = 0.0f;
  for (float v : r.embedding) norm += v * v;
  EXPECT_NEAR(norm, 1.0f, 1e-5f);
  EXPECT_EQ(embedder_->Name(), "hashing-384");
}

TEST_F(HashingEmbedderTest, Deterministic) {
  auto a = embedder_->Embed("same words every time");
  auto b = NewHashingEmbedder(384)->Embed("same words every time");
  EXPECT_EQ(a.embedding, b.embedding);
}

TEST_F(HashingEmbedderTest, SharedWordsScoreHigher) {
  const std::string stored = "Chose Redis for session storage";
  EXPECT_GT(Similarity(stored, "session storage decision"),
            Similarity(stored, "quarterly marketing budget review"));
  EXPECT_NEAR(Similarity(stored, "chose redis, for SESSION storage!"), 1.0f, 1e-5f);
}

TEST_F(HashingEmbedderTest, StopwordOnlyTextFails) {
  auto r = embedder_->Embed("the and of with");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.embedding.empty());
  EXPECT_EQ(r.error_message, "no embeddable tokens");

  EXPECT_FALSE(embedder_->Embed("").success);
  EXPECT_FALSE(embedder_->Embed("?!...").success);
}

// =============================================================================
// Flat Vector Search Tests
// =============================================================================

class FlatVectorSearchTest : public ::testing::Test {
 protected:
  std::unique_ptr<VectorSearch> search_ = NewFlatVectorSearch(3);
};

TEST_F(FlatVectorSearchTest, QueryReturnsBestFirstAndHonorsTopK) {
  ASSERT_TRUE(search_->Upsert("facts", "x", {1, 0, 0}, {}).ok());
  ASSERT_TRUE(search_->Upsert("facts", "y", {0.6f, 0.8f, 0}, {}).ok());
  ASSERT_TRUE(search_->Upsert("facts", "z", {0, 0, 1}, {}).ok());

  std::vector<VectorHit> hits;
  ASSERT_TRUE(search_->Query("facts", {1, 0, 0}, 2, &hits).ok());
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].id, "x");
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-6f);
  EXPECT_EQ(hits[1].id, "y");
  EXPECT_NEAR(hits[1].score, 0.6f, 1e-6f);
}

TEST_F(FlatVectorSearchTest, CollectionsAreIsolated) {
  ASSERT_TRUE(search_->Upsert("facts", "x", {1, 0, 0}, {}).ok());
  ASSERT_TRUE(search_->Upsert("private", "p", {1, 0, 0}, {}).ok());

  std::vector<VectorHit> hits;
  ASSERT_TRUE(search_->Query("facts", {1, 0, 0}, 10, &hits).ok());
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, "x");

  ASSERT_TRUE(search_->Query("nowhere", {1, 0, 0}, 10, &hits).ok());
  EXPECT_TRUE(hits.empty());
  EXPECT_EQ(search_->Size("facts"), 1u);
  EXPECT_EQ(search_->Size("nowhere"), 0u);
}

TEST_F(FlatVectorSearchTest, UpsertReplacesAndDeleteRemoves) {
  ASSERT_TRUE(search_->Upsert("facts", "x", {1, 0, 0}, {}).ok());
  ASSERT_TRUE(search_->Upsert("facts", "x", {0, 1, 0}, {}).ok());
  EXPECT_EQ(search_->Size("facts"), 1u);

  std::vector<VectorHit> hits;
  ASSERT_TRUE(search_->Query("facts", {0, 1, 0}, 1, &hits).ok());
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-6f);

  EXPECT_TRUE(search_->Delete("facts", "x").ok());
  EXPECT_TRUE(search_->Delete("facts", "x").IsNotFound());
  EXPECT_EQ(search_->Size("facts"), 0u);
}

TEST_F(FlatVectorSearchTest, RejectsWrongDimension) {
  EXPECT_TRUE(search_->Upsert("facts", "x", {1, 0}, {}).IsInvalidArgument());
  std::vector<VectorHit> hits;
  EXPECT_TRUE(search_->Query("facts", {1, 0, 0, 0}, 1, &hits).IsInvalidArgument());
}

// =============================================================================
// SemanticIndex Fixture
// =============================================================================

class SemanticIndexTest : public ::testing::Test {
 protected:
  static constexpr size_t kDims = 4;

  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() / ("engram_semantic_test_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_);

    clock_ = std::make_shared<FakeClock>();
    metrics_ = std::make_shared<RecordingMetricsSink>();
    ctx_.clock = clock_;
    ctx_.metrics = metrics_;

    config_.embedding_dimensions = kDims;
    embedder_ = std::make_shared<DeterministicEmbedder>(kDims);
    embedder_->RegisterEmbedding("alpha", {1, 0, 0, 0});
    embedder_->RegisterEmbedding("beta", {0, 1, 0, 0});
    embedder_->RegisterEmbedding("gamma", {0, 0, 1, 0});
    embedder_->RegisterEmbedding("q-alpha", {1, 0, 0, 0});
    embedder_->RegisterEmbedding("q-mostly-alpha", {0.9f, 0.1f, 0, 0});
    embedder_->RegisterEmbedding("q-beta", {0, 1, 0, 0});
  }

  void TearDown() override {
    index_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  Status OpenIndex(std::shared_ptr<Embedder> embedder = nullptr, CacheLayer* cache = nullptr) {
    index_.reset();
    vectors_ = std::make_shared<FlakyVectorSearch>(kDims);
    return SemanticIndex::Open((test_dir_ / "index").string(), config_, ctx_,
                               embedder ? embedder : embedder_, vectors_, cache,
                               SemanticIndexOptions{}, &index_);
  }

  static MemoryRecord Rec(const std::string& id, const std::string& collection,
                          const std::string& text,
                          PrivacyClass privacy = PrivacyClass::kPublic,
                          uint64_t created_at_us = 0) {
    MemoryRecord r;
    r.id = id;
    r.collection = collection;
    r.text = text;
    r.privacy_class = privacy;
    r.created_at_us = created_at_us;
    return r;
  }

  std::vector<std::string> QueryIds(const std::string& text,
                                    std::optional<std::string> collection = std::nullopt,
                                    size_t top_k = 10, bool allow_restricted = false) {
    std::vector<ScoredRecord> out;
    Status s = index_->Query(text, collection, top_k, allow_restricted, &out);
    EXPECT_TRUE(s.ok()) << s.ToString();
    std::vector<std::string> ids;
    for (const auto& sr : out) ids.push_back(sr.record.id);
    return ids;
  }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  std::filesystem::path test_dir_;
  std::shared_ptr<FakeClock> clock_;
  std::shared_ptr<RecordingMetricsSink> metrics_;
  Context ctx_;
  IndexConfig config_;
  std::shared_ptr<DeterministicEmbedder> embedder_;
  std::shared_ptr<FlakyVectorSearch> vectors_;
  std::unique_ptr<SemanticIndex> index_;
};

// =============================================================================
// Privacy Rules
// =============================================================================

TEST_F(SemanticIndexTest, PrivateRecordsAreNeverIndexed) {
  ASSERT_TRUE(OpenIndex().ok());
  Status s = index_->Index(Rec("m-1", "facts", "alpha", PrivacyClass::kPrivate));
  EXPECT_TRUE(s.IsRejected()) << s.ToString();
  s = index_->Index(Rec("m-2", "private", "alpha", PrivacyClass::kPrivate));
  EXPECT_TRUE(s.IsRejected()) << s.ToString();

  MemoryRecord got;
  EXPECT_TRUE(index_->Get("m-1", &got).IsNotFound());
  EXPECT_EQ(index_->Count("facts"), 0u);
  EXPECT_EQ(index_->Count("private"), 0u);
  EXPECT_EQ(metrics_->CounterValue("engram.index.rejected"), 2u);
}

TEST_F(SemanticIndexTest, SensitiveRecordsOnlyInRestrictedCollection) {
  ASSERT_TRUE(OpenIndex().ok());
  EXPECT_TRUE(index_->Index(Rec("m-1", "facts", "alpha", PrivacyClass::kSensitive)).IsRejected());
  EXPECT_TRUE(index_->Index(Rec("m-1", "private", "alpha", PrivacyClass::kSensitive)).ok());
  EXPECT_EQ(index_->Count("private"), 1u);
}

TEST_F(SemanticIndexTest, UnknownCollectionIsRejected) {
  ASSERT_TRUE(OpenIndex().ok());
  EXPECT_TRUE(index_->Index(Rec("m-1", "misc", "alpha")).IsRejected());
}

// =============================================================================
// Index / Get / Delete
// =============================================================================

TEST_F(SemanticIndexTest, IndexThenGetRoundTripsFields) {
  ASSERT_TRUE(OpenIndex().ok());
  MemoryRecord r = Rec("", "technical", "alpha");
  r.source_frame_id = internal::Sha256Hex("alpha");
  r.metadata["memory_type"] = std::string("technical");
  r.metadata["sequence_no"] = int64_t{7};
  r.metadata["pinned"] = true;
  r.metadata["weight"] = 0.25;
  ASSERT_TRUE(index_->Index(r).ok());

  const std::string id = RecordIdForFrame(r.source_frame_id);
  MemoryRecord got;
  ASSERT_TRUE(index_->Get(id, &got).ok());
  EXPECT_EQ(got.id, id);
  EXPECT_EQ(got.collection, "technical");
  EXPECT_EQ(got.text, "alpha");
  EXPECT_EQ(got.source_frame_id, r.source_frame_id);
  EXPECT_EQ(got.privacy_class, PrivacyClass::kPublic);
  EXPECT_EQ(got.created_at_us, clock_->WallClockMicros());
  EXPECT_EQ(got.embedding, (std::vector<float>{1, 0, 0, 0}));
  EXPECT_EQ(std::get<std::string>(got.metadata.at("memory_type")), "technical");
  EXPECT_EQ(std::get<int64_t>(got.metadata.at("sequence_no")), 7);
  EXPECT_TRUE(std::get<bool>(got.metadata.at("pinned")));
  EXPECT_DOUBLE_EQ(std::get<double>(got.metadata.at("weight")), 0.25);

  std::string found;
  ASSERT_TRUE(index_->FindByFrame(r.source_frame_id, &found).ok());
  EXPECT_EQ(found, id);
}

TEST_F(SemanticIndexTest, RecordWithoutIdOrFrameIsInvalid) {
  ASSERT_TRUE(OpenIndex().ok());
  EXPECT_TRUE(index_->Index(Rec("", "facts", "alpha")).IsInvalidArgument());
}

TEST_F(SemanticIndexTest, OverwriteInSameCollectionReplaces) {
  ASSERT_TRUE(OpenIndex().ok());
  ASSERT_TRUE(index_->Index(Rec("m-1", "facts", "alpha")).ok());
  ASSERT_TRUE(index_->Index(Rec("m-1", "facts", "beta")).ok());
  EXPECT_EQ(index_->Count("facts"), 1u);

  MemoryRecord got;
  ASSERT_TRUE(index_->Get("m-1", &got).ok());
  EXPECT_EQ(got.text, "beta");
  EXPECT_EQ(QueryIds("q-beta", std::string("facts"), 1),
            (std::vector<std::string>{"m-1"}));
}

TEST_F(SemanticIndexTest, CollectionMembershipIsImmutable) {
  ASSERT_TRUE(OpenIndex().ok());
  ASSERT_TRUE(index_->Index(Rec("m-1", "facts", "alpha")).ok());
  EXPECT_TRUE(index_->Index(Rec("m-1", "technical", "alpha")).IsRejected());

  MemoryRecord got;
  ASSERT_TRUE(index_->Get("m-1", &got).ok());
  EXPECT_EQ(got.collection, "facts");
  EXPECT_EQ(index_->Count("technical"), 0u);

  // Delete then re-add is the way to move a record.
  ASSERT_TRUE(index_->Delete("m-1").ok());
  EXPECT_TRUE(index_->Index(Rec("m-1", "technical", "alpha")).ok());
}

TEST_F(SemanticIndexTest, DeleteRemovesEverything) {
  ASSERT_TRUE(OpenIndex().ok());
  MemoryRecord r = Rec("m-1", "facts", "alpha");
  r.source_frame_id = internal::Sha256Hex("alpha");
  ASSERT_TRUE(index_->Index(r).ok());

  ASSERT_TRUE(index_->Delete("m-1").ok());
  MemoryRecord got;
  EXPECT_TRUE(index_->Get("m-1", &got).IsNotFound());
  std::string found;
  EXPECT_TRUE(index_->FindByFrame(r.source_frame_id, &found).IsNotFound());
  EXPECT_EQ(index_->Count("facts"), 0u);
  EXPECT_TRUE(QueryIds("q-alpha").empty());
  EXPECT_TRUE(index_->Delete("m-1").IsNotFound());
}

TEST_F(SemanticIndexTest, LongTextIsTruncatedOnCharacterBoundary) {
  config_.max_index_text_bytes = 8;
  ASSERT_TRUE(OpenIndex().ok());
  // 7 ASCII bytes then a two-byte character straddling the limit
  ASSERT_TRUE(index_->Index(Rec("m-1", "facts", "abcdefg\xC3\xA9xyz")).ok());

  MemoryRecord got;
  ASSERT_TRUE(index_->Get("m-1", &got).ok());
  EXPECT_EQ(got.text, "abcdefg");
  EXPECT_EQ(metrics_->CounterValue("engram.index.truncated"), 1u);
}

TEST(TruncateUtf8Test, KeepsWholeSequences) {
  EXPECT_EQ(TruncateUtf8("short", 10), "short");
  EXPECT_EQ(TruncateUtf8("abcdef", 3), "abc");
  EXPECT_EQ(TruncateUtf8("ab\xC3\xA9", 3), "ab");
  EXPECT_EQ(TruncateUtf8("ab\xC3\xA9", 4), "ab\xC3\xA9");
  EXPECT_EQ(TruncateUtf8("\xE2\x82\xAC\xE2\x82\xAC", 5), "\xE2\x82\xAC");
}

// =============================================================================
// Query Scoping and Ordering
// =============================================================================

TEST_F(SemanticIndexTest, UnscopedQueryExcludesRestrictedCollection) {
  ASSERT_TRUE(OpenIndex().ok());
  ASSERT_TRUE(index_->Index(Rec("m-pub", "facts", "alpha")).ok());
  ASSERT_TRUE(index_->Index(Rec("m-sens", "private", "alpha", PrivacyClass::kSensitive)).ok());

  EXPECT_EQ(QueryIds("q-alpha"), (std::vector<std::string>{"m-pub"}));

  auto with_restricted = QueryIds("q-alpha", std::nullopt, 10, /*allow_restricted=*/true);
  EXPECT_EQ(with_restricted.size(), 2u);

  std::vector<ScoredRecord> out;
  EXPECT_TRUE(index_->Query("q-alpha", std::string("private"), 10, false, &out).IsRejected());
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(QueryIds("q-alpha", std::string("private"), 10, true),
            (std::vector<std::string>{"m-sens"}));
}

TEST_F(SemanticIndexTest, ScopedQueryStaysInCollection) {
  ASSERT_TRUE(OpenIndex().ok());
  ASSERT_TRUE(index_->Index(Rec("m-fact", "facts", "alpha")).ok());
  ASSERT_TRUE(index_->Index(Rec("m-tech", "technical", "alpha")).ok());

  EXPECT_EQ(QueryIds("q-alpha", std::string("technical")),
            (std::vector<std::string>{"m-tech"}));

  std::vector<ScoredRecord> out;
  EXPECT_TRUE(index_->Query("q-alpha", std::string("nope"), 10, false, &out).IsInvalidArgument());
}

TEST_F(SemanticIndexTest, ResultsAreBestFirstAndCappedAtTopK) {
  ASSERT_TRUE(OpenIndex().ok());
  ASSERT_TRUE(index_->Index(Rec("m-a", "facts", "alpha")).ok());
  ASSERT_TRUE(index_->Index(Rec("m-b", "conversations", "beta")).ok());
  ASSERT_TRUE(index_->Index(Rec("m-g", "insights", "gamma")).ok());

  std::vector<ScoredRecord> out;
  ASSERT_TRUE(index_->Query("q-mostly-alpha", std::nullopt, 2, false, &out).ok());
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].record.id, "m-a");
  EXPECT_EQ(out[1].record.id, "m-b");
  EXPECT_GT(out[0].score, out[1].score);

  ASSERT_TRUE(index_->Query("q-alpha", std::nullopt, 0, false, &out).ok());
  EXPECT_TRUE(out.empty());
}

TEST_F(SemanticIndexTest, EqualScoresBreakTiesByAgeThenId) {
  ASSERT_TRUE(OpenIndex().ok());
  ASSERT_TRUE(index_->Index(Rec("m-b", "facts", "alpha", PrivacyClass::kPublic, 200)).ok());
  ASSERT_TRUE(index_->Index(Rec("m-c", "technical", "alpha", PrivacyClass::kPublic, 100)).ok());
  ASSERT_TRUE(index_->Index(Rec("m-a", "patterns", "alpha", PrivacyClass::kPublic, 200)).ok());

  EXPECT_EQ(QueryIds("q-alpha"), (std::vector<std::string>{"m-c", "m-a", "m-b"}));
}

TEST_F(SemanticIndexTest, TieAtTopKCutoffKeepsOlderRecord) {
  ASSERT_TRUE(OpenIndex().ok());
  // Same vector, so the vector search alone would keep "m-a" by id.
  ASSERT_TRUE(index_->Index(Rec("m-a", "facts", "alpha", PrivacyClass::kPublic, 200)).ok());
  ASSERT_TRUE(index_->Index(Rec("m-b", "facts", "alpha", PrivacyClass::kPublic, 100)).ok());
  ASSERT_TRUE(index_->Index(Rec("m-c", "facts", "beta", PrivacyClass::kPublic, 50)).ok());

  EXPECT_EQ(QueryIds("q-alpha", std::string("facts"), 1), (std::vector<std::string>{"m-b"}));
  EXPECT_EQ(QueryIds("q-alpha", std::nullopt, 1), (std::vector<std::string>{"m-b"}));
  EXPECT_EQ(QueryIds("q-alpha", std::nullopt, 2), (std::vector<std::string>{"m-b", "m-a"}));
}

TEST_F(SemanticIndexTest, ResolveScopeListsSearchedCollections) {
  ASSERT_TRUE(OpenIndex().ok());
  std::vector<std::string> scope;
  ASSERT_TRUE(index_->ResolveScope(std::nullopt, false, &scope).ok());
  EXPECT_EQ(scope, config_.UnrestrictedCollections());
  ASSERT_TRUE(index_->ResolveScope(std::nullopt, true, &scope).ok());
  EXPECT_EQ(scope, config_.AllCollections());
  ASSERT_TRUE(index_->ResolveScope(std::string("facts"), false, &scope).ok());
  EXPECT_EQ(scope, (std::vector<std::string>{"facts"}));
}

// =============================================================================
// Persistence
// =============================================================================

TEST_F(SemanticIndexTest, ReopenRebuildsVectorSearchAndCheckpoint) {
  ASSERT_TRUE(OpenIndex().ok());
  ASSERT_TRUE(index_->Index(Rec("m-a", "facts", "alpha")).ok());
  ASSERT_TRUE(index_->Index(Rec("m-b", "technical", "beta")).ok());
  ASSERT_TRUE(index_->Index(Rec("m-s", "private", "gamma", PrivacyClass::kSensitive)).ok());
  uint64_t checkpoint = 99;
  ASSERT_TRUE(index_->LoadCheckpoint(&checkpoint).ok());
  EXPECT_EQ(checkpoint, 0u);
  ASSERT_TRUE(index_->SaveCheckpoint(42).ok());

  // Fresh vector search, same RocksDB directory
  ASSERT_TRUE(OpenIndex().ok());
  EXPECT_EQ(index_->Count("facts"), 1u);
  EXPECT_EQ(index_->Count("technical"), 1u);
  EXPECT_EQ(index_->Count("private"), 1u);
  ASSERT_TRUE(index_->LoadCheckpoint(&checkpoint).ok());
  EXPECT_EQ(checkpoint, 42u);

  EXPECT_EQ(QueryIds("q-beta", std::nullopt, 1), (std::vector<std::string>{"m-b"}));

  std::vector<std::string> ids;
  ASSERT_TRUE(index_->ListRecordIds(&ids).ok());
  EXPECT_EQ(ids, (std::vector<std::string>{"m-a", "m-b", "m-s"}));
}

TEST_F(SemanticIndexTest, DimensionMismatchAtOpenIsConfigError) {
  config_.embedding_dimensions = 8;
  Status s = OpenIndex();
  EXPECT_TRUE(s.IsConfigError()) << s.ToString();
  EXPECT_EQ(index_, nullptr);
}

// =============================================================================
// Collaborator Failures
// =============================================================================

TEST_F(SemanticIndexTest, EmbedderFailureIsCollaboratorUnavailable) {
  auto failing = std::make_shared<FailingEmbedder>(kDims);
  ASSERT_TRUE(OpenIndex(failing).ok());

  for (auto mode : {FailingEmbedder::Mode::kError, FailingEmbedder::Mode::kZeroVector,
                    FailingEmbedder::Mode::kWrongDimension}) {
    failing->SetMode(mode);
    Status s = index_->Index(Rec("m-1", "facts", "session storage"));
    EXPECT_TRUE(s.IsCollaboratorUnavailable()) << s.ToString();
  }
  MemoryRecord got;
  EXPECT_TRUE(index_->Get("m-1", &got).IsNotFound());
  EXPECT_EQ(metrics_->CounterValue("engram.embed.failure"), 3u);

  std::vector<ScoredRecord> out;
  EXPECT_TRUE(index_->Query("session", std::nullopt, 5, false, &out).IsCollaboratorUnavailable());

  failing->SetMode(FailingEmbedder::Mode::kHealthy);
  EXPECT_TRUE(index_->Index(Rec("m-1", "facts", "session storage")).ok());
}

TEST_F(SemanticIndexTest, UnembeddableTextIsRejectedNotUnavailable) {
  ASSERT_TRUE(OpenIndex(std::shared_ptr<Embedder>(NewHashingEmbedder(kDims))).ok());

  for (const char* text : {"it is what it is", "", "!!!"}) {
    Status s = index_->Index(Rec("m-1", "facts", text));
    EXPECT_TRUE(s.IsRejected()) << text << ": " << s.ToString();
  }
  EXPECT_EQ(metrics_->CounterValue("engram.embed.unembeddable"), 3u);
  EXPECT_EQ(metrics_->CounterValue("engram.embed.failure"), 0u);

  ASSERT_TRUE(index_->Index(Rec("m-2", "facts", "session storage")).ok());
  std::vector<ScoredRecord> out;
  ASSERT_TRUE(index_->Query("the of and", std::nullopt, 5, false, &out).ok());
  EXPECT_TRUE(out.empty());
}

TEST_F(SemanticIndexTest, VectorWriteFailureLeavesNoRecord) {
  ASSERT_TRUE(OpenIndex().ok());
  vectors_->SetFailWrites(true);
  Status s = index_->Index(Rec("m-1", "facts", "alpha"));
  EXPECT_TRUE(s.IsCollaboratorUnavailable()) << s.ToString();

  MemoryRecord got;
  EXPECT_TRUE(index_->Get("m-1", &got).IsNotFound());

  vectors_->SetFailWrites(false);
  ASSERT_TRUE(index_->Index(Rec("m-1", "facts", "alpha")).ok());
  vectors_->SetFailWrites(true);
  EXPECT_TRUE(index_->Delete("m-1").IsCollaboratorUnavailable());
  EXPECT_TRUE(index_->Get("m-1", &got).ok());
}

TEST_F(SemanticIndexTest, VectorQueryFailureIsCollaboratorUnavailable) {
  ASSERT_TRUE(OpenIndex().ok());
  ASSERT_TRUE(index_->Index(Rec("m-1", "facts", "alpha")).ok());
  vectors_->SetFailQueries(true);

  std::vector<ScoredRecord> out;
  EXPECT_TRUE(index_->Query("q-alpha", std::nullopt, 5, false, &out).IsCollaboratorUnavailable());
  EXPECT_TRUE(out.empty());
}

TEST_F(SemanticIndexTest, IdenticalTextIsEmbeddedOnceWithCache) {
  auto counting = std::make_shared<CountingEmbedder>(std::make_unique<DeterministicEmbedder>(kDims));
  CacheLayer cache(CacheConfig{}, ctx_);
  ASSERT_TRUE(OpenIndex(counting, &cache).ok());

  ASSERT_TRUE(index_->Index(Rec("m-1", "facts", "session storage")).ok());
  ASSERT_TRUE(index_->Index(Rec("m-2", "technical", "session storage")).ok());
  EXPECT_EQ(counting->calls(), 1u);

  std::vector<ScoredRecord> out;
  ASSERT_TRUE(index_->Query("session storage", std::nullopt, 5, false, &out).ok());
  EXPECT_EQ(counting->calls(), 1u);
  EXPECT_EQ(out.size(), 2u);
}

}  // namespace
}  // namespace engram

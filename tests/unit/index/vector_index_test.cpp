#include <gtest/gtest.h>

#include <memory>
#include <thread>

#include "docchat_core/index/faiss_vector_index.hpp"
#include "docchat_core/index/flat_vector_index.hpp"
#include "docchat_core/index/vector_index_factory.hpp"
#include "utilities_test.hpp"

namespace docchat_tests {

using namespace docchat_core;

TEST(RankHitsTest, OrdersByScoreThenChunkId) {
  std::vector<SearchHit> hits = {
      {"1:000002", 1, 0.5f}, {"1:000001", 1, 0.9f}, {"2:000000", 2, 0.5f}, {"1:000000", 1, 0.5f}};
  auto ranked = rank_hits(hits, 10, 0.0f);
  ASSERT_EQ(ranked.size(), 4u);
  EXPECT_EQ(ranked[0].chunk_id, "1:000001");
  EXPECT_EQ(ranked[1].chunk_id, "1:000000");
  EXPECT_EQ(ranked[2].chunk_id, "1:000002");
  EXPECT_EQ(ranked[3].chunk_id, "2:000000");
}

TEST(RankHitsTest, AppliesThresholdAndLimit) {
  std::vector<SearchHit> hits = {{"a", 1, 0.1f}, {"b", 1, 0.3f}, {"c", 1, 0.7f}, {"d", 1, 0.6f}};
  auto ranked = rank_hits(hits, 2, 0.25f);
  ASSERT_EQ(ranked.size(), 2u);
  EXPECT_EQ(ranked[0].chunk_id, "c");
  EXPECT_EQ(ranked[1].chunk_id, "d");

  EXPECT_TRUE(rank_hits(hits, 0, 0.0f).empty());
  EXPECT_TRUE(rank_hits(hits, 5, 0.9f).empty());
}

TEST(SimilarityTest, CosineOfZeroVectorIsZero) {
  EXPECT_FLOAT_EQ(cosine_similarity({0.0f, 0.0f}, {1.0f, 0.0f}), 0.0f);
  EXPECT_FLOAT_EQ(cosine_similarity({1.0f, 0.0f}, {2.0f, 0.0f}), 1.0f);
  EXPECT_FLOAT_EQ(cosine_similarity({1.0f, 0.0f}, {0.0f, 3.0f}), 0.0f);
  EXPECT_FLOAT_EQ(inverse_distance_score(0.0f), 1.0f);
  EXPECT_FLOAT_EQ(inverse_distance_score(1.0f), 0.5f);
}

// Behaviour shared by every backend
template <typename IndexT>
class VectorIndexContractTest : public ::testing::Test {
 protected:
  std::unique_ptr<VectorIndex> make(size_t dimension,
                                    SimilarityMetric metric = SimilarityMetric::COSINE) {
    return std::make_unique<IndexT>(dimension, metric);
  }
};

using IndexBackends = ::testing::Types<FlatVectorIndex, FaissVectorIndex>;
TYPED_TEST_SUITE(VectorIndexContractTest, IndexBackends);

TYPED_TEST(VectorIndexContractTest, RejectsZeroDimension) {
  EXPECT_THROW(this->make(0), InvalidConfigError);
}

TYPED_TEST(VectorIndexContractTest, EmptyIndexReturnsNoHits) {
  auto index = this->make(4);
  EXPECT_EQ(index->size(), 0u);
  EXPECT_TRUE(index->search(TestUtilities::axis_vector(4, 0), 3, 0.0f).empty());
}

TYPED_TEST(VectorIndexContractTest, InsertRejectsWrongDimension) {
  auto index = this->make(4);
  EXPECT_THROW(index->insert("1:000000", {1.0f, 0.0f, 0.0f}, {1, 0}), DimensionMismatchError);
  EXPECT_THROW(index->search({1.0f, 0.0f}, 1, 0.0f), DimensionMismatchError);
  EXPECT_EQ(index->size(), 0u);
}

TYPED_TEST(VectorIndexContractTest, SearchReturnsNearestFirst) {
  auto index = this->make(4);
  index->insert("1:000000", TestUtilities::axis_vector(4, 0), {1, 0});
  index->insert("1:000001", TestUtilities::axis_vector(4, 1), {1, 1});
  index->insert("2:000000", {0.8f, 0.6f, 0.0f, 0.0f}, {2, 0});

  auto hits = index->search(TestUtilities::axis_vector(4, 0, 3.0f), 2, 0.0f);
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk_id, "1:000000");
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);
  EXPECT_EQ(hits[1].chunk_id, "2:000000");
  EXPECT_EQ(hits[1].document_id, 2);
  EXPECT_NEAR(hits[1].score, 0.8f, 1e-5);
}

TYPED_TEST(VectorIndexContractTest, ThresholdExcludesWeakHits) {
  auto index = this->make(4);
  index->insert("1:000000", TestUtilities::axis_vector(4, 0), {1, 0});
  index->insert("1:000001", TestUtilities::axis_vector(4, 1), {1, 1});

  auto hits = index->search(TestUtilities::axis_vector(4, 0), 5, 0.5f);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].chunk_id, "1:000000");
}

TYPED_TEST(VectorIndexContractTest, TiesAreBrokenByChunkId) {
  auto index = this->make(4);
  // Inserted out of id order, all equally similar to the query
  index->insert("3:000000", TestUtilities::axis_vector(4, 0), {3, 0});
  index->insert("1:000000", TestUtilities::axis_vector(4, 0), {1, 0});
  index->insert("2:000000", TestUtilities::axis_vector(4, 0), {2, 0});
  index->insert("0:000000", TestUtilities::axis_vector(4, 1), {0, 0});

  auto hits = index->search(TestUtilities::axis_vector(4, 0), 2, 0.0f);
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk_id, "1:000000");
  EXPECT_EQ(hits[1].chunk_id, "2:000000");
}

TYPED_TEST(VectorIndexContractTest, InsertWithExistingIdReplaces) {
  auto index = this->make(4);
  index->insert("1:000000", TestUtilities::axis_vector(4, 0), {1, 0});
  index->insert("1:000000", TestUtilities::axis_vector(4, 2), {1, 0});

  EXPECT_EQ(index->size(), 1u);
  auto hits = index->search(TestUtilities::axis_vector(4, 2), 1, 0.0f);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);
}

TYPED_TEST(VectorIndexContractTest, RemoveDocumentDropsOnlyItsEntries) {
  auto index = this->make(4);
  index->insert("1:000000", TestUtilities::axis_vector(4, 0), {1, 0});
  index->insert("1:000001", TestUtilities::axis_vector(4, 1), {1, 1});
  index->insert("2:000000", TestUtilities::axis_vector(4, 2), {2, 0});

  EXPECT_EQ(index->count_for_document(1), 2u);
  EXPECT_EQ(index->remove_document(1), 2u);
  EXPECT_EQ(index->remove_document(1), 0u);
  EXPECT_EQ(index->size(), 1u);
  EXPECT_FALSE(index->contains("1:000000"));
  EXPECT_TRUE(index->contains("2:000000"));
  EXPECT_EQ(index->count_for_document(1), 0u);

  for (const auto& hit : index->search(TestUtilities::axis_vector(4, 0), 10, -1.0f)) {
    EXPECT_NE(hit.document_id, 1);
  }
}

TYPED_TEST(VectorIndexContractTest, InverseDistanceScoresExactMatchAsOne) {
  auto index = this->make(2, SimilarityMetric::INVERSE_DISTANCE);
  index->insert("1:000000", {1.0f, 0.0f}, {1, 0});
  index->insert("1:000001", {4.0f, 0.0f}, {1, 1});

  auto hits = index->search({1.0f, 0.0f}, 2, 0.0f);
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk_id, "1:000000");
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);
  EXPECT_NEAR(hits[1].score, 0.25f, 1e-5);
}

TYPED_TEST(VectorIndexContractTest, ConcurrentInsertAndSearch) {
  auto index = this->make(8);
  std::thread writer([&]() {
    for (int i = 0; i < 200; ++i) {
      index->insert(make_chunk_id(1, i), TestUtilities::axis_vector(8, i % 8), {1, i});
    }
  });
  for (int i = 0; i < 200; ++i) {
    auto hits = index->search(TestUtilities::axis_vector(8, 0), 3, 0.0f);
    EXPECT_LE(hits.size(), 3u);
  }
  writer.join();
  EXPECT_EQ(index->size(), 200u);
}

class FaissPersistenceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    index_path_ = TestUtilities::create_temp_path(".faiss");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(index_path_, ec);
    std::filesystem::remove(index_path_.string() + ".ids.json", ec);
  }

  std::filesystem::path index_path_;
};

TEST_F(FaissPersistenceTest, FlushAndReloadKeepsEntries) {
  {
    FaissVectorIndex index(4, SimilarityMetric::COSINE, index_path_);
    index.insert("5:000000", TestUtilities::axis_vector(4, 0), {5, 0});
    index.insert("5:000001", TestUtilities::axis_vector(4, 1), {5, 1});
    index.flush();
  }
  ASSERT_TRUE(std::filesystem::exists(index_path_));

  FaissVectorIndex reloaded(4, SimilarityMetric::COSINE, index_path_);
  EXPECT_EQ(reloaded.size(), 2u);
  EXPECT_TRUE(reloaded.contains("5:000001"));
  auto hits = reloaded.search(TestUtilities::axis_vector(4, 1), 1, 0.0f);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].chunk_id, "5:000001");
  EXPECT_EQ(hits[0].document_id, 5);

  // New labels must not collide with reloaded ones
  reloaded.insert("6:000000", TestUtilities::axis_vector(4, 2), {6, 0});
  EXPECT_EQ(reloaded.size(), 3u);
  EXPECT_TRUE(reloaded.contains("5:000000"));
}

TEST_F(FaissPersistenceTest, ReloadWithDifferentDimensionFails) {
  {
    FaissVectorIndex index(4, SimilarityMetric::COSINE, index_path_);
    index.insert("1:000000", TestUtilities::axis_vector(4, 0), {1, 0});
    index.flush();
  }
  EXPECT_THROW(FaissVectorIndex(8, SimilarityMetric::COSINE, index_path_), DimensionMismatchError);
}

TEST_F(FaissPersistenceTest, ReloadWithDifferentMetricFails) {
  {
    FaissVectorIndex index(4, SimilarityMetric::COSINE, index_path_);
    index.flush();
  }
  EXPECT_THROW(FaissVectorIndex(4, SimilarityMetric::INVERSE_DISTANCE, index_path_),
               InvalidConfigError);
}

TEST(VectorIndexFactoryTest, BuildsConfiguredBackend) {
  PipelineConfig config;
  config.embedding_dimension = 16;
  config.similarity_metric = SimilarityMetric::INVERSE_DISTANCE;

  config.vector_backend = VectorBackend::MEMORY;
  auto memory = VectorIndexFactory::create_index(config);
  EXPECT_NE(dynamic_cast<FlatVectorIndex*>(memory.get()), nullptr);
  EXPECT_EQ(memory->dimension(), 16u);
  EXPECT_EQ(memory->metric(), SimilarityMetric::INVERSE_DISTANCE);

  config.vector_backend = VectorBackend::FAISS;
  auto faiss = VectorIndexFactory::create_index(config);
  EXPECT_NE(dynamic_cast<FaissVectorIndex*>(faiss.get()), nullptr);
  EXPECT_EQ(faiss->dimension(), 16u);
}

}  // namespace docchat_tests

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "../../common/mocks_test.hpp"
#include "docu_core/errors.hpp"
#include "docu_core/retrieval/retriever.hpp"

namespace docu_tests {

using namespace docu_core;
using ::testing::_;
using ::testing::Eq;
using ::testing::Return;
using ::testing::Throw;

class RetrieverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    embedder_ = std::make_shared<::testing::NiceMock<MockEmbedder>>();
    vector_store_ = std::make_shared<::testing::NiceMock<MockVectorStore>>();
    settings_.top_k = 5;
    settings_.similarity_threshold = 0.3f;
    retriever_ = std::make_unique<Retriever>(embedder_, vector_store_, settings_);
  }

  std::shared_ptr<::testing::NiceMock<MockEmbedder>> embedder_;
  std::shared_ptr<::testing::NiceMock<MockVectorStore>> vector_store_;
  RetrievalSettings settings_;
  std::unique_ptr<Retriever> retriever_;
};

TEST_F(RetrieverTest, Retrieve_ConvertsDistancesAndKeepsStoreOrder) {
  // Arrange
  auto result = MockUtilities::create_query_result({
      MockUtilities::create_retrieved_chunk("alpha", "a.txt", 1, 0.9f),
      MockUtilities::create_retrieved_chunk("beta", "b.txt", 2, 0.7f),
  });
  EXPECT_CALL(*vector_store_, query(_, 5, _)).WillOnce(Return(result));

  // Act
  auto chunks = retriever_->retrieve("what is alpha?");

  // Assert
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, "alpha");
  EXPECT_EQ(chunks[0].id, "a.txt#1");
  EXPECT_NEAR(chunks[0].similarity_score, 0.9f, 1e-5);
  EXPECT_NEAR(chunks[0].distance, 0.2f, 1e-5);
  EXPECT_EQ(chunks[1].provenance.file_name, "b.txt");
  EXPECT_EQ(chunks[1].provenance.page_or_paragraph, 2);
}

TEST_F(RetrieverTest, Retrieve_DropsChunksBelowThreshold) {
  // Arrange: similarities 0.9, 0.29 and exactly 0.3
  auto result = MockUtilities::create_query_result({
      MockUtilities::create_retrieved_chunk("keep", "a.txt", 1, 0.9f),
      MockUtilities::create_retrieved_chunk("drop", "a.txt", 2, 0.29f),
      MockUtilities::create_retrieved_chunk("edge", "a.txt", 3, 0.3f),
  });
  result.distances[0][2] = 1.4f;
  EXPECT_CALL(*vector_store_, query(_, _, _)).WillOnce(Return(result));

  // Act
  auto chunks = retriever_->retrieve("query");

  // Assert
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, "keep");
  EXPECT_EQ(chunks[1].text, "edge");
  for (const auto& chunk : chunks) {
    EXPECT_GE(chunk.similarity_score, settings_.similarity_threshold);
  }
}

TEST_F(RetrieverTest, Retrieve_ClampsSimilarityIntoUnitRange) {
  auto result = MockUtilities::create_query_result({
      MockUtilities::create_retrieved_chunk("negative distance", "a.txt"),
  });
  result.distances[0][0] = -0.5f;
  EXPECT_CALL(*vector_store_, query(_, _, _)).WillOnce(Return(result));

  auto chunks = retriever_->retrieve("query");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_FLOAT_EQ(chunks[0].similarity_score, 1.0f);
}

TEST_F(RetrieverTest, Retrieve_PassesTopKAndFiltersThrough) {
  // Arrange
  nlohmann::json filters = {{"file_name", "a.txt"}};
  EXPECT_CALL(*vector_store_, query(_, 3, Eq(filters)))
      .WillOnce(Return(MockUtilities::create_empty_query_result()));

  // Act
  auto chunks = retriever_->retrieve("query", 3, filters);

  // Assert
  EXPECT_TRUE(chunks.empty());
}

TEST_F(RetrieverTest, Retrieve_RejectsBlankQueryAndBadTopK) {
  EXPECT_CALL(*vector_store_, query(_, _, _)).Times(0);

  EXPECT_THROW(retriever_->retrieve(""), ValidationError);
  EXPECT_THROW(retriever_->retrieve("   "), ValidationError);
  EXPECT_THROW(retriever_->retrieve("query", 0), ValidationError);
}

TEST_F(RetrieverTest, Retrieve_WrapsCollaboratorFailures) {
  EXPECT_CALL(*embedder_, embed(_)).WillOnce(Throw(EmbeddingError("model offline")));
  EXPECT_THROW(retriever_->retrieve("query"), RetrievalError);

  EXPECT_CALL(*embedder_, embed(_)).WillRepeatedly(Return(std::vector<float>{1.0f, 0.0f, 0.0f, 0.0f}));
  EXPECT_CALL(*vector_store_, query(_, _, _)).WillOnce(Throw(VectorStoreError("disk I/O error")));
  try {
    retriever_->retrieve("query");
    FAIL() << "Expected RetrievalError";
  } catch (const RetrievalError& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("disk I/O error"));
  }
}

TEST_F(RetrieverTest, RetrieveWithContext_ComputesSummary) {
  // Arrange
  auto result = MockUtilities::create_query_result({
      MockUtilities::create_retrieved_chunk("one", "b.txt", 1, 0.9f),
      MockUtilities::create_retrieved_chunk("two", "a.txt", 1, 0.7f),
      MockUtilities::create_retrieved_chunk("three", "b.txt", 2, 0.5f),
  });
  EXPECT_CALL(*vector_store_, query(_, _, _)).WillOnce(Return(result));

  // Act
  auto context = retriever_->retrieve_with_context("query");

  // Assert
  EXPECT_EQ(context.query, "query");
  EXPECT_EQ(context.total_chunks, 3u);
  EXPECT_NEAR(context.avg_similarity, 0.7f, 1e-5);
  EXPECT_EQ(context.num_sources, 2u);
  EXPECT_THAT(context.source_names, ::testing::ElementsAre("b.txt", "a.txt"));
}

TEST_F(RetrieverTest, RetrieveWithContext_EmptyResultHasZeroAverage) {
  EXPECT_CALL(*vector_store_, query(_, _, _))
      .WillOnce(Return(MockUtilities::create_empty_query_result()));

  auto context = retriever_->retrieve_with_context("query");

  EXPECT_EQ(context.total_chunks, 0u);
  EXPECT_FLOAT_EQ(context.avg_similarity, 0.0f);
  EXPECT_EQ(context.num_sources, 0u);
  EXPECT_TRUE(context.source_names.empty());
}

TEST(DistanceToSimilarityTest, MapsCosineDistanceRange) {
  EXPECT_FLOAT_EQ(distance_to_similarity(0.0f), 1.0f);
  EXPECT_FLOAT_EQ(distance_to_similarity(1.0f), 0.5f);
  EXPECT_FLOAT_EQ(distance_to_similarity(2.0f), 0.0f);
  EXPECT_FLOAT_EQ(distance_to_similarity(3.0f), 0.0f);
}

}  // namespace docu_tests

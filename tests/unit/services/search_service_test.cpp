#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "docvec_core/llm/gemini_client.hpp"
#include "docvec_core/services/indexing_service.hpp"
#include "docvec_core/services/search_service.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Throw;

namespace docvec_core {

class SearchServiceTest : public docvec_tests::VectorStoreTestBase {
 protected:
  void SetUp() override {
    VectorStoreTestBase::SetUp();
    mock_provider_ = std::make_shared<NiceMock<docvec_tests::MockEmbeddingProvider>>();
    search_service_ = std::make_unique<SearchService>(vector_store_, mock_provider_);
  }

  void TearDown() override {
    search_service_.reset();
    VectorStoreTestBase::TearDown();
  }

  void index_seven_sentences() {
    IndexingService indexing_service(vector_store_, mock_provider_,
                                     std::make_shared<ContentExtractorFactory>());
    indexing_service.index_text("seven.txt", docvec_tests::TestUtilities::seven_sentence_text());
  }

  std::shared_ptr<NiceMock<docvec_tests::MockEmbeddingProvider>> mock_provider_;
  std::unique_ptr<SearchService> search_service_;
};

TEST_F(SearchServiceTest, EmbedsQueryWithQueryIntent) {
  EXPECT_CALL(*mock_provider_, embed("find me", EmbeddingIntent::Query)).Times(1);
  EXPECT_CALL(*mock_provider_, embed(_, EmbeddingIntent::Document)).Times(0);

  search_service_->search("find me");
}

TEST_F(SearchServiceTest, EmptyStoreIsNotAnError) {
  auto results = search_service_->search("anything", 5);
  EXPECT_TRUE(results.empty());
}

TEST_F(SearchServiceTest, RoundTripReturnsIndexedChunkFirst) {
  index_seven_sentences();

  const std::string chunk = "Four is fourth. Five is fifth. Six is sixth.";
  auto results = search_service_->search(chunk, 3);

  ASSERT_FALSE(results.empty());
  EXPECT_EQ(results[0].chunk_text, chunk);
  EXPECT_EQ(results[0].filename, "seven.txt");
  EXPECT_NEAR(results[0].score, 1.0f, 1e-4);
}

TEST_F(SearchServiceTest, ReturnsAllWhenFewerThanK) {
  index_seven_sentences();
  auto results = search_service_->search("query", 50);
  EXPECT_EQ(results.size(), 3u);
}

TEST_F(SearchServiceTest, ScoresAreBoundedAndNonIncreasing) {
  vector_store_->insert_batch(docvec_tests::TestUtilities::create_test_records(25));

  auto results = search_service_->search("some question", 25);
  ASSERT_EQ(results.size(), 25u);
  for (size_t i = 0; i < results.size(); ++i) {
    EXPECT_GE(results[i].score, 0.0f);
    EXPECT_LE(results[i].score, 1.0f);
    if (i > 0) {
      EXPECT_GE(results[i - 1].score, results[i].score);
    }
  }
}

TEST_F(SearchServiceTest, QueryEmbeddingFailureIsSurfaced) {
  EXPECT_CALL(*mock_provider_, embed(_, EmbeddingIntent::Query))
      .WillOnce(Throw(EmbeddingError("HTTP 401")));

  try {
    search_service_->search("secret plans");
    FAIL() << "Expected QueryEmbeddingError";
  } catch (const QueryEmbeddingError& e) {
    EXPECT_EQ(e.query(), "secret plans");
    EXPECT_THAT(std::string(e.what()), HasSubstr("HTTP 401"));
    EXPECT_THAT(std::string(e.what()), HasSubstr("secret plans"));
  }
}

TEST_F(SearchServiceTest, InvalidUtf8QueryFailureCarriesQueryText) {
  GeminiClient::Options options;
  options.api_key = "key";
  options.base_url = "http://127.0.0.1:1/v1beta";
  options.dimension = docvec_tests::TEST_DIMENSION;
  options.timeout_seconds = 2;
  SearchService service(vector_store_, std::make_shared<GeminiClient>(options));

  const std::string query = "caf\xE9 menu";
  try {
    service.search(query);
    FAIL() << "Expected QueryEmbeddingError";
  } catch (const QueryEmbeddingError& e) {
    EXPECT_EQ(e.query(), query);
  }
}

TEST_F(SearchServiceTest, RejectsNonPositiveK) {
  EXPECT_THROW(search_service_->search("q", 0), std::invalid_argument);
}

}  // namespace docvec_core

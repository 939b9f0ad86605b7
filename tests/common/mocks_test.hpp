#pragma once

#include <gmock/gmock.h>

#include "docvec_core/extractors/content_extractor.hpp"
#include "docvec_core/extractors/content_extractor_factory.hpp"
#include "docvec_core/llm/embedding_provider.hpp"
#include "utilities_test.hpp"

namespace docvec_tests {

/**
 * Mock embedding provider. By default it returns a deterministic vector derived
 * from the text, so the same text embeds to the same vector for either intent.
 */
class MockEmbeddingProvider : public docvec_core::EmbeddingProvider {
 public:
  explicit MockEmbeddingProvider(size_t dimension = TEST_DIMENSION) {
    ON_CALL(*this, embed(testing::_, testing::_))
        .WillByDefault([dimension](const std::string& text, docvec_core::EmbeddingIntent) {
          return TestUtilities::create_test_vector(text, dimension);
        });
    ON_CALL(*this, dimension()).WillByDefault(testing::Return(dimension));
    ON_CALL(*this, name()).WillByDefault(testing::Return("mock"));
  }

  MOCK_METHOD(std::vector<float>, embed, (const std::string& text, docvec_core::EmbeddingIntent intent),
              (override));
  MOCK_METHOD(size_t, dimension, (), (const, override));
  MOCK_METHOD(std::string, name, (), (const, override));
};

class MockContentExtractor : public docvec_core::ContentExtractor {
 public:
  MOCK_METHOD(bool, can_handle, (const std::filesystem::path& file_path), (const, override));
  MOCK_METHOD(std::string, extract_text, (const std::filesystem::path& file_path),
              (const, override));
  MOCK_METHOD(docvec_core::FileType, get_file_type, (), (const, override));
};

class MockContentExtractorFactory : public docvec_core::ContentExtractorFactory {
 public:
  MOCK_METHOD(const docvec_core::ContentExtractor&, get_extractor_for,
              (const std::filesystem::path& file_path), (const, override));
};

}  // namespace docvec_tests

#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

/**
 * @class ContentExtractorFactory
 * @brief Manages and provides the correct ContentExtractor for a given file type.
 *
 * This factory holds one instance of every available extractor and selects
 * the first one that reports it can handle the file's extension. This class
 * is non-copyable and non-movable.
 */
namespace docvec_core {
class ContentExtractorFactory {
 public:
  /**
   * @brief Constructs the factory and registers the plain text, Markdown, PDF and DOCX extractors.
   */
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  /**
   * @brief Finds and returns the extractor for the given file.
   *
   * @param file_path The path to the file that needs to be processed.
   * @return A constant reference to the appropriate ContentExtractor.
   * @throw ContentExtractorError if the format is not supported.
   */
  virtual const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<ContentExtractorPtr> extractors;
};
}  // namespace docvec_core

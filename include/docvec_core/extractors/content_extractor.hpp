#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "docvec_core/types/file.hpp"

namespace fs = std::filesystem;

namespace docvec_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Opens the file and returns its text as valid UTF-8
  virtual std::string extract_text(const fs::path& file_path) const = 0;

  virtual FileType get_file_type() const = 0;

 protected:
  std::string get_string_content(const fs::path& file_path) const;
  static std::string sanitize_utf8(const std::string& text);
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace docvec_core

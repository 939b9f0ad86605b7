#pragma once

#include "content_extractor.hpp"

namespace docvec_core {

class MarkdownExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;

  FileType get_file_type() const override { return FileType::Markdown; }

  // Strips markup so only prose reaches the chunker
  static std::string strip_markup(const std::string& content);
};

}  // namespace docvec_core

#pragma once

#include "content_extractor.hpp"

namespace docvec_core {

class PlainTextExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;

  FileType get_file_type() const override { return FileType::Text; }
};

}  // namespace docvec_core

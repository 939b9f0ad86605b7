#pragma once

#include "content_extractor.hpp"

namespace docvec_core {

class PdfExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  // Page text in page order, one newline between pages
  std::string extract_text(const fs::path& file_path) const override;

  FileType get_file_type() const override { return FileType::PDF; }
};

}  // namespace docvec_core

#pragma once

#include "content_extractor.hpp"

namespace docvec_core {

/**
 * @class DocxExtractor
 * @brief Reads the body paragraphs of a Word (.docx) document.
 *
 * The archive is opened with libzip and word/document.xml is parsed with
 * libxml2. Each top-level w:p of w:body becomes one line; its w:t runs are
 * concatenated, w:tab becomes a tab and w:br/w:cr a newline.
 */
class DocxExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  // Paragraph texts joined with one newline
  std::string extract_text(const fs::path& file_path) const override;

  FileType get_file_type() const override { return FileType::DOCX; }

  // Same as extract_text, over the raw bytes of word/document.xml
  static std::string paragraphs_from_xml(const std::string& document_xml);
};

}  // namespace docvec_core

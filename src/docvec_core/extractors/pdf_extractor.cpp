#include "docvec_core/extractors/pdf_extractor.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <memory>

namespace docvec_core {

bool PdfExtractor::can_handle(const fs::path& file_path) const {
  return file_type_from_extension(file_path) == FileType::PDF;
}

std::string PdfExtractor::extract_text(const fs::path& file_path) const {
  if (!fs::exists(file_path)) {
    throw ContentExtractorError("The file was not found at: " + file_path.string());
  }

  std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(file_path.string()));
  if (!doc) {
    throw ContentExtractorError("Poppler failed to open PDF: " + file_path.string());
  }
  if (doc->is_locked()) {
    throw ContentExtractorError("PDF is password protected: " + file_path.string());
  }

  std::string text;
  for (int i = 0; i < doc->pages(); ++i) {
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page)
      continue;
    auto bytes = page->text().to_utf8();
    text.append(bytes.begin(), bytes.end());
    text += "\n";
  }
  return sanitize_utf8(text);
}

}  // namespace docvec_core

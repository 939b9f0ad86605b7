#include "docvec_core/extractors/content_extractor_factory.hpp"

#include "docvec_core/extractors/docx_extractor.hpp"
#include "docvec_core/extractors/markdown_extractor.hpp"
#include "docvec_core/extractors/pdf_extractor.hpp"
#include "docvec_core/extractors/plaintext_extractor.hpp"

namespace docvec_core {
ContentExtractorFactory::ContentExtractorFactory() {
  extractors.push_back(std::make_unique<PlainTextExtractor>());
  extractors.push_back(std::make_unique<MarkdownExtractor>());
  extractors.push_back(std::make_unique<PdfExtractor>());
  extractors.push_back(std::make_unique<DocxExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  std::string extension = file_path.extension().string();
  throw ContentExtractorError("Unsupported file format: " +
                              (extension.empty() ? std::string("<none>") : extension) +
                              ". Supported formats are .txt, .md, .pdf and .docx.");
}
}  // namespace docvec_core

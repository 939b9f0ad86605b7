#include "docvec_core/extractors/plaintext_extractor.hpp"

namespace docvec_core {

bool PlainTextExtractor::can_handle(const fs::path& file_path) const {
  return file_type_from_extension(file_path) == FileType::Text;
}

std::string PlainTextExtractor::extract_text(const fs::path& file_path) const {
  return get_string_content(file_path);
}

}  // namespace docvec_core

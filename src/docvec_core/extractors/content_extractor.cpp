#include "docvec_core/extractors/content_extractor.hpp"

#include <utf8.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace docvec_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  if (!fs::exists(file_path)) {
    throw ContentExtractorError("The file was not found at: " + file_path.string());
  }
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return sanitize_utf8(buffer.str());
}

std::string ContentExtractor::sanitize_utf8(const std::string& text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return text;
  }
  std::string cleaned;
  cleaned.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(cleaned));
  return cleaned;
}

}  // namespace docvec_core

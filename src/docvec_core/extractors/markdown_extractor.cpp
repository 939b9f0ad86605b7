#include "docvec_core/extractors/markdown_extractor.hpp"

#include <regex>

namespace docvec_core {

bool MarkdownExtractor::can_handle(const fs::path& file_path) const {
  return file_type_from_extension(file_path) == FileType::Markdown;
}

std::string MarkdownExtractor::extract_text(const fs::path& file_path) const {
  return strip_markup(get_string_content(file_path));
}

std::string MarkdownExtractor::strip_markup(const std::string& content) {
  if (content.empty()) {
    return {};
  }

  const auto flags = std::regex_constants::ECMAScript | std::regex_constants::multiline;
  const std::regex fence_regex(R"(^[ \t]*(```|~~~).*$)", flags);
  const std::regex heading_regex(R"(^[ \t]*#+[ \t]*)", flags);
  const std::regex emphasis_regex(R"((\*\*|__|\*|`))");

  std::string text = std::regex_replace(content, fence_regex, "");
  text = std::regex_replace(text, heading_regex, "");
  text = std::regex_replace(text, emphasis_regex, "");
  return text;
}

}  // namespace docvec_core

#include "docvec_core/types/file.hpp"

#include <algorithm>
#include <cctype>

namespace docvec_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Text:
      return "Text";
    case FileType::Markdown:
      return "Markdown";
    case FileType::PDF:
      return "PDF";
    case FileType::DOCX:
      return "DOCX";
    default:
      return "Unknown";
  }
}

FileType file_type_from_extension(const std::filesystem::path& file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (extension == ".txt" || extension == ".text")
    return FileType::Text;
  if (extension == ".md" || extension == ".markdown")
    return FileType::Markdown;
  if (extension == ".pdf")
    return FileType::PDF;
  if (extension == ".docx")
    return FileType::DOCX;
  return FileType::Unknown;
}

}  // namespace docvec_core

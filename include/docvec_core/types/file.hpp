#pragma once

#include <filesystem>
#include <string>

namespace docvec_core {

// Source document formats the extractors understand
enum class FileType { Text, Markdown, PDF, DOCX, Unknown };

// Conversion utilities
std::string to_string(FileType type);
FileType file_type_from_extension(const std::filesystem::path& file_path);

}  // namespace docvec_core

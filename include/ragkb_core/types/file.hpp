#pragma once

#include <string>

namespace ragkb_core {

// Document kinds accepted by the corpus reader
enum class FileType { Text, Markdown, Unknown };

// Conversion utilities
std::string to_string(FileType type);
FileType file_type_from_string(const std::string& str);
FileType file_type_from_extension(const std::string& extension);

}  // namespace ragkb_core

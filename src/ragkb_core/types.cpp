#include "ragkb_core/types.hpp"

namespace ragkb_core {

namespace {

struct FileTypeInfo {
  FileType type;
  const char* name;
  const char* extension;
};

// Extensions are matched case-sensitively, the same way the corpus glob does.
constexpr FileTypeInfo FILE_TYPES[] = {
    {FileType::Text, "Text", ".txt"},
    {FileType::Markdown, "Markdown", ".md"},
};

}  // namespace

std::string to_string(FileType type) {
  for (const auto& info : FILE_TYPES) {
    if (info.type == type) return info.name;
  }
  return "Unknown";
}

FileType file_type_from_string(const std::string& str) {
  for (const auto& info : FILE_TYPES) {
    if (str == info.name) return info.type;
  }
  return FileType::Unknown;
}

FileType file_type_from_extension(const std::string& extension) {
  for (const auto& info : FILE_TYPES) {
    if (extension == info.extension) return info.type;
  }
  return FileType::Unknown;
}

}  // namespace ragkb_core

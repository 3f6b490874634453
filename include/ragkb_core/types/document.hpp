#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "ragkb_core/types/file.hpp"

namespace ragkb_core {

struct Document {
  std::filesystem::path path;
  std::string text;
  std::string content_hash;
  FileType file_type = FileType::Unknown;
};

// What survives of a Document once the index is built
struct DocumentRecord {
  std::string source;
  std::string content_hash;
  FileType file_type = FileType::Unknown;
  size_t chunk_count = 0;
};

}  // namespace ragkb_core

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "ragkb_core/types/document.hpp"
#include "ragkb_core/types/file.hpp"

namespace fs = std::filesystem;

namespace ragkb_core {

/**
 * @class CorpusReader
 * @brief Finds and loads the documents of a corpus directory.
 *
 * Only regular files sitting directly in the directory with a .txt or .md
 * extension are part of the corpus. Everything else is skipped.
 */
class CorpusReader {
 public:
  virtual ~CorpusReader() = default;

  // Checks if this reader can handle the given file extension
  virtual bool can_handle(const fs::path &file_path) const;

  /**
   * @brief Lists eligible documents, sorted by path.
   * @throw CorpusNotFoundError if corpus_dir is missing or not a directory.
   */
  virtual std::vector<fs::path> list_documents(const fs::path &corpus_dir) const;

  // opens, reads, and hashes the file
  virtual Document read(const fs::path &file_path) const;

 protected:
  std::string get_string_content(const fs::path &file_path) const;
  std::string compute_hash_from_content(const std::string &content) const;
};

}  // namespace ragkb_core

#include "ragkb_core/corpus/corpus_reader.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "ragkb_core/errors.hpp"
#include "ragkb_core/text/utf8_text.hpp"

namespace ragkb_core {

bool CorpusReader::can_handle(const fs::path &file_path) const {
  return file_type_from_extension(file_path.extension().string()) != FileType::Unknown;
}

std::vector<fs::path> CorpusReader::list_documents(const fs::path &corpus_dir) const {
  std::error_code ec;
  if (!fs::exists(corpus_dir, ec) || !fs::is_directory(corpus_dir, ec)) {
    throw CorpusNotFoundError("Docs folder not found: " + corpus_dir.string());
  }

  std::vector<fs::path> documents;
  for (const auto &entry : fs::directory_iterator(corpus_dir)) {
    // Hidden files are not part of the corpus
    if (entry.path().filename().string().rfind('.', 0) == 0) {
      continue;
    }
    if (entry.is_regular_file() && can_handle(entry.path())) {
      documents.push_back(entry.path());
    }
  }
  std::sort(documents.begin(), documents.end());
  return documents;
}

Document CorpusReader::read(const fs::path &file_path) const {
  Document document;
  document.path = file_path;
  document.file_type = file_type_from_extension(file_path.extension().string());
  document.text = get_string_content(file_path);
  document.content_hash = compute_hash_from_content(document.text);
  if (sanitize_utf8(document.text)) {
    std::cerr << "Warning: replaced invalid UTF-8 sequences in " << file_path << std::endl;
  }
  return document;
}

std::string CorpusReader::get_string_content(const fs::path &file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw StorageError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

std::string CorpusReader::compute_hash_from_content(const std::string &content) const {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw StorageError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw StorageError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw StorageError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw StorageError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }

  return ss.str();
}

}  // namespace ragkb_core

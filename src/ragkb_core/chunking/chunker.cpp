#include "ragkb_core/chunking/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <cstdint>

#include "ragkb_core/errors.hpp"
#include "ragkb_core/text/utf8_text.hpp"

namespace ragkb_core {

namespace {

// Unicode White_Space plus the C0 separators (U+001C..U+001F)
bool is_token_separator(uint32_t cp) {
  if ((cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20)) return true;
  if (cp < 0x85) return false;
  switch (cp) {
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

}  // namespace

Chunker::Chunker(int chunk_size, int overlap) {
  if (chunk_size <= 0) {
    throw ConfigurationError("chunk_size must be greater than 0, got " +
                             std::to_string(chunk_size));
  }
  // overlap >= chunk_size would make the window never advance
  if (overlap < 0 || overlap >= chunk_size) {
    throw ConfigurationError("overlap must be in [0, chunk_size), got overlap=" +
                             std::to_string(overlap) +
                             " chunk_size=" + std::to_string(chunk_size));
  }
  chunk_size_ = static_cast<size_t>(chunk_size);
  overlap_ = static_cast<size_t>(overlap);
}

std::vector<std::string> Chunker::tokenize(const std::string &text) {
  std::string clean = text;
  sanitize_utf8(clean);

  std::vector<std::string> tokens;
  auto token_start = clean.cend();
  bool in_token = false;
  for (auto it = clean.cbegin(); it != clean.cend();) {
    auto cp_start = it;
    const uint32_t cp = utf8::next(it, clean.cend());
    if (is_token_separator(cp)) {
      if (in_token) {
        tokens.emplace_back(token_start, cp_start);
        in_token = false;
      }
    } else if (!in_token) {
      token_start = cp_start;
      in_token = true;
    }
  }
  if (in_token) {
    tokens.emplace_back(token_start, clean.cend());
  }
  return tokens;
}

std::vector<std::string> Chunker::chunk(const std::string &text) const {
  const std::vector<std::string> tokens = tokenize(text);
  std::vector<std::string> chunks;
  if (tokens.empty()) {
    return chunks;
  }
  chunks.reserve((tokens.size() + step() - 1) / step());

  for (size_t start = 0; start < tokens.size(); start += step()) {
    const size_t end = std::min(start + chunk_size_, tokens.size());
    std::string window = tokens[start];
    for (size_t i = start + 1; i < end; ++i) {
      window += ' ';
      window += tokens[i];
    }
    chunks.push_back(std::move(window));
  }
  return chunks;
}

}  // namespace ragkb_core

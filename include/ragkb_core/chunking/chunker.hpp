#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ragkb_core {

/**
 * @brief Splits text into overlapping windows of tokens delimited by Unicode whitespace.
 *
 * Windows hold chunk_size tokens and start step() = chunk_size - overlap tokens
 * apart. The trailing window may be shorter. Tokens inside a window are joined
 * with single spaces.
 */
class Chunker {
 public:
  static constexpr int DEFAULT_CHUNK_SIZE = 300;
  static constexpr int DEFAULT_OVERLAP = 50;

  /**
   * @throw ConfigurationError if chunk_size <= 0 or overlap is outside [0, chunk_size).
   */
  Chunker(int chunk_size = DEFAULT_CHUNK_SIZE, int overlap = DEFAULT_OVERLAP);

  std::vector<std::string> chunk(const std::string &text) const;

  size_t chunk_size() const {
    return chunk_size_;
  }
  size_t overlap() const {
    return overlap_;
  }
  size_t step() const {
    return chunk_size_ - overlap_;
  }

 private:
  static std::vector<std::string> tokenize(const std::string &text);

  size_t chunk_size_;
  size_t overlap_;
};

}  // namespace ragkb_core

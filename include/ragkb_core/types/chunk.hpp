#pragma once

#include <string>

namespace ragkb_core {

// Stored metadata of one index entry. text holds the display copy, which may be
// shorter than the text that was embedded.
struct Chunk {
  std::string source;
  int chunk_index = 0;
  std::string text;
};

inline bool operator==(const Chunk &lhs, const Chunk &rhs) {
  return lhs.source == rhs.source && lhs.chunk_index == rhs.chunk_index && lhs.text == rhs.text;
}

}  // namespace ragkb_core

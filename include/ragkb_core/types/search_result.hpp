#pragma once

#include <string>
#include <vector>

namespace ragkb_core {

struct SearchResult {
  float score = 0.0f;
  std::string source;
  int chunk_index = 0;
  std::string text;
};

struct QueryResult {
  std::string query;
  std::string detected_language;
  std::vector<SearchResult> results;
};

}  // namespace ragkb_core

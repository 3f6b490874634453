#pragma once

#include <string>
#include <vector>

namespace ragkb_core {

// text -> dense vector. Implementations raise EmbeddingError on failure and must
// be safe to call from several threads when the index store runs with more than
// one worker.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> embed(const std::string &text) = 0;

  // Name recorded next to a built index
  virtual std::string model_name() const = 0;
};

}  // namespace ragkb_core

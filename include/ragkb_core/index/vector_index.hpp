#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ragkb_core {

struct SearchHit {
  float score;
  int64_t position;
};

// Ordered collection of equal-length vectors searchable by inner product.
// Vector i added to the index keeps position i.
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  virtual size_t dimension() const = 0;
  virtual size_t size() const = 0;

  // Appends vectors in order; each must have dimension() elements
  virtual void add(const std::vector<std::vector<float>> &vectors) = 0;

  // Up to k hits sorted by descending score, "no match" slots removed
  virtual std::vector<SearchHit> search(const std::vector<float> &query, size_t k) const = 0;

  // Engine-native byte form, reloadable by the same engine
  virtual std::vector<char> serialize() const = 0;
};

}  // namespace ragkb_core

#include "ragkb_core/index/vector_math.hpp"

#include <faiss/utils/distances.h>

#include <cmath>

#include "ragkb_core/errors.hpp"

namespace ragkb_core {

float l2_norm(const std::vector<float> &vector) {
  if (vector.empty()) {
    return 0.0f;
  }
  return std::sqrt(faiss::fvec_norm_L2sqr(vector.data(), vector.size()));
}

void normalize_l2(std::vector<float> &vector) {
  const float norm = l2_norm(vector);
  if (!std::isfinite(norm) || norm == 0.0f) {
    throw EmbeddingError("Embedding has zero or non-finite norm and cannot be normalized");
  }
  faiss::fvec_renorm_L2(vector.size(), 1, vector.data());
}

}  // namespace ragkb_core

#pragma once

#include <vector>

namespace ragkb_core {

// Scales vector to unit length in place. A zero or non-finite norm cannot be
// normalized and raises EmbeddingError.
void normalize_l2(std::vector<float> &vector);

float l2_norm(const std::vector<float> &vector);

}  // namespace ragkb_core

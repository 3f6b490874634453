#pragma once

#include <faiss/Index.h>
#include <faiss/IndexFlat.h>

#include <memory>
#include <vector>

#include "ragkb_core/index/vector_index.hpp"

namespace ragkb_core {

/**
 * @class FaissFlatIndex
 * @brief Exact inner-product search over a faiss IndexFlatIP.
 *
 * Callers normalize vectors beforehand so that scores are cosine similarities.
 */
class FaissFlatIndex : public VectorIndex {
 public:
  explicit FaissFlatIndex(size_t dimension);
  ~FaissFlatIndex() override = default;

  FaissFlatIndex(const FaissFlatIndex &) = delete;
  FaissFlatIndex &operator=(const FaissFlatIndex &) = delete;

  /**
   * @brief Rebuilds an index from bytes produced by serialize().
   * @throw VectorIndexError if the bytes are not an inner-product faiss index.
   */
  static std::unique_ptr<FaissFlatIndex> deserialize(const std::vector<char> &bytes);

  size_t dimension() const override;
  size_t size() const override;
  void add(const std::vector<std::vector<float>> &vectors) override;
  std::vector<SearchHit> search(const std::vector<float> &query, size_t k) const override;
  std::vector<char> serialize() const override;

 private:
  explicit FaissFlatIndex(std::unique_ptr<faiss::Index> index);

  std::unique_ptr<faiss::Index> index_;
};

}  // namespace ragkb_core

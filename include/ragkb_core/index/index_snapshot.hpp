#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragkb_core/index/vector_index.hpp"
#include "ragkb_core/types/chunk.hpp"
#include "ragkb_core/types/document.hpp"

namespace ragkb_core {

/**
 * @class IndexSnapshot
 * @brief One immutable built index: vector i belongs to chunk i.
 *
 * Snapshots are shared between readers through shared_ptr<const IndexSnapshot>;
 * a rebuild produces a new snapshot instead of mutating the current one.
 */
class IndexSnapshot {
 public:
  /**
   * @throw IndexIntegrityError if the vector count differs from the chunk count.
   */
  IndexSnapshot(std::unique_ptr<VectorIndex> vectors,
                std::vector<Chunk> chunks,
                std::vector<DocumentRecord> documents,
                std::string embedding_model,
                std::string built_at);

  IndexSnapshot(const IndexSnapshot &) = delete;
  IndexSnapshot &operator=(const IndexSnapshot &) = delete;

  size_t size() const;
  size_t dimension() const;

  // Throws IndexIntegrityError for a position outside [0, size())
  const Chunk &chunk_at(int64_t position) const;

  std::vector<SearchHit> search(const std::vector<float> &query, size_t k) const;

  const VectorIndex &vectors() const {
    return *vectors_;
  }
  const std::vector<Chunk> &chunks() const {
    return chunks_;
  }
  const std::vector<DocumentRecord> &documents() const {
    return documents_;
  }
  const std::string &embedding_model() const {
    return embedding_model_;
  }
  const std::string &built_at() const {
    return built_at_;
  }

 private:
  std::unique_ptr<VectorIndex> vectors_;
  std::vector<Chunk> chunks_;
  std::vector<DocumentRecord> documents_;
  std::string embedding_model_;
  std::string built_at_;
};

}  // namespace ragkb_core

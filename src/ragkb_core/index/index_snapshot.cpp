#include "ragkb_core/index/index_snapshot.hpp"

#include "ragkb_core/errors.hpp"

namespace ragkb_core {

IndexSnapshot::IndexSnapshot(std::unique_ptr<VectorIndex> vectors,
                             std::vector<Chunk> chunks,
                             std::vector<DocumentRecord> documents,
                             std::string embedding_model,
                             std::string built_at)
    : vectors_(std::move(vectors)),
      chunks_(std::move(chunks)),
      documents_(std::move(documents)),
      embedding_model_(std::move(embedding_model)),
      built_at_(std::move(built_at)) {
  if (!vectors_) {
    throw IndexIntegrityError("Index snapshot has no vector collection");
  }
  if (vectors_->size() != chunks_.size()) {
    throw IndexIntegrityError("Vector count " + std::to_string(vectors_->size()) +
                              " does not match chunk count " + std::to_string(chunks_.size()));
  }
}

size_t IndexSnapshot::size() const {
  return chunks_.size();
}

size_t IndexSnapshot::dimension() const {
  return vectors_->dimension();
}

const Chunk &IndexSnapshot::chunk_at(int64_t position) const {
  if (position < 0 || static_cast<size_t>(position) >= chunks_.size()) {
    throw IndexIntegrityError("Vector index returned position " + std::to_string(position) +
                              " but only " + std::to_string(chunks_.size()) +
                              " chunks are stored");
  }
  return chunks_[static_cast<size_t>(position)];
}

std::vector<SearchHit> IndexSnapshot::search(const std::vector<float> &query, size_t k) const {
  return vectors_->search(query, k);
}

}  // namespace ragkb_core

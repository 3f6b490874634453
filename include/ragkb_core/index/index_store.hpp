#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ragkb_core/chunking/chunker.hpp"
#include "ragkb_core/config.hpp"
#include "ragkb_core/corpus/corpus_reader.hpp"
#include "ragkb_core/index/index_repository.hpp"
#include "ragkb_core/index/index_snapshot.hpp"
#include "ragkb_core/llm/embedding_provider.hpp"

namespace ragkb_core {

struct IndexStoreOptions {
  int chunk_size = Chunker::DEFAULT_CHUNK_SIZE;
  int chunk_overlap = Chunker::DEFAULT_OVERLAP;
  size_t max_stored_chars = 600;
  size_t num_workers = 1;

  static IndexStoreOptions from_config(const Config &config) {
    return IndexStoreOptions{
        .chunk_size = config.chunk_size,
        .chunk_overlap = config.chunk_overlap,
        .max_stored_chars = static_cast<size_t>(config.max_stored_chars),
        .num_workers = static_cast<size_t>(config.num_workers),
    };
  }
};

struct BuildSummary {
  size_t entry_count = 0;
  size_t dimension = 0;
  size_t document_count = 0;
};

/**
 * @class IndexStore
 * @brief Owns the current index snapshot and rebuilds it from a corpus.
 *
 * Readers take a shared_ptr to the current snapshot and keep using it even if a
 * rebuild finishes meanwhile. Rebuilds are serialized; a rebuild replaces the
 * snapshot only after the new one has been persisted, so a failed rebuild
 * leaves both memory and disk untouched.
 */
class IndexStore {
 public:
  /**
   * @throw ConfigurationError for an invalid chunking policy.
   */
  IndexStore(std::shared_ptr<EmbeddingProvider> embedder,
             std::shared_ptr<IndexRepository> repository,
             IndexStoreOptions options = {},
             std::shared_ptr<CorpusReader> corpus_reader = std::make_shared<CorpusReader>());

  IndexStore(const IndexStore &) = delete;
  IndexStore &operator=(const IndexStore &) = delete;

  /**
   * @brief Chunks, embeds and indexes every document of document_dir, then
   *        persists and publishes the result.
   * @throw CorpusNotFoundError, EmptyCorpusError, EmbeddingError,
   *        DimensionMismatchError, StorageError
   */
  BuildSummary build(const std::filesystem::path &document_dir);

  // Writes the in-memory snapshot to disk again
  void persist();

  // Replaces the in-memory snapshot with the persisted one
  void load();

  bool is_loaded() const;

  // Current snapshot, loading it from disk on first use. Throws
  // IndexNotFoundError when nothing has been built yet.
  std::shared_ptr<const IndexSnapshot> snapshot();

  std::vector<SearchHit> search(const std::vector<float> &query, size_t k);

  size_t size();
  size_t dimension();

  const IndexStoreOptions &options() const {
    return options_;
  }

 private:
  std::shared_ptr<const IndexSnapshot> build_snapshot(const std::filesystem::path &document_dir);
  std::vector<std::vector<float>> embed_all(const std::vector<std::string> &texts);

  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<IndexRepository> repository_;
  std::shared_ptr<CorpusReader> corpus_reader_;
  IndexStoreOptions options_;
  Chunker chunker_;

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const IndexSnapshot> snapshot_;

  // Held for the whole of a rebuild or persist
  std::mutex build_mutex_;
};

}  // namespace ragkb_core

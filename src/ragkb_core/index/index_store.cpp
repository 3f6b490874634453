#include "ragkb_core/index/index_store.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>

#include "ragkb_core/errors.hpp"
#include "ragkb_core/index/faiss_flat_index.hpp"
#include "ragkb_core/index/vector_math.hpp"
#include "ragkb_core/text/utf8_text.hpp"

namespace ragkb_core {

IndexStore::IndexStore(std::shared_ptr<EmbeddingProvider> embedder,
                       std::shared_ptr<IndexRepository> repository,
                       IndexStoreOptions options,
                       std::shared_ptr<CorpusReader> corpus_reader)
    : embedder_(std::move(embedder)),
      repository_(std::move(repository)),
      corpus_reader_(std::move(corpus_reader)),
      options_(options),
      chunker_(options.chunk_size, options.chunk_overlap) {
  if (!embedder_ || !repository_ || !corpus_reader_) {
    throw ConfigurationError("IndexStore requires an embedder, a repository and a corpus reader");
  }
  if (options_.max_stored_chars == 0) {
    throw ConfigurationError("max_stored_chars must be greater than 0");
  }
  if (options_.num_workers == 0) {
    options_.num_workers = 1;
  }
}

BuildSummary IndexStore::build(const std::filesystem::path &document_dir) {
  std::lock_guard<std::mutex> build_lock(build_mutex_);

  std::shared_ptr<const IndexSnapshot> fresh = build_snapshot(document_dir);
  repository_->save(*fresh);

  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = fresh;
  }

  return BuildSummary{
      .entry_count = fresh->size(),
      .dimension = fresh->dimension(),
      .document_count = fresh->documents().size(),
  };
}

std::shared_ptr<const IndexSnapshot> IndexStore::build_snapshot(
    const std::filesystem::path &document_dir) {
  std::vector<std::filesystem::path> paths = corpus_reader_->list_documents(document_dir);

  std::vector<Chunk> chunks;
  std::vector<std::string> texts;
  std::vector<DocumentRecord> documents;

  for (const auto &path : paths) {
    Document document = corpus_reader_->read(path);
    std::vector<std::string> pieces = chunker_.chunk(document.text);
    const std::string source = path.filename().string();

    for (size_t i = 0; i < pieces.size(); ++i) {
      chunks.push_back(Chunk{source, static_cast<int>(i),
                             truncate_code_points(pieces[i], options_.max_stored_chars)});
      // The full chunk is embedded; only the stored display text is truncated
      texts.push_back(std::move(pieces[i]));
    }
    documents.push_back(DocumentRecord{source, document.content_hash, document.file_type,
                                       pieces.size()});
    std::cout << "Chunked " << source << " into " << pieces.size() << " chunk(s)" << std::endl;
  }

  if (texts.empty()) {
    throw EmptyCorpusError("No text chunks found in " + document_dir.string() +
                           ". Add .txt or .md files to it.");
  }

  std::cout << "Embedding " << texts.size() << " chunk(s) with " << embedder_->model_name()
            << std::endl;
  std::vector<std::vector<float>> vectors = embed_all(texts);

  const size_t dimension = vectors.front().size();
  if (dimension == 0) {
    throw EmbeddingError("Embedding provider returned an empty vector");
  }
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != dimension) {
      throw DimensionMismatchError("Chunk " + std::to_string(i) + " embedded to " +
                                   std::to_string(vectors[i].size()) +
                                   " dimensions, expected " + std::to_string(dimension));
    }
    normalize_l2(vectors[i]);
  }

  auto index = std::make_unique<FaissFlatIndex>(dimension);
  index->add(vectors);

  return std::make_shared<const IndexSnapshot>(
      std::move(index), std::move(chunks), std::move(documents), embedder_->model_name(),
      IndexRepository::time_point_to_string(std::chrono::system_clock::now()));
}

std::vector<std::vector<float>> IndexStore::embed_all(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors(texts.size());
  const size_t workers = std::min(options_.num_workers, texts.size());

  if (workers <= 1) {
    for (size_t i = 0; i < texts.size(); ++i) {
      vectors[i] = embedder_->embed(texts[i]);
    }
    return vectors;
  }

  // Worker w fills slots w, w + workers, ... so output order matches input order
  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    futures.push_back(std::async(std::launch::async, [this, &texts, &vectors, w, workers]() {
      for (size_t i = w; i < texts.size(); i += workers) {
        vectors[i] = embedder_->embed(texts[i]);
      }
    }));
  }
  // get() rethrows the first worker failure after every worker has finished
  for (auto &future : futures) {
    future.wait();
  }
  for (auto &future : futures) {
    future.get();
  }
  return vectors;
}

void IndexStore::persist() {
  std::lock_guard<std::mutex> build_lock(build_mutex_);
  std::shared_ptr<const IndexSnapshot> current;
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    current = snapshot_;
  }
  if (!current) {
    throw IndexNotFoundError("No index in memory to persist. Run rebuild first.");
  }
  repository_->save(*current);
}

void IndexStore::load() {
  std::shared_ptr<const IndexSnapshot> loaded = repository_->load();
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = std::move(loaded);
  std::cout << "Loaded index with " << snapshot_->size() << " entries from "
            << repository_->path().string() << std::endl;
}

bool IndexStore::is_loaded() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_ != nullptr;
}

std::shared_ptr<const IndexSnapshot> IndexStore::snapshot() {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  if (!snapshot_) {
    snapshot_ = repository_->load();
    std::cout << "Loaded index with " << snapshot_->size() << " entries from "
              << repository_->path().string() << std::endl;
  }
  return snapshot_;
}

std::vector<SearchHit> IndexStore::search(const std::vector<float> &query, size_t k) {
  return snapshot()->search(query, k);
}

size_t IndexStore::size() {
  return snapshot()->size();
}

size_t IndexStore::dimension() {
  return snapshot()->dimension();
}

}  // namespace ragkb_core

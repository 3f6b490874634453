#include "ragkb_core/index/faiss_flat_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/impl/io.h>
#include <faiss/index_io.h>

#include <algorithm>
#include <string>

#include "ragkb_core/errors.hpp"

namespace ragkb_core {

FaissFlatIndex::FaissFlatIndex(size_t dimension) {
  if (dimension == 0) {
    throw VectorIndexError("Cannot create a vector index of dimension 0");
  }
  index_ = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension));
}

FaissFlatIndex::FaissFlatIndex(std::unique_ptr<faiss::Index> index) : index_(std::move(index)) {}

std::unique_ptr<FaissFlatIndex> FaissFlatIndex::deserialize(const std::vector<char> &bytes) {
  if (bytes.empty()) {
    throw VectorIndexError("Serialized vector index is empty");
  }
  faiss::VectorIOReader reader;
  reader.data.assign(bytes.begin(), bytes.end());

  std::unique_ptr<faiss::Index> index;
  try {
    index.reset(faiss::read_index(&reader));
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to read vector index: " + std::string(e.what()));
  }
  if (!index || index->metric_type != faiss::METRIC_INNER_PRODUCT) {
    throw VectorIndexError("Stored vector index is not an inner-product index");
  }
  return std::unique_ptr<FaissFlatIndex>(new FaissFlatIndex(std::move(index)));
}

size_t FaissFlatIndex::dimension() const {
  return static_cast<size_t>(index_->d);
}

size_t FaissFlatIndex::size() const {
  return static_cast<size_t>(index_->ntotal);
}

void FaissFlatIndex::add(const std::vector<std::vector<float>> &vectors) {
  if (vectors.empty()) {
    return;
  }
  const size_t dim = dimension();
  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(vectors.size() * dim);
  for (const auto &vector : vectors) {
    if (vector.size() != dim) {
      throw DimensionMismatchError("Vector dimension mismatch. Expected " + std::to_string(dim) +
                                   ", got " + std::to_string(vector.size()));
    }
    all_vectors_flat.insert(all_vectors_flat.end(), vector.begin(), vector.end());
  }

  try {
    index_->add(static_cast<faiss::idx_t>(vectors.size()), all_vectors_flat.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to add vectors: " + std::string(e.what()));
  }
}

std::vector<SearchHit> FaissFlatIndex::search(const std::vector<float> &query, size_t k) const {
  if (query.size() != dimension()) {
    throw DimensionMismatchError("Query vector dimension mismatch. Expected " +
                                 std::to_string(dimension()) + ", got " +
                                 std::to_string(query.size()));
  }
  const size_t actual_k = std::min(k, size());
  if (actual_k == 0) {
    return {};
  }

  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  try {
    index_->search(1, query.data(), static_cast<faiss::idx_t>(actual_k), distances.data(),
                   labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Vector search failed: " + std::string(e.what()));
  }

  std::vector<SearchHit> hits;
  hits.reserve(actual_k);
  for (size_t i = 0; i < actual_k; ++i) {
    // faiss pads missing results with -1
    if (labels[i] < 0) {
      continue;
    }
    hits.push_back({distances[i], static_cast<int64_t>(labels[i])});
  }
  return hits;
}

std::vector<char> FaissFlatIndex::serialize() const {
  faiss::VectorIOWriter writer;
  try {
    faiss::write_index(index_.get(), &writer);
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to serialize vector index: " + std::string(e.what()));
  }
  return std::vector<char>(writer.data.begin(), writer.data.end());
}

}  // namespace ragkb_core

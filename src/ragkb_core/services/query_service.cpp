#include "ragkb_core/services/query_service.hpp"

#include <iostream>

#include "ragkb_core/errors.hpp"
#include "ragkb_core/index/vector_math.hpp"

namespace ragkb_core {

QueryService::QueryService(std::shared_ptr<IndexStore> index_store,
                           std::shared_ptr<EmbeddingProvider> embedder,
                           std::shared_ptr<LanguageDetector> language_detector,
                           std::shared_ptr<AnswerSynthesizer> synthesizer)
    : index_store_(std::move(index_store)),
      embedder_(std::move(embedder)),
      language_detector_(std::move(language_detector)),
      synthesizer_(std::move(synthesizer)) {}

QueryResult QueryService::query(const std::string &query, int k) {
  if (query.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw InvalidRequestError("query required");
  }
  if (k <= 0) {
    throw InvalidRequestError("k must be greater than 0, got " + std::to_string(k));
  }

  // Fails with IndexNotFoundError before spending an embedding call
  std::shared_ptr<const IndexSnapshot> snapshot = index_store_->snapshot();

  std::vector<float> query_embedding = embed_query(query);
  std::vector<SearchHit> hits = snapshot->search(query_embedding, static_cast<size_t>(k));

  QueryResult result;
  result.query = query;
  result.detected_language = detect_language(query);
  result.results.reserve(hits.size());
  for (const auto &hit : hits) {
    const Chunk &chunk = snapshot->chunk_at(hit.position);
    result.results.push_back(SearchResult{hit.score, chunk.source, chunk.chunk_index, chunk.text});
  }
  return result;
}

std::string QueryService::synthesize(const QueryResult &result) {
  return synthesizer_->synthesize(result.query, result.results);
}

std::string QueryService::detect_language(const std::string &text) const {
  try {
    return language_detector_->detect(text);
  } catch (const LanguageDetectionError &e) {
    std::cerr << "Language detection failed: " << e.what() << std::endl;
    return "unknown";
  } catch (const std::exception &e) {
    std::cerr << "Language detector error: " << e.what() << std::endl;
    return "unknown";
  }
}

std::vector<float> QueryService::embed_query(const std::string &query) {
  std::vector<float> embedding = embedder_->embed(query);
  normalize_l2(embedding);
  return embedding;
}

}  // namespace ragkb_core

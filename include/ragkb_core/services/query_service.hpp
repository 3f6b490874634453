#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragkb_core/index/index_store.hpp"
#include "ragkb_core/lang/language_detector.hpp"
#include "ragkb_core/llm/answer_synthesizer.hpp"
#include "ragkb_core/llm/embedding_provider.hpp"
#include "ragkb_core/types/search_result.hpp"

namespace ragkb_core {

class QueryService {
 public:
  QueryService(std::shared_ptr<IndexStore> index_store,
               std::shared_ptr<EmbeddingProvider> embedder,
               std::shared_ptr<LanguageDetector> language_detector,
               std::shared_ptr<AnswerSynthesizer> synthesizer);

  // Top-k passages for query, best first. Throws InvalidRequestError for an
  // empty query or k <= 0, IndexNotFoundError when nothing has been built.
  QueryResult query(const std::string &query, int k = 3);

  std::string synthesize(const QueryResult &result);

  // Never fails; "unknown" when the language cannot be told
  std::string detect_language(const std::string &text) const;

 private:
  std::vector<float> embed_query(const std::string &query);

  std::shared_ptr<IndexStore> index_store_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<LanguageDetector> language_detector_;
  std::shared_ptr<AnswerSynthesizer> synthesizer_;
};

}  // namespace ragkb_core

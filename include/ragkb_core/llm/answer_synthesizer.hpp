#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragkb_core/config.hpp"
#include "ragkb_core/types/search_result.hpp"

namespace ragkb_core {

class AnswerSynthesizer {
 public:
  virtual ~AnswerSynthesizer() = default;

  // Writes an answer to query grounded on the ranked passages
  virtual std::string synthesize(const std::string &query,
                                 const std::vector<SearchResult> &results) = 0;
};

// Used when no LLM credential is configured
class CitationOnlySynthesizer : public AnswerSynthesizer {
 public:
  static constexpr const char *FALLBACK_TEXT =
      "LLM synthesis not configured; returning cited passages instead.";

  std::string synthesize(const std::string &query,
                         const std::vector<SearchResult> &results) override;
};

std::shared_ptr<AnswerSynthesizer> make_answer_synthesizer(const Config &config);

}  // namespace ragkb_core

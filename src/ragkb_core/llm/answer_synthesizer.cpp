#include "ragkb_core/llm/answer_synthesizer.hpp"

#include <iostream>

#include "ragkb_core/llm/openai_synthesizer.hpp"

namespace ragkb_core {

std::string CitationOnlySynthesizer::synthesize(const std::string & /*query*/,
                                                const std::vector<SearchResult> & /*results*/) {
  return FALLBACK_TEXT;
}

std::shared_ptr<AnswerSynthesizer> make_answer_synthesizer(const Config &config) {
  if (!config.synthesis_configured()) {
    std::cout << "No OpenAI API key configured, answers will cite passages only" << std::endl;
    return std::make_shared<CitationOnlySynthesizer>();
  }
  return std::make_shared<OpenAiSynthesizer>(config.openai_url, config.openai_api_key,
                                             config.openai_model, config.synthesis_max_tokens);
}

}  // namespace ragkb_core

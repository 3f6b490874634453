#pragma once

#include <string>
#include <vector>

#include "ragkb_core/llm/answer_synthesizer.hpp"

namespace ragkb_core {

/**
 * @class OpenAiSynthesizer
 * @brief Answers a query with an OpenAI chat completion over the retrieved passages.
 *
 * Each call is one blocking HTTPS request. Transport errors, non-200 replies and
 * replies without a message all raise SynthesisError.
 */
class OpenAiSynthesizer : public AnswerSynthesizer {
 public:
  OpenAiSynthesizer(std::string api_url, std::string api_key, std::string model, int max_tokens);

  std::string synthesize(const std::string &query,
                         const std::vector<SearchResult> &results) override;

  static std::string build_prompt(const std::string &query,
                                  const std::vector<SearchResult> &results);

  // Pulls choices[0].message.content out of a chat-completion reply, trimmed
  static std::string parse_completion(const std::string &response_body);

 private:
  std::string post(const std::string &request_body) const;
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);

  std::string api_url_;
  std::string api_key_;
  std::string model_;
  int max_tokens_;
};

}  // namespace ragkb_core

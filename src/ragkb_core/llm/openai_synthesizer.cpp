#include "ragkb_core/llm/openai_synthesizer.hpp"

#include <curl/curl.h>

#include <memory>
#include <nlohmann/json.hpp>

#include "ragkb_core/errors.hpp"

namespace ragkb_core {

namespace {

std::string trim(const std::string &text) {
  const char *whitespace = " \t\r\n";
  const size_t begin = text.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  const size_t end = text.find_last_not_of(whitespace);
  return text.substr(begin, end - begin + 1);
}

}  // namespace

OpenAiSynthesizer::OpenAiSynthesizer(std::string api_url, std::string api_key, std::string model,
                                     int max_tokens)
    : api_url_(std::move(api_url)),
      api_key_(std::move(api_key)),
      model_(std::move(model)),
      max_tokens_(max_tokens) {
  if (api_key_.empty()) {
    throw ConfigurationError("OpenAI synthesis requires an API key");
  }
}

std::string OpenAiSynthesizer::build_prompt(const std::string &query,
                                            const std::vector<SearchResult> &results) {
  std::string prompt =
      "You are a helpful assistant. Use the following source passages to answer the query. "
      "Cite each passage by filename and chunk index in square brackets.\n\n"
      "Query: " +
      query + "\n\nSources:\n";
  for (const auto &result : results) {
    prompt += "[" + result.source + " | chunk " + std::to_string(result.chunk_index) +
              "]: " + result.text + "\n\n";
  }
  prompt +=
      "\nProvide a concise answer in the same language as the query and include citations "
      "like [file.txt|chunk 0].";
  return prompt;
}

std::string OpenAiSynthesizer::synthesize(const std::string &query,
                                          const std::vector<SearchResult> &results) {
  nlohmann::json message = {{"role", "user"}, {"content", build_prompt(query, results)}};
  nlohmann::json request = {
      {"model", model_},
      {"messages", nlohmann::json::array({message})},
      {"max_tokens", max_tokens_},
      {"temperature", 0.0},
  };
  return parse_completion(post(request.dump()));
}

std::string OpenAiSynthesizer::parse_completion(const std::string &response_body) {
  try {
    nlohmann::json response = nlohmann::json::parse(response_body);
    if (!response.contains("choices") || !response["choices"].is_array() ||
        response["choices"].empty()) {
      throw SynthesisError("Chat completion reply has no choices");
    }
    return trim(response["choices"][0].at("message").at("content").get<std::string>());
  } catch (const nlohmann::json::exception &e) {
    throw SynthesisError("Malformed chat completion reply: " + std::string(e.what()));
  }
}

size_t OpenAiSynthesizer::write_callback(void *contents, size_t size, size_t nmemb,
                                         std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string OpenAiSynthesizer::post(const std::string &request_body) const {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw SynthesisError("Failed to initialize CURL");
  }

  const std::string auth_header = "Authorization: Bearer " + api_key_;
  curl_slist *raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
  raw_headers = curl_slist_append(raw_headers, auth_header.c_str());
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers,
                                                                      &curl_slist_free_all);

  std::string response_buffer;
  curl_easy_setopt(curl.get(), CURLOPT_URL, api_url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request_body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw SynthesisError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code != 200) {
    throw SynthesisError("Chat completion failed with status code " +
                         std::to_string(http_code) + ": " + response_buffer);
  }
  return response_buffer;
}

}  // namespace ragkb_core

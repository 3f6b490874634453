#pragma once

#include <string>
#include <vector>

#include "ragkb_core/llm/embedding_provider.hpp"

namespace ragkb_core {

class OllamaClient : public EmbeddingProvider {
 public:
  // Throws EmbeddingError when the server cannot be reached
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> embed(const std::string &text) override;

  std::string model_name() const override {
    return embedding_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;

  // Helper methods
  void setup_server_connection();
};

}  // namespace ragkb_core

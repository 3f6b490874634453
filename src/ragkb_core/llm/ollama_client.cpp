#include "ragkb_core/llm/ollama_client.hpp"

#include "ollama.hpp"
#include "ragkb_core/errors.hpp"

namespace ragkb_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  // ollama-hpp keeps the server URL globally
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw EmbeddingError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaClient::embed(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw EmbeddingError("Response does not contain embeddings field");
    }

    // /api/embed answers with one vector per input
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw EmbeddingError("Embeddings field is not a non-empty array");
    }
    std::vector<float> vector = embeddings[0].is_array()
                                    ? embeddings[0].get<std::vector<float>>()
                                    : embeddings.get<std::vector<float>>();
    if (vector.empty()) {
      throw EmbeddingError("Model " + embedding_model_ + " returned an empty embedding");
    }
    return vector;

  } catch (const ollama::exception &e) {
    throw EmbeddingError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Malformed embedding response: " + std::string(e.what()));
  }
}

}  // namespace ragkb_core

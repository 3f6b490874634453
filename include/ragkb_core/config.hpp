#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "ragkb_core/errors.hpp"

namespace ragkb_core {

class Config {
 public:
  static constexpr const char *DEFAULT_CONFIG_FILE = "ragkbrc.json";

  std::string api_base_url;
  std::string docs_dir;
  std::string index_path;
  std::string ollama_url;
  std::string embedding_model;

  // Chunking policy
  int chunk_size;
  int chunk_overlap;
  int max_stored_chars;

  int default_top_k;
  int num_workers;

  // Answer synthesis; an empty key selects the citations-only fallback
  std::string openai_url;
  std::string openai_model;
  std::string openai_api_key;
  int synthesis_max_tokens;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw ConfigurationError(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    Config config = from_json(json_config);
    config.apply_environment();
    return config;
  }

  // Same as from_file, but a missing file means "all defaults"
  static Config from_file_or_defaults(const std::string &filename) {
    if (std::filesystem::exists(filename)) {
      return from_file(filename);
    }
    std::cout << "Config file '" << filename << "' not found, using defaults" << std::endl;
    Config config = from_json(nlohmann::json::object());
    config.apply_environment();
    return config;
  }

  // Path from RAGKB_CONFIG, falling back to ./ragkbrc.json
  static std::string default_path() {
    const char *env_path = std::getenv("RAGKB_CONFIG");
    return env_path ? std::string(env_path) : std::string(DEFAULT_CONFIG_FILE);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:5000"));
      config.docs_dir = json_config.value("docs_dir", std::string("./docs"));
      config.index_path = json_config.value("index_path", std::string("./data/index.db"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));

      config.chunk_size = json_config.value("chunk_size", 300);
      config.chunk_overlap = json_config.value("chunk_overlap", 50);
      config.max_stored_chars = json_config.value("max_stored_chars", 600);
      config.default_top_k = json_config.value("default_top_k", 3);

      config.openai_url = json_config.value(
          "openai_url", std::string("https://api.openai.com/v1/chat/completions"));
      config.openai_model = json_config.value("openai_model", std::string("gpt-4o-mini"));
      config.openai_api_key = json_config.value("openai_api_key", std::string(""));
      config.synthesis_max_tokens = json_config.value("synthesis_max_tokens", 200);
    } catch (const nlohmann::json::exception &e) {
      throw ConfigurationError(std::string("Invalid config value: ") + e.what());
    }

    // Handle integer with default and basic type safety
    try {
      if (json_config.contains("num_workers")) {
        config.num_workers = json_config.at("num_workers").get<int>();
      } else {
        config.num_workers = 1;
      }
    } catch (const std::exception &) {
      // Fallback to default if wrong type provided
      config.num_workers = 1;
    }

    config.validate();
    return config;
  }

  // OPENAI_API_KEY wins over the file so credentials can stay out of it
  void apply_environment() {
    const char *api_key = std::getenv("OPENAI_API_KEY");
    if (api_key && *api_key) {
      openai_api_key = api_key;
    }
  }

  bool synthesis_configured() const {
    return !openai_api_key.empty();
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw ConfigurationError("api_base_url must be of the form host:port");
    }
    if (docs_dir.empty()) {
      throw ConfigurationError("docs_dir cannot be empty");
    }
    if (index_path.empty()) {
      throw ConfigurationError("index_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw ConfigurationError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw ConfigurationError("embedding_model cannot be empty");
    }
    if (chunk_size <= 0) {
      throw ConfigurationError("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw ConfigurationError("chunk_overlap must be in [0, chunk_size)");
    }
    if (max_stored_chars <= 0) {
      throw ConfigurationError("max_stored_chars must be greater than 0");
    }
    if (default_top_k <= 0) {
      throw ConfigurationError("default_top_k must be greater than 0");
    }
    if (num_workers <= 0) {
      throw ConfigurationError("num_workers must be greater than 0");
    }
    if (synthesis_max_tokens <= 0) {
      throw ConfigurationError("synthesis_max_tokens must be greater than 0");
    }
  }
};

}  // namespace ragkb_core

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "ragkb_api/routes.hpp"
#include "ragkb_api/server.hpp"
#include "ragkb_core/config.hpp"
#include "ragkb_core/index/index_repository.hpp"
#include "ragkb_core/index/index_store.hpp"
#include "ragkb_core/lang/stopword_language_detector.hpp"
#include "ragkb_core/llm/answer_synthesizer.hpp"
#include "ragkb_core/llm/ollama_client.hpp"
#include "ragkb_core/services/query_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main() {
  try {
    ragkb_core::Config config =
        ragkb_core::Config::from_file_or_defaults(ragkb_core::Config::default_path());

    std::cout << "Starting ragkb API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Docs Dir: " << config.docs_dir << std::endl;
    std::cout << "Index Path: " << config.index_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Answer Synthesis: " << (config.synthesis_configured() ? config.openai_model : "disabled")
              << std::endl;

    // --- 1. WIRE CORE COMPONENTS ---
    auto ollama_client =
        std::make_shared<ragkb_core::OllamaClient>(config.ollama_url, config.embedding_model);
    auto repository = std::make_shared<ragkb_core::IndexRepository>(config.index_path);
    auto index_store = std::make_shared<ragkb_core::IndexStore>(
        ollama_client, repository, ragkb_core::IndexStoreOptions::from_config(config));
    auto query_service = std::make_shared<ragkb_core::QueryService>(
        index_store, ollama_client, std::make_shared<ragkb_core::StopwordLanguageDetector>(),
        ragkb_core::make_answer_synthesizer(config));

    try {
      index_store->load();
    } catch (const ragkb_core::IndexNotFoundError &e) {
      std::cout << "No index loaded yet (" << e.what() << ")" << std::endl;
    }

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    ragkb_api::Server server(host, port, static_cast<unsigned int>(config.num_workers));
    ragkb_api::Routes routes(index_store, query_service, config.docs_dir, config.default_top_k);
    routes.register_routes(server);

    // --- 2. START SERVING ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/1] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}

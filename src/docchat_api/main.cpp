#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "docchat_api/config.hpp"
#include "docchat_api/routes.hpp"
#include "docchat_api/server.hpp"
#include "docchat_core/conversation/sqlite_conversation_store.hpp"
#include "docchat_core/db/database_manager.hpp"
#include "docchat_core/db/document_store.hpp"
#include "docchat_core/db/task_queue_repo.hpp"
#include "docchat_core/extractors/text_extractor_factory.hpp"
#include "docchat_core/llm/ollama_client.hpp"
#include "docchat_core/pipeline/rag_orchestrator.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char** argv) {
  try {
    std::string config_path = argc > 1 ? argv[1] : "docchatrc.json";
    docchat_api::Config config = docchat_api::Config::from_file(config_path);

    std::cout << "Starting docchat API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Metadata DB Path: " << config.metadata_db_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Generation Model: " << config.generation_model << std::endl;
    std::cout << "Vector Backend: " << docchat_core::to_string(config.pipeline.vector_backend)
              << std::endl;

    std::filesystem::path db_path(config.metadata_db_path);
    if (db_path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(db_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Warning: Failed to create data directory: " << ec.message() << std::endl;
      }
    }

    // --- 1. CORE COMPONENTS ---
    auto ollama_client = std::make_shared<docchat_core::OllamaClient>(
        config.ollama_url, config.embedding_model, config.generation_model,
        config.generation_timeout_seconds);
    auto& db_manager = docchat_core::DatabaseManager::get_instance();
    // One connection per worker plus headroom for request handlers
    db_manager.initialize(db_path, config.num_workers + 2);

    docchat_core::AppContext context;
    context.pipeline = config.pipeline;
    context.document_store = std::make_shared<docchat_core::DocumentStore>(db_manager);
    context.task_queue = std::make_shared<docchat_core::TaskQueueRepo>(db_manager);
    context.conversation_store =
        std::make_shared<docchat_core::SqliteConversationStore>(db_manager);
    context.extractor_factory = std::make_shared<docchat_core::TextExtractorFactory>();
    context.embedder = ollama_client;
    context.generator = ollama_client;
    context.num_workers = static_cast<size_t>(config.num_workers);
    context.worker_poll_interval = std::chrono::milliseconds(config.worker_poll_interval_ms);

    if (!ollama_client->is_server_available()) {
      std::cerr << "Warning: Ollama server at " << config.ollama_url
                << " is not reachable; ingestion and questions will fail until it is."
                << std::endl;
    }

    auto orchestrator = std::make_shared<docchat_core::RagOrchestrator>(std::move(context));

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    docchat_api::Server server(host, port);
    docchat_api::Routes routes(orchestrator);
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    orchestrator->init();
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
    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Stopping workers and flushing the vector index..." << std::endl;
    orchestrator->shutdown();

    std::cout << "[3/3] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}

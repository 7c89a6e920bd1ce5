#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docchat_core/cancellation.hpp"
#include "docchat_core/conversation/conversation_codec.hpp"
#include "docchat_core/db/models/task_progress_dto.hpp"
#include "docchat_core/pipeline/ingestion_pipeline.hpp"
#include "docchat_core/pipeline_config.hpp"
#include "docchat_core/types/conversation.hpp"
#include "docchat_core/types/document.hpp"

namespace docchat_core {

class ConversationManager;
class ConversationStore;
class DocumentLocks;
class DocumentStore;
class Embedder;
class EmbeddingGateway;
class Generator;
class QueryPipeline;
class Retriever;
class ServiceProvider;
class TaskQueueRepo;
class TextExtractorFactory;
class VectorIndex;

namespace async {
class WorkerPool;
}

/**
 * @brief The collaborators an orchestrator is built from.
 *
 * Stores, model services and the extractor factory are required. A null
 * vector_index is filled in from pipeline.vector_backend at init().
 * num_workers = 0 leaves queued ingestion to the caller (ingest_now or
 * process_pending_tasks).
 */
struct AppContext {
  PipelineConfig pipeline;
  std::shared_ptr<DocumentStore> document_store;
  std::shared_ptr<TaskQueueRepo> task_queue;
  std::shared_ptr<ConversationStore> conversation_store;
  std::shared_ptr<TextExtractorFactory> extractor_factory;
  std::shared_ptr<Embedder> embedder;
  std::shared_ptr<Generator> generator;
  std::shared_ptr<VectorIndex> vector_index;
  size_t num_workers = 0;
  std::chrono::milliseconds worker_poll_interval{1000};
};

struct SubmitResult {
  long long document_id = 0;
  // Absent when identical content was already indexed
  std::optional<long long> task_id;
  bool deduplicated = false;
};

/**
 * @class RagOrchestrator
 * @brief Owns the document lifecycle and drives ingestion and question answering.
 *
 * Lifecycle is explicit: init() validates the configuration, wires the
 * pipelines and starts the worker pool; shutdown() stops the workers and
 * flushes the index. Every other operation requires a prior init().
 */
class RagOrchestrator {
 public:
  explicit RagOrchestrator(AppContext context);
  ~RagOrchestrator();

  RagOrchestrator(const RagOrchestrator&) = delete;
  RagOrchestrator& operator=(const RagOrchestrator&) = delete;

  // Throws InvalidConfigError.
  void init();
  void shutdown();
  bool is_running() const {
    return initialized_;
  }

  // --- Documents ---
  SubmitResult submit_document(const std::string& filename, const std::string& bytes);

  // Starts a new revision of an INDEXED or FAILED document. Returns the queued task id.
  long long reingest_document(long long document_id);

  IngestionOutcome ingest_now(long long document_id,
                              const CancellationToken& token = CancellationToken());

  // Runs queued tasks on the calling thread until the queue is empty. Returns how many ran.
  size_t process_pending_tasks();

  bool cancel_ingestion(long long document_id);
  bool remove_document(long long document_id);

  // Throws DocumentNotFoundError.
  Document get_document(long long document_id);
  std::vector<Document> list_documents();
  std::optional<TaskProgressDTO> get_task_progress(long long task_id);

  // --- Conversations ---
  Conversation create_conversation();

  // Records the question and the assistant's answer together. Returns the assistant turn.
  Turn ask(const std::string& conversation_id,
           const std::string& question,
           const CancellationToken& token = CancellationToken());

  // Records only the assistant turn.
  Turn answer(const std::string& conversation_id,
              const std::string& question,
              const CancellationToken& token = CancellationToken());

  std::vector<Turn> history(const std::string& conversation_id);
  Conversation get_conversation(const std::string& conversation_id);
  std::string export_conversation(const std::string& conversation_id, ExportFormat format);
  Conversation import_conversation(const std::string& bytes);

  std::shared_ptr<VectorIndex> vector_index() const {
    return context_.vector_index;
  }

 private:
  void require_running() const;

  AppContext context_;
  std::atomic<bool> initialized_{false};

  std::shared_ptr<DocumentLocks> locks_;
  std::shared_ptr<CancellationRegistry> cancellations_;
  std::shared_ptr<EmbeddingGateway> gateway_;
  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<IngestionPipeline> ingestion_;
  std::shared_ptr<QueryPipeline> query_;
  std::shared_ptr<ConversationManager> conversations_;
  std::shared_ptr<ServiceProvider> services_;
  std::unique_ptr<async::WorkerPool> worker_pool_;
};

}  // namespace docchat_core

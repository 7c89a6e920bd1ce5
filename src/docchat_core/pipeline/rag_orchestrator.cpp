#include "docchat_core/pipeline/rag_orchestrator.hpp"

#include <iostream>

#include "docchat_core/async/service_provider.hpp"
#include "docchat_core/async/worker.hpp"
#include "docchat_core/async/worker_pool.hpp"
#include "docchat_core/conversation/conversation_manager.hpp"
#include "docchat_core/db/document_store.hpp"
#include "docchat_core/db/task_queue_repo.hpp"
#include "docchat_core/errors.hpp"
#include "docchat_core/extractors/text_extractor.hpp"
#include "docchat_core/extractors/text_extractor_factory.hpp"
#include "docchat_core/index/vector_index.hpp"
#include "docchat_core/index/vector_index_factory.hpp"
#include "docchat_core/llm/embedding_gateway.hpp"
#include "docchat_core/llm/model_services.hpp"
#include "docchat_core/pipeline/document_locks.hpp"
#include "docchat_core/pipeline/query_pipeline.hpp"
#include "docchat_core/retrieval/retriever.hpp"

namespace docchat_core {

RagOrchestrator::RagOrchestrator(AppContext context) : context_(std::move(context)) {}

RagOrchestrator::~RagOrchestrator() {
  shutdown();
}

void RagOrchestrator::init() {
  if (initialized_) {
    return;
  }
  context_.pipeline.validate();
  if (!context_.document_store || !context_.task_queue || !context_.conversation_store ||
      !context_.extractor_factory || !context_.embedder || !context_.generator) {
    throw InvalidConfigError("orchestrator is missing a required service");
  }

  if (!context_.vector_index) {
    context_.vector_index = VectorIndexFactory::create_index(context_.pipeline);
  }
  if (context_.vector_index->dimension() != context_.pipeline.embedding_dimension) {
    throw InvalidConfigError("vector index dimension " +
                             std::to_string(context_.vector_index->dimension()) +
                             " does not match embedding_dimension " +
                             std::to_string(context_.pipeline.embedding_dimension));
  }

  locks_ = std::make_shared<DocumentLocks>();
  cancellations_ = std::make_shared<CancellationRegistry>();
  gateway_ = std::make_shared<EmbeddingGateway>(context_.embedder,
                                                context_.pipeline.embedding_dimension,
                                                context_.pipeline.embedding_batch_size);
  retriever_ =
      std::make_shared<Retriever>(context_.vector_index, context_.document_store, locks_);
  ingestion_ = std::make_shared<IngestionPipeline>(context_.document_store,
                                                   context_.extractor_factory, gateway_,
                                                   context_.vector_index, locks_,
                                                   context_.pipeline);
  query_ = std::make_shared<QueryPipeline>(gateway_, retriever_, context_.generator,
                                           context_.pipeline);
  conversations_ = std::make_shared<ConversationManager>(context_.conversation_store);
  services_ = std::make_shared<ServiceProvider>(context_.task_queue, context_.document_store,
                                                ingestion_, cancellations_);

  const int requeued = context_.task_queue->requeue_stale_tasks();
  if (requeued > 0) {
    std::cout << "RagOrchestrator: requeued " << requeued << " interrupted task(s)" << std::endl;
  }

  if (context_.num_workers > 0) {
    worker_pool_ = std::make_unique<async::WorkerPool>(context_.num_workers, services_,
                                                       context_.worker_poll_interval);
    worker_pool_->start();
  }
  initialized_ = true;
  std::cout << "RagOrchestrator: ready (backend " << to_string(context_.pipeline.vector_backend)
            << ", metric " << to_string(context_.pipeline.similarity_metric) << ", "
            << context_.vector_index->size() << " vectors)" << std::endl;
}

void RagOrchestrator::shutdown() {
  // Cleared first so request threads are turned away while workers stop.
  if (!initialized_.exchange(false)) {
    return;
  }
  if (worker_pool_) {
    worker_pool_->stop();
    worker_pool_.reset();
  }
  try {
    context_.vector_index->flush();
  } catch (const VectorIndexError& e) {
    std::cerr << "RagOrchestrator: index flush on shutdown failed: " << e.what() << std::endl;
  }
  std::cout << "RagOrchestrator: shut down" << std::endl;
}

void RagOrchestrator::require_running() const {
  if (!initialized_) {
    throw std::logic_error("RagOrchestrator used before init()");
  }
}

SubmitResult RagOrchestrator::submit_document(const std::string& filename,
                                              const std::string& bytes) {
  require_running();
  const std::string content_hash = TextExtractor::compute_content_hash(bytes);
  if (auto existing = context_.document_store->find_indexed_by_hash(content_hash)) {
    std::cout << "RagOrchestrator: '" << filename << "' matches indexed document " << *existing
              << ", not re-ingesting" << std::endl;
    return SubmitResult{*existing, std::nullopt, true};
  }

  const long long document_id =
      context_.document_store->create_document(filename, content_hash, bytes);
  const long long task_id = context_.task_queue->enqueue_ingest_document(document_id);
  std::cout << "RagOrchestrator: queued document " << document_id << " ('" << filename
            << "') as task " << task_id << std::endl;
  return SubmitResult{document_id, task_id, false};
}

long long RagOrchestrator::reingest_document(long long document_id) {
  require_running();
  {
    auto lock = locks_->lock_exclusive(document_id);
    context_.document_store->start_new_revision(document_id);
    context_.vector_index->remove_document(document_id);
  }
  const long long task_id = context_.task_queue->enqueue_ingest_document(document_id);
  std::cout << "RagOrchestrator: re-ingesting document " << document_id << " as task " << task_id
            << std::endl;
  return task_id;
}

IngestionOutcome RagOrchestrator::ingest_now(long long document_id,
                                             const CancellationToken& token) {
  require_running();
  CancellationToken registered = cancellations_->acquire(document_id, token);
  try {
    IngestionOutcome outcome = ingestion_->run(document_id, registered);
    cancellations_->release(document_id);
    return outcome;
  } catch (const std::exception&) {
    cancellations_->release(document_id);
    throw;
  }
}

size_t RagOrchestrator::process_pending_tasks() {
  require_running();
  async::Worker worker(-1, services_);
  size_t ran = 0;
  while (worker.run_one_task()) {
    ++ran;
  }
  return ran;
}

bool RagOrchestrator::cancel_ingestion(long long document_id) {
  require_running();
  const bool cancelled = cancellations_->cancel(document_id);
  if (cancelled) {
    std::cout << "RagOrchestrator: cancellation requested for document " << document_id
              << std::endl;
  }
  return cancelled;
}

bool RagOrchestrator::remove_document(long long document_id) {
  require_running();
  cancellations_->cancel(document_id);
  bool removed = false;
  {
    auto lock = locks_->lock_exclusive(document_id);
    context_.vector_index->remove_document(document_id);
    removed = context_.document_store->delete_document(document_id);
  }
  locks_->forget(document_id);
  if (removed) {
    try {
      context_.vector_index->flush();
    } catch (const VectorIndexError& e) {
      std::cerr << "RagOrchestrator: index flush after removing document " << document_id
                << " failed: " << e.what() << std::endl;
    }
  }
  return removed;
}

Document RagOrchestrator::get_document(long long document_id) {
  require_running();
  auto document = context_.document_store->get_document(document_id);
  if (!document) {
    throw DocumentNotFoundError(document_id);
  }
  return *document;
}

std::vector<Document> RagOrchestrator::list_documents() {
  require_running();
  return context_.document_store->list_documents();
}

std::optional<TaskProgressDTO> RagOrchestrator::get_task_progress(long long task_id) {
  require_running();
  return context_.task_queue->get_task_progress(task_id);
}

Conversation RagOrchestrator::create_conversation() {
  require_running();
  return conversations_->create_conversation();
}

Turn RagOrchestrator::ask(const std::string& conversation_id,
                          const std::string& question,
                          const CancellationToken& token) {
  require_running();
  if (!context_.conversation_store->exists(conversation_id)) {
    throw ConversationNotFoundError(conversation_id);
  }

  Turn assistant = query_->run(question, token);

  Turn user;
  user.role = TurnRole::USER;
  user.text = question;
  std::vector<Turn> turns;
  turns.push_back(std::move(user));
  turns.push_back(std::move(assistant));
  return conversations_->append_all(conversation_id, std::move(turns)).back();
}

Turn RagOrchestrator::answer(const std::string& conversation_id,
                             const std::string& question,
                             const CancellationToken& token) {
  require_running();
  if (!context_.conversation_store->exists(conversation_id)) {
    throw ConversationNotFoundError(conversation_id);
  }
  return conversations_->append(conversation_id, query_->run(question, token));
}

std::vector<Turn> RagOrchestrator::history(const std::string& conversation_id) {
  require_running();
  return conversations_->history(conversation_id);
}

Conversation RagOrchestrator::get_conversation(const std::string& conversation_id) {
  require_running();
  return conversations_->get_conversation(conversation_id);
}

std::string RagOrchestrator::export_conversation(const std::string& conversation_id,
                                                 ExportFormat format) {
  require_running();
  return conversations_->export_conversation(conversation_id, format);
}

Conversation RagOrchestrator::import_conversation(const std::string& bytes) {
  require_running();
  return conversations_->import_conversation(bytes);
}

}  // namespace docchat_core

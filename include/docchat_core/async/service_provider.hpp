#pragma once

#include <memory>

namespace docchat_core {
class CancellationRegistry;
class DocumentStore;
class IngestionPipeline;
class TaskQueueRepo;
}  // namespace docchat_core

namespace docchat_core {

// Everything a background task may touch, shared with the orchestrator.
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<TaskQueueRepo> repo,
                  std::shared_ptr<DocumentStore> store,
                  std::shared_ptr<IngestionPipeline> pipeline,
                  std::shared_ptr<CancellationRegistry> cancellations)
      : task_repo_(std::move(repo)),
        document_store_(std::move(store)),
        ingestion_pipeline_(std::move(pipeline)),
        cancellations_(std::move(cancellations)) {}

  TaskQueueRepo& get_task_queue_repo() {
    return *task_repo_;
  }
  DocumentStore& get_document_store() {
    return *document_store_;
  }
  IngestionPipeline& get_ingestion_pipeline() {
    return *ingestion_pipeline_;
  }
  CancellationRegistry& get_cancellations() {
    return *cancellations_;
  }

 private:
  std::shared_ptr<TaskQueueRepo> task_repo_;
  std::shared_ptr<DocumentStore> document_store_;
  std::shared_ptr<IngestionPipeline> ingestion_pipeline_;
  std::shared_ptr<CancellationRegistry> cancellations_;
};

}  // namespace docchat_core

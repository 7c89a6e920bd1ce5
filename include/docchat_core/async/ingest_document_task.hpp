#pragma once

#include "docchat_core/async/ITask.hpp"

namespace docchat_core {

class IngestionFailedError : public PipelineError {
 public:
  IngestionFailedError(long long document_id, const std::string& reason)
      : PipelineError("Ingestion of document " + std::to_string(document_id) +
                      " failed: " + reason) {}
};

class IngestDocumentTask : public ITask {
 public:
  IngestDocumentTask(long long id,
                     TaskStatus status,
                     std::chrono::system_clock::time_point created_at,
                     std::optional<std::string> error_message,
                     long long document_id);

  // A document that is no longer UPLOADED (already ingested or removed) is skipped.
  void execute(ServiceProvider& services, const ProgressUpdater& on_progress) override;
  const char* get_type() const override {
    return task_type::INGEST_DOCUMENT;
  }

  long long get_document_id() const {
    return document_id_;
  }

 private:
  long long document_id_;
};

}  // namespace docchat_core

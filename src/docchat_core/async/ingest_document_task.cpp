#include "docchat_core/async/ingest_document_task.hpp"

#include <iostream>

#include "docchat_core/async/service_provider.hpp"
#include "docchat_core/cancellation.hpp"
#include "docchat_core/db/document_store.hpp"

namespace docchat_core {

namespace {

// Releases the document's cancellation slot however the task ends.
class CancellationLease {
 public:
  CancellationLease(CancellationRegistry& registry, long long document_id)
      : registry_(registry), document_id_(document_id), token_(registry.acquire(document_id)) {}
  ~CancellationLease() {
    registry_.release(document_id_);
  }

  CancellationLease(const CancellationLease&) = delete;
  CancellationLease& operator=(const CancellationLease&) = delete;

  const CancellationToken& token() const {
    return token_;
  }

 private:
  CancellationRegistry& registry_;
  long long document_id_;
  CancellationToken token_;
};

}  // namespace

IngestDocumentTask::IngestDocumentTask(long long id,
                                       TaskStatus status,
                                       std::chrono::system_clock::time_point created_at,
                                       std::optional<std::string> error_message,
                                       long long document_id)
    : ITask(id, status, created_at, std::move(error_message)), document_id_(document_id) {}

void IngestDocumentTask::execute(ServiceProvider& services, const ProgressUpdater& on_progress) {
  on_progress(0.0f, "Waiting for document...");

  auto status = services.get_document_store().get_status(document_id_);
  if (!status) {
    on_progress(1.0f, "Document no longer exists.");
    std::cout << "IngestDocumentTask [" << id_ << "] document " << document_id_
              << " was removed, skipping" << std::endl;
    return;
  }
  if (*status != DocumentStatus::UPLOADED) {
    on_progress(1.0f, "Document already " + to_string(*status) + ".");
    std::cout << "IngestDocumentTask [" << id_ << "] document " << document_id_ << " is "
              << to_string(*status) << ", skipping" << std::endl;
    return;
  }

  CancellationLease lease(services.get_cancellations(), document_id_);
  IngestionOutcome outcome =
      services.get_ingestion_pipeline().run(document_id_, lease.token(), on_progress);
  if (outcome.status == DocumentStatus::FAILED) {
    throw IngestionFailedError(document_id_, outcome.failure_reason.value_or("unknown"));
  }
}

}  // namespace docchat_core

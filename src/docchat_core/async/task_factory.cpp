#include "docchat_core/async/task_factory.hpp"

#include <stdexcept>

#include "docchat_core/async/ingest_document_task.hpp"

namespace docchat_core {

ITaskPtr TaskFactory::create_task(const TaskDTO& record) {
  if (record.task_type == task_type::INGEST_DOCUMENT) {
    if (!record.target_document_id) {
      throw std::invalid_argument("INGEST_DOCUMENT task is missing required target_document_id.");
    }
    return std::make_unique<IngestDocumentTask>(record.id, record.status, record.created_at,
                                                record.error_message, *record.target_document_id);
  }

  throw std::invalid_argument("Unknown task type: " + record.task_type);
}

}  // namespace docchat_core

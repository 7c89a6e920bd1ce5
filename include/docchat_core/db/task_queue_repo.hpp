#pragma once

#include <optional>
#include <string>
#include <vector>

#include "docchat_core/db/database_manager.hpp"
#include "docchat_core/db/models/task_dto.hpp"
#include "docchat_core/db/models/task_progress_dto.hpp"

namespace docchat_core {

class TaskQueueRepoError : public std::exception {
 public:
  explicit TaskQueueRepoError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Persisted work queue polled by the worker pool.
class TaskQueueRepo {
 public:
  explicit TaskQueueRepo(DatabaseManager& db_manager);
  virtual ~TaskQueueRepo() = default;

  long long create_task(const std::string& task_type,
                        std::optional<long long> target_document_id,
                        int priority = 10);
  long long enqueue_ingest_document(long long document_id, int priority = 10);

  // Claims the oldest highest-priority PENDING task inside a BEGIN IMMEDIATE transaction.
  std::optional<TaskDTO> fetch_and_claim_next_task();

  std::optional<TaskDTO> get_task(long long task_id);
  void update_task_status(long long task_id, TaskStatus new_status);
  void mark_task_as_failed(long long task_id, const std::string& error_message);
  std::vector<TaskDTO> get_tasks_by_status(TaskStatus status);

  // Requeues tasks left PROCESSING by a previous run. Returns how many were reset.
  int requeue_stale_tasks();
  void clear_completed_tasks(int older_than_days = 7);

  void upsert_task_progress(long long task_id, float percent, const std::string& message);
  std::optional<TaskProgressDTO> get_task_progress(long long task_id);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace docchat_core

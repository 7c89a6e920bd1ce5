#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "docchat_core/db/models/task_dto.hpp"
#include "docchat_core/pipeline/ingestion_pipeline.hpp"

namespace docchat_core {
class ServiceProvider;
}

namespace docchat_core {

// A unit of background work rebuilt from a task_queue row.
class ITask {
 public:
  ITask(long long id,
        TaskStatus status,
        std::chrono::system_clock::time_point created_at,
        std::optional<std::string> error_message)
      : id_(id), status_(status), created_at_(created_at), error_message_(error_message) {}

  virtual ~ITask() = default;

  // Throws on failure; the worker records the message on the task.
  virtual void execute(ServiceProvider& services, const ProgressUpdater& on_progress) = 0;

  virtual const char* get_type() const = 0;

  long long get_id() const {
    return id_;
  }
  TaskStatus get_status() const {
    return status_;
  }

 protected:
  long long id_;
  TaskStatus status_;
  std::chrono::system_clock::time_point created_at_;
  std::optional<std::string> error_message_;
};

using ITaskPtr = std::unique_ptr<ITask>;

}  // namespace docchat_core

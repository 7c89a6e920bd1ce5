#pragma once

#include "docchat_core/async/ITask.hpp"

namespace docchat_core {

class TaskFactory {
 public:
  // Throws std::invalid_argument for an unknown type or a row missing its arguments.
  static ITaskPtr create_task(const TaskDTO& record);
};

}  // namespace docchat_core

#pragma once

#include <string>

namespace docchat_core {

struct TaskProgressDTO {
  long long task_id = 0;
  float progress_percent = 0.0f;
  std::string status_message;
  std::string updated_at;
};

}  // namespace docchat_core

#pragma once

#include <memory>

#include "docchat_core/index/vector_index.hpp"
#include "docchat_core/pipeline_config.hpp"

namespace docchat_core {

class VectorIndexFactory {
 public:
  // Builds the backend named by config.vector_backend with the configured dimension and metric.
  static std::shared_ptr<VectorIndex> create_index(const PipelineConfig& config);
};

}  // namespace docchat_core

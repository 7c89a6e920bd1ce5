#include "docchat_core/index/vector_index_factory.hpp"

#include "docchat_core/index/faiss_vector_index.hpp"
#include "docchat_core/index/flat_vector_index.hpp"

namespace docchat_core {

std::shared_ptr<VectorIndex> VectorIndexFactory::create_index(const PipelineConfig& config) {
  switch (config.vector_backend) {
    case VectorBackend::FAISS:
      return std::make_shared<FaissVectorIndex>(config.embedding_dimension,
                                                config.similarity_metric,
                                                config.vector_index_path);
    case VectorBackend::MEMORY:
      return std::make_shared<FlatVectorIndex>(config.embedding_dimension,
                                               config.similarity_metric);
  }
  throw InvalidConfigError("unsupported vector_backend '" + to_string(config.vector_backend) + "'");
}

}  // namespace docchat_core

#include "docchat_core/pipeline_config.hpp"

#include "docchat_core/errors.hpp"

namespace docchat_core {

std::string to_string(SimilarityMetric metric) {
  switch (metric) {
    case SimilarityMetric::COSINE:
      return "cosine";
    case SimilarityMetric::INVERSE_DISTANCE:
      return "inverse_distance";
  }
  return "cosine";
}

SimilarityMetric similarity_metric_from_string(const std::string& str) {
  if (str == "cosine")
    return SimilarityMetric::COSINE;
  if (str == "inverse_distance")
    return SimilarityMetric::INVERSE_DISTANCE;
  throw InvalidConfigError("unknown similarity_metric '" + str + "'");
}

std::string to_string(VectorBackend backend) {
  switch (backend) {
    case VectorBackend::FAISS:
      return "faiss";
    case VectorBackend::MEMORY:
      return "memory";
  }
  return "faiss";
}

VectorBackend vector_backend_from_string(const std::string& str) {
  if (str == "faiss")
    return VectorBackend::FAISS;
  if (str == "memory")
    return VectorBackend::MEMORY;
  throw InvalidConfigError("unknown vector_backend '" + str + "'");
}

void PipelineConfig::validate() const {
  if (chunk_size == 0) {
    throw InvalidConfigError("chunk_size must be greater than 0");
  }
  if (chunk_overlap >= chunk_size) {
    throw InvalidConfigError("chunk_overlap (" + std::to_string(chunk_overlap) +
                             ") must be smaller than chunk_size (" + std::to_string(chunk_size) +
                             ")");
  }
  if (retrieval_k <= 0) {
    throw InvalidConfigError("retrieval_k must be greater than 0");
  }
  if (score_threshold < -1.0f || score_threshold > 1.0f) {
    throw InvalidConfigError("score_threshold must be within [-1, 1]");
  }
  if (context_token_budget == 0) {
    throw InvalidConfigError("context_token_budget must be greater than 0");
  }
  if (embedding_batch_size == 0) {
    throw InvalidConfigError("embedding_batch_size must be greater than 0");
  }
  if (embedding_dimension == 0) {
    throw InvalidConfigError("embedding_dimension must be greater than 0");
  }
  if (retry_max_attempts < 1) {
    throw InvalidConfigError("retry_max_attempts must be at least 1");
  }
  if (retry_base_delay_ms < 0) {
    throw InvalidConfigError("retry_base_delay_ms cannot be negative");
  }
  if (retry_jitter < 0.0 || retry_jitter > 1.0) {
    throw InvalidConfigError("retry_jitter must be within [0, 1]");
  }
  if (generation_retry_attempts < 1) {
    throw InvalidConfigError("generation_retry_attempts must be at least 1");
  }
}

}  // namespace docchat_core

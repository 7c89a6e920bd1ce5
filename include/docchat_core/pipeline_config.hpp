#pragma once

#include <cstddef>
#include <string>

namespace docchat_core {

enum class SimilarityMetric { COSINE, INVERSE_DISTANCE };
enum class VectorBackend { FAISS, MEMORY };

std::string to_string(SimilarityMetric metric);
SimilarityMetric similarity_metric_from_string(const std::string& str);
std::string to_string(VectorBackend backend);
VectorBackend vector_backend_from_string(const std::string& str);

// Knobs consumed by the ingestion and query pipelines. Defaults follow the
// extractor heuristics: 384 tokens per chunk with a 50 token overlap at 3.5
// characters per token.
struct PipelineConfig {
  size_t chunk_size = 1344;
  size_t chunk_overlap = 175;

  int retrieval_k = 5;
  float score_threshold = 0.2f;
  size_t context_token_budget = 2048;

  size_t embedding_batch_size = 32;
  size_t embedding_dimension = 1024;

  int retry_max_attempts = 3;
  int retry_base_delay_ms = 200;
  double retry_jitter = 0.1;
  int generation_retry_attempts = 1;

  VectorBackend vector_backend = VectorBackend::FAISS;
  SimilarityMetric similarity_metric = SimilarityMetric::COSINE;
  // Empty keeps the index in memory only.
  std::string vector_index_path;

  // Throws InvalidConfigError describing the first invalid combination.
  void validate() const;
};

}  // namespace docchat_core

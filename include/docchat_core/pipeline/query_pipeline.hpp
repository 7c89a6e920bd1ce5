#pragma once

#include <memory>
#include <string>

#include "docchat_core/cancellation.hpp"
#include "docchat_core/pipeline_config.hpp"
#include "docchat_core/retry_policy.hpp"
#include "docchat_core/types/conversation.hpp"

namespace docchat_core {

class EmbeddingGateway;
class Generator;
class Retriever;

/**
 * @class QueryPipeline
 * @brief Question in, assistant turn out: embed, retrieve, assemble, generate.
 *
 * Model failures do not throw. They come back as a failed assistant turn
 * with empty text and a reason of "ModelUnavailable", "DimensionMismatch",
 * "Unavailable" or "Timeout". Cancellation throws OperationCancelledError and
 * any answer produced after it is discarded. The returned turn is not stored.
 */
class QueryPipeline {
 public:
  QueryPipeline(std::shared_ptr<EmbeddingGateway> gateway,
                std::shared_ptr<Retriever> retriever,
                std::shared_ptr<Generator> generator,
                const PipelineConfig& config);

  Turn run(const std::string& question, const CancellationToken& token);

 private:
  static Turn failed_turn(const std::string& reason);

  std::shared_ptr<EmbeddingGateway> gateway_;
  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<Generator> generator_;
  int retrieval_k_;
  float score_threshold_;
  size_t context_token_budget_;
  RetryPolicy embedding_retry_;
  RetryPolicy generation_retry_;
};

}  // namespace docchat_core

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docchat_core/cancellation.hpp"
#include "docchat_core/llm/model_services.hpp"

namespace docchat_core {

/**
 * @class EmbeddingGateway
 * @brief Batches text through an Embedder and enforces the index dimensionality.
 *
 * Input is cut into sub-batches of at most batch_size strings, one external
 * call each. Output preserves input order. Any vector whose width differs
 * from the configured dimension raises DimensionMismatchError; an embedder
 * that cannot be reached raises ModelUnavailableError.
 */
class EmbeddingGateway {
 public:
  EmbeddingGateway(std::shared_ptr<Embedder> embedder, size_t dimension, size_t batch_size);

  std::vector<std::vector<float>> embed(const std::vector<std::string>& texts,
                                        const CancellationToken& token = CancellationToken());

  std::vector<float> embed_query(const std::string& text,
                                 const CancellationToken& token = CancellationToken());

  size_t dimension() const {
    return dimension_;
  }
  size_t batch_size() const {
    return batch_size_;
  }

 private:
  std::vector<std::vector<float>> embed_one_batch(const std::vector<std::string>& batch);
  void validate_dimension(const std::vector<float>& vector) const;

  std::shared_ptr<Embedder> embedder_;
  size_t dimension_;
  size_t batch_size_;
};

}  // namespace docchat_core

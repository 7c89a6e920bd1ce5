#include "docchat_core/llm/embedding_gateway.hpp"

#include <algorithm>

#include "docchat_core/errors.hpp"

namespace docchat_core {

EmbeddingGateway::EmbeddingGateway(std::shared_ptr<Embedder> embedder,
                                   size_t dimension,
                                   size_t batch_size)
    : embedder_(std::move(embedder)), dimension_(dimension), batch_size_(batch_size) {
  if (!embedder_) {
    throw InvalidConfigError("embedding gateway requires an embedder");
  }
  if (dimension_ == 0) {
    throw InvalidConfigError("embedding dimension must be greater than 0");
  }
  if (batch_size_ == 0) {
    throw InvalidConfigError("embedding batch size must be greater than 0");
  }
}

std::vector<std::vector<float>> EmbeddingGateway::embed(const std::vector<std::string>& texts,
                                                        const CancellationToken& token) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());

  for (size_t start = 0; start < texts.size(); start += batch_size_) {
    token.throw_if_cancelled("embedding");
    const size_t end = std::min(start + batch_size_, texts.size());
    std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);

    auto batch_vectors = embed_one_batch(batch);
    for (auto& vector : batch_vectors) {
      vectors.push_back(std::move(vector));
    }
  }
  return vectors;
}

std::vector<float> EmbeddingGateway::embed_query(const std::string& text,
                                                 const CancellationToken& token) {
  token.throw_if_cancelled("query embedding");
  auto vectors = embed_one_batch({text});
  return std::move(vectors.front());
}

std::vector<std::vector<float>> EmbeddingGateway::embed_one_batch(
    const std::vector<std::string>& batch) {
  std::vector<std::vector<float>> vectors;
  try {
    vectors = embedder_->get_embeddings(batch);
  } catch (const PipelineError&) {
    throw;
  } catch (const std::exception& e) {
    throw ModelUnavailableError(e.what());
  }

  if (vectors.size() != batch.size()) {
    throw DimensionMismatchError::vector_count(batch.size(), vectors.size());
  }
  for (const auto& vector : vectors) {
    validate_dimension(vector);
  }
  return vectors;
}

void EmbeddingGateway::validate_dimension(const std::vector<float>& vector) const {
  if (vector.size() != dimension_) {
    throw DimensionMismatchError(dimension_, vector.size());
  }
}

}  // namespace docchat_core

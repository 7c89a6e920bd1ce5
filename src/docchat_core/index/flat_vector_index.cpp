#include "docchat_core/index/flat_vector_index.hpp"

#include <cmath>
#include <mutex>

namespace docchat_core {

FlatVectorIndex::FlatVectorIndex(size_t dimension, SimilarityMetric metric)
    : dimension_(dimension), metric_(metric) {
  if (dimension_ == 0) {
    throw InvalidConfigError("vector index dimension must be greater than 0");
  }
}

void FlatVectorIndex::insert(const std::string &chunk_id,
                             const std::vector<float> &vector,
                             const VectorMetadata &metadata) {
  if (vector.size() != dimension_) {
    throw DimensionMismatchError(dimension_, vector.size());
  }
  std::unique_lock lock(mutex_);
  entries_[chunk_id] = Entry{vector, metadata};
}

std::vector<SearchHit> FlatVectorIndex::search(const std::vector<float> &query,
                                               int k,
                                               float score_threshold) const {
  if (query.size() != dimension_) {
    throw DimensionMismatchError(dimension_, query.size());
  }
  if (k <= 0) {
    return {};
  }

  std::vector<SearchHit> hits;
  {
    std::shared_lock lock(mutex_);
    hits.reserve(entries_.size());
    for (const auto &[chunk_id, entry] : entries_) {
      hits.push_back({chunk_id, entry.metadata.document_id, score(query, entry.vector)});
    }
  }
  return rank_hits(std::move(hits), k, score_threshold);
}

size_t FlatVectorIndex::remove_document(long long document_id) {
  std::unique_lock lock(mutex_);
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.metadata.document_id == document_id) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

size_t FlatVectorIndex::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

bool FlatVectorIndex::contains(const std::string &chunk_id) const {
  std::shared_lock lock(mutex_);
  return entries_.count(chunk_id) > 0;
}

size_t FlatVectorIndex::count_for_document(long long document_id) const {
  std::shared_lock lock(mutex_);
  size_t count = 0;
  for (const auto &[chunk_id, entry] : entries_) {
    if (entry.metadata.document_id == document_id) {
      ++count;
    }
  }
  return count;
}

float FlatVectorIndex::score(const std::vector<float> &query,
                             const std::vector<float> &stored) const {
  if (metric_ == SimilarityMetric::COSINE) {
    return cosine_similarity(query, stored);
  }
  double sum = 0.0;
  for (size_t i = 0; i < dimension_; ++i) {
    const double diff = static_cast<double>(query[i]) - stored[i];
    sum += diff * diff;
  }
  return inverse_distance_score(static_cast<float>(std::sqrt(sum)));
}

}  // namespace docchat_core

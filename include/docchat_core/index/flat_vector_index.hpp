#pragma once

#include <map>
#include <shared_mutex>

#include "docchat_core/index/vector_index.hpp"

namespace docchat_core {

// Exact in-process index. Scores every stored vector on each search.
class FlatVectorIndex : public VectorIndex {
 public:
  FlatVectorIndex(size_t dimension, SimilarityMetric metric);

  void insert(const std::string &chunk_id,
              const std::vector<float> &vector,
              const VectorMetadata &metadata) override;
  std::vector<SearchHit> search(const std::vector<float> &query,
                                int k,
                                float score_threshold) const override;
  size_t remove_document(long long document_id) override;

  size_t size() const override;
  size_t dimension() const override {
    return dimension_;
  }
  SimilarityMetric metric() const override {
    return metric_;
  }
  bool contains(const std::string &chunk_id) const override;
  size_t count_for_document(long long document_id) const override;
  void flush() override {}

 private:
  struct Entry {
    std::vector<float> vector;
    VectorMetadata metadata;
  };

  float score(const std::vector<float> &query, const std::vector<float> &stored) const;

  size_t dimension_;
  SimilarityMetric metric_;
  mutable std::shared_mutex mutex_;
  std::map<std::string, Entry> entries_;
};

}  // namespace docchat_core

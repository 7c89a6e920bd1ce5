#pragma once

#include <faiss/IndexIDMap.h>

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "docchat_core/index/vector_index.hpp"

namespace docchat_core {

/**
 * @class FaissVectorIndex
 * @brief Exact FAISS index with chunk-id labels.
 *
 * Cosine similarity is an inner product over L2-normalized vectors
 * (IndexFlatIP); inverse distance scores an IndexFlatL2 result as
 * 1 / (1 + L2). FAISS labels are int64, so the index keeps a
 * label <-> chunk id map next to the FAISS structure.
 *
 * With a non-empty index_path the index is loaded from disk on construction
 * and written back by flush(). The label map lives in a JSON sidecar at
 * "<index_path>.ids.json".
 */
class FaissVectorIndex : public VectorIndex {
 public:
  FaissVectorIndex(size_t dimension,
                   SimilarityMetric metric,
                   const std::filesystem::path &index_path = {});
  ~FaissVectorIndex() override;

  FaissVectorIndex(const FaissVectorIndex &) = delete;
  FaissVectorIndex &operator=(const FaissVectorIndex &) = delete;

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
  void flush() override;

 private:
  struct LabelEntry {
    std::string chunk_id;
    VectorMetadata metadata;
  };

  std::unique_ptr<faiss::IndexIDMap2> create_base_index() const;
  std::vector<float> prepare_vector(const std::vector<float> &vector) const;
  float to_score(float faiss_distance) const;
  void remove_labels(const std::vector<faiss::idx_t> &labels);
  void load();
  std::filesystem::path sidecar_path() const;

  size_t dimension_;
  SimilarityMetric metric_;
  std::filesystem::path index_path_;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<faiss::IndexIDMap2> index_;
  std::unordered_map<std::string, faiss::idx_t> label_by_chunk_;
  std::unordered_map<faiss::idx_t, LabelEntry> entry_by_label_;
  faiss::idx_t next_label_ = 0;
};

}  // namespace docchat_core

#pragma once

#include <string>
#include <vector>

#include "docchat_core/errors.hpp"
#include "docchat_core/pipeline_config.hpp"

namespace docchat_core {

class VectorIndexError : public PipelineError {
 public:
  explicit VectorIndexError(const std::string &message)
      : PipelineError("Vector index error: " + message) {}
};

struct VectorMetadata {
  long long document_id = 0;
  int sequence_index = 0;
};

struct SearchHit {
  std::string chunk_id;
  long long document_id = 0;
  float score = 0.0f;

  bool operator==(const SearchHit &) const = default;
};

/**
 * @class VectorIndex
 * @brief Stores one vector per chunk id and answers top-k similarity queries.
 *
 * The dimension and similarity metric are fixed per instance. Implementations
 * guard their own data structure with a reader/writer lock, so concurrent
 * search and insert calls are safe.
 */
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Inserts or replaces. Throws DimensionMismatchError if the width differs from dimension().
  virtual void insert(const std::string &chunk_id,
                      const std::vector<float> &vector,
                      const VectorMetadata &metadata) = 0;

  /**
   * @brief Returns at most k hits, best first.
   *
   * Hits scoring below score_threshold are excluded. Equal scores are ordered
   * by ascending chunk id.
   */
  virtual std::vector<SearchHit> search(const std::vector<float> &query,
                                        int k,
                                        float score_threshold) const = 0;

  // Returns the number of entries removed.
  virtual size_t remove_document(long long document_id) = 0;

  virtual size_t size() const = 0;
  virtual size_t dimension() const = 0;
  virtual SimilarityMetric metric() const = 0;
  virtual bool contains(const std::string &chunk_id) const = 0;
  virtual size_t count_for_document(long long document_id) const = 0;

  // Persists the index if it is backed by storage.
  virtual void flush() = 0;
};

// Sorts by score descending then chunk id ascending, drops hits below the
// threshold and truncates to k.
std::vector<SearchHit> rank_hits(std::vector<SearchHit> hits, int k, float score_threshold);

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);
float inverse_distance_score(float l2_distance);

}  // namespace docchat_core

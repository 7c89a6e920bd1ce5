#include "docchat_core/index/vector_index.hpp"

#include <algorithm>
#include <cmath>

namespace docchat_core {

std::vector<SearchHit> rank_hits(std::vector<SearchHit> hits, int k, float score_threshold) {
  hits.erase(std::remove_if(hits.begin(), hits.end(),
                            [score_threshold](const SearchHit &hit) {
                              return hit.score < score_threshold;
                            }),
             hits.end());

  std::sort(hits.begin(), hits.end(), [](const SearchHit &a, const SearchHit &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.chunk_id < b.chunk_id;
  });

  if (k <= 0) {
    return {};
  }
  if (hits.size() > static_cast<size_t>(k)) {
    hits.resize(static_cast<size_t>(k));
  }
  return hits;
}

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  const size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  // A zero vector is similar to nothing.
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0f;
  }
  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

float inverse_distance_score(float l2_distance) {
  return 1.0f / (1.0f + l2_distance);
}

}  // namespace docchat_core

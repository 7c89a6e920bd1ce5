#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docchat_core/index/vector_index.hpp"
#include "docchat_core/types/chunk.hpp"

namespace docchat_core {

class DocumentStore;
class DocumentLocks;

struct RetrievedChunk {
  Chunk chunk;
  float score = 0.0f;
};

struct RetrievalResult {
  // Index ranking order
  std::vector<RetrievedChunk> chunks;
  // Ids the index returned that have no stored chunk record
  std::vector<std::string> missing_chunk_ids;
};

/**
 * @class Retriever
 * @brief Top-k similarity search resolved to stored chunks.
 *
 * The search is repeated while holding a shared lock on each hit's document
 * until the hit documents are all locked, and hits from documents that are
 * not INDEXED are dropped, so a result never reflects a document that is
 * being inserted, replaced or removed. A hit whose chunk record is missing is
 * logged and reported in missing_chunk_ids.
 */
class Retriever {
 public:
  Retriever(std::shared_ptr<VectorIndex> index,
            std::shared_ptr<DocumentStore> store,
            std::shared_ptr<DocumentLocks> locks);

  RetrievalResult retrieve(const std::vector<float>& query_vector, int k, float score_threshold);

 private:
  // Throws ChunkNotFoundError if the hit has no chunk record.
  RetrievedChunk resolve_hit(const SearchHit& hit, const std::vector<Chunk>& resolved) const;

  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<DocumentStore> store_;
  std::shared_ptr<DocumentLocks> locks_;
};

}  // namespace docchat_core

#include "docchat_core/retrieval/retriever.hpp"

#include <algorithm>
#include <iostream>
#include <set>

#include "docchat_core/db/document_store.hpp"
#include "docchat_core/errors.hpp"
#include "docchat_core/pipeline/document_locks.hpp"

namespace docchat_core {

Retriever::Retriever(std::shared_ptr<VectorIndex> index,
                     std::shared_ptr<DocumentStore> store,
                     std::shared_ptr<DocumentLocks> locks)
    : index_(std::move(index)), store_(std::move(store)), locks_(std::move(locks)) {}

namespace {

constexpr int kMaxLockedSearches = 3;

std::set<long long> documents_of(const std::vector<SearchHit>& hits) {
  std::set<long long> ids;
  for (const auto& hit : hits) {
    ids.insert(hit.document_id);
  }
  return ids;
}

bool covers(const std::set<long long>& locked, const std::set<long long>& wanted) {
  return std::includes(locked.begin(), locked.end(), wanted.begin(), wanted.end());
}

}  // namespace

RetrievalResult Retriever::retrieve(const std::vector<float>& query_vector,
                                    int k,
                                    float score_threshold) {
  RetrievalResult result;
  std::vector<SearchHit> hits = index_->search(query_vector, k, score_threshold);
  if (hits.empty()) {
    return result;
  }

  // Hits are only used from a search that ran while each hit document was share-locked.
  std::set<long long> locked_ids;
  std::vector<SharedDocumentLock> held;
  for (int attempt = 0; attempt < kMaxLockedSearches; ++attempt) {
    std::set<long long> wanted = documents_of(hits);
    wanted.insert(locked_ids.begin(), locked_ids.end());
    if (wanted != locked_ids) {
      held.clear();
      locked_ids = std::move(wanted);
      // Ascending id order, matching every other multi-document reader
      for (long long document_id : locked_ids) {
        held.push_back(locks_->lock_shared(document_id));
      }
    }
    hits = index_->search(query_vector, k, score_threshold);
    if (covers(locked_ids, documents_of(hits))) {
      break;
    }
  }

  std::set<long long> searchable;
  for (long long document_id : documents_of(hits)) {
    if (locked_ids.count(document_id) == 0) {
      // Still changing after the last locked search
      continue;
    }
    auto status = store_->get_status(document_id);
    if (status && *status == DocumentStatus::INDEXED) {
      searchable.insert(document_id);
    }
  }

  std::vector<std::string> wanted_chunks;
  for (const auto& hit : hits) {
    if (searchable.count(hit.document_id) > 0) {
      wanted_chunks.push_back(hit.chunk_id);
    }
  }
  const std::vector<Chunk> resolved = store_->get_chunks(wanted_chunks);

  for (const auto& hit : hits) {
    if (searchable.count(hit.document_id) == 0) {
      continue;
    }
    try {
      result.chunks.push_back(resolve_hit(hit, resolved));
    } catch (const ChunkNotFoundError& e) {
      std::cerr << "Retriever: dropping hit: " << e.what() << std::endl;
      result.missing_chunk_ids.push_back(e.chunk_id());
    }
  }
  return result;
}

RetrievedChunk Retriever::resolve_hit(const SearchHit& hit,
                                      const std::vector<Chunk>& resolved) const {
  auto it = std::find_if(resolved.begin(), resolved.end(),
                         [&hit](const Chunk& chunk) { return chunk.id == hit.chunk_id; });
  if (it == resolved.end()) {
    throw ChunkNotFoundError(hit.chunk_id);
  }
  return RetrievedChunk{*it, hit.score};
}

}  // namespace docchat_core

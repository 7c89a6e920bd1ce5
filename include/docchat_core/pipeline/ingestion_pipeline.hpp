#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docchat_core/cancellation.hpp"
#include "docchat_core/chunking/chunker.hpp"
#include "docchat_core/pipeline_config.hpp"
#include "docchat_core/retry_policy.hpp"
#include "docchat_core/types/document.hpp"

namespace docchat_core {

class DocumentStore;
class DocumentLocks;
class EmbeddingGateway;
class TextExtractorFactory;
class VectorIndex;

using ProgressUpdater = std::function<void(float, const std::string&)>;

struct IngestionOutcome {
  DocumentStatus status = DocumentStatus::UPLOADED;
  std::optional<std::string> failure_reason;
  size_t chunk_count = 0;
};

/**
 * @class IngestionPipeline
 * @brief Drives one document from UPLOADED to INDEXED or FAILED.
 *
 * Stages run in order: extract, chunk (records persisted), embed every chunk
 * in batches, then insert every vector while holding the document's
 * exclusive lock. Nothing is inserted until all embeddings succeeded, and a
 * failure during insertion removes whatever was inserted, so a FAILED
 * document never has vectors in the index.
 *
 * Per-document failures are recorded on the document and reported in the
 * outcome rather than thrown.
 */
class IngestionPipeline {
 public:
  IngestionPipeline(std::shared_ptr<DocumentStore> store,
                    std::shared_ptr<TextExtractorFactory> extractors,
                    std::shared_ptr<EmbeddingGateway> gateway,
                    std::shared_ptr<VectorIndex> index,
                    std::shared_ptr<DocumentLocks> locks,
                    const PipelineConfig& config);

  /**
   * @brief Ingests the document.
   * @throw DocumentNotFoundError if the id is unknown.
   * @throw InvalidTransitionError if the document is not UPLOADED.
   */
  IngestionOutcome run(long long document_id,
                       const CancellationToken& token,
                       const ProgressUpdater& on_progress = {});

  // Removes every vector of the document from the index under its exclusive lock.
  void rollback(long long document_id);

 private:
  std::string extract(long long document_id, const std::string& filename);
  std::vector<std::vector<float>> embed_chunks(long long document_id,
                                               const std::vector<Chunk>& chunks,
                                               const CancellationToken& token,
                                               const ProgressUpdater& on_progress);
  void index_chunks(long long document_id,
                    const std::vector<Chunk>& chunks,
                    const std::vector<std::vector<float>>& vectors,
                    const CancellationToken& token);
  IngestionOutcome fail(long long document_id,
                        const std::string& reason,
                        const std::string& detail,
                        bool needs_rollback);

  std::shared_ptr<DocumentStore> store_;
  std::shared_ptr<TextExtractorFactory> extractors_;
  std::shared_ptr<EmbeddingGateway> gateway_;
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<DocumentLocks> locks_;
  Chunker chunker_;
  RetryPolicy embedding_retry_;
};

}  // namespace docchat_core

#include "docchat_core/pipeline/ingestion_pipeline.hpp"

#include <algorithm>
#include <iostream>

#include "docchat_core/db/document_store.hpp"
#include "docchat_core/errors.hpp"
#include "docchat_core/extractors/text_extractor_factory.hpp"
#include "docchat_core/index/vector_index.hpp"
#include "docchat_core/llm/embedding_gateway.hpp"
#include "docchat_core/pipeline/document_locks.hpp"

namespace docchat_core {

namespace {

void report(const ProgressUpdater& on_progress, float percent, const std::string& message) {
  if (on_progress) {
    on_progress(percent, message);
  }
}

}  // namespace

IngestionPipeline::IngestionPipeline(std::shared_ptr<DocumentStore> store,
                                     std::shared_ptr<TextExtractorFactory> extractors,
                                     std::shared_ptr<EmbeddingGateway> gateway,
                                     std::shared_ptr<VectorIndex> index,
                                     std::shared_ptr<DocumentLocks> locks,
                                     const PipelineConfig& config)
    : store_(std::move(store)),
      extractors_(std::move(extractors)),
      gateway_(std::move(gateway)),
      index_(std::move(index)),
      locks_(std::move(locks)),
      chunker_(config.chunk_size, config.chunk_overlap),
      embedding_retry_(RetryPolicy::for_embedding(config)) {}

IngestionOutcome IngestionPipeline::run(long long document_id,
                                        const CancellationToken& token,
                                        const ProgressUpdater& on_progress) {
  std::optional<Document> document = store_->get_document(document_id);
  if (!document) {
    throw DocumentNotFoundError(document_id);
  }
  if (document->status != DocumentStatus::UPLOADED) {
    throw InvalidTransitionError("Document " + std::to_string(document_id) + " is " +
                                 to_string(document->status) + ", expected UPLOADED");
  }

  std::cout << "IngestionPipeline [doc " << document_id << "] starting '" << document->filename
            << "' (revision " << document->revision << ")" << std::endl;
  report(on_progress, 0.0f, "Starting ingestion...");

  // 1. Extraction
  std::string text;
  try {
    token.throw_if_cancelled("ingestion");
    store_->transition_status(document_id, DocumentStatus::EXTRACTING);
    text = extract(document_id, document->filename);
  } catch (const OperationCancelledError& e) {
    return fail(document_id, failure_reason::CANCELLED, e.what(), false);
  } catch (const std::exception& e) {
    // Unsupported content, or a store or decompression error.
    return fail(document_id, failure_reason::EXTRACTION, e.what(), false);
  }
  report(on_progress, 0.1f, "Text extracted.");

  // 2. Chunking
  std::vector<Chunk> chunks;
  try {
    token.throw_if_cancelled("ingestion");
    store_->transition_status(document_id, DocumentStatus::CHUNKING);
    chunks = chunker_.chunk(document_id, text);
    store_->replace_chunks(document_id, chunks);
  } catch (const OperationCancelledError& e) {
    return fail(document_id, failure_reason::CANCELLED, e.what(), false);
  } catch (const std::exception& e) {
    // Invalid UTF-8 from the chunker or a failed chunk write.
    return fail(document_id, failure_reason::CHUNKING, e.what(), false);
  }
  report(on_progress, 0.2f, "Split into " + std::to_string(chunks.size()) + " chunks.");

  // 3. Embedding. Vectors are only held in memory until every batch succeeded.
  std::vector<std::vector<float>> vectors;
  try {
    token.throw_if_cancelled("ingestion");
    store_->transition_status(document_id, DocumentStatus::EMBEDDING);
    vectors = embed_chunks(document_id, chunks, token, on_progress);
  } catch (const OperationCancelledError& e) {
    return fail(document_id, failure_reason::CANCELLED, e.what(), true);
  } catch (const std::exception& e) {
    // Retries exhausted, a wrong vector width, or a store error.
    return fail(document_id, failure_reason::EMBEDDING, e.what(), true);
  }

  // 4. Indexing
  try {
    index_chunks(document_id, chunks, vectors, token);
  } catch (const OperationCancelledError& e) {
    return fail(document_id, failure_reason::CANCELLED, e.what(), true);
  } catch (const std::exception& e) {
    return fail(document_id, failure_reason::INDEXING, e.what(), true);
  }

  try {
    index_->flush();
  } catch (const VectorIndexError& e) {
    std::cerr << "IngestionPipeline [doc " << document_id
              << "] WARNING: index flush failed: " << e.what() << std::endl;
  }

  report(on_progress, 1.0f, "Indexed " + std::to_string(chunks.size()) + " chunks.");
  std::cout << "IngestionPipeline [doc " << document_id << "] indexed " << chunks.size()
            << " chunks" << std::endl;
  return IngestionOutcome{DocumentStatus::INDEXED, std::nullopt, chunks.size()};
}

std::string IngestionPipeline::extract(long long document_id, const std::string& filename) {
  const TextExtractor& extractor = extractors_->get_extractor_for(filename);
  const std::string bytes = store_->get_source_bytes(document_id);
  return extractor.extract(bytes);
}

std::vector<std::vector<float>> IngestionPipeline::embed_chunks(
    long long document_id,
    const std::vector<Chunk>& chunks,
    const CancellationToken& token,
    const ProgressUpdater& on_progress) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(chunks.size());

  const size_t batch_size = gateway_->batch_size();
  for (size_t start = 0; start < chunks.size(); start += batch_size) {
    const size_t end = std::min(start + batch_size, chunks.size());
    std::vector<std::string> batch;
    batch.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      batch.push_back(chunks[i].text);
    }

    const std::string operation = "embedding chunks " + std::to_string(start) + "-" +
                                  std::to_string(end - 1) + " of document " +
                                  std::to_string(document_id);
    auto batch_vectors = embedding_retry_.run<ModelUnavailableError>(
        [&]() { return gateway_->embed(batch, token); }, token, operation);
    for (auto& vector : batch_vectors) {
      vectors.push_back(std::move(vector));
    }

    float progress = 0.2f + (0.7f * (static_cast<float>(end) / chunks.size()));
    report(on_progress, progress,
           "Embedded chunk " + std::to_string(end) + " of " + std::to_string(chunks.size()));
  }
  return vectors;
}

void IngestionPipeline::index_chunks(long long document_id,
                                     const std::vector<Chunk>& chunks,
                                     const std::vector<std::vector<float>>& vectors,
                                     const CancellationToken& token) {
  auto lock = locks_->lock_exclusive(document_id);
  // Checked under the lock so a concurrent remove cannot be raced past.
  token.throw_if_cancelled("indexing");

  std::vector<std::string> vector_ids;
  vector_ids.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    index_->insert(chunks[i].id, vectors[i],
                   VectorMetadata{document_id, chunks[i].sequence_index});
    vector_ids.push_back(chunks[i].id);
  }
  store_->set_vector_ids(document_id, vector_ids);
  // INDEXED becomes visible to readers together with the vectors.
  store_->transition_status(document_id, DocumentStatus::INDEXED);
}

void IngestionPipeline::rollback(long long document_id) {
  auto lock = locks_->lock_exclusive(document_id);
  const size_t removed = index_->remove_document(document_id);
  store_->clear_vector_ids(document_id);
  if (removed > 0) {
    std::cout << "IngestionPipeline [doc " << document_id << "] rolled back " << removed
              << " index entries" << std::endl;
  }
}

IngestionOutcome IngestionPipeline::fail(long long document_id,
                                         const std::string& reason,
                                         const std::string& detail,
                                         bool needs_rollback) {
  std::cerr << "IngestionPipeline [doc " << document_id << "] FAILED at stage " << reason << ": "
            << detail << std::endl;
  if (needs_rollback) {
    rollback(document_id);
  }
  store_->transition_status(document_id, DocumentStatus::FAILED, reason);
  return IngestionOutcome{DocumentStatus::FAILED, reason, 0};
}

}  // namespace docchat_core

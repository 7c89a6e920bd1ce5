#pragma once

#include <sqlite_modern_cpp.h>

#include <optional>
#include <string>
#include <vector>

#include "docchat_core/db/database_manager.hpp"
#include "docchat_core/types/chunk.hpp"
#include "docchat_core/types/document.hpp"

namespace docchat_core {

class DocumentStoreError : public std::exception {
 public:
  explicit DocumentStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class DocumentStore
 * @brief SQLite-backed records for documents and their chunks.
 *
 * Chunk text and document source bytes are stored zstd-compressed. Status
 * changes go through transition_status(), which refuses to move a document
 * backwards within a revision.
 */
class DocumentStore {
 public:
  explicit DocumentStore(DatabaseManager &db_manager);
  virtual ~DocumentStore() = default;

  DocumentStore(const DocumentStore &) = delete;
  DocumentStore &operator=(const DocumentStore &) = delete;

  // Stores a new document in UPLOADED state, revision 1. Returns its id.
  long long create_document(const std::string &filename,
                            const std::string &content_hash,
                            const std::string &source_bytes);

  std::optional<Document> get_document(long long document_id);
  std::vector<Document> list_documents();
  std::optional<DocumentStatus> get_status(long long document_id);
  std::string get_source_bytes(long long document_id);

  // Id of an INDEXED document with this content hash, if any.
  std::optional<long long> find_indexed_by_hash(const std::string &content_hash);

  /**
   * @brief Moves the document to `to`.
   *
   * Throws InvalidTransitionError if `to` is not the next pipeline state (or
   * FAILED from a non-terminal state), DocumentNotFoundError if the id is unknown.
   */
  void transition_status(long long document_id,
                         DocumentStatus to,
                         const std::optional<std::string> &failure_reason = std::nullopt);

  // Resets a terminal document to UPLOADED under a new revision and drops its chunks.
  int start_new_revision(long long document_id);

  // Replaces every chunk of the document in one transaction.
  void replace_chunks(long long document_id, const std::vector<Chunk> &chunks);
  std::vector<Chunk> get_chunks_for_document(long long document_id);

  // Chunks for the given ids, keyed in input order; unknown ids are absent from the result.
  std::vector<Chunk> get_chunks(const std::vector<std::string> &chunk_ids);

  void set_vector_ids(long long document_id, const std::vector<std::string> &chunk_ids);
  void clear_vector_ids(long long document_id);

  // Deletes the document and (by cascade) its chunks. Returns false if it did not exist.
  bool delete_document(long long document_id);

 private:
  std::vector<std::string> load_chunk_ids(sqlite::database &db, long long document_id);

  DatabaseManager &db_manager_;
};

}  // namespace docchat_core

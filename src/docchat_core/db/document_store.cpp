#include "docchat_core/db/document_store.hpp"

#include <sstream>
#include <unordered_map>

#include "docchat_core/db/pooled_connection.hpp"
#include "docchat_core/db/sqlite_error_utils.hpp"
#include "docchat_core/db/time_format.hpp"
#include "docchat_core/db/transaction.hpp"
#include "docchat_core/errors.hpp"
#include "docchat_core/services/compression_service.hpp"

namespace docchat_core {

namespace {

Document make_document(long long id,
                       std::string filename,
                       std::string content_hash,
                       const std::string &status,
                       std::optional<std::string> failure_reason,
                       int revision,
                       const std::string &created_at) {
  Document doc;
  doc.id = id;
  doc.filename = std::move(filename);
  doc.content_hash = std::move(content_hash);
  doc.status = document_status_from_string(status);
  doc.failure_reason = std::move(failure_reason);
  doc.revision = revision;
  doc.created_at = string_to_time_point(created_at);
  return doc;
}

}  // namespace

DocumentStore::DocumentStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

long long DocumentStore::create_document(const std::string &filename,
                                         const std::string &content_hash,
                                         const std::string &source_bytes) {
  try {
    const std::string now = time_point_to_string(std::chrono::system_clock::now());
    const std::vector<char> source_blob = CompressionService::compress(source_bytes);

    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO documents (filename, content_hash, status, revision, source_blob, "
             "created_at, updated_at) VALUES (?,?,?,1,?,?,?)"
          << filename << content_hash << to_string(DocumentStatus::UPLOADED) << source_blob << now
          << now;
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("create_document", e));
  }
}

std::optional<Document> DocumentStore::get_document(long long document_id) {
  try {
    std::optional<Document> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, filename, content_hash, status, failure_reason, revision, created_at "
             "FROM documents WHERE id = ?"
          << document_id >>
        [&](long long id, std::string filename, std::string content_hash, std::string status,
            std::optional<std::string> failure_reason, int revision, std::string created_at) {
          result = make_document(id, std::move(filename), std::move(content_hash), status,
                                 std::move(failure_reason), revision, created_at);
        };
    if (result) {
      result->chunk_ids = load_chunk_ids(*conn, document_id);
    }
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("get_document", e));
  }
}

std::vector<Document> DocumentStore::list_documents() {
  try {
    std::vector<Document> documents;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, filename, content_hash, status, failure_reason, revision, created_at "
             "FROM documents ORDER BY id ASC" >>
        [&](long long id, std::string filename, std::string content_hash, std::string status,
            std::optional<std::string> failure_reason, int revision, std::string created_at) {
          documents.push_back(make_document(id, std::move(filename), std::move(content_hash),
                                            status, std::move(failure_reason), revision,
                                            created_at));
        };
    for (auto &doc : documents) {
      doc.chunk_ids = load_chunk_ids(*conn, doc.id);
    }
    return documents;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("list_documents", e));
  }
}

std::optional<DocumentStatus> DocumentStore::get_status(long long document_id) {
  try {
    std::optional<DocumentStatus> status;
    PooledConnection conn(db_manager_);
    *conn << "SELECT status FROM documents WHERE id = ?" << document_id >>
        [&](std::string status_db) { status = document_status_from_string(status_db); };
    return status;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("get_status", e));
  }
}

std::string DocumentStore::get_source_bytes(long long document_id) {
  try {
    bool found = false;
    std::vector<char> blob;
    {
      PooledConnection conn(db_manager_);
      *conn << "SELECT source_blob FROM documents WHERE id = ?" << document_id >>
          [&](std::optional<std::vector<char>> source_blob) {
            found = true;
            if (source_blob) {
              blob = std::move(*source_blob);
            }
          };
    }
    if (!found) {
      throw DocumentNotFoundError(document_id);
    }
    return CompressionService::decompress(blob);
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("get_source_bytes", e));
  }
}

std::optional<long long> DocumentStore::find_indexed_by_hash(const std::string &content_hash) {
  try {
    std::optional<long long> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id FROM documents WHERE content_hash = ? AND status = ? ORDER BY id ASC "
             "LIMIT 1"
          << content_hash << to_string(DocumentStatus::INDEXED) >>
        [&](long long id) { result = id; };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("find_indexed_by_hash", e));
  }
}

void DocumentStore::transition_status(long long document_id,
                                      DocumentStatus to,
                                      const std::optional<std::string> &failure_reason) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    std::optional<DocumentStatus> current;
    *conn << "SELECT status FROM documents WHERE id = ?" << document_id >>
        [&](std::string status_db) { current = document_status_from_string(status_db); };
    if (!current) {
      throw DocumentNotFoundError(document_id);
    }
    if (!is_valid_transition(*current, to)) {
      throw InvalidTransitionError("Document " + std::to_string(document_id) +
                                   " cannot move from " + to_string(*current) + " to " +
                                   to_string(to));
    }

    const std::string now = time_point_to_string(std::chrono::system_clock::now());
    *conn << "UPDATE documents SET status = ?, failure_reason = ?, updated_at = ? WHERE id = ?"
          << to_string(to) << failure_reason << now << document_id;
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("transition_status", e));
  }
}

int DocumentStore::start_new_revision(long long document_id) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    std::optional<DocumentStatus> current;
    int revision = 0;
    *conn << "SELECT status, revision FROM documents WHERE id = ?" << document_id >>
        [&](std::string status_db, int rev) {
          current = document_status_from_string(status_db);
          revision = rev;
        };
    if (!current) {
      throw DocumentNotFoundError(document_id);
    }
    if (!is_terminal(*current)) {
      throw InvalidTransitionError("Document " + std::to_string(document_id) + " is " +
                                   to_string(*current) +
                                   "; re-ingestion requires INDEXED or FAILED");
    }

    const int next_revision = revision + 1;
    const std::string now = time_point_to_string(std::chrono::system_clock::now());
    *conn << "DELETE FROM chunks WHERE document_id = ?" << document_id;
    *conn << "UPDATE documents SET status = ?, failure_reason = NULL, revision = ?, "
             "updated_at = ? WHERE id = ?"
          << to_string(DocumentStatus::UPLOADED) << next_revision << now << document_id;
    tx.commit();
    return next_revision;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("start_new_revision", e));
  }
}

void DocumentStore::replace_chunks(long long document_id, const std::vector<Chunk> &chunks) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    *conn << "DELETE FROM chunks WHERE document_id = ?" << document_id;
    if (chunks.empty()) {
      tx.commit();
      return;
    }
    auto insert = *conn << "INSERT INTO chunks (id, document_id, sequence_index, offset_start, "
                           "offset_end, content, vector_id) VALUES (?,?,?,?,?,?,?)";
    for (const auto &chunk : chunks) {
      if (chunk.document_id != document_id) {
        throw DocumentStoreError("replace_chunks: chunk " + chunk.id +
                                 " belongs to another document");
      }
      insert << chunk.id << document_id << chunk.sequence_index
             << static_cast<int64_t>(chunk.offset_start) << static_cast<int64_t>(chunk.offset_end)
             << CompressionService::compress(chunk.text) << chunk.vector_id;
      insert++;
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("replace_chunks", e));
  }
}

std::vector<Chunk> DocumentStore::get_chunks_for_document(long long document_id) {
  try {
    std::vector<Chunk> chunks;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, sequence_index, offset_start, offset_end, content, vector_id FROM chunks "
             "WHERE document_id = ? ORDER BY sequence_index ASC"
          << document_id >>
        [&](std::string id, int sequence_index, int64_t offset_start, int64_t offset_end,
            std::vector<char> content, std::optional<std::string> vector_id) {
          Chunk chunk;
          chunk.id = std::move(id);
          chunk.document_id = document_id;
          chunk.sequence_index = sequence_index;
          chunk.offset_start = static_cast<size_t>(offset_start);
          chunk.offset_end = static_cast<size_t>(offset_end);
          chunk.text = CompressionService::decompress(content);
          chunk.vector_id = std::move(vector_id);
          chunks.push_back(std::move(chunk));
        };
    return chunks;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("get_chunks_for_document", e));
  }
}

std::vector<Chunk> DocumentStore::get_chunks(const std::vector<std::string> &chunk_ids) {
  if (chunk_ids.empty()) {
    return {};
  }

  try {
    std::stringstream placeholders;
    for (size_t i = 0; i < chunk_ids.size(); ++i) {
      placeholders << (i == 0 ? "?" : ",?");
    }

    std::unordered_map<std::string, Chunk> by_id;
    {
      PooledConnection conn(db_manager_);
      auto query = *conn << "SELECT id, document_id, sequence_index, offset_start, offset_end, "
                            "content, vector_id FROM chunks WHERE id IN (" +
                                placeholders.str() + ")";
      for (const auto &id : chunk_ids) {
        query << id;
      }
      query >> [&](std::string id, long long document_id, int sequence_index,
                   int64_t offset_start, int64_t offset_end, std::vector<char> content,
                   std::optional<std::string> vector_id) {
        Chunk chunk;
        chunk.id = id;
        chunk.document_id = document_id;
        chunk.sequence_index = sequence_index;
        chunk.offset_start = static_cast<size_t>(offset_start);
        chunk.offset_end = static_cast<size_t>(offset_end);
        chunk.text = CompressionService::decompress(content);
        chunk.vector_id = std::move(vector_id);
        by_id.emplace(std::move(id), std::move(chunk));
      };
    }

    std::vector<Chunk> chunks;
    chunks.reserve(by_id.size());
    for (const auto &id : chunk_ids) {
      auto it = by_id.find(id);
      if (it != by_id.end()) {
        chunks.push_back(it->second);
      }
    }
    return chunks;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("get_chunks", e));
  }
}

void DocumentStore::set_vector_ids(long long document_id,
                                   const std::vector<std::string> &chunk_ids) {
  if (chunk_ids.empty()) {
    return;
  }
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    auto update = *conn << "UPDATE chunks SET vector_id = ? WHERE id = ? AND document_id = ?";
    for (const auto &chunk_id : chunk_ids) {
      update << chunk_id << chunk_id << document_id;
      update++;
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("set_vector_ids", e));
  }
}

void DocumentStore::clear_vector_ids(long long document_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE chunks SET vector_id = NULL WHERE document_id = ?" << document_id;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("clear_vector_ids", e));
  }
}

bool DocumentStore::delete_document(long long document_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM documents WHERE id = ?" << document_id;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("delete_document", e));
  }
}

std::vector<std::string> DocumentStore::load_chunk_ids(sqlite::database &db,
                                                       long long document_id) {
  std::vector<std::string> ids;
  db << "SELECT id FROM chunks WHERE document_id = ? ORDER BY sequence_index ASC" << document_id >>
      [&](std::string id) { ids.push_back(std::move(id)); };
  return ids;
}

}  // namespace docchat_core

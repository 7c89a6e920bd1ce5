#include "docchat_core/db/database_manager.hpp"

#include <stdexcept>

namespace docchat_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // 1. One-time schema setup before creating the pool
  setup_schema(db_path);

  // 2. Connection pool for the workers and request handlers
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

bool DatabaseManager::is_initialized() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return is_initialized_;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  ConnectionPool* pool = nullptr;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!is_initialized_) {
      throw std::runtime_error("DatabaseManager has not been initialized.");
    }
    pool = pool_.get();
  }
  return pool->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  // Single-use connection so table creation stays outside the pool
  sqlite::database db(db_path.string());
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          filename TEXT NOT NULL,
          content_hash TEXT NOT NULL,
          status TEXT NOT NULL,
          failure_reason TEXT,
          revision INTEGER NOT NULL DEFAULT 1,
          source_blob BLOB,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_documents_hash_status
      ON documents(content_hash, status)
    )";

  // Chunk text is zstd-compressed; vectors live only in the vector index
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id TEXT PRIMARY KEY,
          document_id INTEGER NOT NULL,
          sequence_index INTEGER NOT NULL,
          offset_start INTEGER NOT NULL,
          offset_end INTEGER NOT NULL,
          content BLOB NOT NULL,
          vector_id TEXT,
          FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_document_sequence
      ON chunks(document_id, sequence_index)
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS conversations (
          id TEXT PRIMARY KEY,
          created_at TEXT NOT NULL
      )
    )";
  db << R"(
      CREATE TABLE IF NOT EXISTS turns (
          id TEXT PRIMARY KEY,
          conversation_id TEXT NOT NULL,
          position INTEGER NOT NULL,
          role TEXT NOT NULL,
          text TEXT NOT NULL,
          citations TEXT NOT NULL DEFAULT '[]',
          failure_reason TEXT,
          created_at TEXT NOT NULL,
          UNIQUE (conversation_id, position),
          FOREIGN KEY (conversation_id) REFERENCES conversations(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS task_queue (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          task_type TEXT NOT NULL,
          status TEXT NOT NULL DEFAULT 'PENDING',
          priority INTEGER NOT NULL DEFAULT 10,
          target_document_id INTEGER,
          error_message TEXT,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL
      )
    )";
  db << R"(
      CREATE TABLE IF NOT EXISTS task_progress (
          task_id INTEGER PRIMARY KEY,
          progress_percent REAL NOT NULL DEFAULT 0.0,
          status_message TEXT NOT NULL DEFAULT 'Initializing...',
          updated_at TEXT NOT NULL,
          FOREIGN KEY (task_id) REFERENCES task_queue(id) ON DELETE CASCADE
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_task_queue_status_priority
      ON task_queue(status, priority, created_at)
    )";
}

}  // namespace docchat_core

#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docchat_core/db/database_manager.hpp"
#include "docchat_core/db/document_store.hpp"
#include "docchat_core/db/task_queue_repo.hpp"
#include "docchat_core/llm/model_services.hpp"
#include "docchat_core/pipeline_config.hpp"
#include "docchat_core/types/chunk.hpp"

namespace docchat_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Database utilities
  static std::filesystem::path create_temp_test_db();
  static void cleanup_temp_db(const std::filesystem::path& db_path);
  static std::filesystem::path create_temp_path(const std::string& suffix);

  // Test data creation
  static docchat_core::Chunk create_test_chunk(long long document_id,
                                               int sequence_index,
                                               const std::string& text);
  static std::vector<docchat_core::Chunk> create_test_chunks(long long document_id,
                                                             int count,
                                                             const std::string& base_text =
                                                                 "test chunk");

  // Unit vector along `axis`, optionally scaled
  static std::vector<float> axis_vector(size_t dimension, size_t axis, float scale = 1.0f);

  // Config with small, fast settings for pipeline tests
  static docchat_core::PipelineConfig fast_pipeline_config(size_t dimension);
};

/**
 * Deterministic bag-of-words embedder. Lower-cased alphanumeric words are
 * hashed (FNV-1a) into buckets and the counts L2-normalized, so texts that
 * share words have a positive cosine similarity.
 */
class HashingEmbedder : public docchat_core::Embedder {
 public:
  explicit HashingEmbedder(size_t dimension = 256) : dimension_(dimension) {}

  std::vector<float> get_embedding(const std::string& text) override;
  bool is_server_available() override {
    return true;
  }

  size_t calls() const {
    return calls_.load();
  }

 private:
  size_t dimension_;
  std::atomic<size_t> calls_{0};
};

/**
 * Base fixture for tests that need a fresh SQLite database. Each test gets
 * its own temp file; the DatabaseManager singleton is re-initialized on it.
 */
class DatabaseTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    auto& mgr = docchat_core::DatabaseManager::get_instance();
    // A previous test may have left the singleton initialized
    mgr.shutdown();
    mgr.initialize(temp_db_path_, /*pool_size*/ 4);
    db_manager_ = &mgr;
    document_store_ = std::make_shared<docchat_core::DocumentStore>(*db_manager_);
    task_queue_repo_ = std::make_shared<docchat_core::TaskQueueRepo>(*db_manager_);
  }

  void TearDown() override {
    document_store_.reset();
    task_queue_repo_.reset();
    if (db_manager_) {
      db_manager_->shutdown();
    }
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  // Stores a document and walks it to `status` through valid transitions.
  long long create_document_in_status(const std::string& filename,
                                      const std::string& content,
                                      docchat_core::DocumentStatus status);

  std::filesystem::path temp_db_path_;
  docchat_core::DatabaseManager* db_manager_ = nullptr;
  std::shared_ptr<docchat_core::DocumentStore> document_store_;
  std::shared_ptr<docchat_core::TaskQueueRepo> task_queue_repo_;
};

}  // namespace docchat_tests

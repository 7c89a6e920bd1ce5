#include <gtest/gtest.h>
#include <unistd.h>

#include <cstdio>
#include <stdexcept>
#include <string>

#include "docchat_api/config.hpp"

namespace {

using docchat_api::Config;

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/docchat_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5);  // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

// Removes the file when the test scope ends.
struct TempFile {
  explicit TempFile(const std::string& contents) : path(write_temp_file(contents)) {}
  ~TempFile() {
    std::remove(path.c_str());
  }
  std::string path;
};

}  // namespace

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {{"api_base_url", "0.0.0.0:8080"},
                      {"metadata_db_path", "./data/chat.db"},
                      {"ollama_url", "http://localhost:11434"},
                      {"embedding_model", "nomic-embed-text"},
                      {"generation_model", "mistral"},
                      {"generation_timeout_seconds", 30},
                      {"num_workers", 4},
                      {"worker_poll_interval_ms", 250}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.metadata_db_path, "./data/chat.db");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.generation_model, "mistral");
  EXPECT_EQ(cfg.generation_timeout_seconds, 30);
  EXPECT_EQ(cfg.num_workers, 4);
  EXPECT_EQ(cfg.worker_poll_interval_ms, 250);
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:3030");
  EXPECT_EQ(cfg.metadata_db_path, "./data/docchat.db");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.generation_model, "llama3.1");
  EXPECT_EQ(cfg.generation_timeout_seconds, 120);
  EXPECT_EQ(cfg.num_workers, 1);
  EXPECT_EQ(cfg.worker_poll_interval_ms, 1000);

  EXPECT_EQ(cfg.pipeline.chunk_size, 1344u);
  EXPECT_EQ(cfg.pipeline.chunk_overlap, 175u);
  EXPECT_EQ(cfg.pipeline.retrieval_k, 5);
  EXPECT_EQ(cfg.pipeline.vector_backend, docchat_core::VectorBackend::FAISS);
}

TEST(ConfigTest, ReadsPipelineSection) {
  nlohmann::json j = {{"pipeline",
                       {{"chunk_size", 20},
                        {"chunk_overlap", 5},
                        {"retrieval_k", 1},
                        {"score_threshold", 0.5},
                        {"embedding_dimension", 768},
                        {"vector_backend", "memory"},
                        {"similarity_metric", "inverse_distance"},
                        {"vector_index_path", "./data/index.faiss"}}}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.pipeline.chunk_size, 20u);
  EXPECT_EQ(cfg.pipeline.chunk_overlap, 5u);
  EXPECT_EQ(cfg.pipeline.retrieval_k, 1);
  EXPECT_FLOAT_EQ(cfg.pipeline.score_threshold, 0.5f);
  EXPECT_EQ(cfg.pipeline.embedding_dimension, 768u);
  EXPECT_EQ(cfg.pipeline.vector_backend, docchat_core::VectorBackend::MEMORY);
  EXPECT_EQ(cfg.pipeline.similarity_metric, docchat_core::SimilarityMetric::INVERSE_DISTANCE);
  EXPECT_EQ(cfg.pipeline.vector_index_path, "./data/index.faiss");
  // Untouched keys keep their defaults
  EXPECT_EQ(cfg.pipeline.context_token_budget, 2048u);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  TempFile file(R"JSON({
    "api_base_url": "127.0.0.1:4000",
    "metadata_db_path": "./db/docchat.db",
    "num_workers": 2
  })JSON");

  Config cfg = Config::from_file(file.path);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:4000");
  EXPECT_EQ(cfg.metadata_db_path, "./db/docchat.db");
  EXPECT_EQ(cfg.num_workers, 2);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW((void)Config::from_file("/nonexistent/path/config.json"), std::runtime_error);
}

TEST(ConfigTest, MalformedJsonThrows) {
  TempFile file("{ \"api_base_url\": ");
  EXPECT_THROW((void)Config::from_file(file.path), std::runtime_error);
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  EXPECT_THROW((void)Config::from_json({{"api_base_url", ""}}), std::runtime_error);
  EXPECT_THROW((void)Config::from_json({{"api_base_url", "no-port"}}), std::runtime_error);
  EXPECT_THROW((void)Config::from_json({{"generation_model", ""}}), std::runtime_error);
}

TEST(ConfigTest, NonPositiveNumbersThrow) {
  EXPECT_THROW((void)Config::from_json({{"num_workers", 0}}), std::runtime_error);
  EXPECT_THROW((void)Config::from_json({{"generation_timeout_seconds", -1}}), std::runtime_error);
  EXPECT_THROW((void)Config::from_json({{"worker_poll_interval_ms", 5}}), std::runtime_error);
}

TEST(ConfigTest, WrongTypeThrows) {
  EXPECT_THROW((void)Config::from_json({{"num_workers", "four"}}), std::runtime_error);
  EXPECT_THROW((void)Config::from_json({{"pipeline", {{"chunk_size", "big"}}}}),
               std::runtime_error);
  EXPECT_THROW((void)Config::from_json({{"pipeline", 3}}), std::runtime_error);
}

TEST(ConfigTest, InvalidPipelineThrows) {
  EXPECT_THROW((void)Config::from_json({{"pipeline", {{"chunk_size", 10}, {"chunk_overlap", 10}}}}),
               std::runtime_error);
  EXPECT_THROW((void)Config::from_json({{"pipeline", {{"vector_backend", "pinecone"}}}}),
               std::exception);
}

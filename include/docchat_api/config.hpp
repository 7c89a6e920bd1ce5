#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "docchat_core/errors.hpp"
#include "docchat_core/pipeline_config.hpp"

namespace docchat_api {

class Config {
 public:
  std::string api_base_url;
  std::string metadata_db_path;
  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  int generation_timeout_seconds;
  int num_workers;
  int worker_poll_interval_ms;

  // Retrieval, chunking and vector store settings
  docchat_core::PipelineConfig pipeline;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    config.metadata_db_path =
        json_config.value("metadata_db_path", std::string("./data/docchat.db"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model =
        json_config.value("embedding_model", std::string("mxbai-embed-large"));
    config.generation_model = json_config.value("generation_model", std::string("llama3.1"));

    try {
      config.generation_timeout_seconds = json_config.value("generation_timeout_seconds", 120);
      config.num_workers = json_config.value("num_workers", 1);
      config.worker_poll_interval_ms = json_config.value("worker_poll_interval_ms", 1000);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid numeric setting: ") + e.what());
    }

    if (json_config.contains("pipeline")) {
      config.pipeline = pipeline_from_json(json_config.at("pipeline"));
    }

    config.validate();
    return config;
  }

  static docchat_core::PipelineConfig pipeline_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
      throw std::runtime_error("pipeline must be a JSON object");
    }
    docchat_core::PipelineConfig p;
    try {
      p.chunk_size = j.value("chunk_size", p.chunk_size);
      p.chunk_overlap = j.value("chunk_overlap", p.chunk_overlap);
      p.retrieval_k = j.value("retrieval_k", p.retrieval_k);
      p.score_threshold = j.value("score_threshold", p.score_threshold);
      p.context_token_budget = j.value("context_token_budget", p.context_token_budget);
      p.embedding_batch_size = j.value("embedding_batch_size", p.embedding_batch_size);
      p.embedding_dimension = j.value("embedding_dimension", p.embedding_dimension);
      p.retry_max_attempts = j.value("retry_max_attempts", p.retry_max_attempts);
      p.retry_base_delay_ms = j.value("retry_base_delay_ms", p.retry_base_delay_ms);
      p.retry_jitter = j.value("retry_jitter", p.retry_jitter);
      p.generation_retry_attempts =
          j.value("generation_retry_attempts", p.generation_retry_attempts);
      p.vector_index_path = j.value("vector_index_path", p.vector_index_path);
      if (j.contains("vector_backend")) {
        p.vector_backend =
            docchat_core::vector_backend_from_string(j.at("vector_backend").get<std::string>());
      }
      if (j.contains("similarity_metric")) {
        p.similarity_metric = docchat_core::similarity_metric_from_string(
            j.at("similarity_metric").get<std::string>());
      }
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid pipeline setting: ") + e.what());
    }
    return p;
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (metadata_db_path.empty()) {
      throw std::runtime_error("metadata_db_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty");
    }
    if (generation_timeout_seconds <= 0) {
      throw std::runtime_error("generation_timeout_seconds must be greater than 0");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (worker_poll_interval_ms < 10) {
      throw std::runtime_error("worker_poll_interval_ms must be at least 10ms");
    }
    try {
      pipeline.validate();
    } catch (const docchat_core::InvalidConfigError& e) {
      throw std::runtime_error(e.what());
    }
  }
};

}  // namespace docchat_api

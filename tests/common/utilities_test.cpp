#include "utilities_test.hpp"

#include <unistd.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>

#include "docchat_core/extractors/text_extractor.hpp"

namespace docchat_tests {

namespace {

std::atomic<int> temp_counter{0};

uint32_t fnv1a(const std::string& word) {
  uint32_t hash = 2166136261u;
  for (unsigned char c : word) {
    hash ^= c;
    hash *= 16777619u;
  }
  return hash;
}

}  // namespace

std::filesystem::path TestUtilities::create_temp_path(const std::string& suffix) {
  auto temp_dir = std::filesystem::temp_directory_path() / "docchat_tests";
  std::filesystem::create_directories(temp_dir);

  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();

  return temp_dir / ("test_" + std::to_string(getpid()) + "_" + std::to_string(timestamp) + "_" +
                     std::to_string(temp_counter++) + suffix);
}

std::filesystem::path TestUtilities::create_temp_test_db() {
  return create_temp_path(".db");
}

void TestUtilities::cleanup_temp_db(const std::filesystem::path& db_path) {
  std::error_code ec;
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(db_path.string() + suffix, ec);
  }

  auto parent_dir = db_path.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

docchat_core::Chunk TestUtilities::create_test_chunk(long long document_id,
                                                     int sequence_index,
                                                     const std::string& text) {
  docchat_core::Chunk chunk;
  chunk.id = docchat_core::make_chunk_id(document_id, sequence_index);
  chunk.document_id = document_id;
  chunk.text = text;
  chunk.sequence_index = sequence_index;
  chunk.offset_start = static_cast<size_t>(sequence_index) * 10;
  chunk.offset_end = chunk.offset_start + text.size();
  return chunk;
}

std::vector<docchat_core::Chunk> TestUtilities::create_test_chunks(long long document_id,
                                                                   int count,
                                                                   const std::string& base_text) {
  std::vector<docchat_core::Chunk> chunks;
  chunks.reserve(count);
  for (int i = 0; i < count; ++i) {
    chunks.push_back(create_test_chunk(document_id, i, base_text + " " + std::to_string(i)));
  }
  return chunks;
}

std::vector<float> TestUtilities::axis_vector(size_t dimension, size_t axis, float scale) {
  std::vector<float> v(dimension, 0.0f);
  v[axis % dimension] = scale;
  return v;
}

docchat_core::PipelineConfig TestUtilities::fast_pipeline_config(size_t dimension) {
  docchat_core::PipelineConfig config;
  config.chunk_size = 20;
  config.chunk_overlap = 5;
  config.retrieval_k = 3;
  config.score_threshold = 0.0f;
  config.context_token_budget = 512;
  config.embedding_batch_size = 4;
  config.embedding_dimension = dimension;
  config.retry_max_attempts = 2;
  config.retry_base_delay_ms = 1;
  config.retry_jitter = 0.0;
  config.generation_retry_attempts = 1;
  config.vector_backend = docchat_core::VectorBackend::MEMORY;
  config.similarity_metric = docchat_core::SimilarityMetric::COSINE;
  return config;
}

std::vector<float> HashingEmbedder::get_embedding(const std::string& text) {
  ++calls_;
  std::vector<float> v(dimension_, 0.0f);
  std::string word;
  auto flush = [&]() {
    if (!word.empty()) {
      v[fnv1a(word) % dimension_] += 1.0f;
      word.clear();
    }
  };
  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      word.push_back(static_cast<char>(std::tolower(c)));
    } else {
      flush();
    }
  }
  flush();

  float norm = 0.0f;
  for (float x : v) {
    norm += x * x;
  }
  if (norm > 0.0f) {
    norm = std::sqrt(norm);
    for (float& x : v) {
      x /= norm;
    }
  }
  return v;
}

long long DatabaseTestBase::create_document_in_status(const std::string& filename,
                                                      const std::string& content,
                                                      docchat_core::DocumentStatus status) {
  using docchat_core::DocumentStatus;
  long long id = document_store_->create_document(
      filename, docchat_core::TextExtractor::compute_content_hash(content), content);
  if (status == DocumentStatus::UPLOADED) {
    return id;
  }
  if (status == DocumentStatus::FAILED) {
    document_store_->transition_status(id, DocumentStatus::FAILED,
                                       std::string(docchat_core::failure_reason::EXTRACTION));
    return id;
  }
  for (auto next : {DocumentStatus::EXTRACTING, DocumentStatus::CHUNKING,
                    DocumentStatus::EMBEDDING, DocumentStatus::INDEXED}) {
    document_store_->transition_status(id, next);
    if (next == status) {
      break;
    }
  }
  return id;
}

}  // namespace docchat_tests

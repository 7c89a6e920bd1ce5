#include "docchat_core/index/faiss_vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/index_io.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>

namespace docchat_core {

FaissVectorIndex::FaissVectorIndex(size_t dimension,
                                   SimilarityMetric metric,
                                   const std::filesystem::path &index_path)
    : dimension_(dimension), metric_(metric), index_path_(index_path) {
  if (dimension_ == 0) {
    throw InvalidConfigError("vector index dimension must be greater than 0");
  }
  if (!index_path_.empty() && std::filesystem::exists(index_path_)) {
    load();
  } else {
    index_ = create_base_index();
  }
}

FaissVectorIndex::~FaissVectorIndex() = default;

std::unique_ptr<faiss::IndexIDMap2> FaissVectorIndex::create_base_index() const {
  const auto d = static_cast<faiss::idx_t>(dimension_);
  faiss::Index *base_index = nullptr;
  if (metric_ == SimilarityMetric::COSINE) {
    base_index = new faiss::IndexFlatIP(d);
  } else {
    base_index = new faiss::IndexFlatL2(d);
  }
  // Wrap with IDMap2 to enable add_with_ids and remove_ids
  auto index = std::make_unique<faiss::IndexIDMap2>(base_index);
  index->own_fields = true;
  return index;
}

std::vector<float> FaissVectorIndex::prepare_vector(const std::vector<float> &vector) const {
  std::vector<float> prepared(vector);
  if (metric_ == SimilarityMetric::COSINE) {
    double norm = 0.0;
    for (float v : prepared) {
      norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
      const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
      for (float &v : prepared) {
        v *= inv;
      }
    }
  }
  return prepared;
}

float FaissVectorIndex::to_score(float faiss_distance) const {
  if (metric_ == SimilarityMetric::COSINE) {
    return faiss_distance;
  }
  // IndexFlatL2 reports squared distances
  return inverse_distance_score(std::sqrt(std::max(0.0f, faiss_distance)));
}

void FaissVectorIndex::insert(const std::string &chunk_id,
                              const std::vector<float> &vector,
                              const VectorMetadata &metadata) {
  if (vector.size() != dimension_) {
    throw DimensionMismatchError(dimension_, vector.size());
  }
  const std::vector<float> prepared = prepare_vector(vector);

  std::unique_lock lock(mutex_);
  try {
    auto existing = label_by_chunk_.find(chunk_id);
    if (existing != label_by_chunk_.end()) {
      remove_labels({existing->second});
      entry_by_label_.erase(existing->second);
      label_by_chunk_.erase(existing);
    }

    const faiss::idx_t label = next_label_++;
    index_->add_with_ids(1, prepared.data(), &label);
    label_by_chunk_[chunk_id] = label;
    entry_by_label_[label] = LabelEntry{chunk_id, metadata};
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("insert of " + chunk_id + " failed: " + e.what());
  }
}

std::vector<SearchHit> FaissVectorIndex::search(const std::vector<float> &query,
                                                int k,
                                                float score_threshold) const {
  if (query.size() != dimension_) {
    throw DimensionMismatchError(dimension_, query.size());
  }
  if (k <= 0) {
    return {};
  }
  const std::vector<float> prepared = prepare_vector(query);

  std::shared_lock lock(mutex_);
  const faiss::idx_t total = index_->ntotal;
  if (total == 0) {
    return {};
  }

  // One extra result reveals a tie at the cutoff. FAISS breaks ties by
  // insertion order, so on a tie everything is fetched and re-ranked by id.
  faiss::idx_t fetch = std::min<faiss::idx_t>(total, static_cast<faiss::idx_t>(k) + 1);
  std::vector<float> distances;
  std::vector<faiss::idx_t> labels;
  while (true) {
    distances.assign(fetch, 0.0f);
    labels.assign(fetch, -1);
    try {
      index_->search(1, prepared.data(), fetch, distances.data(), labels.data());
    } catch (const faiss::FaissException &e) {
      throw VectorIndexError(std::string("search failed: ") + e.what());
    }
    if (fetch < total && fetch > k && to_score(distances[k - 1]) == to_score(distances[k])) {
      fetch = total;
      continue;
    }
    break;
  }

  std::vector<SearchHit> hits;
  hits.reserve(labels.size());
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] == -1) {
      continue;
    }
    auto it = entry_by_label_.find(labels[i]);
    if (it == entry_by_label_.end()) {
      std::cerr << "Warning: Faiss returned label " << labels[i]
                << " with no corresponding chunk id." << std::endl;
      continue;
    }
    hits.push_back({it->second.chunk_id, it->second.metadata.document_id, to_score(distances[i])});
  }
  return rank_hits(std::move(hits), k, score_threshold);
}

size_t FaissVectorIndex::remove_document(long long document_id) {
  std::unique_lock lock(mutex_);
  std::vector<faiss::idx_t> labels;
  for (const auto &[label, entry] : entry_by_label_) {
    if (entry.metadata.document_id == document_id) {
      labels.push_back(label);
    }
  }
  if (labels.empty()) {
    return 0;
  }

  try {
    remove_labels(labels);
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("removal of document " + std::to_string(document_id) +
                           " failed: " + e.what());
  }
  for (faiss::idx_t label : labels) {
    auto it = entry_by_label_.find(label);
    label_by_chunk_.erase(it->second.chunk_id);
    entry_by_label_.erase(it);
  }
  return labels.size();
}

void FaissVectorIndex::remove_labels(const std::vector<faiss::idx_t> &labels) {
  faiss::IDSelectorBatch selector(labels.size(), labels.data());
  index_->remove_ids(selector);
}

size_t FaissVectorIndex::size() const {
  std::shared_lock lock(mutex_);
  return static_cast<size_t>(index_->ntotal);
}

bool FaissVectorIndex::contains(const std::string &chunk_id) const {
  std::shared_lock lock(mutex_);
  return label_by_chunk_.count(chunk_id) > 0;
}

size_t FaissVectorIndex::count_for_document(long long document_id) const {
  std::shared_lock lock(mutex_);
  return static_cast<size_t>(
      std::count_if(entry_by_label_.begin(), entry_by_label_.end(), [document_id](const auto &kv) {
        return kv.second.metadata.document_id == document_id;
      }));
}

std::filesystem::path FaissVectorIndex::sidecar_path() const {
  return std::filesystem::path(index_path_.string() + ".ids.json");
}

void FaissVectorIndex::flush() {
  if (index_path_.empty()) {
    return;
  }

  std::unique_lock lock(mutex_);
  if (index_path_.has_parent_path()) {
    std::filesystem::create_directories(index_path_.parent_path());
  }
  try {
    faiss::write_index(index_.get(), index_path_.c_str());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("failed to write " + index_path_.string() + ": " + e.what());
  }

  nlohmann::json sidecar;
  sidecar["next_label"] = next_label_;
  sidecar["entries"] = nlohmann::json::array();
  for (const auto &[label, entry] : entry_by_label_) {
    sidecar["entries"].push_back({{"label", label},
                                  {"chunk_id", entry.chunk_id},
                                  {"document_id", entry.metadata.document_id},
                                  {"sequence_index", entry.metadata.sequence_index}});
  }
  std::ofstream out(sidecar_path());
  if (!out) {
    throw VectorIndexError("failed to open " + sidecar_path().string() + " for writing");
  }
  out << sidecar.dump();
}

void FaissVectorIndex::load() {
  faiss::Index *raw = nullptr;
  try {
    raw = faiss::read_index(index_path_.c_str());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("failed to read " + index_path_.string() + ": " + e.what());
  }

  std::unique_ptr<faiss::Index> loaded(raw);
  auto *id_map = dynamic_cast<faiss::IndexIDMap2 *>(loaded.get());
  if (!id_map) {
    throw VectorIndexError(index_path_.string() + " does not hold an id-mapped index");
  }
  if (static_cast<size_t>(id_map->d) != dimension_) {
    throw DimensionMismatchError(dimension_, static_cast<size_t>(id_map->d));
  }
  const faiss::MetricType expected_metric = metric_ == SimilarityMetric::COSINE
                                                ? faiss::METRIC_INNER_PRODUCT
                                                : faiss::METRIC_L2;
  if (id_map->metric_type != expected_metric) {
    throw InvalidConfigError("index at " + index_path_.string() +
                             " was built for a different similarity_metric");
  }
  loaded.release();
  index_.reset(id_map);

  std::ifstream in(sidecar_path());
  if (!in) {
    if (index_->ntotal > 0) {
      throw VectorIndexError("missing label map " + sidecar_path().string());
    }
    return;
  }
  try {
    nlohmann::json sidecar = nlohmann::json::parse(in);
    next_label_ = sidecar.value("next_label", static_cast<faiss::idx_t>(0));
    for (const auto &item : sidecar.at("entries")) {
      const auto label = item.at("label").get<faiss::idx_t>();
      LabelEntry entry{item.at("chunk_id").get<std::string>(),
                       VectorMetadata{item.at("document_id").get<long long>(),
                                      item.at("sequence_index").get<int>()}};
      label_by_chunk_[entry.chunk_id] = label;
      entry_by_label_[label] = std::move(entry);
      next_label_ = std::max(next_label_, label + 1);
    }
  } catch (const nlohmann::json::exception &e) {
    throw VectorIndexError("malformed label map " + sidecar_path().string() + ": " + e.what());
  }
  std::cout << "FaissVectorIndex: loaded " << index_->ntotal << " vectors from "
            << index_path_.string() << std::endl;
}

}  // namespace docchat_core

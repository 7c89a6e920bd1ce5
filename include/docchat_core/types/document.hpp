#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace docchat_core {

// Ordered by pipeline progress. Failed may be entered from any non-terminal state.
enum class DocumentStatus { UPLOADED, EXTRACTING, CHUNKING, EMBEDDING, INDEXED, FAILED };

inline std::string to_string(DocumentStatus status) {
  switch (status) {
    case DocumentStatus::UPLOADED:
      return "UPLOADED";
    case DocumentStatus::EXTRACTING:
      return "EXTRACTING";
    case DocumentStatus::CHUNKING:
      return "CHUNKING";
    case DocumentStatus::EMBEDDING:
      return "EMBEDDING";
    case DocumentStatus::INDEXED:
      return "INDEXED";
    case DocumentStatus::FAILED:
      return "FAILED";
  }
  return "UNKNOWN";
}

inline DocumentStatus document_status_from_string(const std::string &str) {
  if (str == "UPLOADED")
    return DocumentStatus::UPLOADED;
  if (str == "EXTRACTING")
    return DocumentStatus::EXTRACTING;
  if (str == "CHUNKING")
    return DocumentStatus::CHUNKING;
  if (str == "EMBEDDING")
    return DocumentStatus::EMBEDDING;
  if (str == "INDEXED")
    return DocumentStatus::INDEXED;
  if (str == "FAILED")
    return DocumentStatus::FAILED;
  throw std::invalid_argument("Unknown DocumentStatus: " + str);
}

inline bool is_terminal(DocumentStatus status) {
  return status == DocumentStatus::INDEXED || status == DocumentStatus::FAILED;
}

// True when `to` is a legal next state for `from` within one revision.
inline bool is_valid_transition(DocumentStatus from, DocumentStatus to) {
  if (is_terminal(from)) {
    return false;
  }
  if (to == DocumentStatus::FAILED) {
    return true;
  }
  return static_cast<int>(to) == static_cast<int>(from) + 1;
}

// Stage names used as failure reasons.
namespace failure_reason {
inline constexpr const char *EXTRACTION = "extraction";
inline constexpr const char *CHUNKING = "chunking";
inline constexpr const char *EMBEDDING = "embedding";
inline constexpr const char *INDEXING = "indexing";
inline constexpr const char *CANCELLED = "cancelled";
}  // namespace failure_reason

struct Document {
  long long id = 0;
  std::string filename;
  std::string content_hash;
  DocumentStatus status = DocumentStatus::UPLOADED;
  std::optional<std::string> failure_reason;
  int revision = 1;
  std::chrono::system_clock::time_point created_at;
  std::vector<std::string> chunk_ids;
};

}  // namespace docchat_core

#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace docchat_core {

enum class TurnRole { USER, ASSISTANT };

inline std::string to_string(TurnRole role) {
  switch (role) {
    case TurnRole::USER:
      return "user";
    case TurnRole::ASSISTANT:
      return "assistant";
  }
  return "user";
}

inline TurnRole turn_role_from_string(const std::string &str) {
  if (str == "user")
    return TurnRole::USER;
  if (str == "assistant")
    return TurnRole::ASSISTANT;
  throw std::invalid_argument("Unknown TurnRole: " + str);
}

struct Citation {
  int marker = 0;
  long long document_id = 0;
  std::string chunk_id;
  float score = 0.0f;

  bool operator==(const Citation &) const = default;
};

struct Turn {
  std::string id;
  std::string conversation_id;
  TurnRole role = TurnRole::USER;
  std::string text;
  std::vector<Citation> citations;
  std::chrono::system_clock::time_point timestamp;
  // Empty means the turn completed ("ok"); otherwise the failure reason.
  std::optional<std::string> failure_reason;

  bool ok() const {
    return !failure_reason.has_value();
  }

  bool operator==(const Turn &) const = default;
};

struct Conversation {
  std::string id;
  std::chrono::system_clock::time_point created_at;
  std::vector<Turn> turns;

  bool operator==(const Conversation &) const = default;
};

}  // namespace docchat_core

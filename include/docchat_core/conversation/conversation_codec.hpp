#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "docchat_core/errors.hpp"
#include "docchat_core/types/conversation.hpp"

namespace docchat_core {

enum class ExportFormat { JSON, TEXT, MARKDOWN };

std::string to_string(ExportFormat format);
// Throws std::invalid_argument for an unknown name.
ExportFormat export_format_from_string(const std::string &str);

class InvalidConversationDataError : public PipelineError {
 public:
  explicit InvalidConversationDataError(const std::string &message)
      : PipelineError("Invalid conversation data: " + message) {}
};

/**
 * @brief Serialization of a conversation's turn sequence.
 *
 * Every function here depends only on its argument. The JSON form is the
 * interchange format: decode(encode(c)) reproduces ids, roles, text,
 * citations, turn state and second-resolution timestamps.
 */
class ConversationCodec {
 public:
  static nlohmann::json turn_to_json(const Turn &turn);
  static nlohmann::json to_json(const Conversation &conversation);
  static Conversation from_json(const nlohmann::json &json);

  static std::string encode(const Conversation &conversation, ExportFormat format);

  // Parses the JSON form. Throws InvalidConversationDataError.
  static Conversation decode(const std::string &bytes);
};

}  // namespace docchat_core

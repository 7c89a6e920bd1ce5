#include "docchat_core/conversation/conversation_codec.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "docchat_core/db/time_format.hpp"

namespace docchat_core {

std::string to_string(ExportFormat format) {
  switch (format) {
    case ExportFormat::JSON:
      return "json";
    case ExportFormat::TEXT:
      return "text";
    case ExportFormat::MARKDOWN:
      return "markdown";
  }
  return "json";
}

ExportFormat export_format_from_string(const std::string &str) {
  if (str == "json")
    return ExportFormat::JSON;
  if (str == "text" || str == "txt")
    return ExportFormat::TEXT;
  if (str == "markdown" || str == "md")
    return ExportFormat::MARKDOWN;
  throw std::invalid_argument("Unknown export format: " + str);
}

namespace {

std::string format_score(float score) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << score;
  return oss.str();
}

std::string role_title(TurnRole role) {
  return role == TurnRole::USER ? "User" : "Assistant";
}

nlohmann::json citation_to_json(const Citation &citation) {
  return {{"marker", citation.marker},
          {"document_id", citation.document_id},
          {"chunk_id", citation.chunk_id},
          {"score", citation.score}};
}

Citation citation_from_json(const nlohmann::json &json) {
  Citation citation;
  citation.marker = json.at("marker").get<int>();
  citation.document_id = json.at("document_id").get<long long>();
  citation.chunk_id = json.at("chunk_id").get<std::string>();
  citation.score = json.at("score").get<float>();
  return citation;
}

std::string encode_text(const Conversation &conversation) {
  std::ostringstream out;
  out << "Conversation " << conversation.id << " (created "
      << time_point_to_string(conversation.created_at) << " UTC)\n";
  for (const auto &turn : conversation.turns) {
    out << "\n[" << time_point_to_string(turn.timestamp) << "] " << to_string(turn.role);
    if (!turn.ok()) {
      out << " (failed: " << *turn.failure_reason << ")";
    }
    out << ": " << turn.text << "\n";
    for (const auto &citation : turn.citations) {
      out << "    [" << citation.marker << "] document " << citation.document_id << ", chunk "
          << citation.chunk_id << ", score " << format_score(citation.score) << "\n";
    }
  }
  return out.str();
}

std::string encode_markdown(const Conversation &conversation) {
  std::ostringstream out;
  out << "# Conversation " << conversation.id << "\n\n";
  out << "_Created " << time_point_to_string(conversation.created_at) << " UTC_\n";
  for (const auto &turn : conversation.turns) {
    out << "\n### " << role_title(turn.role) << " (" << time_point_to_string(turn.timestamp)
        << ")\n\n";
    if (!turn.ok()) {
      out << "> **Failed:** " << *turn.failure_reason << "\n";
      if (!turn.text.empty()) {
        out << "\n" << turn.text << "\n";
      }
    } else {
      out << turn.text << "\n";
    }
    if (!turn.citations.empty()) {
      out << "\n**Sources**\n\n";
      for (const auto &citation : turn.citations) {
        out << citation.marker << ". document " << citation.document_id << ", chunk `"
            << citation.chunk_id << "` (score " << format_score(citation.score) << ")\n";
      }
    }
  }
  return out.str();
}

}  // namespace

nlohmann::json ConversationCodec::turn_to_json(const Turn &turn) {
  nlohmann::json citations = nlohmann::json::array();
  for (const auto &citation : turn.citations) {
    citations.push_back(citation_to_json(citation));
  }
  nlohmann::json item = {{"id", turn.id},
                         {"role", to_string(turn.role)},
                         {"text", turn.text},
                         {"timestamp", time_point_to_string(turn.timestamp)},
                         {"status", turn.ok() ? "ok" : "failed"},
                         {"citations", citations}};
  if (turn.failure_reason) {
    item["failure_reason"] = *turn.failure_reason;
  }
  return item;
}

nlohmann::json ConversationCodec::to_json(const Conversation &conversation) {
  nlohmann::json turns = nlohmann::json::array();
  for (const auto &turn : conversation.turns) {
    turns.push_back(turn_to_json(turn));
  }
  return {{"id", conversation.id},
          {"created_at", time_point_to_string(conversation.created_at)},
          {"turns", turns}};
}

Conversation ConversationCodec::from_json(const nlohmann::json &json) {
  try {
    Conversation conversation;
    conversation.id = json.at("id").get<std::string>();
    if (conversation.id.empty()) {
      throw InvalidConversationDataError("conversation id is empty");
    }
    conversation.created_at = string_to_time_point(json.at("created_at").get<std::string>());

    for (const auto &item : json.at("turns")) {
      Turn turn;
      turn.id = item.at("id").get<std::string>();
      turn.conversation_id = conversation.id;
      turn.role = turn_role_from_string(item.at("role").get<std::string>());
      turn.text = item.at("text").get<std::string>();
      turn.timestamp = string_to_time_point(item.at("timestamp").get<std::string>());

      const std::string status = item.value("status", "ok");
      if (status == "failed") {
        turn.failure_reason = item.value("failure_reason", "unknown");
      } else if (status != "ok") {
        throw InvalidConversationDataError("turn " + turn.id + " has unknown status '" + status +
                                           "'");
      }
      for (const auto &citation : item.value("citations", nlohmann::json::array())) {
        turn.citations.push_back(citation_from_json(citation));
      }
      conversation.turns.push_back(std::move(turn));
    }
    return conversation;
  } catch (const nlohmann::json::exception &e) {
    throw InvalidConversationDataError(e.what());
  } catch (const std::invalid_argument &e) {
    throw InvalidConversationDataError(e.what());
  } catch (const std::runtime_error &e) {
    throw InvalidConversationDataError(e.what());
  }
}

std::string ConversationCodec::encode(const Conversation &conversation, ExportFormat format) {
  switch (format) {
    case ExportFormat::JSON:
      return to_json(conversation).dump(2);
    case ExportFormat::TEXT:
      return encode_text(conversation);
    case ExportFormat::MARKDOWN:
      return encode_markdown(conversation);
  }
  return to_json(conversation).dump(2);
}

Conversation ConversationCodec::decode(const std::string &bytes) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(bytes);
  } catch (const nlohmann::json::parse_error &e) {
    throw InvalidConversationDataError(e.what());
  }
  return from_json(json);
}

}  // namespace docchat_core

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "docchat_core/types/conversation.hpp"

namespace docchat_core {

// Persistence for conversations and their append-only turn logs.
class ConversationStore {
 public:
  virtual ~ConversationStore() = default;

  // Stores the conversation with any turns it already has. Throws ConversationExistsError.
  virtual void create(const Conversation &conversation) = 0;

  virtual bool exists(const std::string &conversation_id) = 0;

  virtual std::optional<Conversation> load(const std::string &conversation_id) = 0;

  // Appends all turns or none. Throws ConversationNotFoundError.
  virtual void append_turns(const std::string &conversation_id, const std::vector<Turn> &turns) = 0;

  virtual std::vector<std::string> list_ids() = 0;
};

}  // namespace docchat_core

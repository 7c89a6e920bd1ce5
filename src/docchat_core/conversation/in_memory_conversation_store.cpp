#include "docchat_core/conversation/in_memory_conversation_store.hpp"

#include "docchat_core/errors.hpp"

namespace docchat_core {

void InMemoryConversationStore::create(const Conversation &conversation) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!conversations_.emplace(conversation.id, conversation).second) {
    throw ConversationExistsError(conversation.id);
  }
}

bool InMemoryConversationStore::exists(const std::string &conversation_id) {
  std::lock_guard<std::mutex> lock(mu_);
  return conversations_.count(conversation_id) > 0;
}

std::optional<Conversation> InMemoryConversationStore::load(const std::string &conversation_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = conversations_.find(conversation_id);
  if (it == conversations_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryConversationStore::append_turns(const std::string &conversation_id,
                                             const std::vector<Turn> &turns) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = conversations_.find(conversation_id);
  if (it == conversations_.end()) {
    throw ConversationNotFoundError(conversation_id);
  }
  it->second.turns.insert(it->second.turns.end(), turns.begin(), turns.end());
}

std::vector<std::string> InMemoryConversationStore::list_ids() {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> ids;
  ids.reserve(conversations_.size());
  for (const auto &[id, conversation] : conversations_) {
    ids.push_back(id);
  }
  return ids;
}

}  // namespace docchat_core

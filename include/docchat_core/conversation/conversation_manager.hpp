#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "docchat_core/conversation/conversation_codec.hpp"
#include "docchat_core/conversation/conversation_store.hpp"

namespace docchat_core {

/**
 * @class ConversationManager
 * @brief Sole writer of conversation turns.
 *
 * Appends to one conversation are serialized by a per-conversation mutex;
 * different conversations never wait on each other. Each appended turn gets a
 * fresh id and a timestamp truncated to whole seconds. Conversations are
 * never deleted here.
 */
class ConversationManager {
 public:
  explicit ConversationManager(std::shared_ptr<ConversationStore> store);

  Conversation create_conversation();

  // Returns the stored turn. Throws ConversationNotFoundError.
  Turn append(const std::string& conversation_id, Turn turn);

  // Appends every turn, adjacent and in order, or none of them.
  std::vector<Turn> append_all(const std::string& conversation_id, std::vector<Turn> turns);

  // Snapshot of the turns committed before the call.
  std::vector<Turn> history(const std::string& conversation_id);

  Conversation get_conversation(const std::string& conversation_id);
  std::vector<std::string> list_conversations();

  std::string export_conversation(const std::string& conversation_id, ExportFormat format);

  // Throws ConversationExistsError if the id is taken, InvalidConversationDataError on bad input.
  Conversation import_conversation(const std::string& bytes);

 private:
  std::shared_ptr<std::mutex> mutex_for(const std::string& conversation_id);

  std::shared_ptr<ConversationStore> store_;
  std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> conversation_mutexes_;
};

}  // namespace docchat_core

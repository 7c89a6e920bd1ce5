#pragma once

#include <map>
#include <mutex>

#include "docchat_core/conversation/conversation_store.hpp"

namespace docchat_core {

class InMemoryConversationStore : public ConversationStore {
 public:
  void create(const Conversation &conversation) override;
  bool exists(const std::string &conversation_id) override;
  std::optional<Conversation> load(const std::string &conversation_id) override;
  void append_turns(const std::string &conversation_id, const std::vector<Turn> &turns) override;
  std::vector<std::string> list_ids() override;

 private:
  std::mutex mu_;
  std::map<std::string, Conversation> conversations_;
};

}  // namespace docchat_core

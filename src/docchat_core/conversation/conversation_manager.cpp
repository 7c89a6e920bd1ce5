#include "docchat_core/conversation/conversation_manager.hpp"

#include <chrono>

#include "docchat_core/errors.hpp"
#include "docchat_core/random_id.hpp"

namespace docchat_core {

namespace {

std::chrono::system_clock::time_point now_seconds() {
  return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

}  // namespace

ConversationManager::ConversationManager(std::shared_ptr<ConversationStore> store)
    : store_(std::move(store)) {}

Conversation ConversationManager::create_conversation() {
  Conversation conversation;
  conversation.id = generate_random_id();
  conversation.created_at = now_seconds();
  store_->create(conversation);
  return conversation;
}

Turn ConversationManager::append(const std::string& conversation_id, Turn turn) {
  std::vector<Turn> turns;
  turns.push_back(std::move(turn));
  return append_all(conversation_id, std::move(turns)).front();
}

std::vector<Turn> ConversationManager::append_all(const std::string& conversation_id,
                                                  std::vector<Turn> turns) {
  auto mutex = mutex_for(conversation_id);
  std::lock_guard<std::mutex> lock(*mutex);

  const auto timestamp = now_seconds();
  for (auto& turn : turns) {
    turn.id = generate_random_id();
    turn.conversation_id = conversation_id;
    turn.timestamp = timestamp;
  }
  store_->append_turns(conversation_id, turns);
  return turns;
}

std::vector<Turn> ConversationManager::history(const std::string& conversation_id) {
  return get_conversation(conversation_id).turns;
}

Conversation ConversationManager::get_conversation(const std::string& conversation_id) {
  auto mutex = mutex_for(conversation_id);
  std::lock_guard<std::mutex> lock(*mutex);
  auto conversation = store_->load(conversation_id);
  if (!conversation) {
    throw ConversationNotFoundError(conversation_id);
  }
  return *conversation;
}

std::vector<std::string> ConversationManager::list_conversations() {
  return store_->list_ids();
}

std::string ConversationManager::export_conversation(const std::string& conversation_id,
                                                     ExportFormat format) {
  return ConversationCodec::encode(get_conversation(conversation_id), format);
}

Conversation ConversationManager::import_conversation(const std::string& bytes) {
  Conversation conversation = ConversationCodec::decode(bytes);

  auto mutex = mutex_for(conversation.id);
  std::lock_guard<std::mutex> lock(*mutex);
  store_->create(conversation);
  return conversation;
}

std::shared_ptr<std::mutex> ConversationManager::mutex_for(const std::string& conversation_id) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto& mutex = conversation_mutexes_[conversation_id];
  if (!mutex) {
    mutex = std::make_shared<std::mutex>();
  }
  return mutex;
}

}  // namespace docchat_core

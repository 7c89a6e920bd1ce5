#pragma once

#include <sqlite_modern_cpp.h>

#include "docchat_core/conversation/conversation_store.hpp"
#include "docchat_core/db/database_manager.hpp"

namespace docchat_core {

class ConversationStoreError : public std::exception {
 public:
  explicit ConversationStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Conversations and turns in the shared SQLite database. Citations are kept as a JSON column.
class SqliteConversationStore : public ConversationStore {
 public:
  explicit SqliteConversationStore(DatabaseManager &db_manager);

  void create(const Conversation &conversation) override;
  bool exists(const std::string &conversation_id) override;
  std::optional<Conversation> load(const std::string &conversation_id) override;
  void append_turns(const std::string &conversation_id, const std::vector<Turn> &turns) override;
  std::vector<std::string> list_ids() override;

 private:
  void insert_turns(sqlite::database &db,
                    const std::string &conversation_id,
                    int first_position,
                    const std::vector<Turn> &turns);

  DatabaseManager &db_manager_;
};

}  // namespace docchat_core

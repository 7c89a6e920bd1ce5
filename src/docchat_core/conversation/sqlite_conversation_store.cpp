#include "docchat_core/conversation/sqlite_conversation_store.hpp"

#include <nlohmann/json.hpp>

#include "docchat_core/db/pooled_connection.hpp"
#include "docchat_core/db/sqlite_error_utils.hpp"
#include "docchat_core/db/time_format.hpp"
#include "docchat_core/db/transaction.hpp"
#include "docchat_core/errors.hpp"

namespace docchat_core {

namespace {

std::string citations_to_string(const std::vector<Citation> &citations) {
  nlohmann::json json = nlohmann::json::array();
  for (const auto &citation : citations) {
    json.push_back({{"marker", citation.marker},
                    {"document_id", citation.document_id},
                    {"chunk_id", citation.chunk_id},
                    {"score", citation.score}});
  }
  return json.dump();
}

std::vector<Citation> citations_from_string(const std::string &str) {
  std::vector<Citation> citations;
  for (const auto &item : nlohmann::json::parse(str)) {
    citations.push_back(Citation{item.at("marker").get<int>(),
                                 item.at("document_id").get<long long>(),
                                 item.at("chunk_id").get<std::string>(),
                                 item.at("score").get<float>()});
  }
  return citations;
}

bool conversation_exists(sqlite::database &db, const std::string &conversation_id) {
  int count = 0;
  db << "SELECT COUNT(*) FROM conversations WHERE id = ?" << conversation_id >> count;
  return count > 0;
}

}  // namespace

SqliteConversationStore::SqliteConversationStore(DatabaseManager &db_manager)
    : db_manager_(db_manager) {}

void SqliteConversationStore::create(const Conversation &conversation) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    if (conversation_exists(*conn, conversation.id)) {
      throw ConversationExistsError(conversation.id);
    }
    *conn << "INSERT INTO conversations (id, created_at) VALUES (?,?)" << conversation.id
          << time_point_to_string(conversation.created_at);
    insert_turns(*conn, conversation.id, 0, conversation.turns);
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw ConversationStoreError(format_db_error("create_conversation", e));
  }
}

bool SqliteConversationStore::exists(const std::string &conversation_id) {
  try {
    PooledConnection conn(db_manager_);
    return conversation_exists(*conn, conversation_id);
  } catch (const sqlite::sqlite_exception &e) {
    throw ConversationStoreError(format_db_error("conversation_exists", e));
  }
}

std::optional<Conversation> SqliteConversationStore::load(const std::string &conversation_id) {
  try {
    std::optional<Conversation> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, created_at FROM conversations WHERE id = ?" << conversation_id >>
        [&](std::string id, std::string created_at) {
          Conversation conversation;
          conversation.id = std::move(id);
          conversation.created_at = string_to_time_point(created_at);
          result = std::move(conversation);
        };
    if (!result) {
      return result;
    }

    *conn << "SELECT id, role, text, citations, failure_reason, created_at FROM turns "
             "WHERE conversation_id = ? ORDER BY position ASC"
          << conversation_id >>
        [&](std::string id, std::string role, std::string text, std::string citations,
            std::optional<std::string> failure_reason, std::string created_at) {
          Turn turn;
          turn.id = std::move(id);
          turn.conversation_id = conversation_id;
          turn.role = turn_role_from_string(role);
          turn.text = std::move(text);
          turn.citations = citations_from_string(citations);
          turn.failure_reason = std::move(failure_reason);
          turn.timestamp = string_to_time_point(created_at);
          result->turns.push_back(std::move(turn));
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw ConversationStoreError(format_db_error("load_conversation", e));
  } catch (const nlohmann::json::exception &e) {
    throw ConversationStoreError("load_conversation failed: malformed citations for " +
                                 conversation_id + ": " + e.what());
  }
}

void SqliteConversationStore::append_turns(const std::string &conversation_id,
                                           const std::vector<Turn> &turns) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    if (!conversation_exists(*conn, conversation_id)) {
      throw ConversationNotFoundError(conversation_id);
    }
    int next_position = 0;
    *conn << "SELECT COALESCE(MAX(position) + 1, 0) FROM turns WHERE conversation_id = ?"
          << conversation_id >>
        next_position;
    insert_turns(*conn, conversation_id, next_position, turns);
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw ConversationStoreError(format_db_error("append_turns", e));
  }
}

std::vector<std::string> SqliteConversationStore::list_ids() {
  try {
    std::vector<std::string> ids;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id FROM conversations ORDER BY created_at ASC, id ASC" >>
        [&](std::string id) { ids.push_back(std::move(id)); };
    return ids;
  } catch (const sqlite::sqlite_exception &e) {
    throw ConversationStoreError(format_db_error("list_conversations", e));
  }
}

void SqliteConversationStore::insert_turns(sqlite::database &db,
                                           const std::string &conversation_id,
                                           int first_position,
                                           const std::vector<Turn> &turns) {
  int position = first_position;
  for (const auto &turn : turns) {
    db << "INSERT INTO turns (id, conversation_id, position, role, text, citations, "
          "failure_reason, created_at) VALUES (?,?,?,?,?,?,?,?)"
       << turn.id << conversation_id << position++ << to_string(turn.role) << turn.text
       << citations_to_string(turn.citations) << turn.failure_reason
       << time_point_to_string(turn.timestamp);
  }
}

}  // namespace docchat_core

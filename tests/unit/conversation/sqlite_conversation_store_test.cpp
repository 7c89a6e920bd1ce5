#include <gtest/gtest.h>

#include <algorithm>

#include "docchat_core/conversation/sqlite_conversation_store.hpp"
#include "docchat_core/db/time_format.hpp"
#include "docchat_core/errors.hpp"
#include "utilities_test.hpp"

namespace docchat_tests {

using namespace docchat_core;

class SqliteConversationStoreTest : public DatabaseTestBase {
 protected:
  void SetUp() override {
    DatabaseTestBase::SetUp();
    store_ = std::make_unique<SqliteConversationStore>(*db_manager_);
  }

  static Conversation make_conversation(const std::string& id) {
    Conversation conversation;
    conversation.id = id;
    conversation.created_at = string_to_time_point("2024-05-05 12:00:00");
    return conversation;
  }

  static Turn make_turn(const std::string& conversation_id,
                        const std::string& id,
                        TurnRole role,
                        const std::string& text) {
    Turn turn;
    turn.id = id;
    turn.conversation_id = conversation_id;
    turn.role = role;
    turn.text = text;
    turn.timestamp = string_to_time_point("2024-05-05 12:00:01");
    return turn;
  }

  std::unique_ptr<SqliteConversationStore> store_;
};

TEST_F(SqliteConversationStoreTest, CreateAndLoad) {
  store_->create(make_conversation("c1"));
  EXPECT_TRUE(store_->exists("c1"));
  EXPECT_FALSE(store_->exists("c2"));

  auto loaded = store_->load("c1");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, make_conversation("c1"));
  EXPECT_FALSE(store_->load("c2").has_value());
}

TEST_F(SqliteConversationStoreTest, DuplicateCreateThrows) {
  store_->create(make_conversation("c1"));
  EXPECT_THROW(store_->create(make_conversation("c1")), ConversationExistsError);
}

TEST_F(SqliteConversationStoreTest, AppendedTurnsKeepOrderAndCitations) {
  store_->create(make_conversation("c1"));
  auto question = make_turn("c1", "t1", TurnRole::USER, "Where is it?");
  auto answer = make_turn("c1", "t2", TurnRole::ASSISTANT, "Here [1][2].");
  answer.citations = {Citation{1, 4, "4:000001", 0.9f}, Citation{2, 5, "5:000000", 0.3f}};
  store_->append_turns("c1", {question, answer});

  auto failed = make_turn("c1", "t3", TurnRole::ASSISTANT, "");
  failed.failure_reason = "ModelUnavailable";
  store_->append_turns("c1", {failed});

  auto loaded = store_->load("c1");
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->turns.size(), 3u);
  EXPECT_EQ(loaded->turns[0], question);
  EXPECT_EQ(loaded->turns[1], answer);
  EXPECT_EQ(loaded->turns[2], failed);
}

TEST_F(SqliteConversationStoreTest, CreateWithTurnsStoresThem) {
  auto conversation = make_conversation("imported");
  conversation.turns = {make_turn("imported", "a", TurnRole::USER, "hello"),
                        make_turn("imported", "b", TurnRole::ASSISTANT, "hi")};
  store_->create(conversation);
  EXPECT_EQ(store_->load("imported"), conversation);
}

TEST_F(SqliteConversationStoreTest, AppendToUnknownConversationThrows) {
  EXPECT_THROW(store_->append_turns("nope", {make_turn("nope", "t", TurnRole::USER, "x")}),
               ConversationNotFoundError);
}

TEST_F(SqliteConversationStoreTest, FailedBatchLeavesNoPartialTurns) {
  store_->create(make_conversation("c1"));
  store_->append_turns("c1", {make_turn("c1", "t1", TurnRole::USER, "first")});
  // Second turn reuses an existing id, so the whole batch is rejected
  EXPECT_ANY_THROW(store_->append_turns("c1", {make_turn("c1", "t2", TurnRole::USER, "second"),
                                               make_turn("c1", "t1", TurnRole::ASSISTANT, "dup")}));
  EXPECT_EQ(store_->load("c1")->turns.size(), 1u);
}

TEST_F(SqliteConversationStoreTest, ListsConversationIds) {
  store_->create(make_conversation("b"));
  store_->create(make_conversation("a"));
  auto ids = store_->list_ids();
  ASSERT_EQ(ids.size(), 2u);
  EXPECT_NE(std::find(ids.begin(), ids.end(), "a"), ids.end());
  EXPECT_NE(std::find(ids.begin(), ids.end(), "b"), ids.end());
}

}  // namespace docchat_tests

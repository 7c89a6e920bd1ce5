#include <gtest/gtest.h>

#include <chrono>

#include "docchat_core/conversation/conversation_codec.hpp"
#include "docchat_core/db/time_format.hpp"

namespace docchat_tests {

using namespace docchat_core;

class ConversationCodecTest : public ::testing::Test {
 protected:
  void SetUp() override {
    created_ = string_to_time_point("2024-03-01 09:15:00");

    Turn question;
    question.id = "t1";
    question.conversation_id = "conv-1";
    question.role = TurnRole::USER;
    question.text = "What color is the sky?";
    question.timestamp = string_to_time_point("2024-03-01 09:15:02");

    Turn answer;
    answer.id = "t2";
    answer.conversation_id = "conv-1";
    answer.role = TurnRole::ASSISTANT;
    answer.text = "The sky is blue [1].";
    answer.citations = {Citation{1, 7, "7:000000", 0.5f}};
    answer.timestamp = string_to_time_point("2024-03-01 09:15:04");

    Turn failed;
    failed.id = "t3";
    failed.conversation_id = "conv-1";
    failed.role = TurnRole::ASSISTANT;
    failed.failure_reason = "Timeout";
    failed.timestamp = string_to_time_point("2024-03-01 09:16:00");

    conversation_.id = "conv-1";
    conversation_.created_at = created_;
    conversation_.turns = {question, answer, failed};
  }

  std::chrono::system_clock::time_point created_;
  Conversation conversation_;
};

TEST_F(ConversationCodecTest, JsonRoundTripPreservesTurns) {
  const std::string bytes = ConversationCodec::encode(conversation_, ExportFormat::JSON);
  Conversation decoded = ConversationCodec::decode(bytes);
  EXPECT_EQ(decoded, conversation_);
}

TEST_F(ConversationCodecTest, JsonCarriesTurnState) {
  auto json = ConversationCodec::to_json(conversation_);
  EXPECT_EQ(json["id"], "conv-1");
  EXPECT_EQ(json["created_at"], "2024-03-01 09:15:00");
  ASSERT_EQ(json["turns"].size(), 3u);
  EXPECT_EQ(json["turns"][0]["role"], "user");
  EXPECT_EQ(json["turns"][1]["status"], "ok");
  EXPECT_EQ(json["turns"][1]["citations"][0]["chunk_id"], "7:000000");
  EXPECT_EQ(json["turns"][2]["status"], "failed");
  EXPECT_EQ(json["turns"][2]["failure_reason"], "Timeout");
  EXPECT_FALSE(json["turns"][1].contains("failure_reason"));
}

TEST_F(ConversationCodecTest, TextExportListsTurnsAndSources) {
  const std::string text = ConversationCodec::encode(conversation_, ExportFormat::TEXT);
  EXPECT_NE(text.find("Conversation conv-1"), std::string::npos);
  EXPECT_NE(text.find("user: What color is the sky?"), std::string::npos);
  EXPECT_NE(text.find("assistant: The sky is blue [1]."), std::string::npos);
  EXPECT_NE(text.find("[1] document 7, chunk 7:000000, score 0.500"), std::string::npos);
  EXPECT_NE(text.find("assistant (failed: Timeout)"), std::string::npos);
  // Turns appear in order
  EXPECT_LT(text.find("What color"), text.find("The sky is blue"));
}

TEST_F(ConversationCodecTest, MarkdownExportUsesHeadings) {
  const std::string md = ConversationCodec::encode(conversation_, ExportFormat::MARKDOWN);
  EXPECT_EQ(md.rfind("# Conversation conv-1", 0), 0u);
  EXPECT_NE(md.find("### User (2024-03-01 09:15:02)"), std::string::npos);
  EXPECT_NE(md.find("**Sources**"), std::string::npos);
  EXPECT_NE(md.find("1. document 7, chunk `7:000000`"), std::string::npos);
  EXPECT_NE(md.find("> **Failed:** Timeout"), std::string::npos);
}

TEST_F(ConversationCodecTest, EmptyConversationEncodes) {
  Conversation empty;
  empty.id = "empty";
  empty.created_at = created_;
  EXPECT_EQ(ConversationCodec::decode(ConversationCodec::encode(empty, ExportFormat::JSON)), empty);
  EXPECT_NE(ConversationCodec::encode(empty, ExportFormat::TEXT).find("empty"), std::string::npos);
}

TEST(ConversationCodecDecodeTest, RejectsMalformedInput) {
  EXPECT_THROW(ConversationCodec::decode("not json"), InvalidConversationDataError);
  EXPECT_THROW(ConversationCodec::decode("{}"), InvalidConversationDataError);
  EXPECT_THROW(ConversationCodec::decode(R"({"id":"","created_at":"2024-01-01 00:00:00","turns":[]})"),
               InvalidConversationDataError);
  EXPECT_THROW(ConversationCodec::decode(R"({"id":"c","created_at":"yesterday","turns":[]})"),
               InvalidConversationDataError);
  EXPECT_THROW(
      ConversationCodec::decode(
          R"({"id":"c","created_at":"2024-01-01 00:00:00","turns":[{"id":"t","role":"system","text":"x","timestamp":"2024-01-01 00:00:00"}]})"),
      InvalidConversationDataError);
  EXPECT_THROW(
      ConversationCodec::decode(
          R"({"id":"c","created_at":"2024-01-01 00:00:00","turns":[{"id":"t","role":"user","text":"x","timestamp":"2024-01-01 00:00:00","status":"pending"}]})"),
      InvalidConversationDataError);
}

TEST(ConversationCodecDecodeTest, MissingStatusMeansOk) {
  auto conversation = ConversationCodec::decode(
      R"({"id":"c","created_at":"2024-01-01 00:00:00","turns":[{"id":"t","role":"user","text":"hi","timestamp":"2024-01-01 00:00:01"}]})");
  ASSERT_EQ(conversation.turns.size(), 1u);
  EXPECT_TRUE(conversation.turns[0].ok());
  EXPECT_EQ(conversation.turns[0].conversation_id, "c");
  EXPECT_TRUE(conversation.turns[0].citations.empty());
}

TEST(ExportFormatTest, ParsesNamesAndAliases) {
  EXPECT_EQ(export_format_from_string("json"), ExportFormat::JSON);
  EXPECT_EQ(export_format_from_string("txt"), ExportFormat::TEXT);
  EXPECT_EQ(export_format_from_string("md"), ExportFormat::MARKDOWN);
  EXPECT_THROW(export_format_from_string("pdf"), std::invalid_argument);
}

}  // namespace docchat_tests

#include <gtest/gtest.h>
#include <utf8.h>

#include <string>

#include "docchat_core/chunking/chunker.hpp"
#include "docchat_core/errors.hpp"

namespace docchat_tests {

using namespace docchat_core;

TEST(ChunkerTest, RejectsOverlapNotSmallerThanSize) {
  EXPECT_THROW(Chunker(10, 10), InvalidConfigError);
  EXPECT_THROW(Chunker(10, 12), InvalidConfigError);
  EXPECT_THROW(Chunker(0, 0), InvalidConfigError);
  EXPECT_NO_THROW(Chunker(10, 9));
}

TEST(ChunkerTest, EmptyTextProducesNoChunks) {
  Chunker chunker(20, 5);
  EXPECT_TRUE(chunker.split("").empty());
  EXPECT_TRUE(chunker.chunk(1, "").empty());
}

TEST(ChunkerTest, ShortTextIsASingleChunk) {
  Chunker chunker(100, 10);
  auto spans = chunker.split("short text");
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].offset_start, 0u);
  EXPECT_EQ(spans[0].offset_end, 10u);
  EXPECT_EQ(spans[0].text, "short text");
}

TEST(ChunkerTest, SkyExampleProducesThreeOverlappingChunks) {
  Chunker chunker(20, 5);
  auto spans = chunker.split("The sky is blue. Grass is green.");

  ASSERT_EQ(spans.size(), 3u);
  EXPECT_EQ(spans[0].text, "The sky is blue. Gra");
  EXPECT_EQ(spans[1].text, ". Grass is green.");
  EXPECT_EQ(spans[2].text, "n.");

  EXPECT_EQ(spans[0].offset_start, 0u);
  EXPECT_EQ(spans[0].offset_end, 20u);
  EXPECT_EQ(spans[1].offset_start, 15u);
  EXPECT_EQ(spans[1].offset_end, 32u);
  EXPECT_EQ(spans[2].offset_start, 30u);
  EXPECT_EQ(spans[2].offset_end, 32u);
}

TEST(ChunkerTest, ChunksCoverTheWholeTextWithConfiguredOverlap) {
  std::string text;
  for (int i = 0; i < 40; ++i) {
    text += "sentence number " + std::to_string(i) + ". ";
  }
  const size_t size = 37;
  const size_t overlap = 11;
  Chunker chunker(size, overlap);
  auto spans = chunker.split(text);

  ASSERT_FALSE(spans.empty());
  EXPECT_EQ(spans.front().offset_start, 0u);
  EXPECT_EQ(spans.back().offset_end, text.size());
  for (size_t i = 0; i < spans.size(); ++i) {
    EXPECT_LE(spans[i].offset_end - spans[i].offset_start, size);
    EXPECT_EQ(spans[i].text, text.substr(spans[i].offset_start,
                                         spans[i].offset_end - spans[i].offset_start));
    if (i > 0) {
      EXPECT_EQ(spans[i].offset_start, spans[i - 1].offset_start + (size - overlap));
      // No gap between neighbours
      EXPECT_LE(spans[i].offset_start, spans[i - 1].offset_end);
    }
  }
}

TEST(ChunkerTest, OffsetsCountCodePointsNotBytes) {
  // Each of these characters is more than one byte in UTF-8
  const std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9\xE2\x82\xAC\xE2\x82\xAC\xE2\x82\xAC";  // ééé€€€
  Chunker chunker(4, 1);
  auto spans = chunker.split(text);

  ASSERT_EQ(spans.size(), 2u);
  EXPECT_EQ(spans[0].offset_start, 0u);
  EXPECT_EQ(spans[0].offset_end, 4u);
  EXPECT_EQ(spans[0].text, "\xC3\xA9\xC3\xA9\xC3\xA9\xE2\x82\xAC");
  EXPECT_EQ(spans[1].offset_start, 3u);
  EXPECT_EQ(spans[1].offset_end, 6u);
  EXPECT_EQ(spans[1].text, "\xE2\x82\xAC\xE2\x82\xAC\xE2\x82\xAC");
}

TEST(ChunkerTest, ChunkingIsDeterministic) {
  const std::string text = "Deterministic chunking means identical input yields identical chunks.";
  Chunker chunker(16, 4);
  auto first = chunker.chunk(42, text);
  auto second = chunker.chunk(42, text);

  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].id, second[i].id);
    EXPECT_EQ(first[i].text, second[i].text);
    EXPECT_EQ(first[i].offset_start, second[i].offset_start);
    EXPECT_EQ(first[i].offset_end, second[i].offset_end);
  }
}

TEST(ChunkerTest, ChunkRecordsCarryDocumentAndSequence) {
  Chunker chunker(20, 5);
  auto chunks = chunker.chunk(7, "The sky is blue. Grass is green.");

  ASSERT_EQ(chunks.size(), 3u);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].document_id, 7);
    EXPECT_EQ(chunks[i].sequence_index, static_cast<int>(i));
    EXPECT_EQ(chunks[i].id, make_chunk_id(7, static_cast<int>(i)));
    EXPECT_FALSE(chunks[i].vector_id.has_value());
  }
  EXPECT_EQ(chunks[0].id, "7:000000");
}

TEST(ChunkerTest, InvalidUtf8Throws) {
  Chunker chunker(20, 5);
  EXPECT_THROW(chunker.split(std::string("abc\xFF\xFE", 5)), utf8::exception);
}

TEST(ChunkerTest, TokenEstimateRoundsUp) {
  EXPECT_EQ(estimate_tokens(""), 0u);
  EXPECT_EQ(estimate_tokens("abc"), 1u);
  EXPECT_EQ(estimate_tokens("abcdefg"), 2u);
  EXPECT_EQ(estimate_tokens("abcdefgh"), 3u);
  EXPECT_EQ(count_characters("\xC3\xA9t\xC3\xA9"), 3u);
}

}  // namespace docchat_tests

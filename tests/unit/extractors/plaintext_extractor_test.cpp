#include <gtest/gtest.h>

#include <string>

#include "docchat_core/errors.hpp"
#include "docchat_core/extractors/markdown_extractor.hpp"
#include "docchat_core/extractors/plaintext_extractor.hpp"
#include "docchat_core/extractors/text_extractor_factory.hpp"

namespace docchat_tests {

using namespace docchat_core;

TEST(PlainTextExtractorTest, HandlesTextExtensions) {
  PlainTextExtractor extractor;
  EXPECT_TRUE(extractor.can_handle("a.txt"));
  EXPECT_TRUE(extractor.can_handle("server.log"));
  EXPECT_FALSE(extractor.can_handle("a.md"));
  EXPECT_FALSE(extractor.can_handle("image.png"));
}

TEST(PlainTextExtractorTest, ReturnsNormalizedText) {
  PlainTextExtractor extractor;
  EXPECT_EQ(extractor.extract("The sky is blue.\r\nGrass is green.\r"),
            "The sky is blue.\nGrass is green.\n");
  EXPECT_EQ(extractor.extract(""), "");
}

TEST(PlainTextExtractorTest, ReplacesInvalidUtf8) {
  PlainTextExtractor extractor;
  const std::string text = extractor.extract(std::string("ok\xFF", 3));
  EXPECT_EQ(text.rfind("ok", 0), 0u);
  // U+FFFD replacement character
  EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
}

TEST(PlainTextExtractorTest, RejectsBinaryContent) {
  PlainTextExtractor extractor;
  EXPECT_THROW(extractor.extract(std::string("a\0b", 3)), ExtractionFailedError);
}

TEST(TextExtractorTest, ContentHashIsSha256Hex) {
  EXPECT_EQ(TextExtractor::compute_content_hash(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(TextExtractor::compute_content_hash("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(TextExtractorTest, ExtractWithHashHashesRawBytes) {
  PlainTextExtractor extractor;
  auto result = extractor.extract_with_hash("a\r\nb");
  EXPECT_EQ(result.text, "a\nb");
  EXPECT_EQ(result.content_hash, TextExtractor::compute_content_hash("a\r\nb"));
}

TEST(TextExtractorFactoryTest, PicksExtractorByExtension) {
  TextExtractorFactory factory;
  EXPECT_NE(dynamic_cast<const MarkdownExtractor*>(&factory.get_extractor_for("doc.md")),
            nullptr);
  EXPECT_NE(dynamic_cast<const PlainTextExtractor*>(&factory.get_extractor_for("doc.txt")),
            nullptr);
  EXPECT_TRUE(factory.supports("x.markdown"));
  EXPECT_FALSE(factory.supports("x.pdf"));
  EXPECT_THROW(factory.get_extractor_for("x.pdf"), ExtractionFailedError);
}

}  // namespace docchat_tests

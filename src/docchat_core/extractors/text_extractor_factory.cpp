#include "docchat_core/extractors/text_extractor_factory.hpp"

#include "docchat_core/errors.hpp"
#include "docchat_core/extractors/markdown_extractor.hpp"
#include "docchat_core/extractors/plaintext_extractor.hpp"

namespace docchat_core {
TextExtractorFactory::TextExtractorFactory() {
  extractors.push_back(std::make_unique<MarkdownExtractor>());
  extractors.push_back(std::make_unique<PlainTextExtractor>());
}

const TextExtractor& TextExtractorFactory::get_extractor_for(
    const std::filesystem::path& filename) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(filename)) {
      return *extractor;
    }
  }
  throw ExtractionFailedError("no suitable text extractor found for " + filename.string());
}

bool TextExtractorFactory::supports(const std::filesystem::path& filename) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(filename)) {
      return true;
    }
  }
  return false;
}
}  // namespace docchat_core

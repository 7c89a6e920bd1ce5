#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "text_extractor.hpp"

/**
 * @class TextExtractorFactory
 * @brief Manages and provides the correct TextExtractor for an uploaded document.
 *
 * This factory holds a collection of all available text extractors and
 * selects the first one that claims the document's file name.
 * This class is non-copyable and non-movable.
 */
namespace docchat_core {
class TextExtractorFactory {
 public:
  /**
   * @brief Constructs the factory and registers the built-in extractors.
   */
  TextExtractorFactory();
  virtual ~TextExtractorFactory() = default;

  /**
   * @brief Finds the extractor responsible for the given file name.
   *
   * @param filename The name the document was uploaded under.
   * @return A constant reference to the appropriate TextExtractor.
   * @throw ExtractionFailedError if no extractor handles the file type.
   */
  virtual const TextExtractor& get_extractor_for(const std::filesystem::path& filename) const;

  bool supports(const std::filesystem::path& filename) const;

  TextExtractorFactory(const TextExtractorFactory&) = delete;
  TextExtractorFactory& operator=(const TextExtractorFactory&) = delete;
  TextExtractorFactory(TextExtractorFactory&&) = delete;
  TextExtractorFactory& operator=(TextExtractorFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<TextExtractor>> extractors;
};
}  // namespace docchat_core

#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace docchat_core {

struct ExtractionResult {
  std::string content_hash;
  std::string text;
};

// Turns the raw bytes of an uploaded document into plain UTF-8 text.
class TextExtractor {
 public:
  virtual ~TextExtractor() = default;

  // Checks if this extractor can handle the given file name (by extension)
  virtual bool can_handle(const fs::path& filename) const = 0;

  // Throws ExtractionFailedError when the bytes cannot be turned into text.
  virtual std::string extract(const std::string& bytes) const = 0;

  // Combined operation - hash of the raw bytes and the extracted text
  ExtractionResult extract_with_hash(const std::string& bytes) const;

  // Hex SHA-256 of `bytes`
  static std::string compute_content_hash(const std::string& bytes);

 protected:
  // Replaces invalid UTF-8 sequences, drops a leading BOM and normalizes CRLF to LF.
  static std::string normalize_text(const std::string& bytes);
};

using TextExtractorPtr = std::unique_ptr<TextExtractor>;

}  // namespace docchat_core

#include "docchat_core/extractors/plaintext_extractor.hpp"

#include <algorithm>

#include "docchat_core/errors.hpp"

namespace docchat_core {

bool PlainTextExtractor::can_handle(const fs::path& filename) const {
  const std::string extension = filename.extension().string();
  return extension == ".txt" || extension == ".text" || extension == ".log";
}

/**
 * @brief Returns the document as normalized UTF-8.
 *
 * Content containing NUL bytes is treated as binary and rejected: the model
 * services cannot do anything useful with it.
 */
std::string PlainTextExtractor::extract(const std::string& bytes) const {
  if (std::find(bytes.begin(), bytes.end(), '\0') != bytes.end()) {
    throw ExtractionFailedError("content looks binary (contains NUL bytes)");
  }
  return normalize_text(bytes);
}

}  // namespace docchat_core

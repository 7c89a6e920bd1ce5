#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace docchat_core {

class CompressionError : public std::runtime_error {
 public:
  explicit CompressionError(const std::string& message) : std::runtime_error(message) {}
};

// Zstandard framing for chunk text and document source bytes at rest.
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  /**
   * @brief Compresses a block of data using Zstandard.
   * @return An empty vector for empty input, otherwise one zstd frame.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = DEFAULT_LEVEL);

  /**
   * @brief Inverse of compress(). Throws CompressionError on data that is not
   *        a single zstd frame with a recorded content size.
   */
  static std::string decompress(const std::vector<char>& compressed_data);
};

}  // namespace docchat_core

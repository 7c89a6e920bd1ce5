#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docchat_core/types/chunk.hpp"

namespace docchat_core {

// Heuristic used wherever a character count has to be turned into tokens.
inline constexpr float CHAR_PER_TOKEN_ESTIMATE = 3.5f;

// Number of Unicode code points in UTF-8 text. Throws utf8::invalid_utf8 on bad input.
size_t count_characters(const std::string& text);

// ceil(count_characters(text) / CHAR_PER_TOKEN_ESTIMATE)
size_t estimate_tokens(const std::string& text);

struct ChunkSpan {
  size_t offset_start;  // code points
  size_t offset_end;
  std::string text;
};

/**
 * @class Chunker
 * @brief Sliding-window splitter over UTF-8 text.
 *
 * Windows are `size` code points wide and start every `size - overlap` code
 * points, so chunk i starts at i * (size - overlap). Windows keep starting
 * until the start reaches the end of the text; the trailing windows may be
 * shorter than `size`. A window never cuts a multi-byte sequence.
 */
class Chunker {
 public:
  Chunker(size_t size, size_t overlap);

  size_t size() const {
    return size_;
  }
  size_t overlap() const {
    return overlap_;
  }

  std::vector<ChunkSpan> split(const std::string& text) const;

  // Chunk records for `document_id`, ids and sequence numbers assigned in order.
  std::vector<Chunk> chunk(long long document_id, const std::string& text) const;

 private:
  size_t size_;
  size_t overlap_;
};

// Validates (size, overlap) on every call; throws InvalidConfigError.
std::vector<ChunkSpan> chunk_text(const std::string& text, size_t size, size_t overlap);

}  // namespace docchat_core

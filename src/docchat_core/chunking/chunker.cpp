#include "docchat_core/chunking/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <cmath>

#include "docchat_core/errors.hpp"

namespace docchat_core {

namespace {

// Byte offset of every code point boundary, plus text.size() at the end.
std::vector<size_t> code_point_boundaries(const std::string& text) {
  std::vector<size_t> boundaries;
  boundaries.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    boundaries.push_back(static_cast<size_t>(it - text.begin()));
  }
  boundaries.push_back(text.size());
  return boundaries;
}

}  // namespace

size_t count_characters(const std::string& text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

size_t estimate_tokens(const std::string& text) {
  const size_t characters = count_characters(text);
  return static_cast<size_t>(std::ceil(static_cast<float>(characters) / CHAR_PER_TOKEN_ESTIMATE));
}

Chunker::Chunker(size_t size, size_t overlap) : size_(size), overlap_(overlap) {
  if (size_ == 0) {
    throw InvalidConfigError("chunk size must be greater than 0");
  }
  if (overlap_ >= size_) {
    throw InvalidConfigError("chunk overlap (" + std::to_string(overlap_) +
                             ") must be smaller than chunk size (" + std::to_string(size_) + ")");
  }
}

std::vector<ChunkSpan> Chunker::split(const std::string& text) const {
  std::vector<ChunkSpan> out;
  if (text.empty())
    return out;

  const std::vector<size_t> boundaries = code_point_boundaries(text);
  const size_t length = boundaries.size() - 1;
  const size_t step = size_ - overlap_;

  for (size_t start = 0; start < length; start += step) {
    const size_t end = std::min(start + size_, length);
    const size_t byte_start = boundaries[start];
    const size_t byte_end = boundaries[end];
    out.push_back({start, end, text.substr(byte_start, byte_end - byte_start)});
  }
  return out;
}

std::vector<Chunk> Chunker::chunk(long long document_id, const std::string& text) const {
  std::vector<ChunkSpan> spans = split(text);
  std::vector<Chunk> chunks;
  chunks.reserve(spans.size());

  int sequence_index = 0;
  for (auto& span : spans) {
    Chunk chunk;
    chunk.id = make_chunk_id(document_id, sequence_index);
    chunk.document_id = document_id;
    chunk.text = std::move(span.text);
    chunk.offset_start = span.offset_start;
    chunk.offset_end = span.offset_end;
    chunk.sequence_index = sequence_index;
    chunks.push_back(std::move(chunk));
    ++sequence_index;
  }
  return chunks;
}

std::vector<ChunkSpan> chunk_text(const std::string& text, size_t size, size_t overlap) {
  return Chunker(size, overlap).split(text);
}

}  // namespace docchat_core

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace docchat_core {

struct Chunk {
  std::string id;
  long long document_id = 0;
  std::string text;
  size_t offset_start = 0;  // code points, inclusive
  size_t offset_end = 0;    // code points, exclusive
  int sequence_index = 0;
  std::optional<std::string> vector_id;
};

// "<document_id>:<sequence_index padded to 6 digits>"
std::string make_chunk_id(long long document_id, int sequence_index);

}  // namespace docchat_core

#include "docchat_core/types.hpp"

#include <iomanip>
#include <sstream>

namespace docchat_core {

std::string make_chunk_id(long long document_id, int sequence_index) {
  std::stringstream ss;
  ss << document_id << ':' << std::setw(6) << std::setfill('0') << sequence_index;
  return ss.str();
}

}  // namespace docchat_core

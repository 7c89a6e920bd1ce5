#include "docchat_core/random_id.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace docchat_core {

std::string generate_random_id() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed: " +
                             std::string(ERR_error_string(ERR_get_error(), nullptr)));
  }
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned char b : bytes) {
    ss << std::setw(2) << static_cast<int>(b);
  }
  return ss.str();
}

}  // namespace docchat_core

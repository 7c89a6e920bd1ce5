#pragma once

#include <string>

namespace docchat_core {

// 32 lowercase hex characters from OpenSSL's CSPRNG.
std::string generate_random_id();

}  // namespace docchat_core

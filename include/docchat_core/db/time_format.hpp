#pragma once

#include <chrono>
#include <string>

namespace docchat_core {

// Timestamps are persisted as "%Y-%m-%d %H:%M:%S" in UTC.
std::string time_point_to_string(const std::chrono::system_clock::time_point& tp);

// Throws std::runtime_error if the string is not in the persisted format.
std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str);

}  // namespace docchat_core

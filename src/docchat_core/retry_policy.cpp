#include "docchat_core/retry_policy.hpp"

#include <algorithm>
#include <random>

#include "docchat_core/pipeline_config.hpp"

namespace docchat_core {

RetryPolicy::RetryPolicy(int max_attempts, std::chrono::milliseconds base_delay, double jitter)
    : max_attempts_(max_attempts), base_delay_(base_delay), jitter_(jitter) {
  if (max_attempts_ < 1) {
    throw InvalidConfigError("retry policy needs at least one attempt");
  }
  if (base_delay_.count() < 0) {
    throw InvalidConfigError("retry base delay cannot be negative");
  }
  if (jitter_ < 0.0 || jitter_ > 1.0) {
    throw InvalidConfigError("retry jitter must be within [0, 1]");
  }
}

RetryPolicy RetryPolicy::for_embedding(const PipelineConfig& config) {
  return RetryPolicy(config.retry_max_attempts,
                     std::chrono::milliseconds(config.retry_base_delay_ms), config.retry_jitter);
}

RetryPolicy RetryPolicy::for_generation(const PipelineConfig& config) {
  return RetryPolicy(config.generation_retry_attempts,
                     std::chrono::milliseconds(config.retry_base_delay_ms), config.retry_jitter);
}

std::chrono::milliseconds RetryPolicy::delay_for_attempt(int attempt, double random_unit) const {
  if (attempt < 1) {
    attempt = 1;
  }
  // Cap the exponent so a large attempt limit cannot overflow the delay.
  const int exponent = std::min(attempt - 1, 20);
  const double base = static_cast<double>(base_delay_.count()) * static_cast<double>(1LL << exponent);
  const double stretched = base * (1.0 + jitter_ * random_unit);
  return std::chrono::milliseconds(static_cast<long long>(stretched));
}

double RetryPolicy::next_random_unit() {
  thread_local std::mt19937 generator{std::random_device{}()};
  std::uniform_real_distribution<double> distribution(0.0, 1.0);
  return distribution(generator);
}

}  // namespace docchat_core

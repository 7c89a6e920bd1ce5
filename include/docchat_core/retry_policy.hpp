#pragma once

#include <chrono>
#include <iostream>
#include <string>

#include "docchat_core/cancellation.hpp"
#include "docchat_core/errors.hpp"

namespace docchat_core {

struct PipelineConfig;

/**
 * @class RetryPolicy
 * @brief Bounded exponential back-off for calls into external model services.
 *
 * Attempt n (1-based) that fails with a retryable error waits
 * base_delay * 2^(n-1), stretched by up to `jitter` of itself, before attempt
 * n+1. After max_attempts the last error propagates unchanged. Back-off sleeps
 * end early when the cancellation token fires.
 */
class RetryPolicy {
 public:
  RetryPolicy(int max_attempts, std::chrono::milliseconds base_delay, double jitter);

  static RetryPolicy for_embedding(const PipelineConfig& config);
  static RetryPolicy for_generation(const PipelineConfig& config);

  int max_attempts() const {
    return max_attempts_;
  }
  std::chrono::milliseconds base_delay() const {
    return base_delay_;
  }
  double jitter() const {
    return jitter_;
  }

  // `random_unit` in [0, 1) scales the jitter; exposed so tests can pin it.
  std::chrono::milliseconds delay_for_attempt(int attempt, double random_unit) const;

  template <typename RetryableError, typename Fn>
  auto run(Fn&& fn, const CancellationToken& token, const std::string& operation) const
      -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
      token.throw_if_cancelled(operation);
      try {
        return fn();
      } catch (const RetryableError& e) {
        if (attempt >= max_attempts_) {
          std::cerr << "RetryPolicy: " << operation << " failed after " << attempt
                    << " attempt(s): " << e.what() << std::endl;
          throw;
        }
        auto delay = delay_for_attempt(attempt, next_random_unit());
        std::cerr << "RetryPolicy: " << operation << " attempt " << attempt << "/"
                  << max_attempts_ << " failed (" << e.what() << "), retrying in "
                  << delay.count() << "ms" << std::endl;
        if (!token.wait_for(delay)) {
          throw OperationCancelledError(operation);
        }
      }
    }
  }

 private:
  static double next_random_unit();

  int max_attempts_;
  std::chrono::milliseconds base_delay_;
  double jitter_;
};

}  // namespace docchat_core

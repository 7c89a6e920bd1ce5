#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "docchat_core/cancellation.hpp"
#include "docchat_core/errors.hpp"
#include "docchat_core/pipeline_config.hpp"
#include "docchat_core/retry_policy.hpp"

namespace docchat_tests {

using namespace docchat_core;
using namespace std::chrono_literals;

TEST(RetryPolicyTest, RejectsInvalidSettings) {
  EXPECT_THROW(RetryPolicy(0, 10ms, 0.1), InvalidConfigError);
  EXPECT_THROW(RetryPolicy(1, -1ms, 0.1), InvalidConfigError);
  EXPECT_THROW(RetryPolicy(1, 10ms, 1.5), InvalidConfigError);
}

TEST(RetryPolicyTest, DelayDoublesPerAttempt) {
  RetryPolicy policy(5, 100ms, 0.0);
  EXPECT_EQ(policy.delay_for_attempt(1, 0.5), 100ms);
  EXPECT_EQ(policy.delay_for_attempt(2, 0.5), 200ms);
  EXPECT_EQ(policy.delay_for_attempt(3, 0.5), 400ms);
}

TEST(RetryPolicyTest, JitterStretchesDelayWithinBound) {
  RetryPolicy policy(3, 100ms, 0.5);
  EXPECT_EQ(policy.delay_for_attempt(1, 0.0), 100ms);
  EXPECT_EQ(policy.delay_for_attempt(1, 1.0), 150ms);
}

TEST(RetryPolicyTest, ReturnsFirstSuccess) {
  RetryPolicy policy(3, 1ms, 0.0);
  int calls = 0;
  int result = policy.run<ModelUnavailableError>(
      [&]() {
        if (++calls < 3) {
          throw ModelUnavailableError("busy");
        }
        return 42;
      },
      CancellationToken(), "test");
  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, RethrowsAfterMaxAttempts) {
  RetryPolicy policy(2, 1ms, 0.0);
  int calls = 0;
  EXPECT_THROW(policy.run<ModelUnavailableError>(
                   [&]() -> int {
                     ++calls;
                     throw ModelUnavailableError("down");
                   },
                   CancellationToken(), "test"),
               ModelUnavailableError);
  EXPECT_EQ(calls, 2);
}

TEST(RetryPolicyTest, OtherErrorsAreNotRetried) {
  RetryPolicy policy(5, 1ms, 0.0);
  int calls = 0;
  EXPECT_THROW(policy.run<ModelUnavailableError>(
                   [&]() -> int {
                     ++calls;
                     throw DimensionMismatchError(4, 3);
                   },
                   CancellationToken(), "test"),
               DimensionMismatchError);
  EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, CancellationDuringBackoffStopsRetrying) {
  RetryPolicy policy(5, 10s, 0.0);
  CancellationToken token;
  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(20ms);
    token.cancel();
  });

  auto started = std::chrono::steady_clock::now();
  EXPECT_THROW(policy.run<ModelUnavailableError>(
                   []() -> int { throw ModelUnavailableError("down"); }, token, "test"),
               OperationCancelledError);
  canceller.join();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(RetryPolicyTest, BuiltFromPipelineConfig) {
  PipelineConfig config;
  config.retry_max_attempts = 4;
  config.retry_base_delay_ms = 50;
  config.retry_jitter = 0.2;
  config.generation_retry_attempts = 1;

  auto embedding = RetryPolicy::for_embedding(config);
  EXPECT_EQ(embedding.max_attempts(), 4);
  EXPECT_EQ(embedding.base_delay(), 50ms);
  EXPECT_DOUBLE_EQ(embedding.jitter(), 0.2);
  EXPECT_EQ(RetryPolicy::for_generation(config).max_attempts(), 1);
}

TEST(CancellationTokenTest, CopiesShareState) {
  CancellationToken token;
  CancellationToken copy = token;
  EXPECT_FALSE(copy.is_cancelled());
  token.cancel();
  EXPECT_TRUE(copy.is_cancelled());
  EXPECT_THROW(copy.throw_if_cancelled("op"), OperationCancelledError);
}

TEST(CancellationTokenTest, ExpiredDeadlineCountsAsCancelled) {
  auto token = CancellationToken::with_timeout(1ms);
  std::this_thread::sleep_for(5ms);
  EXPECT_TRUE(token.is_cancelled());
  EXPECT_FALSE(token.wait_for(10ms));
}

TEST(CancellationTokenTest, WaitForReturnsTrueWhenNotCancelled) {
  CancellationToken token;
  EXPECT_TRUE(token.wait_for(1ms));
}

TEST(CancellationRegistryTest, CancelsOnlyActiveDocuments) {
  CancellationRegistry registry;
  EXPECT_FALSE(registry.cancel(1));

  CancellationToken token = registry.acquire(1);
  EXPECT_TRUE(registry.is_active(1));
  EXPECT_TRUE(registry.cancel(1));
  EXPECT_TRUE(token.is_cancelled());

  registry.release(1);
  EXPECT_FALSE(registry.is_active(1));
  EXPECT_FALSE(registry.cancel(1));
}

TEST(CancellationRegistryTest, AcquireWithCallerTokenRegistersIt) {
  CancellationRegistry registry;
  CancellationToken caller;
  CancellationToken registered = registry.acquire(3, caller);
  registry.cancel(3);
  EXPECT_TRUE(caller.is_cancelled());
  EXPECT_TRUE(registered.is_cancelled());
}

}  // namespace docchat_tests

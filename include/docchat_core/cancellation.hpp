#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace docchat_core {

/**
 * @class CancellationToken
 * @brief Shared cancel flag with an optional deadline.
 *
 * Copies share state, so a token handed to a long-running operation can be
 * cancelled from another thread through any copy. A token is also considered
 * cancelled once its deadline has passed.
 */
class CancellationToken {
 public:
  using Clock = std::chrono::steady_clock;

  CancellationToken();

  static CancellationToken with_deadline(Clock::time_point deadline);
  static CancellationToken with_timeout(std::chrono::milliseconds timeout);

  void cancel();

  bool is_cancelled() const;

  // Throws OperationCancelledError naming `operation` if cancelled.
  void throw_if_cancelled(const std::string& operation) const;

  /**
   * @brief Blocks for up to `duration`, waking early on cancellation.
   * @return false if the token was (or became) cancelled during the wait.
   */
  bool wait_for(std::chrono::milliseconds duration) const;

  std::optional<Clock::time_point> deadline() const;

 private:
  struct State {
    mutable std::mutex mu;
    std::condition_variable cv;
    bool cancelled = false;
    std::optional<Clock::time_point> deadline;
  };

  std::shared_ptr<State> state_;
};

// Tracks the token of each in-flight document ingestion so it can be cancelled by id.
class CancellationRegistry {
 public:
  CancellationToken acquire(long long document_id);
  // Registers a caller-supplied token. An already active id keeps its token.
  CancellationToken acquire(long long document_id, CancellationToken token);
  bool cancel(long long document_id);
  void release(long long document_id);
  bool is_active(long long document_id) const;

 private:
  mutable std::mutex mu_;
  std::unordered_map<long long, CancellationToken> active_;
};

}  // namespace docchat_core

#include "docchat_core/cancellation.hpp"

#include "docchat_core/errors.hpp"

namespace docchat_core {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken CancellationToken::with_deadline(Clock::time_point deadline) {
  CancellationToken token;
  token.state_->deadline = deadline;
  return token;
}

CancellationToken CancellationToken::with_timeout(std::chrono::milliseconds timeout) {
  return with_deadline(Clock::now() + timeout);
}

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  if (state_->cancelled) {
    return true;
  }
  return state_->deadline.has_value() && Clock::now() >= *state_->deadline;
}

void CancellationToken::throw_if_cancelled(const std::string& operation) const {
  if (is_cancelled()) {
    throw OperationCancelledError(operation);
  }
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(state_->mu);
  auto until = Clock::now() + duration;
  if (state_->deadline && *state_->deadline < until) {
    until = *state_->deadline;
  }
  state_->cv.wait_until(lock, until, [this] { return state_->cancelled; });
  if (state_->cancelled) {
    return false;
  }
  return !(state_->deadline.has_value() && Clock::now() >= *state_->deadline);
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->deadline;
}

CancellationToken CancellationRegistry::acquire(long long document_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = active_.find(document_id);
  if (it != active_.end()) {
    return it->second;
  }
  CancellationToken token;
  active_.emplace(document_id, token);
  return token;
}

CancellationToken CancellationRegistry::acquire(long long document_id, CancellationToken token) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = active_.find(document_id);
  if (it != active_.end()) {
    return it->second;
  }
  active_.emplace(document_id, token);
  return token;
}

bool CancellationRegistry::cancel(long long document_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = active_.find(document_id);
  if (it == active_.end()) {
    return false;
  }
  it->second.cancel();
  return true;
}

void CancellationRegistry::release(long long document_id) {
  std::lock_guard<std::mutex> lock(mu_);
  active_.erase(document_id);
}

bool CancellationRegistry::is_active(long long document_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_.count(document_id) > 0;
}

}  // namespace docchat_core

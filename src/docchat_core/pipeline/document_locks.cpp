#include "docchat_core/pipeline/document_locks.hpp"

namespace docchat_core {

ExclusiveDocumentLock DocumentLocks::lock_exclusive(long long document_id) {
  return ExclusiveDocumentLock(mutex_for(document_id));
}

SharedDocumentLock DocumentLocks::lock_shared(long long document_id) {
  return SharedDocumentLock(mutex_for(document_id));
}

void DocumentLocks::forget(long long document_id) {
  std::lock_guard<std::mutex> lock(mu_);
  mutexes_.erase(document_id);
}

std::shared_ptr<std::shared_mutex> DocumentLocks::mutex_for(long long document_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& mutex = mutexes_[document_id];
  if (!mutex) {
    mutex = std::make_shared<std::shared_mutex>();
  }
  return mutex;
}

}  // namespace docchat_core

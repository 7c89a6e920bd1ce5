#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace docchat_core {

// Holds one document's reader/writer lock and keeps the mutex alive while held.
template <typename Lock>
class DocumentLockGuard {
 public:
  explicit DocumentLockGuard(std::shared_ptr<std::shared_mutex> mutex)
      : mutex_(std::move(mutex)), lock_(*mutex_) {}

 private:
  std::shared_ptr<std::shared_mutex> mutex_;
  Lock lock_;
};

using ExclusiveDocumentLock = DocumentLockGuard<std::unique_lock<std::shared_mutex>>;
using SharedDocumentLock = DocumentLockGuard<std::shared_lock<std::shared_mutex>>;

/**
 * @class DocumentLocks
 * @brief Per-document reader/writer locks.
 *
 * Writers (index inserts, rollback, re-ingestion cleanup) take the exclusive
 * lock of the one document they touch. Readers resolving search hits take
 * shared locks, in ascending document id order when they need several.
 */
class DocumentLocks {
 public:
  ExclusiveDocumentLock lock_exclusive(long long document_id);
  SharedDocumentLock lock_shared(long long document_id);

  // Drops the registry entry of a deleted document. Current holders keep their mutex.
  void forget(long long document_id);

 private:
  std::shared_ptr<std::shared_mutex> mutex_for(long long document_id);

  std::mutex mu_;
  std::unordered_map<long long, std::shared_ptr<std::shared_mutex>> mutexes_;
};

}  // namespace docchat_core

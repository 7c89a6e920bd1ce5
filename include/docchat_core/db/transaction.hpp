#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <iostream>

namespace docchat_core {

enum class TransactionMode { Deferred, Immediate };

// How often BEGIN is retried while another connection holds the write lock.
struct BusyRetry {
  int attempts = 5;
  std::chrono::milliseconds base_delay{20};
};

/**
 * @class Transaction
 * @brief Scoped SQLite transaction; rolls back on scope exit unless committed.
 *
 * Immediate mode takes the write lock at BEGIN, so read-then-write sequences
 * (status checks, queue claims) cannot interleave with another writer. When
 * BEGIN reports SQLITE_BUSY or SQLITE_LOCKED it is retried with exponential
 * back-off before the error is rethrown.
 */
class Transaction {
 public:
  explicit Transaction(sqlite::database& db,
                       TransactionMode mode = TransactionMode::Deferred,
                       BusyRetry retry = {});

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();
  void rollback();

  bool active() const {
    return active_;
  }

  ~Transaction() noexcept {
    if (active_) {
      try {
        db_ << "ROLLBACK;";
      } catch (const sqlite::sqlite_exception& e) {
        std::cerr << "Transaction: rollback failed: " << e.what() << std::endl;
      }
    }
  }

 private:
  void begin(TransactionMode mode, const BusyRetry& retry);

  sqlite::database& db_;
  bool active_ = false;
};

}  // namespace docchat_core

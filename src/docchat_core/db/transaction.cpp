#include "docchat_core/db/transaction.hpp"

#include <sqlite3.h>

#include <thread>

namespace docchat_core {

Transaction::Transaction(sqlite::database& db, TransactionMode mode, BusyRetry retry) : db_(db) {
  begin(mode, retry);
}

void Transaction::begin(TransactionMode mode, const BusyRetry& retry) {
  const char* statement = mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN;";
  std::chrono::milliseconds delay = retry.base_delay;
  for (int attempt = 1;; ++attempt) {
    try {
      db_ << statement;
      active_ = true;
      return;
    } catch (const sqlite::sqlite_exception& e) {
      const int code = e.get_code();
      const bool contended = code == SQLITE_BUSY || code == SQLITE_LOCKED;
      if (!contended || attempt >= retry.attempts) {
        throw;
      }
      std::cerr << "Transaction: database busy, retrying BEGIN (attempt " << attempt << " of "
                << retry.attempts << ")" << std::endl;
    }
    std::this_thread::sleep_for(delay);
    delay *= 2;
  }
}

void Transaction::commit() {
  if (active_) {
    db_ << "COMMIT;";
    active_ = false;
  }
}

void Transaction::rollback() {
  if (active_) {
    active_ = false;
    db_ << "ROLLBACK;";
  }
}

}  // namespace docchat_core

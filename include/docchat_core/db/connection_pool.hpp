#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace docchat_core {

/**
 * @class ConnectionPool
 * @brief Fixed set of open SQLite connections handed out one at a time.
 *
 * get_connection() blocks until a connection is free. After shutdown() every
 * waiter is released with an error and returned connections are closed.
 */
class ConnectionPool {
 public:
  ConnectionPool(const std::string& db_path, int pool_size);

  std::unique_ptr<sqlite::database> get_connection();

  // Returns a connection to the pool.
  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

 private:
  std::unique_ptr<sqlite::database> open_connection() const;

  bool shutting_down_ = false;
  std::string db_path_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace docchat_core

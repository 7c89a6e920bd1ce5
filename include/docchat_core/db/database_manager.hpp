#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "docchat_core/db/connection_pool.hpp"

namespace docchat_core {

class DatabaseManager {
 public:
  static DatabaseManager& get_instance();

  // Must be called once at application startup. Creates the schema if missing.
  void initialize(const std::filesystem::path& db_path, int pool_size);

  // Used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();
  bool is_initialized() const;

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  DatabaseManager() = default;
  void setup_schema(const std::filesystem::path& db_path);

  mutable std::mutex mtx_;
  std::unique_ptr<ConnectionPool> pool_;
  bool is_initialized_ = false;
};

}  // namespace docchat_core

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "face_core/db/connection_pool.hpp"

namespace face_core {

/**
 * @brief Owns the connection pool and schema of one embedding database.
 *
 * One instance per library. Instances are created by their owner and passed
 * by reference; there is no process-wide instance.
 */
class DatabaseManager {
 public:
  DatabaseManager(const std::filesystem::path &db_path, const std::string &db_key, int pool_size);
  ~DatabaseManager();

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

  // Used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  const std::filesystem::path &db_path() const {
    return db_path_;
  }

 private:
  void setup_schema();

  std::filesystem::path db_path_;
  std::string db_key_;
  std::unique_ptr<ConnectionPool> pool_;
  bool is_initialized_ = false;
};

}  // namespace face_core

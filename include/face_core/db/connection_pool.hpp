#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace face_core {

class ConnectionPool {
 public:
  ConnectionPool(const std::string &db_path, const std::string &db_key, int pool_size);

  // Blocks until a connection is free. Throws once shutdown() has been called.
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  // Opens a keyed connection with the pragmas every connection needs.
  static std::unique_ptr<sqlite::database> open_keyed(const std::string &db_path,
                                                      const std::string &db_key);

 private:
  bool shutting_down_ = false;
  std::string db_path_;
  std::string db_key_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace face_core

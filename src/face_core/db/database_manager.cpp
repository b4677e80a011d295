#include "face_core/db/database_manager.hpp"

#include <iostream>
#include <stdexcept>

#include "face_core/db/sqlite_error_utils.hpp"
#include "face_core/errors.hpp"

namespace face_core {

DatabaseManager::DatabaseManager(const std::filesystem::path &db_path,
                                 const std::string &db_key,
                                 int pool_size)
    : db_path_(db_path), db_key_(db_key) {
  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  try {
    // 1. One-time schema setup before any pooled connection exists
    setup_schema();

    // 2. Pool for the store's readers and writers
    pool_ = std::make_unique<ConnectionPool>(db_path_.string(), db_key_, pool_size);
  } catch (const sqlite::sqlite_exception &e) {
    if (indicates_corruption(e)) {
      throw CorruptStore("Cannot open embedding store at " + db_path_.string() + ": " +
                         format_db_error("open", e));
    }
    throw StoreError(format_db_error("open " + db_path_.string(), e));
  }

  is_initialized_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager for " + db_path_.string() + " has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  // Single-use connection so table creation never races a pooled one.
  auto db = ConnectionPool::open_keyed(db_path_.string(), db_key_);

  *db << R"(
      CREATE TABLE IF NOT EXISTS faces (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          photo TEXT NOT NULL,
          bbox_x INTEGER NOT NULL,
          bbox_y INTEGER NOT NULL,
          bbox_w INTEGER NOT NULL,
          bbox_h INTEGER NOT NULL,
          confidence REAL NOT NULL,
          vector_blob BLOB NOT NULL,
          metadata_json TEXT,
          deleted INTEGER NOT NULL DEFAULT 0,
          created_at TEXT NOT NULL
      )
    )";

  *db << R"(
      CREATE INDEX IF NOT EXISTS idx_faces_photo_active
      ON faces(photo, deleted)
    )";

  // Dimension tag and schema version
  *db << R"(
      CREATE TABLE IF NOT EXISTS store_meta (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL
      )
    )";
}

}  // namespace face_core

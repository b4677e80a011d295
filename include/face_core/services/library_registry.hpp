#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "face_core/services/face_library.hpp"

namespace face_core {

/**
 * @brief Tenant-keyed set of face libraries, opened on first use.
 *
 * Built once at startup and passed by reference. Each key maps to its own
 * directory under data_dir, so tenants never share a store or an index.
 *
 * Opening a library can rebuild its index, so it happens under a per-key
 * lock. The registry mutex covers map operations only, and other keys stay
 * available while one library opens.
 */
class LibraryRegistry {
 public:
  LibraryRegistry(const std::filesystem::path &data_dir,
                  const std::string &db_key,
                  const LibrarySettings &settings);

  // Opens the library, creating it if needed. Throws std::invalid_argument on a bad key.
  std::shared_ptr<FaceLibrary> get(const std::string &key);

  // Opens an existing library. nullptr if none exists; never creates one.
  std::shared_ptr<FaceLibrary> find(const std::string &key);

  // Throws LibraryNotFound where find() would return nullptr.
  std::shared_ptr<FaceLibrary> require(const std::string &key);

  // True if the library is open or exists on disk. Does not open it.
  bool contains(const std::string &key) const;

  // Open libraries, sorted.
  std::vector<std::string> keys() const;

  void close_all();

  static bool is_valid_key(const std::string &key);

 private:
  struct Slot {
    std::mutex open_mutex;
    std::shared_ptr<FaceLibrary> library;
  };

  std::shared_ptr<FaceLibrary> open(const std::string &key, bool create);
  bool exists_on_disk(const std::string &key) const;

  std::filesystem::path data_dir_;
  std::string db_key_;
  LibrarySettings settings_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Slot>> slots_;
  std::map<std::string, std::shared_ptr<FaceLibrary>> libraries_;
};

}  // namespace face_core

#include "face_core/services/library_registry.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>

#include "face_core/errors.hpp"

namespace face_core {

namespace {
constexpr size_t MAX_KEY_LENGTH = 64;

void require_valid_key(const std::string &key) {
  if (!LibraryRegistry::is_valid_key(key)) {
    throw std::invalid_argument("Invalid library key '" + key +
                                "': expected 1-64 characters from [A-Za-z0-9_-]");
  }
}
}  // namespace

bool LibraryRegistry::is_valid_key(const std::string &key) {
  if (key.empty() || key.size() > MAX_KEY_LENGTH) {
    return false;
  }
  for (unsigned char c : key) {
    if (!std::isalnum(c) && c != '_' && c != '-') {
      return false;
    }
  }
  return true;
}

LibraryRegistry::LibraryRegistry(const std::filesystem::path &data_dir,
                                 const std::string &db_key,
                                 const LibrarySettings &settings)
    : data_dir_(data_dir), db_key_(db_key), settings_(settings) {
  std::filesystem::create_directories(data_dir_);
}

std::shared_ptr<FaceLibrary> LibraryRegistry::get(const std::string &key) {
  return open(key, /*create*/ true);
}

std::shared_ptr<FaceLibrary> LibraryRegistry::find(const std::string &key) {
  return open(key, /*create*/ false);
}

std::shared_ptr<FaceLibrary> LibraryRegistry::require(const std::string &key) {
  std::shared_ptr<FaceLibrary> library = find(key);
  if (!library) {
    throw LibraryNotFound(key);
  }
  return library;
}

std::shared_ptr<FaceLibrary> LibraryRegistry::open(const std::string &key, bool create) {
  require_valid_key(key);

  std::shared_ptr<Slot> slot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto open_it = libraries_.find(key);
    if (open_it != libraries_.end()) {
      return open_it->second;
    }
    // Lookups of unknown keys leave no slot behind.
    if (!create && !slots_.count(key) && !exists_on_disk(key)) {
      return nullptr;
    }
    std::shared_ptr<Slot> &entry = slots_[key];
    if (!entry) {
      entry = std::make_shared<Slot>();
    }
    slot = entry;
  }

  // Concurrent callers for this key wait here; other keys are not blocked.
  std::lock_guard<std::mutex> open_lock(slot->open_mutex);
  if (slot->library) {
    return slot->library;
  }
  if (!create && !exists_on_disk(key)) {
    return nullptr;
  }

  auto library = std::make_shared<FaceLibrary>(key, data_dir_ / key, db_key_, settings_);
  slot->library = library;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    libraries_.emplace(key, library);
  }
  return library;
}

bool LibraryRegistry::exists_on_disk(const std::string &key) const {
  std::error_code ec;
  return std::filesystem::exists(data_dir_ / key / FaceLibrary::DB_FILE, ec);
}

bool LibraryRegistry::contains(const std::string &key) const {
  if (!is_valid_key(key)) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (libraries_.count(key)) {
      return true;
    }
  }
  return exists_on_disk(key);
}

std::vector<std::string> LibraryRegistry::keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(libraries_.size());
  for (const auto &entry : libraries_) {
    result.push_back(entry.first);
  }
  return result;
}

void LibraryRegistry::close_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << "[LibraryRegistry] Closing " << libraries_.size() << " library(ies)." << std::endl;
  libraries_.clear();
  slots_.clear();
}

}  // namespace face_core

#include "face_core/services/database_key_service.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include "face_core/util/random_token.hpp"

namespace face_core {

DatabaseKeyService::DatabaseKeyService(const std::filesystem::path &key_file,
                                       const std::string &env_var)
    : key_file_(key_file), env_var_(env_var) {}

std::string DatabaseKeyService::get_database_key() const {
  const char *from_env = env_var_.empty() ? nullptr : std::getenv(env_var_.c_str());
  if (from_env && *from_env) {
    return from_env;
  }

  try {
    if (std::filesystem::exists(key_file_)) {
      return read_key_file();
    }

    std::string key = util::random_hex(KEY_BYTES);
    write_key_file(key);
    std::cout << "[DatabaseKeyService] Generated new database key at " << key_file_.string()
              << std::endl;
    return key;
  } catch (const KeyServiceError &) {
    throw;
  } catch (const std::exception &e) {
    throw KeyServiceError("Failed to get or create database key: " + std::string(e.what()));
  }
}

std::string DatabaseKeyService::read_key_file() const {
  std::ifstream file(key_file_);
  if (!file) {
    throw KeyServiceError("Cannot read key file " + key_file_.string());
  }
  std::string key;
  std::getline(file, key);
  while (!key.empty() && (key.back() == '\r' || key.back() == ' ')) {
    key.pop_back();
  }
  if (key.empty()) {
    throw KeyServiceError("Key file " + key_file_.string() + " is empty");
  }
  return key;
}

void DatabaseKeyService::write_key_file(const std::string &key) const {
  if (key_file_.has_parent_path()) {
    std::filesystem::create_directories(key_file_.parent_path());
  }
  std::filesystem::path tmp_path = key_file_;
  tmp_path += ".tmp";

  // The file is owner-only before the key is written to it.
  {
    std::ofstream touch(tmp_path, std::ios::trunc);
    if (!touch) {
      throw KeyServiceError("Cannot create key file " + tmp_path.string());
    }
  }
  std::filesystem::permissions(
      tmp_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
      std::filesystem::perm_options::replace);

  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      throw KeyServiceError("Cannot open key file " + tmp_path.string());
    }
    file << key << '\n';
    if (!file.flush()) {
      throw KeyServiceError("Failed to write key file " + tmp_path.string());
    }
  }
  std::filesystem::rename(tmp_path, key_file_);
}

}  // namespace face_core

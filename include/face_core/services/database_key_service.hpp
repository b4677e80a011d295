#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace face_core {

/**
 * @brief A custom exception for key service errors.
 */
class KeyServiceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Resolves the SQLCipher key that protects the face stores.
 */
class DatabaseKeyService {
 public:
  static constexpr const char *ENV_VAR = "FACE_FINDER_DB_KEY";
  static constexpr size_t KEY_BYTES = 32;

  explicit DatabaseKeyService(const std::filesystem::path &key_file,
                              const std::string &env_var = ENV_VAR);

  /**
   * @brief Gets the database encryption key.
   *
   * The environment variable wins if set and non-empty. Otherwise the key file
   * is read. If neither exists a new 256-bit key is generated, written to the
   * key file with owner-only permissions, and returned.
   *
   * @return The key as 64 lowercase hex characters (or the env value verbatim).
   * @throws KeyServiceError if the key cannot be read, generated or stored.
   */
  std::string get_database_key() const;

 private:
  std::string read_key_file() const;
  void write_key_file(const std::string &key) const;

  std::filesystem::path key_file_;
  std::string env_var_;
};

}  // namespace face_core

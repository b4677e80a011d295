#include "face_core/util/random_token.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

namespace face_core {
namespace util {

std::string random_hex(size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    char err[256];
    ERR_error_string_n(ERR_get_error(), err, sizeof(err));
    throw std::runtime_error(std::string("RAND_bytes failed: ") + err);
  }

  static const char digits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(bytes * 2);
  for (unsigned char b : buffer) {
    hex.push_back(digits[b >> 4]);
    hex.push_back(digits[b & 0x0f]);
  }
  return hex;
}

}  // namespace util
}  // namespace face_core

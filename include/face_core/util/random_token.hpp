#pragma once

#include <cstddef>
#include <string>

namespace face_core {
namespace util {

// Lowercase hex of `bytes` bytes from OpenSSL's CSPRNG. Throws std::runtime_error on RNG failure.
std::string random_hex(size_t bytes);

}  // namespace util
}  // namespace face_core

#pragma once

#include <stdexcept>
#include <string>

namespace face_core {

/**
 * @brief Base class for every error raised by the retrieval engine.
 */
class FaceFinderError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Input vector length differs from the configured dimension. Never truncated or padded.
class DimensionMismatch : public FaceFinderError {
 public:
  DimensionMismatch(size_t expected, size_t actual)
      : FaceFinderError("Vector dimension mismatch. Expected " + std::to_string(expected) +
                        ", got " + std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const noexcept {
    return expected_;
  }
  size_t actual() const noexcept {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
};

// Zero-length or non-finite vector; cannot be normalized.
class InvalidEmbedding : public FaceFinderError {
 public:
  using FaceFinderError::FaceFinderError;
};

class InvalidFaceRecord : public FaceFinderError {
 public:
  using FaceFinderError::FaceFinderError;
};

/**
 * @brief The authoritative embedding store cannot be read.
 *
 * Fatal: the caller must treat the store as unavailable and must not resume
 * with partial data.
 */
class CorruptStore : public FaceFinderError {
 public:
  using FaceFinderError::FaceFinderError;
};

// Generic SQLite failure that does not indicate corruption (busy, constraint, full disk...).
class StoreError : public FaceFinderError {
 public:
  using FaceFinderError::FaceFinderError;
};

// Persisted index blob is unreadable or was written for a different dimension.
class CorruptIndex : public FaceFinderError {
 public:
  using FaceFinderError::FaceFinderError;
};

class IndexError : public FaceFinderError {
 public:
  using FaceFinderError::FaceFinderError;
};

/**
 * @brief Index contents disagree with the embedding store.
 *
 * Recoverable: the owner logs it and rebuilds the index from the store.
 */
class InvariantViolation : public FaceFinderError {
 public:
  using FaceFinderError::FaceFinderError;
};

// No library exists under the requested tenant key.
class LibraryNotFound : public FaceFinderError {
 public:
  explicit LibraryNotFound(const std::string &key)
      : FaceFinderError("No face library named '" + key + "'") {}
};

class SessionExpired : public FaceFinderError {
 public:
  explicit SessionExpired(const std::string &session_id)
      : FaceFinderError("Session expired or unknown: " + session_id) {}
};

}  // namespace face_core

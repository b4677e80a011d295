#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "face_core/db/database_manager.hpp"
#include "face_core/types/embedding.hpp"
#include "face_core/types/face_record.hpp"

namespace face_core {

struct LocationSummary {
  std::string name;
  std::optional<double> latitude;
  std::optional<double> longitude;
  int photo_count = 0;
};

/**
 * @brief Durable, append-only record of every face embedding in a library.
 *
 * The store is the source of truth for the vector index: every rebuild reads
 * all_active(). It is the only component that assigns face ids, which are
 * strictly increasing and never reused (AUTOINCREMENT survives reset()).
 *
 * Deletion is a tombstone flag; rows are only physically removed by reset().
 */
class EmbeddingStore {
 public:
  static constexpr int STORE_SCHEMA_VERSION = 1;

  // Throws DimensionMismatch if the store was created with a different dimension,
  // CorruptStore if its tags are unreadable.
  EmbeddingStore(DatabaseManager &db_manager,
                 size_t dimension,
                 float normalization_epsilon = embedding::DEFAULT_NORM_EPSILON);

  EmbeddingStore(const EmbeddingStore &) = delete;
  EmbeddingStore &operator=(const EmbeddingStore &) = delete;

  int64_t append(const NewFace &face);

  // All-or-nothing: one invalid face rejects the whole batch.
  std::vector<int64_t> append_batch(const std::vector<NewFace> &faces);

  // Tombstones every active face of the photo. Returns how many were tombstoned.
  int remove_by_photo(const std::string &photo);

  // Active faces with their vectors, ordered by id.
  std::vector<StoredFace> all_active();

  void reset();

  int64_t count_active();
  int64_t count_tombstoned();
  std::vector<int64_t> active_ids();
  std::vector<int64_t> active_ids_for_photo(const std::string &photo);

  // Records without vectors, in the order of the requested ids. Unknown or
  // tombstoned ids are skipped.
  std::vector<FaceRecord> get_faces(const std::vector<int64_t> &ids);

  std::vector<LocationSummary> list_locations();

  size_t dimension() const {
    return dimension_;
  }

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

 private:
  struct PreparedFace {
    const NewFace *face;
    std::vector<char> vector_blob;
    std::string metadata_json;
  };

  void verify_store_tags();
  PreparedFace prepare(const NewFace &face) const;
  std::vector<float> blob_to_vector(int64_t id, const std::vector<char> &blob) const;
  FaceMetadata parse_metadata(int64_t id, const std::optional<std::string> &json) const;

  // Translates a SQLite failure into CorruptStore or StoreError.
  [[noreturn]] void rethrow_db_error(const std::string &operation,
                                     const sqlite::sqlite_exception &e) const;

  DatabaseManager &db_manager_;
  size_t dimension_;
  float normalization_epsilon_;
};

}  // namespace face_core

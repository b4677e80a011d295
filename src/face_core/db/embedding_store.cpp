#include "face_core/db/embedding_store.hpp"

#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "face_core/db/pooled_connection.hpp"
#include "face_core/db/sqlite_error_utils.hpp"
#include "face_core/db/transaction.hpp"
#include "face_core/errors.hpp"

namespace face_core {

namespace {

std::string id_vector_to_comma_string(const std::vector<int64_t> &ids) {
  std::ostringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) {
      ss << ",";
    }
    ss << ids[i];
  }
  return ss.str();
}

}  // namespace

std::string EmbeddingStore::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point EmbeddingStore::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw CorruptStore("Failed to parse time string: " + time_str +
                       ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // Stored as GMT
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

EmbeddingStore::EmbeddingStore(DatabaseManager &db_manager,
                               size_t dimension,
                               float normalization_epsilon)
    : db_manager_(db_manager), dimension_(dimension), normalization_epsilon_(normalization_epsilon) {
  if (dimension_ == 0) {
    throw std::invalid_argument("Embedding dimension must be positive");
  }
  verify_store_tags();
}

void EmbeddingStore::rethrow_db_error(const std::string &operation,
                                      const sqlite::sqlite_exception &e) const {
  if (indicates_corruption(e)) {
    throw CorruptStore(format_db_error(operation, e));
  }
  throw StoreError(format_db_error(operation, e));
}

void EmbeddingStore::verify_store_tags() {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);

    std::optional<std::string> dimension_tag;
    std::optional<std::string> version_tag;
    *conn << "SELECT key, value FROM store_meta WHERE key IN ('dimension', 'schema_version')" >>
        [&](std::string key, std::string value) {
          if (key == "dimension") {
            dimension_tag = value;
          } else {
            version_tag = value;
          }
        };

    if (!dimension_tag) {
      *conn << "INSERT INTO store_meta (key, value) VALUES ('dimension', ?)"
            << std::to_string(dimension_);
      *conn << "INSERT OR REPLACE INTO store_meta (key, value) VALUES ('schema_version', ?)"
            << std::to_string(STORE_SCHEMA_VERSION);
      tx.commit();
      return;
    }

    size_t stored_dimension = 0;
    int stored_version = 0;
    try {
      stored_dimension = static_cast<size_t>(std::stoull(*dimension_tag));
      stored_version = version_tag ? std::stoi(*version_tag) : STORE_SCHEMA_VERSION;
    } catch (const std::logic_error &) {
      throw CorruptStore("Unreadable store_meta tags (dimension='" + *dimension_tag + "')");
    }

    if (stored_version > STORE_SCHEMA_VERSION) {
      throw CorruptStore("Store schema version " + std::to_string(stored_version) +
                         " is newer than supported version " +
                         std::to_string(STORE_SCHEMA_VERSION));
    }
    if (stored_dimension != dimension_) {
      throw DimensionMismatch(dimension_, stored_dimension);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("verify_store_tags", e);
  }
}

EmbeddingStore::PreparedFace EmbeddingStore::prepare(const NewFace &face) const {
  std::vector<float> unit = embedding::normalized_copy(face.embedding, dimension_,
                                                       normalization_epsilon_);
  validate_face(face);

  PreparedFace prepared;
  prepared.face = &face;
  prepared.vector_blob.resize(unit.size() * sizeof(float));
  std::memcpy(prepared.vector_blob.data(), unit.data(), prepared.vector_blob.size());
  prepared.metadata_json = metadata_to_json(face.metadata).dump();
  return prepared;
}

std::vector<float> EmbeddingStore::blob_to_vector(int64_t id, const std::vector<char> &blob) const {
  if (blob.size() != dimension_ * sizeof(float)) {
    throw CorruptStore("Vector blob for face " + std::to_string(id) + " has " +
                       std::to_string(blob.size()) + " bytes, expected " +
                       std::to_string(dimension_ * sizeof(float)));
  }
  std::vector<float> vec(dimension_);
  std::memcpy(vec.data(), blob.data(), blob.size());
  return vec;
}

FaceMetadata EmbeddingStore::parse_metadata(int64_t id,
                                            const std::optional<std::string> &json) const {
  if (!json || json->empty()) {
    return FaceMetadata{};
  }
  try {
    return metadata_from_json(nlohmann::json::parse(*json));
  } catch (const nlohmann::json::exception &e) {
    throw CorruptStore("Unreadable metadata for face " + std::to_string(id) + ": " + e.what());
  } catch (const std::invalid_argument &e) {
    throw CorruptStore("Unreadable metadata for face " + std::to_string(id) + ": " + e.what());
  }
}

int64_t EmbeddingStore::append(const NewFace &face) {
  std::vector<int64_t> ids = append_batch({face});
  return ids.front();
}

std::vector<int64_t> EmbeddingStore::append_batch(const std::vector<NewFace> &faces) {
  std::vector<int64_t> ids;
  if (faces.empty()) {
    return ids;
  }

  // Validate the whole batch before touching the database.
  std::vector<PreparedFace> prepared;
  prepared.reserve(faces.size());
  for (const auto &face : faces) {
    prepared.push_back(prepare(face));
  }

  try {
    const std::string created_at = time_point_to_string(std::chrono::system_clock::now());
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    for (const auto &p : prepared) {
      const NewFace &face = *p.face;
      *conn << "INSERT INTO faces (photo, bbox_x, bbox_y, bbox_w, bbox_h, confidence, "
               "vector_blob, metadata_json, deleted, created_at) VALUES (?,?,?,?,?,?,?,?,0,?)"
            << face.photo << face.bbox.x << face.bbox.y << face.bbox.width << face.bbox.height
            << static_cast<double>(face.confidence) << p.vector_blob << p.metadata_json
            << created_at;
      ids.push_back(conn->last_insert_rowid());
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("append_batch", e);
  }
  return ids;
}

int EmbeddingStore::remove_by_photo(const std::string &photo) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    int count = 0;
    *conn << "SELECT count(*) FROM faces WHERE photo = ? AND deleted = 0" << photo >> count;
    if (count > 0) {
      *conn << "UPDATE faces SET deleted = 1 WHERE photo = ? AND deleted = 0" << photo;
    }
    tx.commit();
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("remove_by_photo", e);
  }
}

std::vector<StoredFace> EmbeddingStore::all_active() {
  std::vector<StoredFace> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, photo, bbox_x, bbox_y, bbox_w, bbox_h, confidence, vector_blob, "
             "metadata_json, created_at FROM faces WHERE deleted = 0 ORDER BY id" >>
        [&](int64_t id, std::string photo, int x, int y, int w, int h, double confidence,
            std::vector<char> vector_blob, std::optional<std::string> metadata_json,
            std::string created_at) {
          StoredFace stored;
          stored.record.id = id;
          stored.record.photo = std::move(photo);
          stored.record.bbox = BoundingBox{x, y, w, h};
          stored.record.confidence = static_cast<float>(confidence);
          stored.record.metadata = parse_metadata(id, metadata_json);
          stored.record.created_at = string_to_time_point(created_at);
          stored.vector = blob_to_vector(id, vector_blob);
          result.push_back(std::move(stored));
        };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("all_active", e);
  }
  return result;
}

void EmbeddingStore::reset() {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    // sqlite_sequence keeps its value, so ids are never reused after a reset.
    *conn << "DELETE FROM faces";
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("reset", e);
  }
}

int64_t EmbeddingStore::count_active() {
  try {
    PooledConnection conn(db_manager_);
    int64_t count = 0;
    *conn << "SELECT count(*) FROM faces WHERE deleted = 0" >> count;
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("count_active", e);
  }
}

int64_t EmbeddingStore::count_tombstoned() {
  try {
    PooledConnection conn(db_manager_);
    int64_t count = 0;
    *conn << "SELECT count(*) FROM faces WHERE deleted = 1" >> count;
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("count_tombstoned", e);
  }
}

std::vector<int64_t> EmbeddingStore::active_ids() {
  std::vector<int64_t> ids;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id FROM faces WHERE deleted = 0 ORDER BY id" >>
        [&](int64_t id) { ids.push_back(id); };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("active_ids", e);
  }
  return ids;
}

std::vector<int64_t> EmbeddingStore::active_ids_for_photo(const std::string &photo) {
  std::vector<int64_t> ids;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id FROM faces WHERE photo = ? AND deleted = 0 ORDER BY id" << photo >>
        [&](int64_t id) { ids.push_back(id); };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("active_ids_for_photo", e);
  }
  return ids;
}

std::vector<FaceRecord> EmbeddingStore::get_faces(const std::vector<int64_t> &ids) {
  std::vector<FaceRecord> result;
  if (ids.empty()) {
    return result;
  }

  std::unordered_map<int64_t, FaceRecord> by_id;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, photo, bbox_x, bbox_y, bbox_w, bbox_h, confidence, metadata_json, "
             "created_at FROM faces WHERE deleted = 0 AND id IN (" +
                 id_vector_to_comma_string(ids) + ")" >>
        [&](int64_t id, std::string photo, int x, int y, int w, int h, double confidence,
            std::optional<std::string> metadata_json, std::string created_at) {
          FaceRecord record;
          record.id = id;
          record.photo = std::move(photo);
          record.bbox = BoundingBox{x, y, w, h};
          record.confidence = static_cast<float>(confidence);
          record.metadata = parse_metadata(id, metadata_json);
          record.created_at = string_to_time_point(created_at);
          by_id.emplace(id, std::move(record));
        };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("get_faces", e);
  }

  result.reserve(by_id.size());
  for (int64_t id : ids) {
    auto it = by_id.find(id);
    if (it != by_id.end()) {
      result.push_back(it->second);
    }
  }
  return result;
}

std::vector<LocationSummary> EmbeddingStore::list_locations() {
  // Ordered by name; first coordinates seen for a name win.
  std::map<std::string, LocationSummary> by_name;
  std::map<std::string, std::set<std::string>> photos_by_name;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, photo, metadata_json FROM faces WHERE deleted = 0 ORDER BY id" >>
        [&](int64_t id, std::string photo, std::optional<std::string> metadata_json) {
          FaceMetadata metadata = parse_metadata(id, metadata_json);
          if (!metadata.location_name || metadata.location_name->empty()) {
            return;
          }
          const std::string &name = *metadata.location_name;
          auto [it, inserted] = by_name.try_emplace(name);
          if (inserted) {
            it->second.name = name;
          }
          if (!it->second.latitude && metadata.has_coordinates()) {
            it->second.latitude = metadata.latitude;
            it->second.longitude = metadata.longitude;
          }
          photos_by_name[name].insert(photo);
        };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("list_locations", e);
  }

  std::vector<LocationSummary> result;
  result.reserve(by_name.size());
  for (auto &[name, summary] : by_name) {
    summary.photo_count = static_cast<int>(photos_by_name[name].size());
    result.push_back(std::move(summary));
  }
  return result;
}

}  // namespace face_core

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace face_core {

struct BoundingBox {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  bool operator==(const BoundingBox &other) const {
    return x == other.x && y == other.y && width == other.width && height == other.height;
  }
};

/**
 * @brief Photo-level metadata attached to every face of a photo.
 *
 * Closed, versioned schema. Every field is optional because EXIF data is
 * frequently missing.
 */
struct FaceMetadata {
  static constexpr int SCHEMA_VERSION = 1;

  std::optional<std::string> timestamp;  // "YYYY:MM:DD HH:MM:SS" (EXIF) or ISO-8601
  std::optional<std::string> location_name;
  std::optional<double> latitude;
  std::optional<double> longitude;
  std::optional<double> altitude;
  std::optional<std::string> camera_make;
  std::optional<std::string> camera_model;
  std::optional<int> image_width;
  std::optional<int> image_height;

  bool has_coordinates() const {
    return latitude.has_value() && longitude.has_value();
  }
};

nlohmann::json metadata_to_json(const FaceMetadata &metadata);

// Throws std::invalid_argument on a wrongly typed field or an unsupported schema version.
FaceMetadata metadata_from_json(const nlohmann::json &json);

struct FaceRecord {
  int64_t id = 0;
  std::string photo;
  BoundingBox bbox;
  float confidence = 0.0f;
  FaceMetadata metadata;
  std::chrono::system_clock::time_point created_at;
};

// Ingestion input: one detected face as produced by the embedding model.
struct NewFace {
  std::vector<float> embedding;
  std::string photo;
  BoundingBox bbox;
  float confidence = 0.0f;
  FaceMetadata metadata;
};

struct StoredFace {
  FaceRecord record;
  std::vector<float> vector;
};

// Throws InvalidFaceRecord on an empty photo, a degenerate bbox, a bbox outside
// the known image bounds, or a confidence outside [0, 1].
void validate_face(const NewFace &face);

// Final path component of a photo identifier ("a/b/c.jpg" -> "c.jpg").
std::string photo_display_name(const std::string &photo);

}  // namespace face_core

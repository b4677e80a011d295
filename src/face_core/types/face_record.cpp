#include "face_core/types/face_record.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>

#include "face_core/errors.hpp"

namespace face_core {

namespace {

template <typename T>
void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value) {
  if (value) {
    json[key] = *value;
  }
}

template <typename T>
void get_optional(const nlohmann::json &json, const char *key, std::optional<T> &out) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw std::invalid_argument(std::string("Metadata field '") + key + "' has wrong type: " +
                                e.what());
  }
}

}  // namespace

nlohmann::json metadata_to_json(const FaceMetadata &metadata) {
  nlohmann::json json = nlohmann::json::object();
  json["schema_version"] = FaceMetadata::SCHEMA_VERSION;
  put_optional(json, "timestamp", metadata.timestamp);
  put_optional(json, "location_name", metadata.location_name);
  put_optional(json, "latitude", metadata.latitude);
  put_optional(json, "longitude", metadata.longitude);
  put_optional(json, "altitude", metadata.altitude);
  put_optional(json, "camera_make", metadata.camera_make);
  put_optional(json, "camera_model", metadata.camera_model);
  put_optional(json, "image_width", metadata.image_width);
  put_optional(json, "image_height", metadata.image_height);
  return json;
}

FaceMetadata metadata_from_json(const nlohmann::json &json) {
  FaceMetadata metadata;
  if (json.is_null()) {
    return metadata;
  }
  if (!json.is_object()) {
    throw std::invalid_argument("Metadata must be a JSON object");
  }

  int version = json.value("schema_version", FaceMetadata::SCHEMA_VERSION);
  if (version > FaceMetadata::SCHEMA_VERSION) {
    throw std::invalid_argument("Unsupported metadata schema_version " + std::to_string(version));
  }

  get_optional(json, "timestamp", metadata.timestamp);
  get_optional(json, "location_name", metadata.location_name);
  get_optional(json, "latitude", metadata.latitude);
  get_optional(json, "longitude", metadata.longitude);
  get_optional(json, "altitude", metadata.altitude);
  get_optional(json, "camera_make", metadata.camera_make);
  get_optional(json, "camera_model", metadata.camera_model);
  get_optional(json, "image_width", metadata.image_width);
  get_optional(json, "image_height", metadata.image_height);
  return metadata;
}

void validate_face(const NewFace &face) {
  if (face.photo.empty()) {
    throw InvalidFaceRecord("Face must reference an owning photo");
  }
  const BoundingBox &box = face.bbox;
  if (box.x < 0 || box.y < 0 || box.width <= 0 || box.height <= 0) {
    throw InvalidFaceRecord("Invalid bounding box for photo " + face.photo);
  }
  if ((face.metadata.image_width && *face.metadata.image_width <= 0) ||
      (face.metadata.image_height && *face.metadata.image_height <= 0)) {
    throw InvalidFaceRecord("Image dimensions must be positive for photo " + face.photo);
  }
  // Widened so coordinates near INT_MAX cannot overflow.
  if (face.metadata.image_width &&
      static_cast<int64_t>(box.x) + box.width > *face.metadata.image_width) {
    throw InvalidFaceRecord("Bounding box exceeds image width for photo " + face.photo);
  }
  if (face.metadata.image_height &&
      static_cast<int64_t>(box.y) + box.height > *face.metadata.image_height) {
    throw InvalidFaceRecord("Bounding box exceeds image height for photo " + face.photo);
  }
  if (!std::isfinite(face.confidence) || face.confidence < 0.0f || face.confidence > 1.0f) {
    throw InvalidFaceRecord("Detection confidence must be within [0, 1] for photo " + face.photo);
  }
}

std::string photo_display_name(const std::string &photo) {
  auto pos = photo.find_last_of("/\\");
  if (pos == std::string::npos) {
    return photo;
  }
  return photo.substr(pos + 1);
}

}  // namespace face_core

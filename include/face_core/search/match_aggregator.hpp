#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "face_core/types/face_record.hpp"

namespace face_core {

// One resolved per-face hit.
struct FaceHit {
  int64_t face_id = 0;
  std::string photo;
  BoundingBox bbox;
  float similarity = 0.0f;
  bool expanded = false;
  FaceMetadata metadata;
};

struct PerFaceHit {
  int64_t face_id = 0;
  BoundingBox bbox;
  float similarity = 0.0f;
  bool expanded = false;
};

struct MatchGroup {
  std::string photo;
  std::string photo_name;
  std::vector<PerFaceHit> per_face_hits;
  float max_similarity = 0.0f;
  float avg_similarity = 0.0f;
  int face_count = 0;
  bool expanded = false;
  // Taken from the first hit of the photo
  FaceMetadata metadata;
};

/**
 * @brief Groups deduplicated per-face hits by photo.
 *
 * Hits keep their input order inside a group. Groups are ordered by
 * max_similarity descending, then avg_similarity descending, then photo
 * ascending.
 */
std::vector<MatchGroup> aggregate_matches(const std::vector<FaceHit> &hits);

}  // namespace face_core

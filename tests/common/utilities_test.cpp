#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <random>

namespace face_tests {

std::filesystem::path TestUtilities::create_temp_test_dir() {
  static std::atomic<int> counter{0};
  auto temp_dir = std::filesystem::temp_directory_path() / "face_finder_tests";

  // Timestamp plus counter keeps directories unique within one run
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
  auto dir = temp_dir / ("test_" + std::to_string(timestamp) + "_" + std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::cleanup_temp_dir(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  // Also cleanup the parent directory if it's empty
  auto parent_dir = dir.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

std::vector<float> TestUtilities::axis_vector(size_t dimension, size_t axis, float value) {
  std::vector<float> v(dimension, 0.0f);
  v[axis % dimension] = value;
  return v;
}

std::vector<float> TestUtilities::random_unit_vector(size_t dimension, unsigned seed) {
  std::mt19937 gen(seed);
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<float> v(dimension);
  double norm = 0.0;
  do {
    norm = 0.0;
    for (auto &x : v) {
      x = dist(gen);
      norm += static_cast<double>(x) * x;
    }
  } while (norm == 0.0);
  norm = std::sqrt(norm);
  for (auto &x : v) {
    x = static_cast<float>(x / norm);
  }
  return v;
}

std::vector<float> TestUtilities::perturbed(const std::vector<float> &base,
                                            float noise,
                                            unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<float> dist(-noise, noise);
  std::vector<float> v(base);
  double norm = 0.0;
  for (auto &x : v) {
    x += dist(gen);
    norm += static_cast<double>(x) * x;
  }
  norm = std::sqrt(norm);
  for (auto &x : v) {
    x = static_cast<float>(x / norm);
  }
  return v;
}

std::vector<float> TestUtilities::flatten(const std::vector<std::vector<float>> &vectors) {
  std::vector<float> flat;
  for (const auto &v : vectors) {
    flat.insert(flat.end(), v.begin(), v.end());
  }
  return flat;
}

face_core::NewFace TestUtilities::create_test_face(const std::string &photo,
                                                   const std::vector<float> &embedding,
                                                   const face_core::BoundingBox &bbox,
                                                   const face_core::FaceMetadata &metadata) {
  face_core::NewFace face;
  face.embedding = embedding;
  face.photo = photo;
  face.bbox = bbox;
  face.confidence = 0.99f;
  face.metadata = metadata;
  return face;
}

std::vector<face_core::NewFace> TestUtilities::create_random_faces(int count,
                                                                   size_t dimension,
                                                                   unsigned seed,
                                                                   const std::string &photo_prefix) {
  std::vector<face_core::NewFace> faces;
  faces.reserve(count);
  for (int i = 0; i < count; ++i) {
    faces.push_back(create_test_face(photo_prefix + std::to_string(i) + ".jpg",
                                     random_unit_vector(dimension, seed + i)));
  }
  return faces;
}

face_core::LibrarySettings TestUtilities::create_test_settings(size_t dimension,
                                                               int64_t approximate_threshold) {
  face_core::LibrarySettings settings;
  settings.index.dimension = dimension;
  settings.index.approximate_threshold = approximate_threshold;
  // Probe every cluster so approximate search has exact recall in tests
  settings.index.cluster_count = 4;
  settings.index.probe_count = 4;
  settings.db_pool_size = 2;
  return settings;
}

}  // namespace face_tests

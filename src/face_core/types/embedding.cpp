#include "face_core/types/embedding.hpp"

#include <cmath>

#include "face_core/errors.hpp"

namespace face_core {
namespace embedding {

float l2_norm(const std::vector<float> &vector) {
  double sum = 0.0;
  for (float value : vector) {
    sum += static_cast<double>(value) * static_cast<double>(value);
  }
  return static_cast<float>(std::sqrt(sum));
}

float inner_product(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.size() != b.size()) {
    throw DimensionMismatch(a.size(), b.size());
  }
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return static_cast<float>(sum);
}

void validate_dimension(const std::vector<float> &vector, size_t dimension) {
  if (vector.size() != dimension) {
    throw DimensionMismatch(dimension, vector.size());
  }
}

bool is_unit_length(const std::vector<float> &vector, float epsilon) {
  return std::fabs(l2_norm(vector) - 1.0f) <= epsilon;
}

std::vector<float> normalized_copy(const std::vector<float> &vector,
                                   size_t dimension,
                                   float epsilon) {
  validate_dimension(vector, dimension);

  float norm = l2_norm(vector);
  if (!std::isfinite(norm) || norm == 0.0f) {
    throw InvalidEmbedding("Embedding has zero or non-finite norm and cannot be normalized");
  }
  if (std::fabs(norm - 1.0f) <= epsilon) {
    return vector;
  }

  std::vector<float> result(vector.size());
  for (size_t i = 0; i < vector.size(); ++i) {
    result[i] = vector[i] / norm;
  }
  return result;
}

}  // namespace embedding
}  // namespace face_core

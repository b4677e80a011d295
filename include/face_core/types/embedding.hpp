#pragma once

#include <cstddef>
#include <vector>

namespace face_core {
namespace embedding {

// Absolute tolerance on |norm - 1| under which a vector is already unit-length.
constexpr float DEFAULT_NORM_EPSILON = 1e-3f;

float l2_norm(const std::vector<float> &vector);

float inner_product(const std::vector<float> &a, const std::vector<float> &b);

// Throws DimensionMismatch if vector.size() != dimension.
void validate_dimension(const std::vector<float> &vector, size_t dimension);

bool is_unit_length(const std::vector<float> &vector, float epsilon = DEFAULT_NORM_EPSILON);

/**
 * @brief Returns a unit-length copy of the vector.
 *
 * Vectors already within epsilon of unit length are returned unchanged so that
 * re-normalizing stored data is a no-op.
 *
 * @throws DimensionMismatch if the size differs from the expected dimension.
 * @throws InvalidEmbedding if the norm is zero or not finite.
 */
std::vector<float> normalized_copy(const std::vector<float> &vector,
                                   size_t dimension,
                                   float epsilon = DEFAULT_NORM_EPSILON);

}  // namespace embedding
}  // namespace face_core

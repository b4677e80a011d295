#pragma once

#include <cstdint>
#include <vector>

namespace face_core {

struct ScoredId {
  int64_t id = 0;
  float similarity = 0.0f;
};

// Top-k cosine search over unit-normalized embeddings.
class SimilaritySearcher {
 public:
  virtual ~SimilaritySearcher() = default;

  // Hits with similarity >= threshold, ordered by similarity descending then id
  // ascending. At most k hits; empty when k <= 0 or nothing is indexed.
  virtual std::vector<ScoredId> search(const std::vector<float> &query,
                                       int k,
                                       float threshold) const = 0;
};

}  // namespace face_core

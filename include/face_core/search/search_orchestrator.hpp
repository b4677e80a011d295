#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "face_core/index/similarity_searcher.hpp"

namespace face_core {

enum class SearchStage { Primary, Expand, Fallback, Merged };

inline std::string to_string(SearchStage stage) {
  switch (stage) {
    case SearchStage::Primary:
      return "PRIMARY";
    case SearchStage::Expand:
      return "EXPAND";
    case SearchStage::Fallback:
      return "FALLBACK";
    case SearchStage::Merged:
      return "MERGED";
    default:
      return "UNKNOWN";
  }
}

struct SearchPolicy {
  float primary_threshold = 0.55f;
  int max_results = 100;
  // Fewer primary hits than this (but at least one) triggers EXPAND.
  int sufficiency_count = 8;
  float expand_delta = 0.10f;
  float floor_threshold = 0.42f;
  float fallback_threshold = 0.30f;
};

struct StagedHit {
  int64_t id = 0;
  float similarity = 0.0f;
  // True when the hit came from a relaxed stage.
  bool expanded = false;
};

struct OrchestratedResult {
  std::vector<StagedHit> hits;
  std::vector<SearchStage> stages;
};

/**
 * @brief Multi-stage threshold-expansion search.
 *
 * PRIMARY runs at the primary threshold. A thin but non-empty primary result
 * is widened once at max(floor, primary - delta); an empty one gets a single
 * deep FALLBACK search. Results are merged by id, keeping the first-seen
 * similarity, and ordered by similarity descending then id ascending.
 *
 * The merged result never has fewer hits than PRIMARY and never repeats an id.
 */
class SearchOrchestrator {
 public:
  explicit SearchOrchestrator(SearchPolicy policy = SearchPolicy{});

  // threshold and top_k override the policy's primary threshold and max_results.
  OrchestratedResult run(const SimilaritySearcher &searcher,
                         const std::vector<float> &query,
                         std::optional<int> top_k = std::nullopt,
                         std::optional<float> threshold = std::nullopt) const;

  const SearchPolicy &policy() const {
    return policy_;
  }

 private:
  SearchPolicy policy_;
};

}  // namespace face_core

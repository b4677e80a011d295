#include "face_core/search/search_orchestrator.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace face_core {

SearchOrchestrator::SearchOrchestrator(SearchPolicy policy) : policy_(policy) {
  if (policy_.max_results <= 0) {
    throw std::invalid_argument("max_results must be positive");
  }
  if (policy_.sufficiency_count < 1) {
    throw std::invalid_argument("sufficiency_count must be at least 1");
  }
}

OrchestratedResult SearchOrchestrator::run(const SimilaritySearcher &searcher,
                                           const std::vector<float> &query,
                                           std::optional<int> top_k,
                                           std::optional<float> threshold) const {
  const int k = top_k.value_or(policy_.max_results);
  const float primary_threshold = threshold.value_or(policy_.primary_threshold);

  OrchestratedResult result;
  std::unordered_set<int64_t> seen;
  auto merge = [&](const std::vector<ScoredId> &hits, bool expanded) {
    for (const auto &hit : hits) {
      if (seen.insert(hit.id).second) {
        result.hits.push_back(StagedHit{hit.id, hit.similarity, expanded});
      }
    }
  };

  // 1. PRIMARY
  std::vector<ScoredId> primary = searcher.search(query, k, primary_threshold);
  result.stages.push_back(SearchStage::Primary);
  merge(primary, false);

  const int primary_count = static_cast<int>(primary.size());
  if (primary_count > 0 && primary_count < policy_.sufficiency_count) {
    // 2. EXPAND
    const float relaxed =
        std::max(policy_.floor_threshold, primary_threshold - policy_.expand_delta);
    if (relaxed < primary_threshold) {
      merge(searcher.search(query, k, relaxed), true);
      result.stages.push_back(SearchStage::Expand);
    } else {
      std::cout << "[SearchOrchestrator] Skipping EXPAND: relaxed threshold " << relaxed
                << " is not below primary threshold " << primary_threshold << std::endl;
    }
  } else if (primary_count == 0) {
    // 3. FALLBACK
    merge(searcher.search(query, k, policy_.fallback_threshold), true);
    result.stages.push_back(SearchStage::Fallback);
  }

  // 4. MERGED
  std::stable_sort(result.hits.begin(), result.hits.end(),
                   [](const StagedHit &a, const StagedHit &b) {
                     if (a.similarity != b.similarity) {
                       return a.similarity > b.similarity;
                     }
                     return a.id < b.id;
                   });
  result.stages.push_back(SearchStage::Merged);
  return result;
}

}  // namespace face_core

#include "face_core/search/match_aggregator.hpp"

#include <algorithm>
#include <unordered_map>

namespace face_core {

std::vector<MatchGroup> aggregate_matches(const std::vector<FaceHit> &hits) {
  std::vector<MatchGroup> groups;
  std::unordered_map<std::string, size_t> group_index;
  std::vector<double> similarity_sums;

  for (const auto &hit : hits) {
    auto [it, inserted] = group_index.try_emplace(hit.photo, groups.size());
    if (inserted) {
      MatchGroup group;
      group.photo = hit.photo;
      group.photo_name = photo_display_name(hit.photo);
      group.max_similarity = hit.similarity;
      group.metadata = hit.metadata;
      groups.push_back(std::move(group));
      similarity_sums.push_back(0.0);
    }

    MatchGroup &group = groups[it->second];
    group.per_face_hits.push_back(PerFaceHit{hit.face_id, hit.bbox, hit.similarity, hit.expanded});
    group.max_similarity = std::max(group.max_similarity, hit.similarity);
    group.expanded = group.expanded || hit.expanded;
    similarity_sums[it->second] += hit.similarity;
  }

  for (size_t i = 0; i < groups.size(); ++i) {
    groups[i].face_count = static_cast<int>(groups[i].per_face_hits.size());
    groups[i].avg_similarity = static_cast<float>(similarity_sums[i] / groups[i].face_count);
  }

  std::sort(groups.begin(), groups.end(), [](const MatchGroup &a, const MatchGroup &b) {
    if (a.max_similarity != b.max_similarity) {
      return a.max_similarity > b.max_similarity;
    }
    if (a.avg_similarity != b.avg_similarity) {
      return a.avg_similarity > b.avg_similarity;
    }
    return a.photo < b.photo;
  });
  return groups;
}

}  // namespace face_core

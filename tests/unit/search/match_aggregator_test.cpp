#include <gtest/gtest.h>

#include "face_core/search/match_aggregator.hpp"

using namespace face_core;

namespace {

FaceHit hit(int64_t id, const std::string &photo, float similarity, bool expanded = false) {
  FaceHit h;
  h.face_id = id;
  h.photo = photo;
  h.bbox = {0, 0, 10, 10};
  h.similarity = similarity;
  h.expanded = expanded;
  return h;
}

}  // namespace

TEST(MatchAggregatorTest, GroupsByPhotoAndRanksByMaxThenAverage) {
  // Arrange
  std::vector<FaceHit> hits = {hit(1, "A", 0.9f), hit(2, "A", 0.7f), hit(3, "B", 0.8f)};

  // Act
  auto groups = aggregate_matches(hits);

  // Assert
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].photo, "A");
  EXPECT_FLOAT_EQ(groups[0].max_similarity, 0.9f);
  EXPECT_NEAR(groups[0].avg_similarity, 0.8f, 1e-6f);
  EXPECT_EQ(groups[0].face_count, 2);
  EXPECT_EQ(groups[1].photo, "B");
  EXPECT_FLOAT_EQ(groups[1].max_similarity, 0.8f);
  EXPECT_FLOAT_EQ(groups[1].avg_similarity, 0.8f);
  EXPECT_EQ(groups[1].face_count, 1);
}

TEST(MatchAggregatorTest, EqualMaxIsBrokenByAverageThenPhoto) {
  std::vector<FaceHit> hits = {hit(1, "z.jpg", 0.9f), hit(2, "y.jpg", 0.9f), hit(3, "y.jpg", 0.5f),
                               hit(4, "x.jpg", 0.9f)};

  auto groups = aggregate_matches(hits);

  ASSERT_EQ(groups.size(), 3u);
  EXPECT_EQ(groups[0].photo, "x.jpg");
  EXPECT_EQ(groups[1].photo, "z.jpg");
  EXPECT_EQ(groups[2].photo, "y.jpg");
}

TEST(MatchAggregatorTest, HitsKeepInputOrderWithinGroup) {
  std::vector<FaceHit> hits = {hit(7, "A", 0.6f), hit(3, "A", 0.95f), hit(5, "A", 0.7f)};

  auto groups = aggregate_matches(hits);

  ASSERT_EQ(groups.size(), 1u);
  ASSERT_EQ(groups[0].per_face_hits.size(), 3u);
  EXPECT_EQ(groups[0].per_face_hits[0].face_id, 7);
  EXPECT_EQ(groups[0].per_face_hits[1].face_id, 3);
  EXPECT_EQ(groups[0].per_face_hits[2].face_id, 5);
}

TEST(MatchAggregatorTest, GroupIsExpandedIfAnyHitIs) {
  std::vector<FaceHit> hits = {hit(1, "A", 0.6f), hit(2, "A", 0.45f, true), hit(3, "B", 0.6f)};

  auto groups = aggregate_matches(hits);

  ASSERT_EQ(groups.size(), 2u);
  EXPECT_TRUE(groups[0].photo == "A" ? groups[0].expanded : groups[1].expanded);
  EXPECT_FALSE(groups[0].photo == "B" ? groups[0].expanded : groups[1].expanded);
}

TEST(MatchAggregatorTest, PhotoNameAndMetadataComeFromFirstHit) {
  FaceHit first = hit(1, "albums/trip/IMG_1.jpg", 0.9f);
  first.metadata.location_name = "Lisbon";
  FaceHit second = hit(2, "albums/trip/IMG_1.jpg", 0.8f);
  second.metadata.location_name = "Elsewhere";

  auto groups = aggregate_matches({first, second});

  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0].photo_name, "IMG_1.jpg");
  EXPECT_EQ(groups[0].metadata.location_name, std::optional<std::string>("Lisbon"));
}

TEST(MatchAggregatorTest, EmptyInputGivesNoGroups) {
  EXPECT_TRUE(aggregate_matches({}).empty());
}

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <cmath>
#include <fstream>
#include <random>
#include <set>
#include <thread>

#include <nlohmann/json.hpp>

#include "face_core/errors.hpp"
#include "face_core/services/face_library.hpp"
#include "../../common/utilities_test.hpp"

using namespace face_core;
using namespace face_tests;

namespace {

constexpr size_t kDim = 8;

// Non-negative components keep every pairwise similarity >= 0.
std::vector<float> positive_unit_vector(unsigned seed) {
  std::vector<float> v = TestUtilities::random_unit_vector(kDim, seed);
  for (auto &x : v) {
    x = std::fabs(x);
  }
  return v;
}

std::vector<NewFace> positive_faces(int count, unsigned seed, const std::string &prefix = "photo_") {
  std::vector<NewFace> faces;
  for (int i = 0; i < count; ++i) {
    faces.push_back(TestUtilities::create_test_face(prefix + std::to_string(i) + ".jpg",
                                                    positive_unit_vector(seed + i)));
  }
  return faces;
}

std::set<int64_t> hit_ids(const SearchResponse &response) {
  std::set<int64_t> ids;
  for (const auto &group : response.groups) {
    for (const auto &hit : group.per_face_hits) {
      ids.insert(hit.face_id);
    }
  }
  return ids;
}

SearchRequest everything(int k = 1000) {
  SearchRequest request;
  request.top_k = k;
  request.threshold = 0.0f;
  return request;
}

}  // namespace

class FaceLibraryTest : public FaceLibraryTestBase {};

TEST_F(FaceLibraryTest, QueryMatchingOneFaceReturnsOnlyItsPhoto) {
  // Arrange
  LibrarySettings settings = TestUtilities::create_test_settings(4);
  FaceLibrary &library = open_library(settings);
  const float s = 1.0f / std::sqrt(2.0f);
  library.insert_batch({TestUtilities::create_test_face("p1.jpg", {1, 0, 0, 0}),
                        TestUtilities::create_test_face("p1.jpg", {0, 1, 0, 0}),
                        TestUtilities::create_test_face("p1.jpg", {0, 0, 1, 0}),
                        TestUtilities::create_test_face("p2.jpg", {s, s, 0, 0}),
                        TestUtilities::create_test_face("p2.jpg", {0, 0, s, s})});

  // Act
  SearchRequest request;
  request.top_k = 10;
  request.threshold = 0.99f;
  SearchResponse response = library.search({0, 1, 0, 0}, request);

  // Assert
  ASSERT_EQ(response.groups.size(), 1u);
  EXPECT_EQ(response.groups[0].photo, "p1.jpg");
  EXPECT_NEAR(response.groups[0].max_similarity, 1.0f, 1e-5f);
  EXPECT_EQ(response.groups[0].face_count, 1);
}

TEST_F(FaceLibraryTest, ReadAfterWriteReturnsEveryActiveIdOnce) {
  // Arrange
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(kDim));
  std::vector<int64_t> ids = library.insert_batch(positive_faces(25, 100));

  // Act
  SearchResponse response = library.search(positive_unit_vector(7), everything());

  // Assert
  EXPECT_EQ(response.face_hits, ids.size());
  EXPECT_EQ(hit_ids(response), std::set<int64_t>(ids.begin(), ids.end()));
}

TEST_F(FaceLibraryTest, SelfSimilarityOfUnnormalizedInsertIsOne) {
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(4));
  library.insert(TestUtilities::create_test_face("a.jpg", {2.0f, 0.0f, 0.0f, 0.0f}));

  SearchResponse response = library.search({5.0f, 0.0f, 0.0f, 0.0f});

  ASSERT_EQ(response.groups.size(), 1u);
  EXPECT_NEAR(response.groups[0].max_similarity, 1.0f, 1e-5f);
}

TEST_F(FaceLibraryTest, DeletedPhotoNeverAppearsInResults) {
  // Arrange
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(kDim));
  std::vector<NewFace> faces = positive_faces(20, 200);
  faces[3].photo = "gone.jpg";
  faces[4].photo = "gone.jpg";
  library.insert_batch(faces);

  // Act
  int removed = library.delete_by_photo("gone.jpg");
  SearchResponse response = library.search(faces[3].embedding, everything());

  // Assert
  EXPECT_EQ(removed, 2);
  EXPECT_EQ(response.face_hits, 18u);
  for (const auto &group : response.groups) {
    EXPECT_NE(group.photo, "gone.jpg");
  }
  EXPECT_EQ(library.stats().total_active, 18);
}

TEST_F(FaceLibraryTest, DeletingUnknownPhotoIsNoop) {
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(kDim));
  library.insert_batch(positive_faces(3, 1));

  EXPECT_EQ(library.delete_by_photo("never-seen.jpg"), 0);
  EXPECT_EQ(library.stats().total_active, 3);
}

TEST_F(FaceLibraryTest, ExactToApproximateTransitionKeepsEveryFace) {
  // Arrange
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(kDim, 50));
  std::vector<int64_t> first = library.insert_batch(positive_faces(30, 1000, "a_"));
  ASSERT_EQ(library.stats().index_kind, IndexKind::Exact);

  // Act
  std::vector<int64_t> second = library.insert_batch(positive_faces(30, 2000, "b_"));

  // Assert
  LibraryStats stats = library.stats();
  EXPECT_EQ(stats.index_kind, IndexKind::Approximate);
  EXPECT_TRUE(stats.trained);
  EXPECT_EQ(stats.trained_on, 60);
  std::set<int64_t> expected(first.begin(), first.end());
  expected.insert(second.begin(), second.end());
  EXPECT_EQ(hit_ids(library.search(positive_unit_vector(5), everything())), expected);
  EXPECT_TRUE(library.check_invariants());
}

TEST_F(FaceLibraryTest, ApproximateIndexIsRetrainedWhenItOutgrowsTraining) {
  // Arrange
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(kDim, 50));
  library.insert_batch(positive_faces(60, 1, "a_"));
  ASSERT_EQ(library.stats().trained_on, 60);

  // Act: below 4x growth stays in place, above it retrains
  library.insert_batch(positive_faces(100, 500, "b_"));
  int64_t trained_mid = library.stats().trained_on;
  library.insert_batch(positive_faces(100, 900, "c_"));

  // Assert
  LibraryStats stats = library.stats();
  EXPECT_EQ(trained_mid, 60);
  EXPECT_EQ(stats.index_kind, IndexKind::Approximate);
  EXPECT_EQ(stats.trained_on, 260);
  EXPECT_EQ(library.search(positive_unit_vector(3), everything()).face_hits, 260u);
}

TEST_F(FaceLibraryTest, LibraryReopensFromPersistedIndex) {
  // Arrange
  LibrarySettings settings = TestUtilities::create_test_settings(kDim, 50);
  std::vector<int64_t> ids = open_library(settings).insert_batch(positive_faces(60, 42));
  close_library();

  // Act
  FaceLibrary &reopened = open_library(settings);

  // Assert
  LibraryStats stats = reopened.stats();
  EXPECT_EQ(stats.total_active, 60);
  EXPECT_EQ(stats.index_kind, IndexKind::Approximate);
  EXPECT_EQ(hit_ids(reopened.search(positive_unit_vector(9), everything())),
            std::set<int64_t>(ids.begin(), ids.end()));
}

TEST_F(FaceLibraryTest, CorruptIndexBlobIsRebuiltFromStore) {
  // Arrange
  LibrarySettings settings = TestUtilities::create_test_settings(kDim);
  open_library(settings).insert_batch(positive_faces(12, 7));
  close_library();
  {
    std::ofstream blob(library_dir_ / FaceLibrary::INDEX_DIR / VectorIndex::INDEX_FILE,
                       std::ios::trunc | std::ios::binary);
    blob << "garbage";
  }

  // Act
  FaceLibrary &reopened = open_library(settings);

  // Assert
  EXPECT_EQ(reopened.stats().total_active, 12);
  EXPECT_EQ(reopened.search(positive_unit_vector(1), everything()).face_hits, 12u);
}

TEST_F(FaceLibraryTest, ManifestDimensionMismatchTriggersRebuild) {
  // Arrange
  LibrarySettings settings = TestUtilities::create_test_settings(kDim);
  open_library(settings).insert_batch(positive_faces(5, 7));
  close_library();
  auto manifest_path = library_dir_ / FaceLibrary::INDEX_DIR / VectorIndex::MANIFEST_FILE;
  nlohmann::json manifest;
  {
    std::ifstream in(manifest_path);
    manifest = nlohmann::json::parse(in);
  }
  manifest["dimension"] = kDim * 2;
  {
    std::ofstream out(manifest_path, std::ios::trunc);
    out << manifest.dump();
  }

  // Act
  FaceLibrary &reopened = open_library(settings);

  // Assert
  EXPECT_EQ(reopened.search(positive_unit_vector(2), everything()).face_hits, 5u);
  std::ifstream in(manifest_path);
  EXPECT_EQ(nlohmann::json::parse(in)["dimension"], kDim);
}

TEST_F(FaceLibraryTest, MissingIndexIsRebuiltFromStore) {
  LibrarySettings settings = TestUtilities::create_test_settings(kDim);
  open_library(settings).insert_batch(positive_faces(6, 3));
  close_library();
  std::filesystem::remove_all(library_dir_ / FaceLibrary::INDEX_DIR);

  FaceLibrary &reopened = open_library(settings);

  EXPECT_EQ(reopened.search(positive_unit_vector(4), everything()).face_hits, 6u);
  EXPECT_TRUE(std::filesystem::exists(library_dir_ / FaceLibrary::INDEX_DIR / VectorIndex::INDEX_FILE));
}

TEST_F(FaceLibraryTest, StaleIndexWithDifferentIdsIsRebuilt) {
  // Arrange: keep a copy of the index from before the second insert
  LibrarySettings settings = TestUtilities::create_test_settings(kDim);
  FaceLibrary &library = open_library(settings);
  library.insert_batch(positive_faces(4, 10, "old_"));
  auto index_dir = library_dir_ / FaceLibrary::INDEX_DIR;
  auto saved_dir = temp_dir_ / "saved_index";
  std::filesystem::copy(index_dir, saved_dir);
  library.insert_batch(positive_faces(4, 20, "new_"));
  close_library();
  std::filesystem::remove_all(index_dir);
  std::filesystem::copy(saved_dir, index_dir);

  // Act
  FaceLibrary &reopened = open_library(settings);

  // Assert
  EXPECT_EQ(reopened.search(positive_unit_vector(4), everything()).face_hits, 8u);
  EXPECT_TRUE(reopened.check_invariants());
}

TEST_F(FaceLibraryTest, HeavyDeletionCompactsTheIndex) {
  // Arrange
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(kDim));
  std::vector<NewFace> faces = positive_faces(10, 50);
  faces[0].photo = "small.jpg";
  for (int i = 1; i <= 3; ++i) {
    faces[i].photo = "big.jpg";
  }
  library.insert_batch(faces);

  // Act & Assert: 1 of 10 stays pending
  library.delete_by_photo("small.jpg");
  EXPECT_EQ(library.stats().pending_deletions, 1);

  // 4 of 10 exceeds the 0.2 ratio and compacts
  library.delete_by_photo("big.jpg");
  LibraryStats stats = library.stats();
  EXPECT_EQ(stats.pending_deletions, 0);
  EXPECT_EQ(stats.total_active, 6);
  EXPECT_EQ(stats.tombstoned, 4);
}

TEST_F(FaceLibraryTest, ResetEmptiesLibraryButKeepsIdSequence) {
  // Arrange
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(kDim));
  std::vector<int64_t> before = library.insert_batch(positive_faces(3, 1));

  // Act
  library.reset();
  SearchResponse empty = library.search(positive_unit_vector(1), everything());
  int64_t after = library.insert(TestUtilities::create_test_face("x.jpg", positive_unit_vector(99)));

  // Assert
  EXPECT_TRUE(empty.groups.empty());
  EXPECT_GT(after, before.back());
  EXPECT_EQ(library.stats().total_active, 1);
}

TEST_F(FaceLibraryTest, EmptyLibrarySearchIsNotAnError) {
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(kDim));

  SearchResponse response = library.search(positive_unit_vector(1));

  EXPECT_TRUE(response.groups.empty());
  EXPECT_EQ(response.stages.back(), SearchStage::Merged);
}

TEST_F(FaceLibraryTest, WrongQueryDimensionIsRejected) {
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(kDim));

  EXPECT_THROW(library.search(std::vector<float>(kDim - 1, 0.3f)), DimensionMismatch);
  EXPECT_THROW(library.insert(TestUtilities::create_test_face("a.jpg", {1.0f, 0.0f})),
               DimensionMismatch);
  EXPECT_EQ(library.stats().total_active, 0);
}

TEST_F(FaceLibraryTest, StatsReportIndexShape) {
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(kDim));
  library.insert_batch(positive_faces(3, 1));

  LibraryStats stats = library.stats();

  EXPECT_EQ(stats.total_active, 3);
  EXPECT_EQ(stats.index_kind, IndexKind::Exact);
  EXPECT_EQ(stats.dimension, kDim);
  EXPECT_TRUE(stats.trained);
}

TEST_F(FaceLibraryTest, ConcurrentSearchesDuringIngestionSeeConsistentIndex) {
  // Arrange
  FaceLibrary &library = open_library(TestUtilities::create_test_settings(kDim, 50));
  library.insert_batch(positive_faces(10, 1, "seed_"));
  std::atomic<bool> done{false};
  std::atomic<int> failures{0};

  // Act
  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&, r] {
      unsigned seed = 10000 + r;
      while (!done.load()) {
        try {
          SearchResponse response = library.search(positive_unit_vector(seed++), everything());
          if (response.face_hits < 10) {
            ++failures;
          }
        } catch (const std::exception &) {
          ++failures;
        }
      }
    });
  }
  for (int batch = 0; batch < 8; ++batch) {
    library.insert_batch(positive_faces(10, 100 * (batch + 1), "b" + std::to_string(batch) + "_"));
  }
  done = true;
  for (auto &t : readers) {
    t.join();
  }

  // Assert
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(library.stats().total_active, 90);
  EXPECT_TRUE(library.check_invariants());
}

TEST_F(FaceLibraryTest, UnwritableIndexDirectoryDoesNotLoseCommittedFaces) {
  // Arrange: replace the index directory with a plain file so saves fail
  LibrarySettings settings = TestUtilities::create_test_settings(kDim, 50);
  FaceLibrary &library = open_library(settings);
  auto index_dir = library_dir_ / FaceLibrary::INDEX_DIR;
  std::filesystem::remove_all(index_dir);
  std::ofstream(index_dir) << "not a directory";

  // Act: one in-place insert and one that migrates to the approximate index
  std::vector<int64_t> first = library.insert_batch(positive_faces(10, 1, "a_"));
  std::vector<int64_t> second = library.insert_batch(positive_faces(50, 100, "b_"));

  // Assert
  EXPECT_EQ(first.size(), 10u);
  EXPECT_EQ(second.size(), 50u);
  std::set<int64_t> expected(first.begin(), first.end());
  expected.insert(second.begin(), second.end());
  EXPECT_EQ(hit_ids(library.search(positive_unit_vector(5), everything())), expected);
  EXPECT_EQ(library.stats().index_kind, IndexKind::Approximate);
  EXPECT_TRUE(library.check_invariants());

  // Deletes keep working too, and a reopen recovers the index from the store
  EXPECT_EQ(library.delete_by_photo("a_0.jpg"), 1);
  close_library();
  std::filesystem::remove(index_dir);
  FaceLibrary &reopened = open_library(settings);
  EXPECT_EQ(reopened.search(positive_unit_vector(5), everything()).face_hits, 59u);
}

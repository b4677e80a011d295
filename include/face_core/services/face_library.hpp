#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "face_core/db/database_manager.hpp"
#include "face_core/db/embedding_store.hpp"
#include "face_core/index/vector_index.hpp"
#include "face_core/search/match_aggregator.hpp"
#include "face_core/search/search_orchestrator.hpp"
#include "face_core/types/face_record.hpp"

namespace face_core {

struct LibrarySettings {
  IndexOptions index;
  SearchPolicy policy;
  // Approximate index is retrained once the active count exceeds trained_on * factor.
  double retrain_growth_factor = 4.0;
  // Pending deletions above this share of indexed vectors trigger a compaction rebuild.
  double compaction_ratio = 0.2;
  int db_pool_size = 4;
};

struct SearchRequest {
  std::optional<int> top_k;
  std::optional<float> threshold;
};

struct SearchResponse {
  std::vector<MatchGroup> groups;
  std::vector<SearchStage> stages;
  size_t face_hits = 0;
};

struct LibraryStats {
  int64_t total_active = 0;
  int64_t tombstoned = 0;
  int64_t pending_deletions = 0;
  IndexKind index_kind = IndexKind::Exact;
  size_t dimension = 0;
  int cluster_count = 0;
  int probe_count = 0;
  bool trained = false;
  int64_t trained_on = 0;
};

/**
 * @brief One tenant's face collection: an embedding store plus its index.
 *
 * Mutations (insert, delete, reset, rebuild) are serialized on write_mutex_.
 * Searches hold a shared lock on the index for the whole orchestration. A
 * rebuild constructs the replacement index from the store while readers keep
 * using the old one, then swaps it in under the exclusive lock.
 *
 * Layout under the library directory: faces.db, index/faces.faiss and
 * index/manifest.json.
 */
class FaceLibrary {
 public:
  static constexpr const char *DB_FILE = "faces.db";
  static constexpr const char *INDEX_DIR = "index";

  // Throws CorruptStore / DimensionMismatch when the store cannot be used.
  // A missing or unusable index is rebuilt from the store.
  FaceLibrary(const std::string &key,
              const std::filesystem::path &dir,
              const std::string &db_key,
              const LibrarySettings &settings);
  ~FaceLibrary();

  FaceLibrary(const FaceLibrary &) = delete;
  FaceLibrary &operator=(const FaceLibrary &) = delete;

  int64_t insert(const NewFace &face);
  // Once the store commits, the ids are returned even if the index update
  // fails; the index is then rebuilt before its next use.
  std::vector<int64_t> insert_batch(const std::vector<NewFace> &faces);

  SearchResponse search(const std::vector<float> &query, const SearchRequest &request = {});

  int delete_by_photo(const std::string &photo);
  void reset();
  void rebuild();

  // true when the index matches the store; otherwise rebuilds and returns false.
  bool check_invariants();

  LibraryStats stats();
  std::vector<LocationSummary> list_locations();

  // Validated, unit-length copy of a query vector.
  std::vector<float> prepare_query(const std::vector<float> &query) const;

  const std::string &key() const {
    return key_;
  }
  const std::filesystem::path &dir() const {
    return dir_;
  }

 private:
  void open_index();
  bool needs_rebuild_for(int64_t active_count) const;
  // Throws InvariantViolation when the index disagrees with the store.
  void verify_index_locked(bool compare_ids);
  void enforce_invariant_locked();
  void rebuild_locked(const std::string &reason);
  // Logs and continues on failure; the store stays authoritative and a stale
  // index on disk is replaced when the library is next opened.
  void persist_index_locked();
  void update_index_after_insert_locked(const std::vector<int64_t> &ids,
                                        const std::vector<NewFace> &faces);
  // Rebuilds if an earlier index update failed after its store write committed.
  void refresh_stale_index();
  void refresh_stale_index_locked();

  std::string key_;
  std::filesystem::path dir_;
  LibrarySettings settings_;
  SearchOrchestrator orchestrator_;
  std::unique_ptr<DatabaseManager> db_;
  std::unique_ptr<EmbeddingStore> store_;

  std::mutex write_mutex_;
  mutable std::shared_mutex index_mutex_;
  std::unique_ptr<VectorIndex> index_;
  std::atomic<bool> index_stale_{false};
};

}  // namespace face_core

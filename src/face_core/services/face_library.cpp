#include "face_core/services/face_library.hpp"

#include <iostream>
#include <stdexcept>
#include <unordered_map>

#include "face_core/errors.hpp"

namespace face_core {

FaceLibrary::FaceLibrary(const std::string &key,
                         const std::filesystem::path &dir,
                         const std::string &db_key,
                         const LibrarySettings &settings)
    : key_(key), dir_(dir), settings_(settings), orchestrator_(settings.policy) {
  if (settings_.retrain_growth_factor <= 1.0) {
    throw std::invalid_argument("retrain_growth_factor must be greater than 1");
  }
  if (settings_.compaction_ratio <= 0.0 || settings_.compaction_ratio >= 1.0) {
    throw std::invalid_argument("compaction_ratio must be in (0, 1)");
  }

  std::filesystem::create_directories(dir_);
  db_ = std::make_unique<DatabaseManager>(dir_ / DB_FILE, db_key, settings_.db_pool_size);
  store_ = std::make_unique<EmbeddingStore>(*db_, settings_.index.dimension,
                                            settings_.index.normalization_epsilon);
  open_index();
  std::cout << "[FaceLibrary:" << key_ << "] Opened with " << index_->count() << " face(s), "
            << to_string(index_->kind()) << " index." << std::endl;
}

FaceLibrary::~FaceLibrary() {
  index_.reset();
  store_.reset();
  if (db_) {
    db_->shutdown();
  }
}

void FaceLibrary::open_index() {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  const std::filesystem::path index_dir = dir_ / INDEX_DIR;

  try {
    index_ = VectorIndex::load(index_dir, settings_.index);
  } catch (const CorruptIndex &e) {
    std::cerr << "[FaceLibrary:" << key_ << "] ERROR: persisted index is unusable, discarding it: "
              << e.what() << std::endl;
    index_.reset();
  }

  if (!index_) {
    rebuild_locked("no usable persisted index");
    return;
  }

  try {
    verify_index_locked(/*compare_ids*/ true);
  } catch (const InvariantViolation &e) {
    std::cerr << "[FaceLibrary:" << key_ << "] Persisted index is stale: " << e.what()
              << std::endl;
    rebuild_locked("stale persisted index");
    return;
  }

  if (needs_rebuild_for(index_->count())) {
    rebuild_locked("persisted index does not fit the current thresholds");
  }
}

std::vector<float> FaceLibrary::prepare_query(const std::vector<float> &query) const {
  return embedding::normalized_copy(query, settings_.index.dimension,
                                    settings_.index.normalization_epsilon);
}

bool FaceLibrary::needs_rebuild_for(int64_t active_count) const {
  if (index_->kind() == IndexKind::Exact) {
    return active_count >= settings_.index.approximate_threshold;
  }
  if (!index_->is_trained()) {
    return true;
  }
  return static_cast<double>(active_count) >
         static_cast<double>(index_->trained_on()) * settings_.retrain_growth_factor;
}

void FaceLibrary::verify_index_locked(bool compare_ids) {
  const int64_t store_count = store_->count_active();
  const int64_t index_count = index_->count();
  if (store_count != index_count) {
    throw InvariantViolation("index holds " + std::to_string(index_count) +
                             " face(s) but store holds " + std::to_string(store_count));
  }
  if (compare_ids && index_->ids() != store_->active_ids()) {
    throw InvariantViolation("index and store hold different face ids");
  }
}

void FaceLibrary::enforce_invariant_locked() {
  try {
    verify_index_locked(/*compare_ids*/ false);
  } catch (const InvariantViolation &e) {
    std::cerr << "[FaceLibrary:" << key_ << "] Invariant violation: " << e.what() << std::endl;
    rebuild_locked("invariant violation");
  }
}

void FaceLibrary::rebuild_locked(const std::string &reason) {
  // Always from the full store, never from vectors held by the old index.
  std::vector<StoredFace> faces = store_->all_active();
  std::vector<int64_t> ids;
  std::vector<float> flat;
  ids.reserve(faces.size());
  flat.reserve(faces.size() * settings_.index.dimension);
  for (const auto &face : faces) {
    ids.push_back(face.record.id);
    flat.insert(flat.end(), face.vector.begin(), face.vector.end());
  }

  std::unique_ptr<VectorIndex> fresh = VectorIndex::build(ids, flat, settings_.index);
  std::cout << "[FaceLibrary:" << key_ << "] Rebuilt " << to_string(fresh->kind()) << " index over "
            << fresh->count() << " face(s) (" << reason << ")." << std::endl;
  {
    std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
    index_.swap(fresh);
  }
  index_stale_ = false;
  persist_index_locked();
}

void FaceLibrary::persist_index_locked() {
  // write_mutex_ is held, so nothing mutates the index while it is written.
  try {
    index_->save(dir_ / INDEX_DIR);
  } catch (const std::exception &e) {
    std::cerr << "[FaceLibrary:" << key_ << "] ERROR: failed to persist index: " << e.what()
              << std::endl;
  }
}

void FaceLibrary::refresh_stale_index() {
  if (!index_stale_) {
    return;
  }
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  refresh_stale_index_locked();
}

void FaceLibrary::refresh_stale_index_locked() {
  if (index_stale_) {
    rebuild_locked("index missed committed store changes");
  }
}

int64_t FaceLibrary::insert(const NewFace &face) {
  return insert_batch({face}).front();
}

std::vector<int64_t> FaceLibrary::insert_batch(const std::vector<NewFace> &faces) {
  if (faces.empty()) {
    return {};
  }
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  refresh_stale_index_locked();

  // Store first; it validates and normalizes the whole batch.
  std::vector<int64_t> ids = store_->append_batch(faces);

  // The faces are committed from here on, so index failures must not hide the ids.
  try {
    update_index_after_insert_locked(ids, faces);
    enforce_invariant_locked();
  } catch (const std::exception &e) {
    std::cerr << "[FaceLibrary:" << key_ << "] ERROR: index update failed after storing "
              << ids.size() << " face(s), rebuilding before next use: " << e.what() << std::endl;
    index_stale_ = true;
  }
  return ids;
}

void FaceLibrary::update_index_after_insert_locked(const std::vector<int64_t> &ids,
                                                   const std::vector<NewFace> &faces) {
  const int64_t active = store_->count_active();

  if (needs_rebuild_for(active)) {
    rebuild_locked(index_->kind() == IndexKind::Exact ? "exact to approximate transition"
                                                      : "approximate index outgrew its training");
    return;
  }

  std::vector<float> flat;
  flat.reserve(faces.size() * settings_.index.dimension);
  for (const auto &face : faces) {
    std::vector<float> unit = prepare_query(face.embedding);
    flat.insert(flat.end(), unit.begin(), unit.end());
  }

  try {
    std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
    index_->insert(ids, flat);
  } catch (const IndexError &e) {
    std::cerr << "[FaceLibrary:" << key_ << "] In-place insert failed: " << e.what() << std::endl;
    rebuild_locked("in-place insert failed");
    return;
  }
  persist_index_locked();
}

SearchResponse FaceLibrary::search(const std::vector<float> &query, const SearchRequest &request) {
  std::vector<float> unit = prepare_query(query);
  if (request.top_k && *request.top_k < 0) {
    throw std::invalid_argument("top_k must not be negative");
  }
  refresh_stale_index();

  SearchResponse response;
  OrchestratedResult result;
  {
    // Every stage sees the same index.
    std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
    result = orchestrator_.run(*index_, unit, request.top_k, request.threshold);
  }
  response.stages = result.stages;
  if (result.hits.empty()) {
    return response;
  }

  std::vector<int64_t> ids;
  ids.reserve(result.hits.size());
  for (const auto &hit : result.hits) {
    ids.push_back(hit.id);
  }
  std::unordered_map<int64_t, FaceRecord> records;
  for (auto &record : store_->get_faces(ids)) {
    records.emplace(record.id, std::move(record));
  }

  std::vector<FaceHit> face_hits;
  face_hits.reserve(result.hits.size());
  bool unresolved = false;
  for (const auto &hit : result.hits) {
    auto it = records.find(hit.id);
    if (it == records.end()) {
      std::cerr << "[FaceLibrary:" << key_ << "] Index returned face " << hit.id
                << " which is not active in the store" << std::endl;
      unresolved = true;
      continue;
    }
    const FaceRecord &record = it->second;
    face_hits.push_back(
        FaceHit{record.id, record.photo, record.bbox, hit.similarity, hit.expanded, record.metadata});
  }

  response.face_hits = face_hits.size();
  response.groups = aggregate_matches(face_hits);

  // A concurrent delete can also leave an id unresolved; the check tells the two apart.
  if (unresolved) {
    check_invariants();
  }
  return response;
}

int FaceLibrary::delete_by_photo(const std::string &photo) {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  refresh_stale_index_locked();

  std::vector<int64_t> ids = store_->active_ids_for_photo(photo);
  int removed = store_->remove_by_photo(photo);
  if (removed == 0) {
    return 0;
  }

  // Tombstones are committed; a failed index update is repaired on next use.
  try {
    {
      std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
      index_->mark_deleted(ids);
    }

    if (static_cast<double>(index_->deleted_count()) >
        settings_.compaction_ratio * static_cast<double>(index_->total())) {
      rebuild_locked("compacting " + std::to_string(index_->deleted_count()) + " deleted face(s)");
    } else {
      persist_index_locked();
    }

    enforce_invariant_locked();
  } catch (const std::exception &e) {
    std::cerr << "[FaceLibrary:" << key_ << "] ERROR: index update failed after deleting " << photo
              << ", rebuilding before next use: " << e.what() << std::endl;
    index_stale_ = true;
  }
  std::cout << "[FaceLibrary:" << key_ << "] Deleted " << removed << " face(s) of " << photo
            << std::endl;
  return removed;
}

void FaceLibrary::reset() {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  store_->reset();
  rebuild_locked("reset");
}

void FaceLibrary::rebuild() {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  rebuild_locked("requested");
}

bool FaceLibrary::check_invariants() {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  try {
    verify_index_locked(/*compare_ids*/ true);
    return true;
  } catch (const InvariantViolation &e) {
    std::cerr << "[FaceLibrary:" << key_ << "] Invariant violation: " << e.what() << std::endl;
    rebuild_locked("invariant violation");
    return false;
  }
}

LibraryStats FaceLibrary::stats() {
  LibraryStats stats;
  stats.total_active = store_->count_active();
  stats.tombstoned = store_->count_tombstoned();
  stats.dimension = settings_.index.dimension;

  std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
  stats.pending_deletions = index_->deleted_count();
  stats.index_kind = index_->kind();
  stats.cluster_count = index_->cluster_count();
  stats.probe_count = index_->probe_count();
  stats.trained = index_->is_trained();
  stats.trained_on = index_->trained_on();
  return stats;
}

std::vector<LocationSummary> FaceLibrary::list_locations() {
  return store_->list_locations();
}

}  // namespace face_core

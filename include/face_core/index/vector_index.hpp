#pragma once

#include <faiss/IndexIDMap.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "face_core/index/similarity_searcher.hpp"
#include "face_core/types/embedding.hpp"

namespace face_core {

enum class IndexKind { Exact, Approximate };

inline std::string to_string(IndexKind kind) {
  switch (kind) {
    case IndexKind::Exact:
      return "exact";
    case IndexKind::Approximate:
      return "approximate";
    default:
      return "unknown";
  }
}

IndexKind index_kind_from_string(const std::string &str);

struct IndexOptions {
  size_t dimension = 1024;
  // Active count at or above which the index is built as IVF-Flat.
  int64_t approximate_threshold = 1000;
  // 0 picks ceil(sqrt(n)) at build time.
  int cluster_count = 0;
  int probe_count = 10;
  float normalization_epsilon = embedding::DEFAULT_NORM_EPSILON;
};

/**
 * @brief In-memory inner-product index over the active faces of one library.
 *
 * Wraps a faiss IndexIDMap2 around either IndexFlatIP (exact) or IndexIVFFlat
 * (approximate). The index is derived state: it never owns face data and can
 * be rebuilt from the embedding store at any time.
 *
 * Deletions are soft. Marked ids stay in the faiss structure but are filtered
 * from results and excluded from count() until the next rebuild.
 *
 * Not synchronized; the owning library serializes mutations.
 */
class VectorIndex : public SimilaritySearcher {
 public:
  static constexpr int MANIFEST_FORMAT_VERSION = 1;
  static constexpr const char *INDEX_FILE = "faces.faiss";
  static constexpr const char *MANIFEST_FILE = "manifest.json";

  /**
   * @brief Builds an index over the given corpus.
   *
   * Picks Exact below options.approximate_threshold and Approximate at or
   * above it. An approximate index is trained on the full corpus passed in.
   *
   * @param ids one id per vector
   * @param flat_vectors ids.size() * dimension unit-length floats
   */
  static std::unique_ptr<VectorIndex> build(const std::vector<int64_t> &ids,
                                            const std::vector<float> &flat_vectors,
                                            const IndexOptions &options);

  // Returns nullptr when no index has been persisted in dir.
  // Throws CorruptIndex when the files exist but cannot be used.
  static std::unique_ptr<VectorIndex> load(const std::filesystem::path &dir,
                                           const IndexOptions &options);

  ~VectorIndex() override;

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  std::vector<ScoredId> search(const std::vector<float> &query,
                               int k,
                               float threshold) const override;

  // Throws IndexError on an untrained approximate index.
  void insert(const std::vector<int64_t> &ids, const std::vector<float> &flat_vectors);

  // Returns how many of the ids were indexed and not yet marked.
  size_t mark_deleted(const std::vector<int64_t> &ids);

  // Writes the faiss blob and manifest via tmp files and rename.
  void save(const std::filesystem::path &dir) const;

  // Indexed minus marked-deleted
  int64_t count() const;
  int64_t total() const;
  int64_t deleted_count() const {
    return static_cast<int64_t>(deleted_.size());
  }

  IndexKind kind() const {
    return kind_;
  }
  bool is_trained() const;
  int cluster_count() const {
    return cluster_count_;
  }
  int probe_count() const {
    return probe_count_;
  }
  int64_t trained_on() const {
    return trained_on_;
  }
  size_t dimension() const {
    return options_.dimension;
  }

  // Live ids, ascending.
  std::vector<int64_t> ids() const;

 private:
  VectorIndex(std::unique_ptr<faiss::IndexIDMap2> index, IndexKind kind, const IndexOptions &options);

  static faiss::IndexIDMap2 *create_exact_index(size_t dimension);
  static faiss::IndexIDMap2 *create_approximate_index(size_t dimension, int nlist);
  void apply_probe_count(int requested);

  std::unique_ptr<faiss::IndexIDMap2> index_;
  IndexKind kind_;
  IndexOptions options_;
  int cluster_count_ = 0;
  int probe_count_ = 0;
  int64_t trained_on_ = 0;
  std::unordered_set<int64_t> deleted_;
};

}  // namespace face_core

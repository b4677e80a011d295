#include "face_core/index/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexIVFFlat.h>
#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "face_core/errors.hpp"

namespace face_core {

namespace {

void check_flat_size(const std::vector<int64_t> &ids,
                     const std::vector<float> &flat_vectors,
                     size_t dimension) {
  if (flat_vectors.size() != ids.size() * dimension) {
    size_t actual = ids.empty() ? flat_vectors.size() : flat_vectors.size() / ids.size();
    throw DimensionMismatch(dimension, actual);
  }
}

// Write to "<name>.tmp" then rename over the target.
template <typename Writer>
void write_atomically(const std::filesystem::path &target, Writer &&writer) {
  std::filesystem::path tmp = target;
  tmp += ".tmp";
  writer(tmp);
  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw IndexError("Failed to move " + tmp.string() + " into place: " + ec.message());
  }
}

}  // namespace

IndexKind index_kind_from_string(const std::string &str) {
  if (str == "exact")
    return IndexKind::Exact;
  if (str == "approximate")
    return IndexKind::Approximate;
  throw std::invalid_argument("Unknown IndexKind: " + str);
}

VectorIndex::VectorIndex(std::unique_ptr<faiss::IndexIDMap2> index,
                         IndexKind kind,
                         const IndexOptions &options)
    : index_(std::move(index)), kind_(kind), options_(options) {}

VectorIndex::~VectorIndex() = default;

faiss::IndexIDMap2 *VectorIndex::create_exact_index(size_t dimension) {
  auto *base_index = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimension));
  auto *id_map = new faiss::IndexIDMap2(base_index);
  id_map->own_fields = true;
  return id_map;
}

faiss::IndexIDMap2 *VectorIndex::create_approximate_index(size_t dimension, int nlist) {
  auto *quantizer = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimension));
  auto *ivf = new faiss::IndexIVFFlat(quantizer, dimension, static_cast<size_t>(nlist),
                                      faiss::METRIC_INNER_PRODUCT);
  ivf->own_fields = true;
  auto *id_map = new faiss::IndexIDMap2(ivf);
  id_map->own_fields = true;
  return id_map;
}

void VectorIndex::apply_probe_count(int requested) {
  if (kind_ != IndexKind::Approximate) {
    probe_count_ = 0;
    return;
  }
  probe_count_ = std::max(1, std::min(requested, cluster_count_));
  auto *ivf = dynamic_cast<faiss::IndexIVFFlat *>(index_->index);
  if (ivf) {
    ivf->nprobe = static_cast<size_t>(probe_count_);
  }
}

std::unique_ptr<VectorIndex> VectorIndex::build(const std::vector<int64_t> &ids,
                                                const std::vector<float> &flat_vectors,
                                                const IndexOptions &options) {
  if (options.dimension == 0) {
    throw std::invalid_argument("Index dimension must be positive");
  }
  check_flat_size(ids, flat_vectors, options.dimension);

  const int64_t n = static_cast<int64_t>(ids.size());
  const bool approximate = n > 0 && n >= options.approximate_threshold;

  try {
    if (!approximate) {
      std::unique_ptr<faiss::IndexIDMap2> index(create_exact_index(options.dimension));
      if (n > 0) {
        index->add_with_ids(n, flat_vectors.data(), ids.data());
      }
      return std::unique_ptr<VectorIndex>(
          new VectorIndex(std::move(index), IndexKind::Exact, options));
    }

    int nlist = options.cluster_count > 0
                    ? options.cluster_count
                    : static_cast<int>(std::ceil(std::sqrt(static_cast<double>(n))));
    nlist = static_cast<int>(std::clamp<int64_t>(nlist, 1, n));

    std::unique_ptr<faiss::IndexIDMap2> index(create_approximate_index(options.dimension, nlist));
    // Train on the whole corpus, never on an incoming batch alone.
    index->train(n, flat_vectors.data());
    index->add_with_ids(n, flat_vectors.data(), ids.data());

    std::unique_ptr<VectorIndex> result(
        new VectorIndex(std::move(index), IndexKind::Approximate, options));
    result->cluster_count_ = nlist;
    result->trained_on_ = n;
    result->apply_probe_count(options.probe_count);
    return result;
  } catch (const faiss::FaissException &e) {
    throw IndexError(std::string("Failed to build index: ") + e.what());
  }
}

std::unique_ptr<VectorIndex> VectorIndex::load(const std::filesystem::path &dir,
                                               const IndexOptions &options) {
  const std::filesystem::path index_path = dir / INDEX_FILE;
  const std::filesystem::path manifest_path = dir / MANIFEST_FILE;
  const bool has_index = std::filesystem::exists(index_path);
  const bool has_manifest = std::filesystem::exists(manifest_path);
  if (!has_index && !has_manifest) {
    return nullptr;
  }
  if (!has_index || !has_manifest) {
    throw CorruptIndex("Incomplete index in " + dir.string() + ": " +
                       (has_index ? "manifest" : "index blob") + " is missing");
  }

  nlohmann::json manifest;
  try {
    std::ifstream file(manifest_path);
    manifest = nlohmann::json::parse(file);
  } catch (const nlohmann::json::exception &e) {
    throw CorruptIndex("Unreadable index manifest " + manifest_path.string() + ": " + e.what());
  }

  IndexKind kind;
  size_t manifest_dimension = 0;
  int64_t trained_on = 0;
  int64_t manifest_count = 0;
  std::vector<int64_t> deleted;
  try {
    int format_version = manifest.at("format_version").get<int>();
    if (format_version != MANIFEST_FORMAT_VERSION) {
      throw CorruptIndex("Unsupported index manifest format version " +
                         std::to_string(format_version));
    }
    manifest_dimension = manifest.at("dimension").get<size_t>();
    kind = index_kind_from_string(manifest.at("kind").get<std::string>());
    trained_on = manifest.value("trained_on", static_cast<int64_t>(0));
    manifest_count = manifest.at("count").get<int64_t>();
    deleted = manifest.value("deleted", std::vector<int64_t>{});
  } catch (const nlohmann::json::exception &e) {
    throw CorruptIndex("Malformed index manifest " + manifest_path.string() + ": " + e.what());
  } catch (const std::invalid_argument &e) {
    throw CorruptIndex("Malformed index manifest " + manifest_path.string() + ": " + e.what());
  }

  if (manifest_dimension != options.dimension) {
    throw CorruptIndex("Index manifest dimension " + std::to_string(manifest_dimension) +
                       " does not match configured dimension " +
                       std::to_string(options.dimension));
  }

  std::unique_ptr<faiss::Index> raw;
  try {
    raw.reset(faiss::read_index(index_path.c_str()));
  } catch (const faiss::FaissException &e) {
    throw CorruptIndex("Unreadable index blob " + index_path.string() + ": " + e.what());
  }

  auto *id_map = dynamic_cast<faiss::IndexIDMap2 *>(raw.get());
  if (!id_map) {
    throw CorruptIndex("Index blob " + index_path.string() + " is not an id-mapped index");
  }
  if (static_cast<size_t>(id_map->d) != options.dimension) {
    throw CorruptIndex("Index blob dimension " + std::to_string(id_map->d) +
                       " does not match configured dimension " +
                       std::to_string(options.dimension));
  }

  auto *ivf = dynamic_cast<faiss::IndexIVFFlat *>(id_map->index);
  auto *flat = dynamic_cast<faiss::IndexFlatIP *>(id_map->index);
  if ((kind == IndexKind::Approximate && !ivf) || (kind == IndexKind::Exact && !flat)) {
    throw CorruptIndex("Index blob structure does not match manifest kind " + to_string(kind));
  }

  raw.release();
  std::unique_ptr<VectorIndex> result(
      new VectorIndex(std::unique_ptr<faiss::IndexIDMap2>(id_map), kind, options));
  if (ivf) {
    result->cluster_count_ = static_cast<int>(ivf->nlist);
    result->trained_on_ = trained_on;
    result->apply_probe_count(options.probe_count);
  }
  for (int64_t id : deleted) {
    if (id_map->rev_map.count(id)) {
      result->deleted_.insert(id);
    }
  }

  if (result->count() != manifest_count) {
    throw CorruptIndex("Index holds " + std::to_string(result->count()) +
                       " live vectors but manifest records " + std::to_string(manifest_count));
  }
  return result;
}

std::vector<ScoredId> VectorIndex::search(const std::vector<float> &query,
                                          int k,
                                          float threshold) const {
  if (k <= 0 || count() == 0) {
    return {};
  }
  std::vector<float> unit =
      embedding::normalized_copy(query, options_.dimension, options_.normalization_epsilon);

  // Over-fetch so marked-deleted ids cannot crowd out live ones.
  const int64_t fetch = std::min<int64_t>(static_cast<int64_t>(k) + deleted_count(), total());
  std::vector<float> distances(fetch);
  std::vector<faiss::idx_t> labels(fetch);
  try {
    index_->search(1, unit.data(), fetch, distances.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw IndexError(std::string("Index search failed: ") + e.what());
  }

  std::vector<ScoredId> hits;
  hits.reserve(fetch);
  for (int64_t i = 0; i < fetch; ++i) {
    if (labels[i] == -1 || deleted_.count(labels[i])) {
      continue;
    }
    if (distances[i] >= threshold) {
      hits.push_back(ScoredId{labels[i], distances[i]});
    }
  }

  std::stable_sort(hits.begin(), hits.end(), [](const ScoredId &a, const ScoredId &b) {
    if (a.similarity != b.similarity) {
      return a.similarity > b.similarity;
    }
    return a.id < b.id;
  });
  if (hits.size() > static_cast<size_t>(k)) {
    hits.resize(static_cast<size_t>(k));
  }
  return hits;
}

void VectorIndex::insert(const std::vector<int64_t> &ids, const std::vector<float> &flat_vectors) {
  if (ids.empty()) {
    return;
  }
  check_flat_size(ids, flat_vectors, options_.dimension);
  if (!is_trained()) {
    throw IndexError("Cannot insert into an untrained approximate index");
  }
  for (int64_t id : ids) {
    if (index_->rev_map.count(id)) {
      throw IndexError("Face id " + std::to_string(id) + " is already indexed");
    }
  }

  try {
    index_->add_with_ids(static_cast<faiss::idx_t>(ids.size()), flat_vectors.data(), ids.data());
  } catch (const faiss::FaissException &e) {
    throw IndexError(std::string("Index insert failed: ") + e.what());
  }
}

size_t VectorIndex::mark_deleted(const std::vector<int64_t> &ids) {
  size_t marked = 0;
  for (int64_t id : ids) {
    if (index_->rev_map.count(id) && deleted_.insert(id).second) {
      ++marked;
    }
  }
  return marked;
}

void VectorIndex::save(const std::filesystem::path &dir) const {
  std::filesystem::create_directories(dir);

  write_atomically(dir / INDEX_FILE, [this](const std::filesystem::path &tmp) {
    try {
      faiss::write_index(index_.get(), tmp.c_str());
    } catch (const faiss::FaissException &e) {
      throw IndexError("Failed to write index blob " + tmp.string() + ": " + e.what());
    }
  });

  std::vector<int64_t> deleted(deleted_.begin(), deleted_.end());
  std::sort(deleted.begin(), deleted.end());
  nlohmann::json manifest = {
      {"format_version", MANIFEST_FORMAT_VERSION},
      {"dimension", options_.dimension},
      {"kind", to_string(kind_)},
      {"cluster_count", cluster_count_},
      {"probe_count", probe_count_},
      {"trained_on", trained_on_},
      {"count", count()},
      {"deleted", deleted},
  };

  write_atomically(dir / MANIFEST_FILE, [&manifest](const std::filesystem::path &tmp) {
    std::ofstream file(tmp, std::ios::trunc);
    file << manifest.dump(2);
    file.close();
    if (!file) {
      throw IndexError("Failed to write index manifest " + tmp.string());
    }
  });
}

int64_t VectorIndex::total() const {
  return static_cast<int64_t>(index_->ntotal);
}

int64_t VectorIndex::count() const {
  return total() - deleted_count();
}

bool VectorIndex::is_trained() const {
  return index_->is_trained;
}

std::vector<int64_t> VectorIndex::ids() const {
  std::vector<int64_t> live;
  live.reserve(static_cast<size_t>(count()));
  for (faiss::idx_t id : index_->id_map) {
    if (!deleted_.count(id)) {
      live.push_back(id);
    }
  }
  std::sort(live.begin(), live.end());
  return live;
}

}  // namespace face_core

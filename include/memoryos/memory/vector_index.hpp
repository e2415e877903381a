#pragma once

#include "memoryos/common/result.hpp"
#include "memoryos/memory/types.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace memoryos::memory {

enum class Metric {
  L2,
  InnerProduct,
};

[[nodiscard]] std::string to_string(Metric metric);

struct VectorSearchResult {
  std::string id;
  std::size_t slot = 0;
  /// Squared L2 distance, or 1 - similarity for inner product.
  float distance = 0.0F;
  /// 1 / (1 + distance) for L2, the inner product itself otherwise.
  float score = 0.0F;
};

using CandidateFilter = std::function<bool(const std::string &id)>;

/// Exact nearest-neighbour index over dense integer slots.
///
/// Slots are assigned in insertion order and never reused; remove() leaves a
/// tombstone. Inner-product indices L2-normalize vectors on add, and queries on
/// search. All public methods are safe to call concurrently.
class VectorIndex {
public:
  VectorIndex(Modality modality, std::size_t dimensions, Metric metric);

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  [[nodiscard]] common::Result<std::size_t> add(const std::string &id, std::vector<float> vector);
  [[nodiscard]] common::Status remove(std::size_t slot);
  /// Best k live entries, ties broken by lower slot. An empty index yields no results.
  [[nodiscard]] common::Result<std::vector<VectorSearchResult>>
  search(const std::vector<float> &query, std::size_t k,
         const CandidateFilter &filter = nullptr) const;

  /// Live entries.
  [[nodiscard]] std::size_t size() const;
  /// Slots ever assigned, tombstones included.
  [[nodiscard]] std::size_t slot_count() const;
  [[nodiscard]] std::optional<std::string> id_at(std::size_t slot) const;
  [[nodiscard]] std::vector<std::pair<std::size_t, std::string>> entries() const;
  void clear();

  /// Writes "<stem>.vec" then "<stem>.map" into dir, each via temp file + rename.
  [[nodiscard]] common::Status persist(const std::filesystem::path &dir) const;
  /// Replaces the contents from dir. Missing files load as empty; files that
  /// disagree with each other or with this index fail with CorruptIndex.
  [[nodiscard]] common::Status load(const std::filesystem::path &dir);

  /// e.g. "text-l2-384", so indices of different shapes never share files.
  [[nodiscard]] std::string file_stem() const;
  [[nodiscard]] Modality modality() const { return modality_; }
  [[nodiscard]] Metric metric() const { return metric_; }
  [[nodiscard]] std::size_t dimensions() const { return dimensions_; }

private:
  Modality modality_;
  std::size_t dimensions_;
  Metric metric_;

  mutable std::mutex mutex_;
  std::vector<float> data_;
  std::vector<std::string> slot_ids_;
  std::vector<bool> live_;
  std::unordered_map<std::string, std::size_t> id_to_slot_;
  std::size_t live_count_ = 0;
};

} // namespace memoryos::memory

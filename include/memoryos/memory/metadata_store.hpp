#pragma once

#include "memoryos/common/result.hpp"
#include "memoryos/memory/types.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace memoryos::memory {

/// Relational store of memory items, their chunks and the embedding cache.
///
/// Chunks carry their embedding so the vector indices can always be rebuilt
/// from this store. All methods serialize on one connection.
class MetadataStore {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<MetadataStore>>
  open(const std::filesystem::path &db_path);
  ~MetadataStore();

  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;

  /// false when an item with the same id already exists.
  [[nodiscard]] common::Result<bool> put_item(const MemoryItem &item);
  [[nodiscard]] common::Status put_chunk(const Chunk &chunk);
  /// Item and chunks in one transaction. false (and nothing written) on a duplicate id.
  [[nodiscard]] common::Result<bool> put_item_with_chunks(const MemoryItem &item,
                                                          const std::vector<Chunk> &chunks);

  [[nodiscard]] common::Result<bool> exists(const std::string &id);
  [[nodiscard]] common::Result<std::optional<MemoryItem>> get_item(const std::string &id);
  /// Ordered by sequence_index.
  [[nodiscard]] common::Result<std::vector<Chunk>> list_chunks(const std::string &parent_id);
  /// Newest first.
  [[nodiscard]] common::Result<std::vector<MemoryItem>> query(const ItemFilter &filter);

  /// Ids of chunks of one modality whose parent matches filter.
  [[nodiscard]] common::Result<std::unordered_set<std::string>>
  chunk_refs(const ItemFilter &filter, Modality modality);
  /// Chunks by id; ids without a row are absent from the map.
  [[nodiscard]] common::Result<std::unordered_map<std::string, Chunk>>
  get_chunks(const std::vector<std::string> &ids);
  /// Every chunk of a modality, ordered by slot then id.
  [[nodiscard]] common::Result<std::vector<Chunk>> chunks_for_modality(Modality modality);
  /// Replaces the slot of every listed chunk in one transaction.
  [[nodiscard]] common::Status
  reassign_slots(Modality modality, const std::vector<std::pair<std::string, std::size_t>> &slots);

  [[nodiscard]] common::Result<std::optional<std::vector<float>>>
  cached_embedding(const std::string &model, std::size_t dimensions, const std::string &text);
  /// Evicts oldest entries beyond max_entries; max_entries == 0 disables the cache.
  [[nodiscard]] common::Status cache_embedding(const std::string &model, std::size_t dimensions,
                                               const std::string &text,
                                               const std::vector<float> &embedding,
                                               std::size_t max_entries);

  [[nodiscard]] common::Result<std::size_t> count_items();
  [[nodiscard]] common::Result<std::size_t> count_chunks(std::optional<Modality> modality = {});
  [[nodiscard]] common::Result<std::size_t> count_cached_embeddings();
  [[nodiscard]] bool health_check();

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  MetadataStore(std::filesystem::path db_path, sqlite3 *db);

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status insert_chunk(const Chunk &chunk);
  [[nodiscard]] common::Result<bool> insert_item(const MemoryItem &item);
  [[nodiscard]] common::Status db_error(const std::string &context) const;

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace memoryos::memory

#pragma once

#include "memoryos/common/result.hpp"
#include "memoryos/config/schema.hpp"
#include "memoryos/memory/content.hpp"
#include "memoryos/memory/embedding_gateway.hpp"
#include "memoryos/memory/metadata_store.hpp"
#include "memoryos/memory/types.hpp"
#include "memoryos/memory/vector_index.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace memoryos::memory {

enum class IngestOutcome {
  Ingested,
  DuplicateSkipped,
};

[[nodiscard]] std::string to_string(IngestOutcome outcome);

struct IngestReport {
  IngestOutcome outcome = IngestOutcome::Ingested;
  std::string item_id;
  std::size_t text_chunks = 0;
  std::size_t visual_chunks = 0;
  /// "<unit label>: <reason>" for each unit dropped on an encoding error.
  std::vector<std::string> skipped_units;
};

struct BatchEntry {
  MemoryItem item;
  std::optional<RawContent> content;
};

struct BatchReport {
  std::size_t ingested = 0;
  std::size_t duplicates = 0;
  std::size_t failed = 0;
  std::vector<std::string> errors;
};

struct SearchRequest {
  std::string query;
  /// 0 uses search.default_top_k.
  std::size_t top_k = 0;
  SearchModality modality = SearchModality::Text;
  ItemFilter filter;
};

struct StorageStats {
  std::size_t items = 0;
  std::size_t text_chunks = 0;
  std::size_t visual_chunks = 0;
  std::size_t text_index_size = 0;
  std::size_t visual_index_size = 0;
  std::size_t cached_embeddings = 0;
  bool text_index_corrupt = false;
  bool visual_index_corrupt = false;
};

/// Keeps a metadata store and the text/visual vector indices consistent.
///
/// Lifecycle is open -> ingest/search -> flush/close. Ingest and search may be
/// called from several threads; flush and reconcile wait for in-flight ingests.
/// The metadata store is authoritative: an index that fails to load or disagrees
/// with it is marked corrupt, and searches touching it fail with CorruptIndex
/// until reconcile() rebuilds it from the stored chunk embeddings.
class StorageManager {
public:
  /// Opens <data_dir>/memoryos.db and the indices under <data_dir>/index. A null
  /// gateway is built from config.embedding.
  [[nodiscard]] static common::Result<std::unique_ptr<StorageManager>>
  open(const config::Config &config, std::unique_ptr<EmbeddingGateway> gateway = nullptr);

  ~StorageManager();

  StorageManager(const StorageManager &) = delete;
  StorageManager &operator=(const StorageManager &) = delete;

  [[nodiscard]] common::Result<IngestReport> ingest(MemoryItem item,
                                                    std::optional<RawContent> content = std::nullopt);
  /// Continues past failures; each failure is counted and described in errors.
  [[nodiscard]] BatchReport ingest_batch(std::vector<BatchEntry> entries);
  /// Ingests a JSON array (or JSON lines) of collector records.
  [[nodiscard]] common::Result<BatchReport>
  ingest_records_file(const std::filesystem::path &path);

  [[nodiscard]] common::Result<std::vector<SearchHit>> search(const SearchRequest &request);
  [[nodiscard]] common::Result<std::vector<SearchHit>>
  search_by_vector(Modality modality, const std::vector<float> &vector, std::size_t top_k,
                   const ItemFilter &filter = {});
  [[nodiscard]] common::Result<std::vector<SearchHit>>
  search_by_image(const std::vector<std::uint8_t> &bytes, std::size_t top_k,
                  const ItemFilter &filter = {});

  [[nodiscard]] common::Result<std::optional<MemoryItem>> get_item(const std::string &id);
  [[nodiscard]] common::Result<std::vector<Chunk>> list_chunks(const std::string &parent_id);
  [[nodiscard]] common::Result<std::vector<MemoryItem>> query(const ItemFilter &filter);
  [[nodiscard]] common::Result<bool> exists(const std::string &id);

  /// Rebuilds both indices from the metadata store, compacting slots, and persists them.
  [[nodiscard]] common::Status reconcile();
  /// Persists every index that is not marked corrupt.
  [[nodiscard]] common::Status flush();
  /// Flushes and rejects further calls with Unavailable.
  [[nodiscard]] common::Status close();

  [[nodiscard]] common::Result<StorageStats> stats();
  [[nodiscard]] bool health_check();

  [[nodiscard]] const std::filesystem::path &data_dir() const { return data_dir_; }
  [[nodiscard]] const EmbeddingGateway &gateway() const { return *gateway_; }

private:
  struct WrittenSlot {
    VectorIndex *index = nullptr;
    std::size_t slot = 0;
  };

  StorageManager(config::Config config, std::filesystem::path data_dir,
                 std::unique_ptr<EmbeddingGateway> gateway, std::unique_ptr<MetadataStore> store);

  [[nodiscard]] common::Status load_indices();
  [[nodiscard]] std::optional<std::string> verify_index(const VectorIndex &index);
  [[nodiscard]] common::Status reconcile_locked();
  [[nodiscard]] common::Status flush_locked();
  [[nodiscard]] common::Status ensure_open() const;
  void mark_corrupt(Modality modality, const std::string &reason);
  [[nodiscard]] bool is_corrupt(Modality modality) const;

  /// Blocks while another ingest of the same id is in flight, then marks id in flight.
  void claim(const std::string &id);
  void release(const std::string &id);
  [[nodiscard]] common::Status prepare_item(MemoryItem &item, std::optional<RawContent> &content);
  [[nodiscard]] common::Result<std::vector<float>> embed_text_cached(const std::string &text);
  void rollback(const std::string &item_id, const std::vector<WrittenSlot> &written,
                const std::string &reason);

  [[nodiscard]] common::Result<std::vector<SearchHit>>
  search_index(Modality modality, const std::vector<float> &vector, std::size_t top_k,
               const ItemFilter &filter, std::optional<double> min_score);

  [[nodiscard]] VectorIndex &index_for(Modality modality);
  [[nodiscard]] std::filesystem::path index_dir() const;

  config::Config config_;
  std::filesystem::path data_dir_;
  std::unique_ptr<EmbeddingGateway> gateway_;
  std::unique_ptr<MetadataStore> store_;
  VectorIndex text_index_;
  VectorIndex visual_index_;

  // Shared by ingest writes and searches, exclusive for flush and reconcile.
  mutable std::shared_mutex commit_mutex_;
  std::atomic<bool> text_corrupt_{false};
  std::atomic<bool> visual_corrupt_{false};
  std::atomic<bool> closed_{false};
  std::atomic<std::size_t> ingests_since_flush_{0};

  std::mutex in_flight_mutex_;
  std::condition_variable in_flight_released_;
  std::unordered_set<std::string> in_flight_;
};

} // namespace memoryos::memory

#include "memoryos/memory/storage_manager.hpp"

#include "memoryos/common/fs.hpp"
#include "memoryos/config/config.hpp"
#include "memoryos/memory/chunker.hpp"
#include "memoryos/memory/record.hpp"
#include "memoryos/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace memoryos::memory {

namespace {

constexpr const char *kComponent = "storage";

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

std::string unit_reason(const RoutedUnit &unit, const std::string &reason) {
  return unit.label + ": " + reason;
}

} // namespace

std::string to_string(const IngestOutcome outcome) {
  switch (outcome) {
  case IngestOutcome::Ingested:
    return "ingested";
  case IngestOutcome::DuplicateSkipped:
    return "duplicate_skipped";
  }
  return "ingested";
}

StorageManager::StorageManager(config::Config config, std::filesystem::path data_dir,
                               std::unique_ptr<EmbeddingGateway> gateway,
                               std::unique_ptr<MetadataStore> store)
    : config_(std::move(config)), data_dir_(std::move(data_dir)), gateway_(std::move(gateway)),
      store_(std::move(store)),
      text_index_(Modality::Text, gateway_->text_dimensions(), Metric::L2),
      visual_index_(Modality::Visual, gateway_->visual_dimensions(), Metric::InnerProduct) {}

StorageManager::~StorageManager() {
  if (!closed_.load()) {
    if (auto status = close(); !status.ok()) {
      observability::record_error(kComponent, "close on destruction failed: " + status.error());
    }
  }
}

common::Result<std::unique_ptr<StorageManager>>
StorageManager::open(const config::Config &config, std::unique_ptr<EmbeddingGateway> gateway) {
  using OpenResult = common::Result<std::unique_ptr<StorageManager>>;

  auto warnings = config::validate_config(config);
  if (!warnings.ok()) {
    return OpenResult::failure(warnings.status());
  }
  for (const auto &warning : warnings.value()) {
    observability::record_error("config", warning);
  }

  if (gateway == nullptr) {
    auto created = create_embedding_gateway(config);
    if (!created.ok()) {
      return OpenResult::failure(created.status());
    }
    gateway = std::move(created.value());
  }

  const std::filesystem::path dir = config::data_dir(config);
  if (auto ensured = common::ensure_dir(dir / "index"); !ensured.ok()) {
    return OpenResult::failure(ensured.status());
  }

  auto store = MetadataStore::open(dir / "memoryos.db");
  if (!store.ok()) {
    return OpenResult::failure(store.status());
  }

  std::unique_ptr<StorageManager> manager(
      new StorageManager(config, dir, std::move(gateway), std::move(store.value())));
  if (auto status = manager->load_indices(); !status.ok()) {
    manager->closed_ = true;
    return OpenResult::failure(status);
  }
  return OpenResult::success(std::move(manager));
}

std::filesystem::path StorageManager::index_dir() const { return data_dir_ / "index"; }

VectorIndex &StorageManager::index_for(const Modality modality) {
  return modality == Modality::Visual ? visual_index_ : text_index_;
}

bool StorageManager::is_corrupt(const Modality modality) const {
  return modality == Modality::Visual ? visual_corrupt_.load() : text_corrupt_.load();
}

void StorageManager::mark_corrupt(const Modality modality, const std::string &reason) {
  (modality == Modality::Visual ? visual_corrupt_ : text_corrupt_) = true;
  observability::record_event(
      observability::IndexCorruptEvent{.modality = to_string(modality), .reason = reason});
}

common::Status StorageManager::ensure_open() const {
  if (closed_.load()) {
    return common::Status::error(common::ErrorCode::Unavailable, "storage manager is closed");
  }
  return common::Status::success();
}

std::optional<std::string> StorageManager::verify_index(const VectorIndex &index) {
  auto chunks = store_->chunks_for_modality(index.modality());
  if (!chunks.ok()) {
    return "cannot read chunks: " + chunks.error();
  }
  if (chunks.value().size() != index.size()) {
    return "index holds " + std::to_string(index.size()) + " entries but the metadata store has " +
           std::to_string(chunks.value().size()) + " chunks";
  }
  for (const auto &chunk : chunks.value()) {
    if (!chunk.slot.has_value()) {
      return "chunk " + chunk.id + " has no slot";
    }
    if (index.id_at(*chunk.slot) != chunk.id) {
      return "slot " + std::to_string(*chunk.slot) + " does not map to chunk " + chunk.id;
    }
  }
  return std::nullopt;
}

common::Status StorageManager::load_indices() {
  for (VectorIndex *index : {&text_index_, &visual_index_}) {
    auto status = index->load(index_dir());
    if (!status.ok()) {
      if (status.code() != common::ErrorCode::CorruptIndex) {
        return status;
      }
      mark_corrupt(index->modality(), status.error());
      continue;
    }
    if (auto mismatch = verify_index(*index); mismatch.has_value()) {
      mark_corrupt(index->modality(), *mismatch);
    }
  }

  if ((text_corrupt_.load() || visual_corrupt_.load()) && config_.storage.auto_reconcile) {
    std::unique_lock<std::shared_mutex> lock(commit_mutex_);
    return reconcile_locked();
  }
  return common::Status::success();
}

void StorageManager::claim(const std::string &id) {
  std::unique_lock<std::mutex> lock(in_flight_mutex_);
  in_flight_released_.wait(lock, [this, &id] { return in_flight_.count(id) == 0; });
  in_flight_.insert(id);
}

void StorageManager::release(const std::string &id) {
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(id);
  }
  in_flight_released_.notify_all();
}

common::Status StorageManager::prepare_item(MemoryItem &item,
                                            std::optional<RawContent> &content) {
  if (common::trim(item.timestamp).empty()) {
    item.timestamp = now_rfc3339();
  }
  auto timestamp = normalize_timestamp(item.timestamp);
  if (!timestamp.ok()) {
    return timestamp.status();
  }
  item.timestamp = timestamp.value();

  if (auto status = validate_item(item); !status.ok()) {
    return status;
  }

  if (is_image_bearing(item.content_type)) {
    auto *image = content.has_value() ? std::get_if<ImageContent>(&*content) : nullptr;
    const bool needs_bytes = !content.has_value() || (image != nullptr && image->bytes.empty());
    if (needs_bytes && !item.raw_path.empty()) {
      auto bytes = common::read_binary_file(common::expand_path(item.raw_path));
      if (!bytes.ok()) {
        return bytes.status();
      }
      if (image != nullptr) {
        image->bytes = std::move(bytes.value());
      } else {
        content = ImageContent{.bytes = std::move(bytes.value()), .ocr_text = std::nullopt};
      }
    }
  }

  item.id = common::trim(item.id);
  if (item.id.empty()) {
    item.id = compute_item_id(item, content);
  }
  return common::Status::success();
}

common::Result<std::vector<float>> StorageManager::embed_text_cached(const std::string &text) {
  const std::string model = gateway_->text_model();
  const std::size_t dims = gateway_->text_dimensions();

  auto cached = store_->cached_embedding(model, dims, text);
  if (cached.ok() && cached.value().has_value()) {
    return common::Result<std::vector<float>>::success(std::move(*cached.value()));
  }
  if (!cached.ok()) {
    observability::record_error(kComponent, "embedding cache lookup failed: " + cached.error());
  }

  auto embedded = gateway_->embed_text(text);
  if (!embedded.ok()) {
    return embedded;
  }
  if (auto status = store_->cache_embedding(model, dims, text, embedded.value(),
                                            config_.embedding.cache_size);
      !status.ok()) {
    observability::record_error(kComponent, "embedding cache write failed: " + status.error());
  }
  return embedded;
}

void StorageManager::rollback(const std::string &item_id, const std::vector<WrittenSlot> &written,
                              const std::string &reason) {
  for (auto it = written.rbegin(); it != written.rend(); ++it) {
    if (auto status = it->index->remove(it->slot); !status.ok()) {
      observability::record_error(kComponent, "rollback of " + item_id + " could not remove slot " +
                                                  std::to_string(it->slot) + ": " +
                                                  status.error());
    }
  }
  observability::record_event(
      observability::IngestRolledBackEvent{.item_id = item_id, .reason = reason});
}

common::Result<IngestReport> StorageManager::ingest(MemoryItem item,
                                                    std::optional<RawContent> content) {
  using IngestResult = common::Result<IngestReport>;
  if (auto status = ensure_open(); !status.ok()) {
    return IngestResult::failure(status);
  }
  const auto started = std::chrono::steady_clock::now();

  if (auto status = prepare_item(item, content); !status.ok()) {
    return IngestResult::failure(status);
  }

  IngestReport report;
  report.item_id = item.id;

  // Ingests of one id run one at a time; a waiter re-checks existence once the holder is done.
  claim(item.id);
  struct ClaimGuard {
    StorageManager *manager;
    std::string id;
    ~ClaimGuard() { manager->release(id); }
  } claim_guard{this, item.id};

  auto exists = store_->exists(item.id);
  if (!exists.ok()) {
    return IngestResult::failure(exists.status());
  }
  if (exists.value()) {
    report.outcome = IngestOutcome::DuplicateSkipped;
    observability::record_event(observability::DuplicateSkippedEvent{.item_id = item.id});
    return IngestResult::success(std::move(report));
  }

  auto routed = route_content(item, std::move(content));
  if (!routed.ok()) {
    return IngestResult::failure(routed.status());
  }
  if (routed.value().empty()) {
    return IngestResult::failure(common::ErrorCode::IngestionFailed,
                                 "item " + item.id + " has no embeddable content");
  }

  {
    std::shared_lock<std::shared_mutex> lock(commit_mutex_);
    for (const auto &unit : routed.value()) {
      if (is_corrupt(unit.modality)) {
        return IngestResult::failure(common::ErrorCode::CorruptIndex,
                                     to_string(unit.modality) +
                                         " index is corrupt; reconcile before ingesting");
      }
    }

    std::vector<Chunk> chunks;
    std::vector<WrittenSlot> written;
    std::uint32_t sequence = 0;
    std::string last_skip;

    auto fail = [&](const std::string &reason) {
      rollback(item.id, written, reason);
      return IngestResult::failure(common::ErrorCode::IngestionFailed, reason);
    };

    auto append = [&](Chunk chunk, std::vector<float> vector) -> common::Status {
      VectorIndex &index = index_for(chunk.modality);
      auto slot = index.add(chunk.id, vector);
      if (!slot.ok()) {
        return slot.status();
      }
      written.push_back(WrittenSlot{.index = &index, .slot = slot.value()});
      chunk.slot = slot.value();
      chunk.embedding = std::move(vector);
      chunks.push_back(std::move(chunk));
      ++sequence;
      return common::Status::success();
    };

    auto skip = [&](const RoutedUnit &unit, const std::string &reason) {
      last_skip = unit_reason(unit, reason);
      report.skipped_units.push_back(last_skip);
      observability::record_event(observability::EncodingSkippedEvent{
          .item_id = item.id, .unit = unit.label, .reason = reason});
    };

    for (const auto &unit : routed.value()) {
      if (const auto *image = std::get_if<ImagePayload>(&unit.payload); image != nullptr) {
        auto vector = gateway_->embed_image(image->bytes);
        if (!vector.ok()) {
          if (vector.code() == common::ErrorCode::EncodingError) {
            skip(unit, vector.error());
            continue;
          }
          return fail(unit_reason(unit, common::describe(vector.status())));
        }
        Chunk chunk;
        chunk.id = make_chunk_id(item.id, sequence);
        chunk.parent_id = item.id;
        chunk.sequence_index = sequence;
        chunk.modality = Modality::Visual;
        chunk.payload = image->frame;
        if (auto status = append(std::move(chunk), std::move(vector.value())); !status.ok()) {
          return fail(unit_reason(unit, common::describe(status)));
        }
        ++report.visual_chunks;
        continue;
      }

      const auto &text = std::get<std::string>(unit.payload);
      for (auto &span :
           chunk_text(text, config_.chunking.max_chars, config_.chunking.overlap_chars)) {
        auto vector = embed_text_cached(span.text);
        if (!vector.ok()) {
          if (vector.code() == common::ErrorCode::EncodingError) {
            skip(unit, vector.error());
            continue;
          }
          return fail(unit_reason(unit, common::describe(vector.status())));
        }
        Chunk chunk;
        chunk.id = make_chunk_id(item.id, sequence);
        chunk.parent_id = item.id;
        chunk.sequence_index = sequence;
        chunk.modality = Modality::Text;
        chunk.payload = std::move(span);
        if (auto status = append(std::move(chunk), std::move(vector.value())); !status.ok()) {
          return fail(unit_reason(unit, common::describe(status)));
        }
        ++report.text_chunks;
      }
    }

    if (chunks.empty()) {
      return fail("no chunks could be encoded" + (last_skip.empty() ? "" : " (" + last_skip + ")"));
    }

    auto inserted = store_->put_item_with_chunks(item, chunks);
    if (!inserted.ok()) {
      return fail(common::describe(inserted.status()));
    }
    if (!inserted.value()) {
      // Another writer committed the same id after our existence check.
      rollback(item.id, written, "duplicate id committed concurrently");
      report = IngestReport{.outcome = IngestOutcome::DuplicateSkipped, .item_id = item.id};
      observability::record_event(observability::DuplicateSkippedEvent{.item_id = item.id});
      return IngestResult::success(std::move(report));
    }
  }

  const auto duration = elapsed_since(started);
  observability::record_event(observability::ItemIngestedEvent{
      .item_id = item.id,
      .content_type = to_string(item.content_type),
      .text_chunks = report.text_chunks,
      .visual_chunks = report.visual_chunks,
      .duration = duration,
  });
  observability::record_metric(observability::IngestLatencyMetric{.latency = duration});

  const std::size_t flush_every = config_.storage.flush_every;
  if (flush_every > 0 && ++ingests_since_flush_ >= flush_every) {
    ingests_since_flush_ = 0;
    if (auto status = flush(); !status.ok()) {
      observability::record_error(kComponent, "periodic flush failed: " + status.error());
    }
  }
  return IngestResult::success(std::move(report));
}

BatchReport StorageManager::ingest_batch(std::vector<BatchEntry> entries) {
  BatchReport batch;
  for (auto &entry : entries) {
    const std::string label = entry.item.id.empty() ? entry.item.content_preview : entry.item.id;
    auto result = ingest(std::move(entry.item), std::move(entry.content));
    if (!result.ok()) {
      ++batch.failed;
      batch.errors.push_back(label + ": " + common::describe(result.status()));
      continue;
    }
    if (result.value().outcome == IngestOutcome::DuplicateSkipped) {
      ++batch.duplicates;
    } else {
      ++batch.ingested;
    }
  }
  return batch;
}

common::Result<BatchReport> StorageManager::ingest_records_file(const std::filesystem::path &path) {
  auto text = common::read_file(path);
  if (!text.ok()) {
    return common::Result<BatchReport>::failure(text.status());
  }

  auto parsed = parse_records(text.value());
  std::vector<BatchEntry> entries;
  entries.reserve(parsed.items.size());
  for (auto &item : parsed.items) {
    entries.push_back(BatchEntry{.item = std::move(item), .content = std::nullopt});
  }

  BatchReport batch = ingest_batch(std::move(entries));
  batch.failed += parsed.errors.size();
  batch.errors.insert(batch.errors.end(), parsed.errors.begin(), parsed.errors.end());
  return common::Result<BatchReport>::success(std::move(batch));
}

common::Result<std::vector<SearchHit>>
StorageManager::search_index(const Modality modality, const std::vector<float> &vector,
                             const std::size_t top_k, const ItemFilter &raw_filter,
                             const std::optional<double> min_score) {
  using HitsResult = common::Result<std::vector<SearchHit>>;
  auto normalized = normalize_filter(raw_filter);
  if (!normalized.ok()) {
    return HitsResult::failure(normalized.status());
  }
  const ItemFilter &filter = normalized.value();
  if (is_corrupt(modality)) {
    return HitsResult::failure(common::ErrorCode::CorruptIndex,
                               to_string(modality) + " index is corrupt; reconcile required");
  }

  VectorIndex &index = index_for(modality);
  std::vector<SearchHit> hits;
  if (top_k == 0 || index.size() == 0) {
    return HitsResult::success(std::move(hits));
  }

  // Resolved up front: the filter runs under the index lock.
  std::unordered_set<std::string> allowed;
  CandidateFilter candidate_filter;
  if (!filter.empty()) {
    auto refs = store_->chunk_refs(filter, modality);
    if (!refs.ok()) {
      return HitsResult::failure(refs.status());
    }
    allowed = std::move(refs.value());
    if (allowed.empty()) {
      return HitsResult::success(std::move(hits));
    }
    candidate_filter = [&allowed](const std::string &id) { return allowed.count(id) > 0; };
  }

  const std::size_t fan_out = std::max<std::size_t>(config_.search.fan_out_factor, 1);
  auto candidates = index.search(vector, top_k * fan_out, candidate_filter);
  if (!candidates.ok()) {
    return HitsResult::failure(candidates.status());
  }

  std::vector<std::string> ids;
  ids.reserve(candidates.value().size());
  for (const auto &candidate : candidates.value()) {
    ids.push_back(candidate.id);
  }
  auto chunks = store_->get_chunks(ids);
  if (!chunks.ok()) {
    return HitsResult::failure(chunks.status());
  }

  std::unordered_map<std::string, std::optional<MemoryItem>> parents;
  std::unordered_set<std::string> seen_parents;
  for (const auto &candidate : candidates.value()) {
    if (min_score.has_value() && candidate.score < *min_score) {
      continue;
    }
    auto chunk_it = chunks.value().find(candidate.id);
    if (chunk_it == chunks.value().end()) {
      continue;
    }
    const Chunk &chunk = chunk_it->second;
    if (seen_parents.count(chunk.parent_id) > 0) {
      continue;
    }

    auto parent_it = parents.find(chunk.parent_id);
    if (parent_it == parents.end()) {
      auto item = store_->get_item(chunk.parent_id);
      if (!item.ok()) {
        return HitsResult::failure(item.status());
      }
      parent_it = parents.emplace(chunk.parent_id, std::move(item.value())).first;
    }
    if (!parent_it->second.has_value() || !filter.matches(*parent_it->second)) {
      continue;
    }

    seen_parents.insert(chunk.parent_id);
    hits.push_back(SearchHit{
        .item = *parent_it->second,
        .chunk = chunk,
        .score = candidate.score,
        .distance = candidate.distance,
        .modality = modality,
    });
    if (hits.size() >= top_k) {
      break;
    }
  }
  return HitsResult::success(std::move(hits));
}

common::Result<std::vector<SearchHit>> StorageManager::search(const SearchRequest &request) {
  using HitsResult = common::Result<std::vector<SearchHit>>;
  if (auto status = ensure_open(); !status.ok()) {
    return HitsResult::failure(status);
  }
  const auto started = std::chrono::steady_clock::now();
  const std::size_t top_k = request.top_k == 0 ? config_.search.default_top_k : request.top_k;

  const bool want_text = request.modality != SearchModality::Visual;
  const bool want_visual = request.modality != SearchModality::Text;

  std::shared_lock<std::shared_mutex> lock(commit_mutex_);
  std::vector<SearchHit> text_hits;
  std::vector<SearchHit> visual_hits;

  if (want_text) {
    auto query = embed_text_cached(request.query);
    if (!query.ok()) {
      return HitsResult::failure(query.status());
    }
    auto hits = search_index(Modality::Text, query.value(), top_k, request.filter, std::nullopt);
    if (!hits.ok()) {
      return hits;
    }
    text_hits = std::move(hits.value());
  }
  if (want_visual) {
    auto query = gateway_->embed_text_for_image_search(request.query);
    if (!query.ok()) {
      return HitsResult::failure(query.status());
    }
    auto hits = search_index(Modality::Visual, query.value(), top_k, request.filter,
                             config_.search.visual_min_score);
    if (!hits.ok()) {
      return hits;
    }
    visual_hits = std::move(hits.value());
  }

  std::vector<SearchHit> results;
  if (request.modality == SearchModality::Text) {
    results = std::move(text_hits);
  } else if (request.modality == SearchModality::Visual) {
    results = std::move(visual_hits);
  } else {
    // Scores of the two indices are not comparable; interleave by rank, text first.
    std::unordered_set<std::string> seen;
    const std::size_t depth = std::max(text_hits.size(), visual_hits.size());
    for (std::size_t rank = 0; rank < depth && results.size() < top_k; ++rank) {
      for (auto *list : {&text_hits, &visual_hits}) {
        if (rank >= list->size() || results.size() >= top_k) {
          continue;
        }
        SearchHit &hit = (*list)[rank];
        if (!seen.insert(hit.item.id).second) {
          continue;
        }
        hit.score = 1.0 / static_cast<double>(rank + 1);
        results.push_back(std::move(hit));
      }
    }
  }

  const auto duration = elapsed_since(started);
  observability::record_event(observability::SearchEvent{
      .modality = to_string(request.modality), .results = results.size(), .duration = duration});
  observability::record_metric(observability::SearchLatencyMetric{.latency = duration});
  return HitsResult::success(std::move(results));
}

common::Result<std::vector<SearchHit>>
StorageManager::search_by_vector(const Modality modality, const std::vector<float> &vector,
                                 const std::size_t top_k, const ItemFilter &filter) {
  if (auto status = ensure_open(); !status.ok()) {
    return common::Result<std::vector<SearchHit>>::failure(status);
  }
  std::shared_lock<std::shared_mutex> lock(commit_mutex_);
  return search_index(modality, vector, top_k, filter, std::nullopt);
}

common::Result<std::vector<SearchHit>>
StorageManager::search_by_image(const std::vector<std::uint8_t> &bytes, const std::size_t top_k,
                                const ItemFilter &filter) {
  using HitsResult = common::Result<std::vector<SearchHit>>;
  if (auto status = ensure_open(); !status.ok()) {
    return HitsResult::failure(status);
  }
  auto query = gateway_->embed_image(bytes);
  if (!query.ok()) {
    return HitsResult::failure(query.status());
  }
  std::shared_lock<std::shared_mutex> lock(commit_mutex_);
  return search_index(Modality::Visual, query.value(), top_k, filter, std::nullopt);
}

common::Result<std::optional<MemoryItem>> StorageManager::get_item(const std::string &id) {
  if (auto status = ensure_open(); !status.ok()) {
    return common::Result<std::optional<MemoryItem>>::failure(status);
  }
  return store_->get_item(id);
}

common::Result<std::vector<Chunk>> StorageManager::list_chunks(const std::string &parent_id) {
  if (auto status = ensure_open(); !status.ok()) {
    return common::Result<std::vector<Chunk>>::failure(status);
  }
  return store_->list_chunks(parent_id);
}

common::Result<std::vector<MemoryItem>> StorageManager::query(const ItemFilter &filter) {
  if (auto status = ensure_open(); !status.ok()) {
    return common::Result<std::vector<MemoryItem>>::failure(status);
  }
  return store_->query(filter);
}

common::Result<bool> StorageManager::exists(const std::string &id) {
  if (auto status = ensure_open(); !status.ok()) {
    return common::Result<bool>::failure(status);
  }
  return store_->exists(id);
}

common::Status StorageManager::reconcile_locked() {
  for (VectorIndex *index : {&text_index_, &visual_index_}) {
    const Modality modality = index->modality();
    auto chunks = store_->chunks_for_modality(modality);
    if (!chunks.ok()) {
      return chunks.status();
    }

    index->clear();
    std::vector<std::pair<std::string, std::size_t>> slots;
    slots.reserve(chunks.value().size());
    for (auto &chunk : chunks.value()) {
      auto slot = index->add(chunk.id, std::move(chunk.embedding));
      if (!slot.ok()) {
        mark_corrupt(modality, "rebuild failed at chunk " + chunk.id + ": " + slot.error());
        return common::Status::error(slot.code(),
                                     "cannot rebuild " + to_string(modality) + " index from chunk " +
                                         chunk.id + ": " + slot.error());
      }
      slots.emplace_back(chunk.id, slot.value());
    }

    if (auto status = store_->reassign_slots(modality, slots); !status.ok()) {
      mark_corrupt(modality, "slot update failed: " + status.error());
      return status;
    }
    (modality == Modality::Visual ? visual_corrupt_ : text_corrupt_) = false;
    observability::record_event(observability::IndexReconciledEvent{
        .modality = to_string(modality), .entries = index->size()});
  }
  return flush_locked();
}

common::Status StorageManager::reconcile() {
  if (auto status = ensure_open(); !status.ok()) {
    return status;
  }
  std::unique_lock<std::shared_mutex> lock(commit_mutex_);
  return reconcile_locked();
}

common::Status StorageManager::flush_locked() {
  for (const VectorIndex *index : {&text_index_, &visual_index_}) {
    if (is_corrupt(index->modality())) {
      continue;
    }
    if (auto status = index->persist(index_dir()); !status.ok()) {
      observability::record_error(kComponent, "flush of " + to_string(index->modality()) +
                                                  " index failed: " + status.error());
      return status;
    }
    observability::record_event(observability::IndexFlushedEvent{
        .modality = to_string(index->modality()), .entries = index->size()});
    observability::record_metric(observability::IndexSizeMetric{
        .modality = to_string(index->modality()), .size = index->size()});
  }
  return common::Status::success();
}

common::Status StorageManager::flush() {
  if (auto status = ensure_open(); !status.ok()) {
    return status;
  }
  std::unique_lock<std::shared_mutex> lock(commit_mutex_);
  return flush_locked();
}

common::Status StorageManager::close() {
  if (closed_.load()) {
    return common::Status::success();
  }
  std::unique_lock<std::shared_mutex> lock(commit_mutex_);
  auto status = flush_locked();
  closed_ = true;
  return status;
}

common::Result<StorageStats> StorageManager::stats() {
  using StatsResult = common::Result<StorageStats>;
  if (auto status = ensure_open(); !status.ok()) {
    return StatsResult::failure(status);
  }

  StorageStats stats;
  auto items = store_->count_items();
  if (!items.ok()) {
    return StatsResult::failure(items.status());
  }
  auto text_chunks = store_->count_chunks(Modality::Text);
  if (!text_chunks.ok()) {
    return StatsResult::failure(text_chunks.status());
  }
  auto visual_chunks = store_->count_chunks(Modality::Visual);
  if (!visual_chunks.ok()) {
    return StatsResult::failure(visual_chunks.status());
  }
  auto cached = store_->count_cached_embeddings();
  if (!cached.ok()) {
    return StatsResult::failure(cached.status());
  }

  stats.items = items.value();
  stats.text_chunks = text_chunks.value();
  stats.visual_chunks = visual_chunks.value();
  stats.cached_embeddings = cached.value();
  stats.text_index_size = text_index_.size();
  stats.visual_index_size = visual_index_.size();
  stats.text_index_corrupt = text_corrupt_.load();
  stats.visual_index_corrupt = visual_corrupt_.load();
  return StatsResult::success(stats);
}

bool StorageManager::health_check() {
  if (closed_.load()) {
    return false;
  }
  return store_->health_check() && !text_corrupt_.load() && !visual_corrupt_.load();
}

} // namespace memoryos::memory

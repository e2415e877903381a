#include "memoryos/memory/metadata_store.hpp"

#include "memoryos/common/hash.hpp"
#include "memoryos/memory/record.hpp"

#include <cstring>
#include <sstream>

namespace memoryos::memory {

namespace {

constexpr const char *kItemColumns =
    "id, timestamp, content_type, source, content_preview, raw_path, fields";
constexpr const char *kChunkColumns =
    "id, parent_id, sequence_index, modality, slot, text, start_offset, end_offset, "
    "frame_path, frame_index, frame_timestamp_ms, embedding";

std::vector<unsigned char> vector_to_blob(const std::vector<float> &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), values.data(), blob.size());
  }
  return blob;
}

std::vector<float> blob_to_vector(const void *blob, const int bytes) {
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(float)) != 0)) {
    return {};
  }

  const std::size_t length = static_cast<std::size_t>(bytes) / sizeof(float);
  std::vector<float> values(length);
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  return values;
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::Database, msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  if (text == nullptr) {
    return "";
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

MemoryItem row_to_item(sqlite3_stmt *stmt) {
  MemoryItem item;
  item.id = column_text(stmt, 0);
  item.timestamp = column_text(stmt, 1);
  item.content_type = content_type_from_string(column_text(stmt, 2)).value_or(ContentType::Text);
  item.source = source_from_string(column_text(stmt, 3)).value_or(Source::Clipboard);
  item.content_preview = column_text(stmt, 4);
  item.raw_path = column_text(stmt, 5);
  item.fields = fields_from_json(column_text(stmt, 6));
  return item;
}

Chunk row_to_chunk(sqlite3_stmt *stmt) {
  Chunk chunk;
  chunk.id = column_text(stmt, 0);
  chunk.parent_id = column_text(stmt, 1);
  chunk.sequence_index = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 2));
  chunk.modality = modality_from_string(column_text(stmt, 3)).value_or(Modality::Text);
  if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
    chunk.slot = static_cast<std::size_t>(sqlite3_column_int64(stmt, 4));
  }
  if (chunk.modality == Modality::Visual) {
    FrameReference frame;
    frame.raw_path = column_text(stmt, 8);
    frame.frame_index = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 9));
    if (sqlite3_column_type(stmt, 10) != SQLITE_NULL) {
      frame.timestamp_ms = sqlite3_column_int64(stmt, 10);
    }
    chunk.payload = std::move(frame);
  } else {
    TextSpan span;
    span.text = column_text(stmt, 5);
    span.start_offset = static_cast<std::size_t>(sqlite3_column_int64(stmt, 6));
    span.end_offset = static_cast<std::size_t>(sqlite3_column_int64(stmt, 7));
    chunk.payload = std::move(span);
  }
  chunk.embedding = blob_to_vector(sqlite3_column_blob(stmt, 11), sqlite3_column_bytes(stmt, 11));
  return chunk;
}

// WHERE clause over memory_items aliased as "i"; parameters bound from index 1.
std::string filter_clause(const ItemFilter &filter) {
  std::string clause;
  auto add = [&clause](const char *condition) {
    clause += clause.empty() ? " WHERE " : " AND ";
    clause += condition;
  };
  if (filter.content_type.has_value()) {
    add("i.content_type = ?");
  }
  if (filter.source.has_value()) {
    add("i.source = ?");
  }
  if (filter.since.has_value()) {
    add("i.timestamp >= ?");
  }
  if (filter.until.has_value()) {
    add("i.timestamp <= ?");
  }
  return clause;
}

int bind_filter(sqlite3_stmt *stmt, const ItemFilter &filter) {
  int index = 1;
  if (filter.content_type.has_value()) {
    bind_text(stmt, index++, to_string(*filter.content_type));
  }
  if (filter.source.has_value()) {
    bind_text(stmt, index++, to_string(*filter.source));
  }
  if (filter.since.has_value()) {
    bind_text(stmt, index++, *filter.since);
  }
  if (filter.until.has_value()) {
    bind_text(stmt, index++, *filter.until);
  }
  return index;
}

std::string cache_key(const std::string &model, const std::size_t dimensions,
                      const std::string &text) {
  return common::sha256_hex(model + "|" + std::to_string(dimensions) + "|" + text);
}

} // namespace

MetadataStore::MetadataStore(std::filesystem::path db_path, sqlite3 *db)
    : db_path_(std::move(db_path)), db_(db) {}

MetadataStore::~MetadataStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Result<std::unique_ptr<MetadataStore>>
MetadataStore::open(const std::filesystem::path &db_path) {
  using OpenResult = common::Result<std::unique_ptr<MetadataStore>>;
  if (db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      return OpenResult::failure(common::ErrorCode::Io, "Failed to create " +
                                                            db_path.parent_path().string() +
                                                            ": " + ec.message());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
    const std::string message = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return OpenResult::failure(common::ErrorCode::Database,
                               "Failed to open " + db_path.string() + ": " + message);
  }

  std::unique_ptr<MetadataStore> store(new MetadataStore(db_path, db));
  if (auto status = store->init_schema(); !status.ok()) {
    return OpenResult::failure(status);
  }
  return OpenResult::success(std::move(store));
}

common::Status MetadataStore::db_error(const std::string &context) const {
  return common::Status::error(common::ErrorCode::Database,
                               context + ": " + sqlite3_errmsg(db_));
}

common::Status MetadataStore::init_schema() {
  sqlite3_busy_timeout(db_, 5000);

  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  status = exec_sql(db_, "PRAGMA foreign_keys=ON;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS memory_items (
  id TEXT PRIMARY KEY,
  timestamp TEXT NOT NULL,
  content_type TEXT NOT NULL,
  source TEXT NOT NULL,
  content_preview TEXT NOT NULL DEFAULT '',
  raw_path TEXT NOT NULL DEFAULT '',
  fields TEXT NOT NULL DEFAULT '{}',
  ingested_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_items_content_type ON memory_items(content_type);
CREATE INDEX IF NOT EXISTS idx_items_source ON memory_items(source);
CREATE INDEX IF NOT EXISTS idx_items_timestamp ON memory_items(timestamp);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS chunks (
  id TEXT PRIMARY KEY,
  parent_id TEXT NOT NULL REFERENCES memory_items(id) ON DELETE CASCADE,
  sequence_index INTEGER NOT NULL,
  modality TEXT NOT NULL,
  slot INTEGER,
  text TEXT,
  start_offset INTEGER,
  end_offset INTEGER,
  frame_path TEXT,
  frame_index INTEGER,
  frame_timestamp_ms INTEGER,
  embedding BLOB NOT NULL,
  UNIQUE(parent_id, sequence_index)
);
CREATE INDEX IF NOT EXISTS idx_chunks_parent ON chunks(parent_id);
CREATE UNIQUE INDEX IF NOT EXISTS idx_chunks_slot ON chunks(modality, slot);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS embedding_cache (
  text_hash TEXT PRIMARY KEY,
  embedding BLOB NOT NULL,
  created_at TEXT NOT NULL
);
)");
}

common::Result<bool> MetadataStore::insert_item(const MemoryItem &item) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT OR IGNORE INTO memory_items(
  id, timestamp, content_type, source, content_preview, raw_path, fields, ingested_at)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(db_error("prepare item insert"));
  }

  const std::string fields = fields_to_json(item.fields);
  const std::string now = now_rfc3339();
  bind_text(stmt, 1, item.id);
  bind_text(stmt, 2, item.timestamp);
  bind_text(stmt, 3, to_string(item.content_type));
  bind_text(stmt, 4, to_string(item.source));
  bind_text(stmt, 5, item.content_preview);
  bind_text(stmt, 6, item.raw_path);
  bind_text(stmt, 7, fields);
  bind_text(stmt, 8, now);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(db_error("insert item " + item.id));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Status MetadataStore::insert_chunk(const Chunk &chunk) {
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("INSERT INTO chunks(") + kChunkColumns +
                          ") VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return db_error("prepare chunk insert");
  }

  bind_text(stmt, 1, chunk.id);
  bind_text(stmt, 2, chunk.parent_id);
  sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(chunk.sequence_index));
  bind_text(stmt, 4, to_string(chunk.modality));
  if (chunk.slot.has_value()) {
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(*chunk.slot));
  } else {
    sqlite3_bind_null(stmt, 5);
  }
  if (const auto *span = std::get_if<TextSpan>(&chunk.payload); span != nullptr) {
    bind_text(stmt, 6, span->text);
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(span->start_offset));
    sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(span->end_offset));
  } else {
    const auto &frame = std::get<FrameReference>(chunk.payload);
    bind_text(stmt, 9, frame.raw_path);
    sqlite3_bind_int64(stmt, 10, static_cast<sqlite3_int64>(frame.frame_index));
    if (frame.timestamp_ms.has_value()) {
      sqlite3_bind_int64(stmt, 11, *frame.timestamp_ms);
    }
  }
  const auto blob = vector_to_blob(chunk.embedding);
  sqlite3_bind_blob(stmt, 12, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return db_error("insert chunk " + chunk.id);
  }
  return common::Status::success();
}

common::Result<bool> MetadataStore::put_item(const MemoryItem &item) {
  std::lock_guard<std::mutex> lock(mutex_);
  return insert_item(item);
}

common::Status MetadataStore::put_chunk(const Chunk &chunk) {
  std::lock_guard<std::mutex> lock(mutex_);
  return insert_chunk(chunk);
}

common::Result<bool> MetadataStore::put_item_with_chunks(const MemoryItem &item,
                                                         const std::vector<Chunk> &chunks) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = exec_sql(db_, "BEGIN IMMEDIATE;"); !status.ok()) {
    return common::Result<bool>::failure(status);
  }

  auto inserted = insert_item(item);
  if (!inserted.ok() || !inserted.value()) {
    (void)exec_sql(db_, "ROLLBACK;");
    return inserted;
  }

  for (const auto &chunk : chunks) {
    if (auto status = insert_chunk(chunk); !status.ok()) {
      (void)exec_sql(db_, "ROLLBACK;");
      return common::Result<bool>::failure(status);
    }
  }

  if (auto status = exec_sql(db_, "COMMIT;"); !status.ok()) {
    (void)exec_sql(db_, "ROLLBACK;");
    return common::Result<bool>::failure(status);
  }
  return common::Result<bool>::success(true);
}

common::Result<bool> MetadataStore::exists(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT 1 FROM memory_items WHERE id = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<bool>::failure(db_error("prepare exists"));
  }
  bind_text(stmt, 1, id);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return common::Result<bool>::failure(db_error("exists " + id));
  }
  return common::Result<bool>::success(rc == SQLITE_ROW);
}

common::Result<std::optional<MemoryItem>> MetadataStore::get_item(const std::string &id) {
  using ItemResult = common::Result<std::optional<MemoryItem>>;
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string sql =
      std::string("SELECT ") + kItemColumns + " FROM memory_items WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return ItemResult::failure(db_error("prepare get_item"));
  }
  bind_text(stmt, 1, id);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    auto item = row_to_item(stmt);
    sqlite3_finalize(stmt);
    return ItemResult::success(std::move(item));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ItemResult::failure(db_error("get_item " + id));
  }
  return ItemResult::success(std::nullopt);
}

common::Result<std::vector<Chunk>> MetadataStore::list_chunks(const std::string &parent_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kChunkColumns +
                          " FROM chunks WHERE parent_id = ?1 ORDER BY sequence_index ASC";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<Chunk>>::failure(db_error("prepare list_chunks"));
  }
  bind_text(stmt, 1, parent_id);

  std::vector<Chunk> chunks;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    chunks.push_back(row_to_chunk(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<Chunk>>::failure(db_error("list_chunks " + parent_id));
  }
  return common::Result<std::vector<Chunk>>::success(std::move(chunks));
}

common::Result<std::vector<MemoryItem>> MetadataStore::query(const ItemFilter &raw_filter) {
  auto normalized = normalize_filter(raw_filter);
  if (!normalized.ok()) {
    return common::Result<std::vector<MemoryItem>>::failure(normalized.status());
  }
  const ItemFilter &filter = normalized.value();
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream sql;
  sql << "SELECT i.id, i.timestamp, i.content_type, i.source, i.content_preview, i.raw_path, "
         "i.fields FROM memory_items i"
      << filter_clause(filter) << " ORDER BY i.timestamp DESC, i.id ASC";
  if (filter.limit.has_value()) {
    sql << " LIMIT " << *filter.limit;
  }

  sqlite3_stmt *stmt = nullptr;
  const std::string text = sql.str();
  if (sqlite3_prepare_v2(db_, text.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<MemoryItem>>::failure(db_error("prepare query"));
  }
  (void)bind_filter(stmt, filter);

  std::vector<MemoryItem> items;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    items.push_back(row_to_item(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<MemoryItem>>::failure(db_error("query"));
  }
  return common::Result<std::vector<MemoryItem>>::success(std::move(items));
}

common::Result<std::unordered_set<std::string>>
MetadataStore::chunk_refs(const ItemFilter &raw_filter, const Modality modality) {
  using RefsResult = common::Result<std::unordered_set<std::string>>;
  auto normalized = normalize_filter(raw_filter);
  if (!normalized.ok()) {
    return RefsResult::failure(normalized.status());
  }
  const ItemFilter &filter = normalized.value();
  std::lock_guard<std::mutex> lock(mutex_);
  std::string where = filter_clause(filter);
  where += where.empty() ? " WHERE " : " AND ";
  where += "c.modality = ?";
  const std::string sql =
      "SELECT c.id FROM chunks c JOIN memory_items i ON i.id = c.parent_id" + where;

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return RefsResult::failure(db_error("prepare chunk_refs"));
  }
  const int next = bind_filter(stmt, filter);
  bind_text(stmt, next, to_string(modality));

  std::unordered_set<std::string> ids;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    ids.insert(column_text(stmt, 0));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return RefsResult::failure(db_error("chunk_refs"));
  }
  return RefsResult::success(std::move(ids));
}

common::Result<std::unordered_map<std::string, Chunk>>
MetadataStore::get_chunks(const std::vector<std::string> &ids) {
  using ChunksResult = common::Result<std::unordered_map<std::string, Chunk>>;
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kChunkColumns + " FROM chunks WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return ChunksResult::failure(db_error("prepare get_chunks"));
  }

  std::unordered_map<std::string, Chunk> chunks;
  for (const auto &id : ids) {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    bind_text(stmt, 1, id);
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
      chunks.emplace(id, row_to_chunk(stmt));
    } else if (rc != SQLITE_DONE) {
      sqlite3_finalize(stmt);
      return ChunksResult::failure(db_error("get_chunks " + id));
    }
  }
  sqlite3_finalize(stmt);
  return ChunksResult::success(std::move(chunks));
}

common::Result<std::vector<Chunk>> MetadataStore::chunks_for_modality(const Modality modality) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kChunkColumns +
                          " FROM chunks WHERE modality = ?1 ORDER BY slot IS NULL, slot, id";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<Chunk>>::failure(db_error("prepare chunks_for_modality"));
  }
  bind_text(stmt, 1, to_string(modality));

  std::vector<Chunk> chunks;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    chunks.push_back(row_to_chunk(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<Chunk>>::failure(db_error("chunks_for_modality"));
  }
  return common::Result<std::vector<Chunk>>::success(std::move(chunks));
}

common::Status
MetadataStore::reassign_slots(const Modality modality,
                              const std::vector<std::pair<std::string, std::size_t>> &slots) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = exec_sql(db_, "BEGIN IMMEDIATE;"); !status.ok()) {
    return status;
  }

  auto fail = [this](const std::string &context) {
    auto status = db_error(context);
    (void)exec_sql(db_, "ROLLBACK;");
    return status;
  };

  // Clear first so the (modality, slot) unique index never sees a transient clash.
  sqlite3_stmt *clear = nullptr;
  if (sqlite3_prepare_v2(db_, "UPDATE chunks SET slot = NULL WHERE modality = ?1", -1, &clear,
                         nullptr) != SQLITE_OK) {
    return fail("prepare slot reset");
  }
  bind_text(clear, 1, to_string(modality));
  const int clear_rc = sqlite3_step(clear);
  sqlite3_finalize(clear);
  if (clear_rc != SQLITE_DONE) {
    return fail("slot reset");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "UPDATE chunks SET slot = ?1 WHERE id = ?2 AND modality = ?3", -1,
                         &stmt, nullptr) != SQLITE_OK) {
    return fail("prepare slot update");
  }
  const std::string modality_name = to_string(modality);
  for (const auto &[chunk_id, slot] : slots) {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(slot));
    bind_text(stmt, 2, chunk_id);
    bind_text(stmt, 3, modality_name);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      sqlite3_finalize(stmt);
      return fail("slot update " + chunk_id);
    }
  }
  sqlite3_finalize(stmt);

  if (auto status = exec_sql(db_, "COMMIT;"); !status.ok()) {
    (void)exec_sql(db_, "ROLLBACK;");
    return status;
  }
  return common::Status::success();
}

common::Result<std::optional<std::vector<float>>>
MetadataStore::cached_embedding(const std::string &model, const std::size_t dimensions,
                                const std::string &text) {
  using CacheResult = common::Result<std::optional<std::vector<float>>>;
  const std::string hash = cache_key(model, dimensions, text);

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT embedding FROM embedding_cache WHERE text_hash = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return CacheResult::failure(db_error("prepare cache lookup"));
  }
  bind_text(stmt, 1, hash);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    auto embedding =
        blob_to_vector(sqlite3_column_blob(stmt, 0), sqlite3_column_bytes(stmt, 0));
    sqlite3_finalize(stmt);
    if (embedding.size() != dimensions) {
      return CacheResult::success(std::nullopt);
    }
    return CacheResult::success(std::move(embedding));
  }

  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return CacheResult::failure(db_error("cache lookup"));
  }
  return CacheResult::success(std::nullopt);
}

common::Status MetadataStore::cache_embedding(const std::string &model,
                                              const std::size_t dimensions,
                                              const std::string &text,
                                              const std::vector<float> &embedding,
                                              const std::size_t max_entries) {
  if (max_entries == 0) {
    return common::Status::success();
  }
  const std::string hash = cache_key(model, dimensions, text);
  const auto blob = vector_to_blob(embedding);

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT OR REPLACE INTO embedding_cache(text_hash, embedding, created_at) VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return db_error("prepare cache insert");
  }

  bind_text(stmt, 1, hash);
  sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  const std::string now = now_rfc3339();
  bind_text(stmt, 3, now);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return db_error("cache insert");
  }

  std::size_t cache_size = 0;
  sqlite3_stmt *count_stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache", -1, &count_stmt, nullptr) !=
      SQLITE_OK) {
    return db_error("prepare cache count");
  }
  if (sqlite3_step(count_stmt) == SQLITE_ROW) {
    cache_size = static_cast<std::size_t>(sqlite3_column_int64(count_stmt, 0));
  }
  sqlite3_finalize(count_stmt);

  if (cache_size > max_entries) {
    const std::size_t overflow = cache_size - max_entries;
    std::ostringstream trim_sql;
    trim_sql << "DELETE FROM embedding_cache WHERE rowid IN ("
             << "SELECT rowid FROM embedding_cache ORDER BY created_at ASC, rowid ASC LIMIT "
             << overflow << ")";
    return exec_sql(db_, trim_sql.str());
  }
  return common::Status::success();
}

namespace {

common::Result<std::size_t> count_rows(sqlite3 *db, const std::string &sql,
                                       const std::optional<std::string> &param) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(common::ErrorCode::Database, sqlite3_errmsg(db));
  }
  if (param.has_value()) {
    bind_text(stmt, 1, *param);
  }
  std::size_t count = 0;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    return common::Result<std::size_t>::failure(common::ErrorCode::Database, sqlite3_errmsg(db));
  }
  return common::Result<std::size_t>::success(count);
}

} // namespace

common::Result<std::size_t> MetadataStore::count_items() {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_rows(db_, "SELECT COUNT(*) FROM memory_items", std::nullopt);
}

common::Result<std::size_t> MetadataStore::count_chunks(const std::optional<Modality> modality) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!modality.has_value()) {
    return count_rows(db_, "SELECT COUNT(*) FROM chunks", std::nullopt);
  }
  return count_rows(db_, "SELECT COUNT(*) FROM chunks WHERE modality = ?1",
                    to_string(*modality));
}

common::Result<std::size_t> MetadataStore::count_cached_embeddings() {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_rows(db_, "SELECT COUNT(*) FROM embedding_cache", std::nullopt);
}

bool MetadataStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "PRAGMA quick_check", -1, &stmt, nullptr) != SQLITE_OK) {
    return false;
  }
  bool healthy = false;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    healthy = column_text(stmt, 0) == "ok";
  }
  sqlite3_finalize(stmt);
  return healthy;
}

} // namespace memoryos::memory

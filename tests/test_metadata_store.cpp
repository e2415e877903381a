#include "test_framework.hpp"

#include "memoryos/memory/metadata_store.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace mem = memoryos::memory;

mem::MemoryItem make_item(const std::string &id, const std::string &timestamp,
                          const mem::ContentType type, const mem::Source source) {
  mem::MemoryItem item;
  item.id = id;
  item.timestamp = timestamp;
  item.content_type = type;
  item.source = source;
  item.content_preview = "preview of " + id;
  return item;
}

mem::Chunk text_chunk(const std::string &parent, const std::uint32_t seq,
                      const std::size_t slot, const std::string &text) {
  mem::Chunk chunk;
  chunk.id = mem::make_chunk_id(parent, seq);
  chunk.parent_id = parent;
  chunk.sequence_index = seq;
  chunk.modality = mem::Modality::Text;
  chunk.embedding = {0.25F, -0.5F, static_cast<float>(seq)};
  chunk.payload = mem::TextSpan{.text = text, .start_offset = seq * 10U, .end_offset = seq * 10U + text.size()};
  chunk.slot = slot;
  return chunk;
}

mem::Chunk frame_chunk(const std::string &parent, const std::uint32_t seq, const std::size_t slot) {
  mem::Chunk chunk;
  chunk.id = mem::make_chunk_id(parent, seq);
  chunk.parent_id = parent;
  chunk.sequence_index = seq;
  chunk.modality = mem::Modality::Visual;
  chunk.embedding = {1.0F, 0.0F};
  chunk.payload = mem::FrameReference{.raw_path = "/shots/" + parent + ".png", .frame_index = 0, .timestamp_ms = 1234};
  chunk.slot = slot;
  return chunk;
}

std::unique_ptr<mem::MetadataStore> open_store(const memoryos::testing::TempWorkspace &ws) {
  auto store = mem::MetadataStore::open(ws.path() / "db" / "memoryos.db");
  memoryos::tests::require(store.ok(), store.error());
  return std::move(store.value());
}

} // namespace

void register_metadata_store_tests(std::vector<memoryos::tests::TestCase> &tests) {
  using memoryos::tests::require;
  namespace common = memoryos::common;

  tests.push_back({"metadata_store_put_and_get_item", [] {
                     memoryos::testing::TempWorkspace ws;
                     auto store = open_store(ws);
                     auto item = make_item("a", "2026-03-01T10:00:00Z", mem::ContentType::Email,
                                           mem::Source::Gmail);
                     item.raw_path = "/mail/a.eml";
                     item.fields["subject"] = std::string("Invoice");
                     item.fields["attachments"] = std::int64_t{2};

                     auto first = store->put_item(item);
                     require(first.ok() && first.value(), "first insert should write");
                     auto again = store->put_item(item);
                     require(again.ok() && !again.value(), "duplicate id should be ignored");
                     require(store->count_items().value() == 1, "one item expected");

                     require(store->exists("a").value(), "item should exist");
                     require(!store->exists("missing").value(), "unknown id");

                     auto loaded = store->get_item("a");
                     require(loaded.ok() && loaded.value().has_value(), "item should load");
                     const auto &got = *loaded.value();
                     require(got.content_type == mem::ContentType::Email && got.source == mem::Source::Gmail,
                             "enums should round-trip");
                     require(got.raw_path == "/mail/a.eml", "raw_path should round-trip");
                     require(got.fields == item.fields, "typed fields should round-trip");

                     auto none = store->get_item("missing");
                     require(none.ok() && !none.value().has_value(), "unknown id yields nullopt");
                   }});

  tests.push_back({"metadata_store_item_with_chunks_is_atomic", [] {
                     memoryos::testing::TempWorkspace ws;
                     auto store = open_store(ws);
                     const auto item = make_item("doc", "2026-03-01T10:00:00Z", mem::ContentType::Text,
                                                 mem::Source::Clipboard);

                     // Two chunks with the same sequence index violate UNIQUE(parent_id, sequence_index).
                     auto clash = text_chunk("doc", 0, 0, "first");
                     auto dup = text_chunk("doc", 0, 1, "second");
                     dup.id = "doc#dup";
                     auto failed = store->put_item_with_chunks(item, {clash, dup});
                     require(!failed.ok(), "constraint violation should fail");
                     require(failed.code() == common::ErrorCode::Database, "expected a database error");
                     require(store->count_items().value() == 0, "item must not be written");
                     require(store->count_chunks().value() == 0, "no chunk must be written");

                     auto ok = store->put_item_with_chunks(
                         item, {text_chunk("doc", 1, 1, "second"), text_chunk("doc", 0, 0, "first")});
                     require(ok.ok() && ok.value(), "clean write should succeed");

                     auto duplicate = store->put_item_with_chunks(item, {text_chunk("doc", 2, 2, "third")});
                     require(duplicate.ok() && !duplicate.value(), "existing id reports false");
                     require(store->count_chunks().value() == 2, "duplicate must not add chunks");

                     auto chunks = store->list_chunks("doc");
                     require(chunks.ok() && chunks.value().size() == 2, "two chunks expected");
                     require(chunks.value()[0].sequence_index == 0, "chunks ordered by sequence");
                     require(mem::chunk_text_of(chunks.value()[1]) == "second", "text should round-trip");
                     require(chunks.value()[1].embedding == std::vector<float>({0.25F, -0.5F, 1.0F}),
                             "embedding blob should round-trip");
                     require(std::get<mem::TextSpan>(chunks.value()[1].payload).start_offset == 10,
                             "offsets should round-trip");
                   }});

  tests.push_back({"metadata_store_chunk_requires_parent", [] {
                     memoryos::testing::TempWorkspace ws;
                     auto store = open_store(ws);
                     auto status = store->put_chunk(text_chunk("ghost", 0, 0, "orphan"));
                     require(!status.ok(), "foreign key should reject orphans");
                     require(store->count_chunks().value() == 0, "orphan not written");
                   }});

  tests.push_back({"metadata_store_frame_chunks", [] {
                     memoryos::testing::TempWorkspace ws;
                     auto store = open_store(ws);
                     const auto item = make_item("shot", "2026-03-01T10:00:00Z", mem::ContentType::Image,
                                                 mem::Source::Screenshot);
                     require(store->put_item_with_chunks(item, {frame_chunk("shot", 0, 0)}).value(),
                             "write image item");
                     auto chunks = store->list_chunks("shot");
                     require(chunks.ok() && chunks.value().size() == 1, "one frame chunk");
                     const auto &frame = std::get<mem::FrameReference>(chunks.value()[0].payload);
                     require(frame.raw_path == "/shots/shot.png", "frame path");
                     require(frame.timestamp_ms == std::optional<std::int64_t>(1234), "frame timestamp");
                     require(chunks.value()[0].modality == mem::Modality::Visual, "visual modality");
                     require(store->count_chunks(mem::Modality::Visual).value() == 1, "visual count");
                     require(store->count_chunks(mem::Modality::Text).value() == 0, "text count");
                   }});

  tests.push_back({"metadata_store_query_filters", [] {
                     memoryos::testing::TempWorkspace ws;
                     auto store = open_store(ws);
                     require(store->put_item(make_item("m1", "2026-01-01T00:00:00Z", mem::ContentType::Email,
                                                       mem::Source::Gmail))
                                 .value(),
                             "m1");
                     require(store->put_item(make_item("m2", "2026-02-01T00:00:00Z", mem::ContentType::Email,
                                                       mem::Source::Gmail))
                                 .value(),
                             "m2");
                     require(store->put_item(make_item("u1", "2026-02-01T00:00:00Z", mem::ContentType::Url,
                                                       mem::Source::Browser))
                                 .value(),
                             "u1");
                     require(store->put_item(make_item("c1", "2026-03-01T00:00:00Z",
                                                       mem::ContentType::CalendarEvent,
                                                       mem::Source::GoogleCalendar))
                                 .value(),
                             "c1");

                     auto all = store->query({});
                     require(all.ok() && all.value().size() == 4, "empty filter returns everything");
                     require(all.value()[0].id == "c1", "newest first");
                     require(all.value()[1].id == "m2" && all.value()[2].id == "u1", "ties ordered by id");

                     mem::ItemFilter by_type;
                     by_type.content_type = mem::ContentType::Email;
                     require(store->query(by_type).value().size() == 2, "type filter");

                     mem::ItemFilter by_source;
                     by_source.source = mem::Source::Browser;
                     auto browser = store->query(by_source);
                     require(browser.value().size() == 1 && browser.value()[0].id == "u1", "source filter");

                     mem::ItemFilter range;
                     range.since = "2026-02-01T00:00:00Z";
                     range.until = "2026-02-28T23:59:59Z";
                     require(store->query(range).value().size() == 2, "range is inclusive");

                     mem::ItemFilter limited;
                     limited.limit = 1;
                     auto one = store->query(limited);
                     require(one.value().size() == 1 && one.value()[0].id == "c1", "limit keeps the newest");
                   }});

  tests.push_back({"metadata_store_chunk_refs_and_lookup", [] {
                     memoryos::testing::TempWorkspace ws;
                     auto store = open_store(ws);
                     require(store->put_item_with_chunks(
                                      make_item("mail", "2026-01-01T00:00:00Z", mem::ContentType::Email,
                                                mem::Source::Gmail),
                                      {text_chunk("mail", 0, 0, "a"), text_chunk("mail", 1, 1, "b")})
                                 .value(),
                             "mail");
                     require(store->put_item_with_chunks(
                                      make_item("shot", "2026-01-02T00:00:00Z", mem::ContentType::Image,
                                                mem::Source::Screenshot),
                                      {frame_chunk("shot", 0, 0), text_chunk("shot", 1, 2, "ocr text")})
                                 .value(),
                             "shot");

                     mem::ItemFilter gmail;
                     gmail.source = mem::Source::Gmail;
                     auto refs = store->chunk_refs(gmail, mem::Modality::Text);
                     require(refs.ok(), refs.error());
                     require(refs.value() == std::unordered_set<std::string>({"mail#0", "mail#1"}),
                             "gmail text chunks");
                     require(store->chunk_refs(gmail, mem::Modality::Visual).value().empty(),
                             "no visual chunks from gmail");

                     auto visual = store->chunk_refs({}, mem::Modality::Visual);
                     require(visual.value() == std::unordered_set<std::string>({"shot#0"}), "visual refs");

                     auto found = store->get_chunks({"mail#1", "nope", "shot#0"});
                     require(found.ok() && found.value().size() == 2, "unknown ids are skipped");
                     require(found.value().at("shot#0").modality == mem::Modality::Visual, "visual lookup");
                   }});

  tests.push_back({"metadata_store_reassign_slots", [] {
                     memoryos::testing::TempWorkspace ws;
                     auto store = open_store(ws);
                     require(store->put_item_with_chunks(
                                      make_item("d", "2026-01-01T00:00:00Z", mem::ContentType::Text,
                                                mem::Source::Clipboard),
                                      {text_chunk("d", 0, 5, "a"), text_chunk("d", 1, 9, "b"),
                                       text_chunk("d", 2, 7, "c")})
                                 .value(),
                             "write");

                     auto by_slot = store->chunks_for_modality(mem::Modality::Text);
                     require(by_slot.ok() && by_slot.value().size() == 3, "three chunks");
                     require(by_slot.value()[0].id == "d#0" && by_slot.value()[1].id == "d#2" &&
                                 by_slot.value()[2].id == "d#1",
                             "ordered by slot");

                     // Swapping slots would clash without clearing them first.
                     auto status = store->reassign_slots(mem::Modality::Text,
                                                         {{"d#0", 1}, {"d#1", 0}, {"d#2", 2}});
                     require(status.ok(), status.error());
                     auto after = store->chunks_for_modality(mem::Modality::Text);
                     require(after.value()[0].id == "d#1" && after.value()[0].slot == std::optional<std::size_t>(0),
                             "d#1 should now hold slot 0");
                     require(after.value()[1].id == "d#0", "d#0 should now hold slot 1");

                     require(store->reassign_slots(mem::Modality::Text, {{"d#0", 3}}).ok(), "partial reassign");
                     auto partial = store->chunks_for_modality(mem::Modality::Text);
                     require(partial.value()[0].id == "d#0", "assigned slot first");
                     require(!partial.value()[1].slot.has_value() && !partial.value()[2].slot.has_value(),
                             "unlisted chunks lose their slot");
                   }});

  tests.push_back({"metadata_store_embedding_cache", [] {
                     memoryos::testing::TempWorkspace ws;
                     auto store = open_store(ws);
                     const std::vector<float> emb = {0.1F, 0.2F, 0.3F};

                     auto miss = store->cached_embedding("m", 3, "hello");
                     require(miss.ok() && !miss.value().has_value(), "cache starts empty");

                     require(store->cache_embedding("m", 3, "hello", emb, 10).ok(), "store");
                     auto hit = store->cached_embedding("m", 3, "hello");
                     require(hit.ok() && hit.value() == std::optional<std::vector<float>>(emb), "cache hit");
                     require(!store->cached_embedding("other-model", 3, "hello").value().has_value(),
                             "model is part of the key");
                     require(!store->cached_embedding("m", 4, "hello").value().has_value(),
                             "dimensions are part of the key");

                     require(store->cache_embedding("m", 3, "disabled", emb, 0).ok(), "disabled cache");
                     require(!store->cached_embedding("m", 3, "disabled").value().has_value(),
                             "max_entries 0 stores nothing");

                     require(store->cache_embedding("m", 3, "second", emb, 2).ok(), "second");
                     require(store->cache_embedding("m", 3, "third", emb, 2).ok(), "third");
                     require(store->count_cached_embeddings().value() == 2, "cache bounded");
                     require(!store->cached_embedding("m", 3, "hello").value().has_value(),
                             "oldest entry evicted");
                     require(store->cached_embedding("m", 3, "third").value().has_value(), "newest kept");
                   }});

  tests.push_back({"metadata_store_reopen_and_health", [] {
                     memoryos::testing::TempWorkspace ws;
                     {
                       auto store = open_store(ws);
                       require(store->put_item(make_item("keep", "2026-01-01T00:00:00Z",
                                                         mem::ContentType::Text, mem::Source::Clipboard))
                                   .value(),
                               "write");
                       require(store->health_check(), "fresh store is healthy");
                     }
                     auto reopened = open_store(ws);
                     require(reopened->exists("keep").value(), "data should survive reopen");
                     require(reopened->path().filename() == "memoryos.db", "path accessor");
                   }});
}

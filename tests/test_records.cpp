#include "test_framework.hpp"

#include "memoryos/memory/content.hpp"
#include "memoryos/memory/record.hpp"
#include "memoryos/memory/types.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <optional>
#include <string>

namespace {

memoryos::memory::MemoryItem clipboard_item(const std::string &preview) {
  memoryos::memory::MemoryItem item;
  item.timestamp = "2026-03-14T09:00:00Z";
  item.content_type = memoryos::memory::ContentType::Text;
  item.source = memoryos::memory::Source::Clipboard;
  item.content_preview = preview;
  return item;
}

} // namespace

void register_records_tests(std::vector<memoryos::tests::TestCase> &tests) {
  using memoryos::tests::require;
  namespace mem = memoryos::memory;
  namespace common = memoryos::common;

  tests.push_back({"records_parse_calendar_record_with_details", [] {
                     const std::string json = R"({
                       "id": "evt-1",
                       "timestamp": "2026-03-14T15:00:00+01:00",
                       "content_type": "calendar_event",
                       "source": "calendar",
                       "content_preview": "Design sync",
                       "calendar_event_details": {
                         "summary": "Design sync",
                         "location": "Room 4",
                         "attendees": ["ana@example.com", "li@example.com"],
                         "start": "2026-03-14T15:00:00+01:00",
                         "duration_minutes": 45,
                         "all_day": false
                       },
                       "sync_token": null
                     })";
                     auto item = mem::parse_record(json);
                     require(item.ok(), item.error());
                     const auto &parsed = item.value();
                     require(parsed.id == "evt-1", "id mismatch");
                     require(parsed.content_type == mem::ContentType::CalendarEvent, "type mismatch");
                     require(parsed.source == mem::Source::GoogleCalendar, "calendar alias not mapped");
                     require(mem::field_text(parsed.fields, "location") == std::optional<std::string>("Room 4"),
                             "details members should be lifted");
                     require(mem::field_text(parsed.fields, "attendees") ==
                                 std::optional<std::string>("ana@example.com, li@example.com"),
                             "string arrays should be joined");
                     require(std::get<std::int64_t>(parsed.fields.at("duration_minutes")) == 45,
                             "integers should stay integers");
                     require(!std::get<bool>(parsed.fields.at("all_day")), "bools should stay bools");
                     require(!parsed.fields.contains("sync_token"), "null members should be dropped");
                     require(!parsed.fields.contains("calendar_event_details"),
                             "details object itself should not be stored");
                   }});

  tests.push_back({"records_parse_aliases_and_paths", [] {
                     auto item = mem::parse_record(
                         R"({"timestamp":"2026-01-02T03:04:05Z","content_type":"FILE","source":"file_system",)"
                         R"("content_preview":"notes.md","file_path":"/home/u/notes.md","size":1.5e3})");
                     require(item.ok(), item.error());
                     require(item.value().source == mem::Source::Filesystem, "file_system alias");
                     require(item.value().content_type == mem::ContentType::File, "type should be case-insensitive");
                     require(item.value().raw_path == "/home/u/notes.md", "file_path should map to raw_path");
                     require(item.value().id.empty(), "id is optional");
                     require(std::get<double>(item.value().fields.at("size")) == 1500.0, "exponent should parse");
                   }});

  tests.push_back({"records_reject_missing_or_unknown_members", [] {
                     auto missing = mem::parse_record(
                         R"({"timestamp":"2026-01-02T03:04:05Z","content_type":"text","source":"clipboard"})");
                     require(!missing.ok(), "content_preview is required");
                     require(missing.code() == common::ErrorCode::InvalidArgument, "expected invalid argument");

                     auto bad_source = mem::parse_record(
                         R"({"timestamp":"t","content_type":"text","source":"fax","content_preview":"x"})");
                     require(!bad_source.ok(), "unknown source should fail");
                     require(bad_source.error().find("fax") != std::string::npos, "message should name the source");

                     require(!mem::parse_record("[1,2]").ok(), "non-object should fail");
                   }});

  tests.push_back({"records_parse_array_and_lines", [] {
                     const std::string array = R"([
                       {"timestamp":"2026-01-01T00:00:00Z","content_type":"text","source":"clipboard","content_preview":"one"},
                       {"timestamp":"2026-01-01T00:00:00Z","content_type":"text","content_preview":"two"},
                       {"timestamp":"2026-01-01T00:00:00Z","content_type":"url","source":"browser","content_preview":"three","url":"https://example.com"}
                     ])";
                     auto parsed = mem::parse_records(array);
                     require(parsed.items.size() == 2, "two records should parse");
                     require(parsed.errors.size() == 1, "one record should fail");
                     require(parsed.errors.front().rfind("record 1:", 0) == 0, "error should carry the position");

                     const std::string lines =
                         "{\"timestamp\":\"2026-01-01T00:00:00Z\",\"content_type\":\"text\",\"source\":\"clipboard\",\"content_preview\":\"a\"}\n"
                         "\n"
                         "{\"timestamp\":\"2026-01-01T00:00:00Z\",\"content_type\":\"email\",\"source\":\"mail\",\"content_preview\":\"b\"}\n";
                     auto from_lines = mem::parse_records(lines);
                     require(from_lines.errors.empty(), "json lines should parse cleanly");
                     require(from_lines.items.size() == 2, "blank lines should be skipped");
                     require(from_lines.items[1].source == mem::Source::Gmail, "mail alias");
                   }});

  tests.push_back({"records_serialize_and_parse_back", [] {
                     mem::MemoryItem item = clipboard_item("quote \"this\"");
                     item.id = "abc";
                     item.content_type = mem::ContentType::Url;
                     item.source = mem::Source::Browser;
                     item.raw_path = "/tmp/page.html";
                     item.fields["url"] = std::string("https://example.com/a?b=c");
                     item.fields["visit_count"] = std::int64_t{7};
                     item.fields["dwell_seconds"] = 3.0;
                     item.fields["bookmarked"] = true;

                     const std::string json = mem::record_to_json(item);
                     require(json.find("\"url_details\":{") != std::string::npos, "fields go under details");
                     auto back = mem::parse_record(json);
                     require(back.ok(), back.error());
                     require(back.value().id == "abc", "id lost");
                     require(back.value().content_preview == item.content_preview, "preview lost");
                     require(back.value().raw_path == item.raw_path, "raw_path lost");
                     require(back.value().fields == item.fields, "fields should keep their types");
                   }});

  tests.push_back({"records_fields_json_preserves_types", [] {
                     mem::ExtensionFields fields;
                     fields["whole"] = 2.0;
                     fields["count"] = std::int64_t{-12};
                     fields["name"] = std::string("line\nbreak");
                     fields["flag"] = false;
                     const std::string json = mem::fields_to_json(fields);
                     require(json.find("\"whole\":2.0") != std::string::npos, "whole doubles keep a decimal point");
                     const auto back = mem::fields_from_json(json);
                     require(back == fields, "types should survive the round trip");

                     const auto nested = mem::fields_from_json(R"({"tags":[{"a":1}],"meta":{"k":"v"}})");
                     require(std::get<std::string>(nested.at("tags")) == R"([{"a":1}])", "nested arrays stay raw");
                     require(std::get<std::string>(nested.at("meta")) == R"({"k":"v"})", "objects stay raw");
                   }});

  tests.push_back({"records_normalize_filter_bounds", [] {
                     mem::ItemFilter filter;
                     filter.since = "2026-03-01T12:00:00+05:00";
                     filter.until = " 2026-03-01 ";
                     auto normalized = mem::normalize_filter(filter);
                     require(normalized.ok(), normalized.error());
                     require(normalized.value().since == std::optional<std::string>("2026-03-01T07:00:00Z"),
                             "since shifted to UTC");
                     require(normalized.value().until == std::optional<std::string>("2026-03-01T23:59:59Z"),
                             "date-only until reaches the end of the day");

                     mem::ItemFilter unbounded;
                     auto untouched = mem::normalize_filter(unbounded);
                     require(untouched.ok() && untouched.value().empty(), "no bounds stays empty");

                     mem::ItemFilter bad;
                     bad.until = "2026-13-01";
                     require(mem::normalize_filter(bad).code() == memoryos::common::ErrorCode::InvalidArgument,
                             "invalid bound rejected");
                   }});

  tests.push_back({"records_normalize_timestamps", [] {
                     auto with_offset = mem::normalize_timestamp("2026-03-14T15:30:00+01:30");
                     require(with_offset.ok(), with_offset.error());
                     require(with_offset.value() == "2026-03-14T14:00:00Z", "offset not applied");

                     auto fractional = mem::normalize_timestamp("2026-03-14t15:30:00.123456Z");
                     require(fractional.ok() && fractional.value() == "2026-03-14T15:30:00Z",
                             "fractions should be dropped");

                     auto naive = mem::normalize_timestamp("2026-03-14 08:05");
                     require(naive.ok() && naive.value() == "2026-03-14T08:05:00Z", "naive times are UTC");

                     auto date_only = mem::normalize_timestamp("2026-03-14");
                     require(date_only.ok() && date_only.value() == "2026-03-14T00:00:00Z", "date only");

                     auto rolls_back = mem::normalize_timestamp("2026-01-01T00:30:00+02:00");
                     require(rolls_back.ok() && rolls_back.value() == "2025-12-31T22:30:00Z",
                             "offsets should cross day boundaries");

                     require(!mem::normalize_timestamp("yesterday").ok(), "garbage should fail");
                     require(!mem::normalize_timestamp("2026-13-01T00:00:00Z").ok(), "month 13 should fail");
                     require(!mem::normalize_timestamp("2026-03-14T10:00:00Zjunk").ok(), "trailing junk should fail");
                   }});

  tests.push_back({"records_validate_required_fields", [] {
                     auto item = clipboard_item("hello");
                     require(mem::validate_item(item).ok(), "plain text item should validate");

                     item.timestamp = "not a time";
                     require(mem::validate_item(item).code() == common::ErrorCode::InvalidArgument,
                             "bad timestamp should fail");

                     item = clipboard_item("page");
                     item.content_type = mem::ContentType::BrowserHistory;
                     require(!mem::validate_item(item).ok(), "browser history needs a url");
                     item.fields["url"] = std::string("https://example.com");
                     require(mem::validate_item(item).ok(), "url present");

                     item = clipboard_item("mail");
                     item.content_type = mem::ContentType::Email;
                     item.fields["subject"] = std::string("   ");
                     require(!mem::validate_item(item).ok(), "blank subject counts as missing");

                     item = clipboard_item("meeting");
                     item.content_type = mem::ContentType::CalendarEvent;
                     require(!mem::validate_item(item).ok(), "calendar event needs start");

                     item = clipboard_item("file");
                     item.content_type = mem::ContentType::File;
                     require(!mem::validate_item(item).ok(), "file item needs raw_path");
                   }});

  tests.push_back({"records_compose_searchable_text", [] {
                     auto email = clipboard_item("preview");
                     email.content_type = mem::ContentType::Email;
                     email.fields["subject"] = std::string("Invoice 42");
                     email.fields["from"] = std::string("billing@acme.test");
                     email.fields["snippet"] = std::string("Total due 310 EUR");
                     require(mem::compose_searchable_text(email) ==
                                 "Invoice 42 from billing@acme.test Total due 310 EUR",
                             "email text mismatch");

                     auto calendar = clipboard_item("preview");
                     calendar.content_type = mem::ContentType::CalendarEvent;
                     calendar.fields["summary"] = std::string("Meet at 3pm");
                     calendar.fields["start"] = std::string("2026-03-14T15:00:00Z");
                     require(mem::compose_searchable_text(calendar) == "Meet at 3pm 2026-03-14T15:00:00Z",
                             "calendar text mismatch");

                     auto bare = clipboard_item("just the preview");
                     bare.content_type = mem::ContentType::Url;
                     require(mem::compose_searchable_text(bare) == "just the preview",
                             "preview is the fallback");
                   }});

  tests.push_back({"records_item_id_is_content_derived", [] {
                     auto a = clipboard_item("x");
                     auto b = clipboard_item("y");
                     b.timestamp = "2027-01-01T00:00:00Z";
                     const std::optional<mem::RawContent> ca = mem::TextContent{"Hello   World"};
                     const std::optional<mem::RawContent> cb = mem::TextContent{"hello world\n"};
                     const auto id_a = mem::compute_item_id(a, ca);
                     require(id_a.size() == 64, "id should be a sha256 hex digest");
                     require(id_a == mem::compute_item_id(b, cb), "case and whitespace should not matter");

                     b.source = mem::Source::Browser;
                     require(id_a != mem::compute_item_id(b, cb), "source is part of the identity");

                     auto image = clipboard_item("");
                     image.content_type = mem::ContentType::Image;
                     const std::optional<mem::RawContent> png1 =
                         mem::ImageContent{memoryos::testing::fake_png("one"), std::nullopt};
                     const std::optional<mem::RawContent> png1_ocr =
                         mem::ImageContent{memoryos::testing::fake_png("one"), std::string("ocr")};
                     const std::optional<mem::RawContent> png2 =
                         mem::ImageContent{memoryos::testing::fake_png("two"), std::nullopt};
                     require(mem::compute_item_id(image, png1) == mem::compute_item_id(image, png1_ocr),
                             "image identity is the bytes");
                     require(mem::compute_item_id(image, png1) != mem::compute_item_id(image, png2),
                             "different images differ");
                   }});

  tests.push_back({"records_route_content_variants", [] {
                     auto text_item = clipboard_item("fallback preview");
                     auto record_only = mem::route_content(text_item, std::nullopt);
                     require(record_only.ok(), record_only.error());
                     require(record_only.value().size() == 1, "record unit expected");
                     require(record_only.value()[0].label == "record", "label mismatch");
                     require(std::get<std::string>(record_only.value()[0].payload) == "fallback preview",
                             "record text should come from the preview");

                     auto blank = mem::route_content(text_item, mem::RawContent{mem::TextContent{"  "}});
                     require(blank.ok() && blank.value().empty(), "blank text yields no units");

                     auto transcript = mem::route_content(
                         text_item, mem::RawContent{mem::TranscriptContent{
                                        "", {{0, 900, "hello"}, {900, 2000, " there "}}}});
                     require(transcript.ok(), transcript.error());
                     require(std::get<std::string>(transcript.value()[0].payload) == "hello there",
                             "segments should be joined");
                     require(transcript.value()[0].label == "transcript", "transcript label");

                     auto document = mem::route_content(
                         text_item, mem::RawContent{mem::DocumentContent{"Title", "Body text"}});
                     require(document.ok(), document.error());
                     require(std::get<std::string>(document.value()[0].payload) == "Title\n\nBody text",
                             "document text mismatch");

                     auto image_item = clipboard_item("");
                     image_item.content_type = mem::ContentType::Image;
                     image_item.raw_path = "/shots/1.png";
                     auto with_ocr = mem::route_content(
                         image_item,
                         mem::RawContent{mem::ImageContent{memoryos::testing::fake_png("s"), "Invoice total"}});
                     require(with_ocr.ok(), with_ocr.error());
                     require(with_ocr.value().size() == 2, "image plus ocr expected");
                     require(with_ocr.value()[0].modality == mem::Modality::Visual, "image unit first");
                     require(std::get<mem::ImagePayload>(with_ocr.value()[0].payload).frame.raw_path ==
                                 "/shots/1.png",
                             "frame should reference raw_path");
                     require(with_ocr.value()[1].label == "ocr", "ocr unit second");

                     require(mem::route_content(image_item, std::nullopt).code() ==
                                 common::ErrorCode::InvalidArgument,
                             "image item without payload should fail");
                     require(!mem::route_content(image_item, mem::RawContent{mem::TextContent{"x"}}).ok(),
                             "image item with text payload should fail");
                     require(!mem::route_content(text_item, mem::RawContent{mem::ImageContent{
                                                                 memoryos::testing::fake_png("t"), std::nullopt}})
                                  .ok(),
                             "text item with image payload should fail");
                   }});
}

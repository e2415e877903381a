#include "test_framework.hpp"

#include "memoryos/memory/chunker.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <string>

namespace {

bool is_continuation(const char ch) { return (static_cast<unsigned char>(ch) & 0xC0) == 0x80; }

} // namespace

void register_chunker_tests(std::vector<memoryos::tests::TestCase> &tests) {
  using memoryos::tests::require;
  namespace mem = memoryos::memory;

  tests.push_back({"chunker_empty_text_no_spans", [] {
                     require(mem::chunk_text("", 512, 64).empty(), "empty input should yield nothing");
                   }});

  tests.push_back({"chunker_short_text_single_chunk", [] {
                     const auto chunks = mem::chunk_text("Meet at 3pm", 512, 64);
                     require(chunks.size() == 1, "short text should produce one chunk");
                     require(chunks[0].text == "Meet at 3pm", "content mismatch");
                     require(chunks[0].start_offset == 0 && chunks[0].end_offset == 11,
                             "offsets should cover the whole text");
                   }});

  tests.push_back({"chunker_exact_limit_single_chunk", [] {
                     const std::string text(512, 'x');
                     require(mem::chunk_text(text, 512, 64).size() == 1,
                             "text of exactly max_chars stays whole");
                   }});

  tests.push_back({"chunker_long_document_covers_text", [] {
                     const std::string text = memoryos::testing::make_document(2000);
                     const auto chunks = mem::chunk_text(text, 512, 64);
                     require(chunks.size() >= 3, "2000 chars should give at least 3 chunks");
                     require(chunks.front().start_offset == 0, "first span starts at 0");
                     require(chunks.back().end_offset == text.size(), "last span reaches the end");

                     for (std::size_t i = 0; i < chunks.size(); ++i) {
                       const auto &span = chunks[i];
                       require(!span.text.empty(), "spans must not be empty");
                       require(span.text.size() <= 512, "span exceeds max_chars");
                       require(span.text == text.substr(span.start_offset,
                                                        span.end_offset - span.start_offset),
                               "span text must match its offsets");
                       if (i > 0) {
                         const auto &prev = chunks[i - 1];
                         require(span.start_offset <= prev.end_offset, "gap between spans");
                         require(prev.end_offset - span.start_offset == 64,
                                 "consecutive spans should overlap by 64");
                         require(span.start_offset > prev.start_offset, "spans must advance");
                       }
                     }
                   }});

  tests.push_back({"chunker_prefers_sentence_boundaries", [] {
                     const std::string text = memoryos::testing::make_document(3000);
                     const auto chunks = mem::chunk_text(text, 512, 64);
                     for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
                       const std::string &span = chunks[i].text;
                       require(span.size() >= 2, "span too short");
                       const char last = span[span.size() - 1];
                       const char before = span[span.size() - 2];
                       require((last == ' ' || last == '\n') && (before == '.' || before == '\n'),
                               "non-final spans should end after a sentence or paragraph");
                     }
                   }});

  tests.push_back({"chunker_is_deterministic", [] {
                     const std::string text = memoryos::testing::make_document(5000);
                     const auto a = mem::chunk_text(text, 400, 50);
                     const auto b = mem::chunk_text(text, 400, 50);
                     require(a.size() == b.size(), "chunk count differs between runs");
                     for (std::size_t i = 0; i < a.size(); ++i) {
                       require(a[i].start_offset == b[i].start_offset &&
                                   a[i].end_offset == b[i].end_offset,
                               "chunk boundaries differ between runs");
                     }
                   }});

  tests.push_back({"chunker_hard_cuts_without_whitespace", [] {
                     const std::string text(1000, 'a');
                     const auto chunks = mem::chunk_text(text, 100, 10);
                     require(chunks.size() > 10, "unbroken text should still be split");
                     for (const auto &span : chunks) {
                       require(span.text.size() <= 100, "hard cut exceeded max_chars");
                     }
                     require(chunks.back().end_offset == text.size(), "coverage lost");
                   }});

  tests.push_back({"chunker_respects_utf8_boundaries", [] {
                     std::string text;
                     for (int i = 0; i < 300; ++i) {
                       text += "\xC3\xA9"; // é
                     }
                     const auto chunks = mem::chunk_text(text, 101, 11);
                     require(chunks.size() > 1, "expected multiple chunks");
                     for (const auto &span : chunks) {
                       require(!is_continuation(span.text.front()), "span starts mid code point");
                       require(span.end_offset == text.size() || !is_continuation(text[span.end_offset]),
                               "span ends mid code point");
                     }
                   }});

  tests.push_back({"chunker_clamps_oversized_overlap", [] {
                     const std::string text = memoryos::testing::make_document(600);
                     const auto chunks = mem::chunk_text(text, 50, 80);
                     require(chunks.size() > 1, "expected multiple chunks");
                     require(chunks.back().end_offset == text.size(), "should terminate with full coverage");
                     for (const auto &span : chunks) {
                       require(span.text.size() <= 50, "span exceeds max_chars");
                     }
                   }});
}

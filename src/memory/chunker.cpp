#include "memoryos/memory/chunker.hpp"

#include <algorithm>
#include <cctype>

namespace memoryos::memory {

namespace {

bool is_space(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool is_continuation_byte(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

bool is_sentence_end(const char ch) { return ch == '.' || ch == '!' || ch == '?'; }

// Latest break position in [lowest, hard_end], or hard_end when nothing fits.
// Positions are exclusive span ends.
std::size_t find_break(std::string_view text, const std::size_t lowest,
                       const std::size_t hard_end, const std::size_t max_chars) {
  const std::size_t lookback = std::max<std::size_t>(max_chars / 2, 1);
  const std::size_t boundary_floor =
      hard_end > lowest + lookback ? hard_end - lookback : lowest;

  for (std::size_t end = hard_end; end > boundary_floor && end >= 2; --end) {
    if (text[end - 1] == '\n' && text[end - 2] == '\n') {
      return end;
    }
  }
  for (std::size_t end = hard_end; end > boundary_floor && end >= 2; --end) {
    if (is_space(text[end - 1]) && is_sentence_end(text[end - 2])) {
      return end;
    }
  }
  for (std::size_t end = hard_end; end > lowest && end >= 1; --end) {
    if (text[end - 1] == '\n') {
      return end;
    }
  }
  for (std::size_t end = hard_end; end > lowest && end >= 1; --end) {
    if (is_space(text[end - 1])) {
      return end;
    }
  }
  return hard_end;
}

} // namespace

std::vector<TextSpan> chunk_text(const std::string_view text, std::size_t max_chars,
                                 std::size_t overlap_chars) {
  std::vector<TextSpan> spans;
  if (text.empty()) {
    return spans;
  }
  max_chars = std::max<std::size_t>(max_chars, 1);
  if (text.size() <= max_chars) {
    spans.push_back(TextSpan{.text = std::string(text), .start_offset = 0, .end_offset = text.size()});
    return spans;
  }
  overlap_chars = std::min(overlap_chars, max_chars - 1);

  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t hard_end = std::min(start + max_chars, text.size());
    std::size_t end = hard_end;
    if (hard_end < text.size()) {
      // Every span must end past start + overlap so the next one moves forward.
      const std::size_t lowest = start + overlap_chars + 1;
      end = find_break(text, lowest, hard_end, max_chars);
      while (end > lowest && is_continuation_byte(text[end])) {
        --end;
      }
    }

    spans.push_back(TextSpan{.text = std::string(text.substr(start, end - start)),
                             .start_offset = start,
                             .end_offset = end});
    if (end >= text.size()) {
      break;
    }

    std::size_t next = end - overlap_chars;
    while (next > start + 1 && is_continuation_byte(text[next])) {
      --next;
    }
    start = next;
  }

  return spans;
}

} // namespace memoryos::memory

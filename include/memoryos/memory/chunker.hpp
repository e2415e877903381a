#pragma once

#include "memoryos/memory/types.hpp"

#include <string_view>
#include <vector>

namespace memoryos::memory {

/// Splits text into ordered spans of at most max_chars bytes.
///
/// Text that fits in max_chars comes back as a single span. Longer text breaks at
/// paragraph ends, then sentence ends, then whitespace, and only cuts mid-word when
/// a window has none of those. Consecutive spans share overlap_chars bytes (a few
/// more when the overlap start is moved back to a UTF-8 code point boundary), so
/// the spans cover the whole input. Empty input yields no spans.
[[nodiscard]] std::vector<TextSpan> chunk_text(std::string_view text, std::size_t max_chars = 512,
                                               std::size_t overlap_chars = 64);

} // namespace memoryos::memory

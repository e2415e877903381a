#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace memoryos::common {

using Sha256Digest = std::array<std::uint8_t, 32>;

[[nodiscard]] Sha256Digest sha256(std::string_view data);
[[nodiscard]] std::string sha256_hex(std::string_view data);
[[nodiscard]] std::string sha256_hex(const std::vector<std::uint8_t> &bytes);
[[nodiscard]] std::string to_hex(const std::uint8_t *data, std::size_t size);

/// 64-bit FNV-1a, used for hashed feature buckets.
[[nodiscard]] std::uint64_t fnv1a64(std::string_view data);

} // namespace memoryos::common

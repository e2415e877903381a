#include "memoryos/common/hash.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace memoryos::common {

Sha256Digest sha256(std::string_view data) {
  Sha256Digest digest{};
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest.data());
  return digest;
}

std::string to_hex(const std::uint8_t *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

std::string sha256_hex(std::string_view data) {
  const auto digest = sha256(data);
  return to_hex(digest.data(), digest.size());
}

std::string sha256_hex(const std::vector<std::uint8_t> &bytes) {
  return sha256_hex(
      std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
}

std::uint64_t fnv1a64(std::string_view data) {
  std::uint64_t hash = 1469598103934665603ULL;
  for (const char ch : data) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= 1099511628211ULL;
  }
  return hash;
}

} // namespace memoryos::common

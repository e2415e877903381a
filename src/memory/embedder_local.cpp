#include "memoryos/memory/embedder_local.hpp"

#include "memoryos/common/fs.hpp"
#include "memoryos/common/hash.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace memoryos::memory {

namespace {

constexpr std::size_t kImageScanLimit = 1U << 20;

void add_feature(std::vector<float> &values, std::string_view feature, const float weight) {
  const std::uint64_t hash = common::fnv1a64(feature);
  const std::size_t bucket = static_cast<std::size_t>(hash % values.size());
  // High bit picks the sign so unrelated features tend to cancel.
  const float sign = (hash >> 63U) != 0U ? -1.0F : 1.0F;
  values[bucket] += sign * weight;
}

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (const char ch : text) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) != 0 || uch >= 0x80) {
      current.push_back(static_cast<char>(std::tolower(uch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

void add_text_features(std::vector<float> &values, std::string_view text,
                       const std::string &namespace_tag) {
  for (const auto &token : tokenize(text)) {
    add_feature(values, namespace_tag + "w:" + token, 1.0F);
    const std::string padded = " " + token + " ";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      add_feature(values, namespace_tag + "t:" + padded.substr(i, 3), 0.5F);
    }
  }
}

bool has_prefix(const std::vector<std::uint8_t> &bytes, std::initializer_list<std::uint8_t> magic,
                const std::size_t offset = 0) {
  if (bytes.size() < offset + magic.size()) {
    return false;
  }
  return std::equal(magic.begin(), magic.end(), bytes.begin() + static_cast<std::ptrdiff_t>(offset));
}

} // namespace

void l2_normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (const float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-12) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

std::optional<std::string_view> detect_image_format(const std::vector<std::uint8_t> &bytes) {
  if (has_prefix(bytes, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) {
    return "png";
  }
  if (has_prefix(bytes, {0xFF, 0xD8, 0xFF})) {
    return "jpeg";
  }
  if (has_prefix(bytes, {'G', 'I', 'F', '8'})) {
    return "gif";
  }
  if (has_prefix(bytes, {'B', 'M'}) && bytes.size() > 14) {
    return "bmp";
  }
  if (has_prefix(bytes, {'R', 'I', 'F', 'F'}) && has_prefix(bytes, {'W', 'E', 'B', 'P'}, 8)) {
    return "webp";
  }
  return std::nullopt;
}

LocalTextEmbedder::LocalTextEmbedder(const std::size_t dimensions)
    : dimensions_(std::max<std::size_t>(dimensions, 1)) {}

std::string LocalTextEmbedder::model() const {
  return "local-hash-" + std::to_string(dimensions_);
}

common::Result<std::vector<float>> LocalTextEmbedder::embed(const std::string_view text) {
  if (common::trim(std::string(text)).empty()) {
    return common::Result<std::vector<float>>::failure(common::ErrorCode::EncodingError,
                                                       "cannot embed empty text");
  }
  std::vector<float> values(dimensions_, 0.0F);
  add_text_features(values, text, "");
  l2_normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

LocalImageEmbedder::LocalImageEmbedder(const std::size_t dimensions)
    : dimensions_(std::max<std::size_t>(dimensions, 1)) {}

common::Result<std::vector<float>>
LocalImageEmbedder::embed_image(const std::vector<std::uint8_t> &bytes) {
  const auto format = detect_image_format(bytes);
  if (!format.has_value()) {
    return common::Result<std::vector<float>>::failure(common::ErrorCode::EncodingError,
                                                       "unrecognized image data");
  }

  std::vector<float> values(dimensions_, 0.0F);
  add_feature(values, std::string("fmt:") + std::string(*format), 1.0F);
  const std::size_t limit = std::min(bytes.size(), kImageScanLimit);
  const std::string_view data(reinterpret_cast<const char *>(bytes.data()), limit);
  for (std::size_t i = 0; i + 4 <= data.size(); ++i) {
    add_feature(values, data.substr(i, 4), 1.0F);
  }
  l2_normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

common::Result<std::vector<float>> LocalImageEmbedder::embed_text(const std::string_view text) {
  if (common::trim(std::string(text)).empty()) {
    return common::Result<std::vector<float>>::failure(common::ErrorCode::EncodingError,
                                                       "cannot embed empty text");
  }
  std::vector<float> values(dimensions_, 0.0F);
  add_text_features(values, text, "clip:");
  l2_normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

} // namespace memoryos::memory

#pragma once

#include "memoryos/memory/embedder.hpp"

#include <optional>

namespace memoryos::memory {

/// Deterministic hashed bag of words and character trigrams, L2-normalized.
class LocalTextEmbedder final : public ITextEmbedder {
public:
  explicit LocalTextEmbedder(std::size_t dimensions = 384);

  [[nodiscard]] std::string_view name() const override { return "local"; }
  [[nodiscard]] std::string model() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

private:
  std::size_t dimensions_;
};

/// Deterministic stand-in for a CLIP encoder: byte-shingle features for images,
/// hashed tokens for text. Rejects payloads that are not PNG, JPEG, GIF, BMP or WebP.
class LocalImageEmbedder final : public IImageEmbedder {
public:
  explicit LocalImageEmbedder(std::size_t dimensions = 512);

  [[nodiscard]] std::string_view name() const override { return "local"; }
  [[nodiscard]] common::Result<std::vector<float>>
  embed_image(const std::vector<std::uint8_t> &bytes) override;
  [[nodiscard]] common::Result<std::vector<float>> embed_text(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

private:
  std::size_t dimensions_;
};

/// "png", "jpeg", "gif", "bmp" or "webp" from the magic bytes.
[[nodiscard]] std::optional<std::string_view> detect_image_format(const std::vector<std::uint8_t> &bytes);

/// Scales to unit length; zero vectors are left alone.
void l2_normalize(std::vector<float> &values);

} // namespace memoryos::memory

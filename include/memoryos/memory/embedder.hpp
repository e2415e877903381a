#pragma once

#include "memoryos/common/result.hpp"
#include "memoryos/config/schema.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace memoryos::memory {

class HttpClient;

/// Text to vector in the text index space.
class ITextEmbedder {
public:
  virtual ~ITextEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  /// Model identity, part of the embedding cache key.
  [[nodiscard]] virtual std::string model() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts);
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

/// Images and text into one shared visual space (CLIP-style).
class IImageEmbedder {
public:
  virtual ~IImageEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>>
  embed_image(const std::vector<std::uint8_t> &bytes) = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed_text(std::string_view text) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

[[nodiscard]] common::Result<std::unique_ptr<ITextEmbedder>>
create_text_embedder(const config::Config &config, std::shared_ptr<HttpClient> http_client = nullptr);

[[nodiscard]] common::Result<std::unique_ptr<IImageEmbedder>>
create_image_embedder(const config::Config &config);

} // namespace memoryos::memory

#pragma once

#include "memoryos/common/result.hpp"
#include "memoryos/config/schema.hpp"
#include "memoryos/memory/embedder.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace memoryos::memory {

/// Uniform entry point to the text and image encoders.
///
/// Blank text and undecodable images fail with EncodingError; an encoder that
/// returns a vector of the wrong length fails with DimensionMismatch.
class EmbeddingGateway {
public:
  EmbeddingGateway(std::unique_ptr<ITextEmbedder> text_embedder,
                   std::unique_ptr<IImageEmbedder> image_embedder);

  [[nodiscard]] common::Result<std::vector<float>> embed_text(std::string_view text) const;
  [[nodiscard]] common::Result<std::vector<float>>
  embed_image(const std::vector<std::uint8_t> &bytes) const;
  /// Text projected into the visual space, for querying the visual index.
  [[nodiscard]] common::Result<std::vector<float>>
  embed_text_for_image_search(std::string_view text) const;

  [[nodiscard]] std::size_t text_dimensions() const;
  [[nodiscard]] std::size_t visual_dimensions() const;
  [[nodiscard]] std::string text_model() const;

private:
  std::unique_ptr<ITextEmbedder> text_embedder_;
  std::unique_ptr<IImageEmbedder> image_embedder_;
};

[[nodiscard]] common::Result<std::unique_ptr<EmbeddingGateway>>
create_embedding_gateway(const config::Config &config);

} // namespace memoryos::memory

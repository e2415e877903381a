#include "memoryos/memory/embedding_gateway.hpp"

#include "memoryos/common/fs.hpp"

namespace memoryos::memory {

namespace {

common::Result<std::vector<float>> check_dimensions(common::Result<std::vector<float>> vector,
                                                    const std::size_t expected,
                                                    std::string_view what) {
  if (vector.ok() && vector.value().size() != expected) {
    return common::Result<std::vector<float>>::failure(
        common::ErrorCode::DimensionMismatch,
        std::string(what) + " encoder returned " + std::to_string(vector.value().size()) +
            " values, expected " + std::to_string(expected));
  }
  return vector;
}

bool is_blank(std::string_view text) { return common::trim(std::string(text)).empty(); }

} // namespace

EmbeddingGateway::EmbeddingGateway(std::unique_ptr<ITextEmbedder> text_embedder,
                                   std::unique_ptr<IImageEmbedder> image_embedder)
    : text_embedder_(std::move(text_embedder)), image_embedder_(std::move(image_embedder)) {}

common::Result<std::vector<float>> EmbeddingGateway::embed_text(const std::string_view text) const {
  if (is_blank(text)) {
    return common::Result<std::vector<float>>::failure(common::ErrorCode::EncodingError,
                                                       "cannot embed empty text");
  }
  return check_dimensions(text_embedder_->embed(text), text_embedder_->dimensions(), "text");
}

common::Result<std::vector<float>>
EmbeddingGateway::embed_image(const std::vector<std::uint8_t> &bytes) const {
  if (bytes.empty()) {
    return common::Result<std::vector<float>>::failure(common::ErrorCode::EncodingError,
                                                       "cannot embed empty image");
  }
  return check_dimensions(image_embedder_->embed_image(bytes), image_embedder_->dimensions(),
                          "image");
}

common::Result<std::vector<float>>
EmbeddingGateway::embed_text_for_image_search(const std::string_view text) const {
  if (is_blank(text)) {
    return common::Result<std::vector<float>>::failure(common::ErrorCode::EncodingError,
                                                       "cannot embed empty text");
  }
  return check_dimensions(image_embedder_->embed_text(text), image_embedder_->dimensions(),
                          "cross-modal text");
}

std::size_t EmbeddingGateway::text_dimensions() const { return text_embedder_->dimensions(); }

std::size_t EmbeddingGateway::visual_dimensions() const { return image_embedder_->dimensions(); }

std::string EmbeddingGateway::text_model() const { return text_embedder_->model(); }

common::Result<std::unique_ptr<EmbeddingGateway>>
create_embedding_gateway(const config::Config &config) {
  using GatewayResult = common::Result<std::unique_ptr<EmbeddingGateway>>;
  auto text = create_text_embedder(config);
  if (!text.ok()) {
    return GatewayResult::failure(text.status());
  }
  auto image = create_image_embedder(config);
  if (!image.ok()) {
    return GatewayResult::failure(image.status());
  }
  return GatewayResult::success(
      std::make_unique<EmbeddingGateway>(std::move(text.value()), std::move(image.value())));
}

} // namespace memoryos::memory

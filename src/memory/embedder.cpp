#include "memoryos/memory/embedder.hpp"

#include "memoryos/common/fs.hpp"
#include "memoryos/memory/embedder_local.hpp"
#include "memoryos/memory/embedder_ollama.hpp"

namespace memoryos::memory {

common::Result<std::vector<std::vector<float>>>
ITextEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return common::Result<std::vector<std::vector<float>>>::failure(emb.status());
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

common::Result<std::unique_ptr<ITextEmbedder>>
create_text_embedder(const config::Config &config, std::shared_ptr<HttpClient> http_client) {
  using TextResult = common::Result<std::unique_ptr<ITextEmbedder>>;
  const auto &embedding = config.embedding;
  const std::string provider = common::to_lower(common::trim(embedding.text_provider));

  if (provider == "local") {
    return TextResult::success(std::make_unique<LocalTextEmbedder>(embedding.text_dimensions));
  }
  if (provider == "ollama") {
    if (http_client == nullptr) {
      http_client = std::make_shared<CurlHttpClient>();
    }
    return TextResult::success(std::make_unique<OllamaEmbedder>(
        embedding.ollama_url, embedding.text_model, embedding.text_dimensions,
        embedding.timeout_ms, std::move(http_client)));
  }
  return TextResult::failure(common::ErrorCode::InvalidArgument,
                             "unknown text embedding provider: " + embedding.text_provider);
}

common::Result<std::unique_ptr<IImageEmbedder>> create_image_embedder(const config::Config &config) {
  using ImageResult = common::Result<std::unique_ptr<IImageEmbedder>>;
  const std::string provider = common::to_lower(common::trim(config.embedding.image_provider));
  if (provider == "local") {
    return ImageResult::success(
        std::make_unique<LocalImageEmbedder>(config.embedding.visual_dimensions));
  }
  return ImageResult::failure(common::ErrorCode::InvalidArgument,
                              "unknown image embedding provider: " +
                                  config.embedding.image_provider);
}

} // namespace memoryos::memory

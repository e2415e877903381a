#pragma once

#include "memoryos/memory/embedder.hpp"
#include "memoryos/memory/http_client.hpp"

#include <memory>

namespace memoryos::memory {

/// Text embeddings from a local Ollama server (POST /api/embed).
class OllamaEmbedder final : public ITextEmbedder {
public:
  OllamaEmbedder(std::string base_url, std::string model, std::size_t dimensions,
                 std::uint64_t timeout_ms,
                 std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override { return "ollama"; }
  [[nodiscard]] std::string model() const override { return model_; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

private:
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  request(const std::string &input_json, std::size_t expected);

  std::string base_url_;
  std::string model_;
  std::size_t dimensions_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace memoryos::memory

#include "memoryos/memory/embedder_ollama.hpp"

#include "memoryos/common/fs.hpp"
#include "memoryos/common/json_util.hpp"

#include <sstream>

namespace memoryos::memory {

namespace {

using Vectors = std::vector<std::vector<float>>;

common::Result<Vectors> parse_embeddings(const std::string &body) {
  std::string outer = common::json_get_array(body, "embeddings");
  if (outer.empty()) {
    // Older servers answer /api/embeddings with a single "embedding" array.
    const std::string single = common::json_get_array(body, "embedding");
    if (single.empty()) {
      return common::Result<Vectors>::failure(common::ErrorCode::Unavailable,
                                              "embedding field missing in response");
    }
    outer = "[" + single + "]";
  }

  Vectors vectors;
  std::size_t pos = 1;
  while (pos < outer.size()) {
    pos = common::json_skip_ws(outer, pos);
    if (pos >= outer.size() || outer[pos] == ']') {
      break;
    }
    if (outer[pos] == ',') {
      ++pos;
      continue;
    }
    const std::size_t end = common::json_find_matching_token(outer, pos, '[', ']');
    if (end == std::string::npos) {
      return common::Result<Vectors>::failure(common::ErrorCode::Unavailable,
                                              "malformed embeddings array");
    }
    const auto numbers = common::json_parse_number_array(outer.substr(pos, end - pos + 1));
    if (!numbers.has_value()) {
      return common::Result<Vectors>::failure(common::ErrorCode::Unavailable,
                                              "invalid embedding value");
    }
    vectors.emplace_back(numbers->begin(), numbers->end());
    pos = end + 1;
  }
  return common::Result<Vectors>::success(std::move(vectors));
}

} // namespace

OllamaEmbedder::OllamaEmbedder(std::string base_url, std::string model,
                               const std::size_t dimensions, const std::uint64_t timeout_ms,
                               std::shared_ptr<HttpClient> http_client)
    : base_url_(std::move(base_url)), model_(std::move(model)), dimensions_(dimensions),
      timeout_ms_(timeout_ms), http_client_(std::move(http_client)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

common::Result<Vectors> OllamaEmbedder::request(const std::string &input_json,
                                                const std::size_t expected) {
  std::ostringstream body;
  body << "{\"model\":\"" << common::json_escape(model_) << "\",\"input\":" << input_json << "}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
  };
  const auto response = http_client_->post_json(base_url_ + "/api/embed", headers, body.str(),
                                                timeout_ms_);
  if (response.timeout) {
    return common::Result<Vectors>::failure(common::ErrorCode::Unavailable,
                                            "ollama request timed out");
  }
  if (response.network_error) {
    return common::Result<Vectors>::failure(common::ErrorCode::Unavailable,
                                            "ollama unreachable: " +
                                                response.network_error_message);
  }
  if (response.status == 400) {
    // Ollama rejects inputs it cannot tokenize with a 400.
    return common::Result<Vectors>::failure(common::ErrorCode::EncodingError,
                                            "ollama rejected input: " +
                                                common::json_get_string(response.body, "error"));
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<Vectors>::failure(common::ErrorCode::Unavailable,
                                            "ollama returned HTTP " +
                                                std::to_string(response.status));
  }

  auto parsed = parse_embeddings(response.body);
  if (!parsed.ok()) {
    return parsed;
  }
  if (parsed.value().size() != expected) {
    return common::Result<Vectors>::failure(common::ErrorCode::Unavailable,
                                            "ollama returned " +
                                                std::to_string(parsed.value().size()) +
                                                " embeddings for " + std::to_string(expected) +
                                                " inputs");
  }
  for (const auto &vector : parsed.value()) {
    if (vector.size() != dimensions_) {
      return common::Result<Vectors>::failure(
          common::ErrorCode::DimensionMismatch,
          "model " + model_ + " produced " + std::to_string(vector.size()) +
              "-d vectors, expected " + std::to_string(dimensions_));
    }
  }
  return parsed;
}

common::Result<std::vector<float>> OllamaEmbedder::embed(const std::string_view text) {
  if (common::trim(std::string(text)).empty()) {
    return common::Result<std::vector<float>>::failure(common::ErrorCode::EncodingError,
                                                       "cannot embed empty text");
  }
  auto vectors = request("\"" + common::json_escape(std::string(text)) + "\"", 1);
  if (!vectors.ok()) {
    return common::Result<std::vector<float>>::failure(vectors.status());
  }
  return common::Result<std::vector<float>>::success(std::move(vectors.value().front()));
}

common::Result<Vectors> OllamaEmbedder::embed_batch(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return common::Result<Vectors>::success({});
  }
  std::string input = "[";
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (common::trim(texts[i]).empty()) {
      return common::Result<Vectors>::failure(common::ErrorCode::EncodingError,
                                              "cannot embed empty text at index " +
                                                  std::to_string(i));
    }
    if (i > 0) {
      input += ",";
    }
    input += "\"" + common::json_escape(texts[i]) + "\"";
  }
  input += "]";
  return request(input, texts.size());
}

} // namespace memoryos::memory

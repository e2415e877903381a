#pragma once

#include "memoryos/config/schema.hpp"
#include "memoryos/memory/embedder_local.hpp"
#include "memoryos/memory/embedding_gateway.hpp"
#include "memoryos/memory/http_client.hpp"
#include "memoryos/observability/observer.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace memoryos::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  void create_binary_file(const std::string &name, const std::vector<std::uint8_t> &bytes) const;

private:
  std::filesystem::path path_;
};

/// Local encoders, data under the workspace, observability off.
config::Config temp_config(const TempWorkspace &workspace);

/// Local text encoder with failure injection by call number or text content.
class ScriptedTextEmbedder final : public memory::ITextEmbedder {
public:
  explicit ScriptedTextEmbedder(std::size_t dimensions = 384);

  /// The n-th call (1-based) fails with code.
  void fail_on_call(std::size_t call, common::ErrorCode code);
  /// The n-th call (1-based) returns a vector one element too long.
  void wrong_dimensions_on_call(std::size_t call);
  /// Any text containing needle fails with EncodingError.
  void reject_text_containing(std::string needle);
  [[nodiscard]] std::size_t calls() const;
  /// The next text containing needle blocks inside embed() until release_held().
  void hold_text_containing(std::string needle);
  /// True once a call is blocked, false if none blocks within timeout.
  [[nodiscard]] bool wait_until_held(std::chrono::milliseconds timeout);
  /// Unblocks the held call; with a code it fails instead of embedding.
  void release_held(std::optional<common::ErrorCode> code);

  [[nodiscard]] std::string_view name() const override { return "scripted"; }
  [[nodiscard]] std::string model() const override { return inner_.model(); }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return inner_.dimensions(); }

private:
  memory::LocalTextEmbedder inner_;
  mutable std::mutex mutex_;
  std::size_t calls_ = 0;
  std::optional<std::size_t> fail_call_;
  common::ErrorCode fail_code_ = common::ErrorCode::Unavailable;
  std::optional<std::size_t> wrong_dims_call_;
  std::vector<std::string> rejected_;
  std::condition_variable held_changed_;
  std::optional<std::string> held_needle_;
  bool holding_ = false;
  bool released_ = false;
  std::optional<common::ErrorCode> release_code_;
};

/// Local image encoder that can be told to fail every image.
class ScriptedImageEmbedder final : public memory::IImageEmbedder {
public:
  explicit ScriptedImageEmbedder(std::size_t dimensions = 512);

  void fail_images(common::ErrorCode code);
  /// embed_text(query) returns the embedding of image, as a perfect text-to-image match.
  void map_text_to_image(std::string query, std::vector<std::uint8_t> image);

  [[nodiscard]] std::string_view name() const override { return "scripted"; }
  [[nodiscard]] common::Result<std::vector<float>>
  embed_image(const std::vector<std::uint8_t> &bytes) override;
  [[nodiscard]] common::Result<std::vector<float>> embed_text(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return inner_.dimensions(); }

private:
  memory::LocalImageEmbedder inner_;
  std::optional<common::ErrorCode> fail_code_;
  std::unordered_map<std::string, std::vector<std::uint8_t>> text_to_image_;
};

struct ScriptedGateway {
  std::unique_ptr<memory::EmbeddingGateway> gateway;
  ScriptedTextEmbedder *text = nullptr;
  ScriptedImageEmbedder *image = nullptr;
};

/// Gateway over scripted encoders; the raw pointers stay valid while the gateway lives.
ScriptedGateway make_scripted_gateway(std::size_t text_dimensions = 384);

struct RecordedRequest {
  std::string url;
  std::string body;
  std::uint64_t timeout_ms = 0;
};

class MockHttpClient final : public memory::HttpClient {
public:
  void push_response(memory::HttpResponse response);
  [[nodiscard]] const std::vector<RecordedRequest> &requests() const { return requests_; }

  [[nodiscard]] memory::HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;

private:
  std::deque<memory::HttpResponse> responses_;
  std::vector<RecordedRequest> requests_;
};

struct CapturedTelemetry {
  std::mutex mutex;
  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;

  template <typename Event> std::size_t count() {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t n = 0;
    for (const auto &event : events) {
      n += std::holds_alternative<Event>(event) ? 1 : 0;
    }
    return n;
  }
};

/// Installs a capturing global observer for its lifetime, then restores a no-op one.
class ScopedCapture {
public:
  ScopedCapture();
  ~ScopedCapture();

  ScopedCapture(const ScopedCapture &) = delete;
  ScopedCapture &operator=(const ScopedCapture &) = delete;

  [[nodiscard]] CapturedTelemetry &telemetry() { return *telemetry_; }

private:
  std::shared_ptr<CapturedTelemetry> telemetry_;
};

/// PNG signature followed by bytes derived from seed.
std::vector<std::uint8_t> fake_png(const std::string &seed);

/// Deterministic prose of at least min_chars bytes, sentences and paragraphs included.
std::string make_document(std::size_t min_chars);

} // namespace memoryos::testing

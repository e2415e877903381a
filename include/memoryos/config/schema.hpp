#pragma once

#include <cstddef>
#include <string>

namespace memoryos::config {

struct StorageConfig {
  std::string data_dir = "~/.memoryos/data";
  std::size_t flush_every = 0;
  bool auto_reconcile = false;
};

struct EmbeddingConfig {
  std::string text_provider = "local";
  std::string text_model = "bge-m3";
  std::size_t text_dimensions = 384;
  std::string ollama_url = "http://127.0.0.1:11434";
  std::size_t timeout_ms = 30'000;
  std::string image_provider = "local";
  std::size_t visual_dimensions = 512;
  std::size_t cache_size = 10'000;
};

struct ChunkingConfig {
  std::size_t max_chars = 512;
  std::size_t overlap_chars = 64;
};

struct SearchConfig {
  std::size_t fan_out_factor = 3;
  std::size_t default_top_k = 5;
  double visual_min_score = 0.22;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  StorageConfig storage;
  EmbeddingConfig embedding;
  ChunkingConfig chunking;
  SearchConfig search;
  ObservabilityConfig observability;
};

} // namespace memoryos::config

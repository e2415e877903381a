#include "bench_common.hpp"

#include "memoryos/config/schema.hpp"
#include "memoryos/memory/chunker.hpp"
#include "memoryos/memory/storage_manager.hpp"
#include "memoryos/memory/vector_index.hpp"
#include "memoryos/observability/global.hpp"
#include "memoryos/observability/noop_observer.hpp"

#include <filesystem>
#include <random>

namespace {

std::string bench_text(const int i) {
  return "benchmark note " + std::to_string(i) +
         " about storage layouts, vector search and the embedding cache. "
         "The quarterly review asked for faster recall across archived threads.";
}

} // namespace

void run_chunker_benchmark() {
  std::string document;
  for (int i = 0; i < 200; ++i) {
    document += bench_text(i);
    document += i % 4 == 3 ? "\n\n" : " ";
  }
  memoryos::bench::run_bench("chunk_text_30k", 200, [&] {
    (void)memoryos::memory::chunk_text(document, 512, 64);
  });
}

void run_vector_index_benchmark() {
  namespace mem = memoryos::memory;
  constexpr std::size_t kDims = 384;
  std::mt19937 rng(7);
  std::normal_distribution<float> dist(0.0F, 1.0F);
  auto random_vector = [&] {
    std::vector<float> v(kDims);
    for (auto &x : v) {
      x = dist(rng);
    }
    return v;
  };

  mem::VectorIndex index(mem::Modality::Text, kDims, mem::Metric::L2);
  memoryos::bench::run_bench("vector_index_add", 10000, [&] {
    static int i = 0;
    (void)index.add("chunk-" + std::to_string(i++), random_vector());
  });

  const auto query = random_vector();
  memoryos::bench::run_bench("vector_index_search_10k", 100, [&] { (void)index.search(query, 15); });
}

void run_storage_benchmark() {
  namespace mem = memoryos::memory;
  memoryos::observability::set_global_observer(
      std::make_unique<memoryos::observability::NoopObserver>());

  const auto data_dir = std::filesystem::temp_directory_path() / "memoryos-storage-bench";
  std::error_code ec;
  std::filesystem::remove_all(data_dir, ec);

  memoryos::config::Config config;
  config.storage.data_dir = data_dir.string();
  config.observability.backend = "none";
  auto manager = mem::StorageManager::open(config);
  if (!manager.ok()) {
    return;
  }

  memoryos::bench::run_bench("storage_ingest", 500, [&] {
    static int i = 0;
    mem::MemoryItem item;
    item.timestamp = "2026-03-14T09:00:00Z";
    item.content_type = mem::ContentType::Text;
    item.source = mem::Source::Clipboard;
    item.content_preview = "bench";
    (void)manager.value()->ingest(item, mem::RawContent{mem::TextContent{bench_text(i++)}});
  });

  mem::SearchRequest request;
  request.query = "faster recall across archived threads";
  memoryos::bench::run_bench("storage_search", 200, [&] { (void)manager.value()->search(request); });

  memoryos::bench::run_bench("storage_flush", 20, [&] { (void)manager.value()->flush(); });
  memoryos::bench::run_bench("storage_reconcile", 5, [&] { (void)manager.value()->reconcile(); });

  (void)manager.value()->close();
  std::filesystem::remove_all(data_dir, ec);
}

#include <benchmark/benchmark.h>
#include <quiver/engine/vector_index.hpp>
#include <quiver/storage/blob_store.hpp>

#include <memory>
#include <random>
#include <vector>

using namespace quiver;

namespace {

constexpr std::size_t kDim = 64;
constexpr std::size_t kBase = 10000;

auto dataset() -> const std::vector<float>& {
  static const std::vector<float> data = [] {
    std::mt19937 rng(1234);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> v(kBase * kDim);
    for (auto& x : v) x = dist(rng);
    return v;
  }();
  return data;
}

auto build(index::QuantizerKind kind) -> std::unique_ptr<engine::VectorIndex> {
  engine::IndexConfig cfg;
  cfg.dimension = kDim;
  cfg.hnsw.M = 16;
  cfg.hnsw.ef_construction = 100;
  cfg.quantizer.kind = kind;
  cfg.quantizer.m = 16;
  auto idx = engine::VectorIndex::create(cfg, std::make_shared<storage::MemoryBlobStore>());
  if (!idx) return nullptr;
  const auto& data = dataset();
  for (std::size_t i = 0; i < kBase; ++i) {
    if (!idx->insert(i, std::span<const float>(data.data() + i * kDim, kDim))) return nullptr;
  }
  if (kind != index::QuantizerKind::none && !idx->train_quantizer(data.data(), kBase)) return nullptr;
  return std::make_unique<engine::VectorIndex>(std::move(*idx));
}

} // namespace

static void BenchSearch(benchmark::State& state){
  const auto kind = static_cast<index::QuantizerKind>(state.range(0));
  auto idx = build(kind);
  if (!idx) { state.SkipWithError("index build failed"); return; }

  engine::SearchParams params;
  params.ef = static_cast<std::uint32_t>(state.range(1));
  const auto& data = dataset();
  std::size_t q = 0;
  for (auto _ : state) {
    auto r = idx->search(std::span<const float>(data.data() + q * kDim, kDim), 10, params);
    benchmark::DoNotOptimize(r);
    q = (q + 97) % kBase;
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BenchSearch)
  ->Args({static_cast<int>(index::QuantizerKind::none), 64})
  ->Args({static_cast<int>(index::QuantizerKind::none), 256})
  ->Args({static_cast<int>(index::QuantizerKind::scalar), 64})
  ->Args({static_cast<int>(index::QuantizerKind::product), 64})
  ->Unit(benchmark::kMicrosecond);

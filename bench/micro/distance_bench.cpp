#include <benchmark/benchmark.h>
#include <quiver/index/quantizer.hpp>
#include <quiver/kernels/dispatch.hpp>
#include <quiver/kernels/distance.hpp>

#include <random>
#include <string>
#include <vector>

using namespace quiver::kernels;

static void BenchL2Sq(benchmark::State& state){
  const auto d = static_cast<std::size_t>(state.range(0));
  std::vector<float> a(d), b(d);
  for (std::size_t i=0;i<d;++i){ a[i]=i*1.0f; b[i]=(d-1-i)*1.0f; }
  for (auto _ : state) {
    benchmark::DoNotOptimize(l2_sq(a, b));
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BenchL2Sq)->Arg(64)->Arg(128)->Arg(768);

static void BenchIP(benchmark::State& state){
  const auto d = static_cast<std::size_t>(state.range(0));
  std::vector<float> a(d), b(d);
  for (std::size_t i=0;i<d;++i){ a[i]=i*0.5f; b[i]=(d-1-i)*0.25f; }
  for (auto _ : state) {
    benchmark::DoNotOptimize(inner_product(a, b));
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BenchIP)->Arg(64)->Arg(128)->Arg(768);

static void BenchL2_Auto(benchmark::State& state){
  const auto d = static_cast<std::size_t>(state.range(0));
  std::vector<float> a(d), b(d);
  for (std::size_t i=0;i<d;++i){ a[i]=i*0.25f; b[i]=(d-1-i)*0.5f; }
  const auto& ops = select_backend_auto();
  state.SetLabel(std::string(ops.name));
  for (auto _ : state) { benchmark::DoNotOptimize(ops.l2_sq(a,b)); }
}
BENCHMARK(BenchL2_Auto)->Arg(128)->Arg(768);

// Table lookups against a trained product codebook, one code per iteration.
static void BenchPqAdc(benchmark::State& state){
  constexpr std::size_t d = 128, n = 4096;
  std::mt19937 rng(7);
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<float> data(n * d);
  for (auto& v : data) v = dist(rng);

  quiver::index::QuantizerConfig cfg;
  cfg.kind = quiver::index::QuantizerKind::product;
  cfg.m = static_cast<std::uint32_t>(state.range(0));
  cfg.nbits = 8;
  cfg.max_iter = 10;
  auto cb = quiver::index::train_codebook(data.data(), n, d, cfg);
  if (!cb) { state.SkipWithError(cb.error().message.c_str()); return; }

  std::vector<std::uint8_t> codes(n * (*cb)->code_size());
  if (!(*cb)->encode_batch(data.data(), n, codes.data())) { state.SkipWithError("encode failed"); return; }
  auto table = (*cb)->make_table(std::span<const float>(data.data(), d), quiver::index::Metric::l2);
  if (!table) { state.SkipWithError(table.error().message.c_str()); return; }

  const auto cs = (*cb)->code_size();
  std::size_t i = 0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(table->distance(std::span<const std::uint8_t>(codes.data() + i * cs, cs)));
    i = (i + 1) % n;
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BenchPqAdc)->Arg(8)->Arg(16);

#include <benchmark/benchmark.h>
#include <vista/collection.hpp>
#include <vista/kernels/distance.hpp>

#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>

using namespace vista;

namespace {

std::vector<float> random_rows(std::size_t n, std::size_t dim, std::uint32_t seed) {
  std::mt19937 gen(seed);
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<float> out(n * dim);
  for (auto& x : out) x = dist(gen);
  return out;
}

collection make_collection(index::IndexStrategy strategy, std::size_t n, std::size_t dim) {
  collection_config cfg;
  cfg.dimension = dim;
  cfg.index.strategy = strategy;
  cfg.index.num_partitions = 64;
  cfg.index.probe_count = 8;
  cfg.consistency.background = false;
  auto c = collection::create(cfg);
  if (!c) std::abort();
  const auto rows = random_rows(n, dim, 7);
  char id[32];
  for (std::size_t i = 0; i < n; ++i) {
    std::snprintf(id, sizeof(id), "img-%08zu", i);
    std::vector<float> v(rows.begin() + i * dim, rows.begin() + (i + 1) * dim);
    if (!c->insert(id, std::move(v))) std::abort();
  }
  if (!c->rebuild()) std::abort();
  return std::move(*c);
}

} // namespace

static void BenchL2Sq512(benchmark::State& state){
  const auto a = random_rows(1, 512, 1);
  const auto b = random_rows(1, 512, 2);
  for (auto _ : state) {
    benchmark::DoNotOptimize(kernels::l2_sq(a, b));
  }
}
BENCHMARK(BenchL2Sq512);

static void BenchCosine512(benchmark::State& state){
  const auto a = random_rows(1, 512, 1);
  const auto b = random_rows(1, 512, 2);
  for (auto _ : state) {
    benchmark::DoNotOptimize(kernels::cosine_similarity(a, b));
  }
}
BENCHMARK(BenchCosine512);

static void BenchQuery(benchmark::State& state, index::IndexStrategy strategy){
  const auto n = static_cast<std::size_t>(state.range(0));
  constexpr std::size_t dim = 128;
  const auto c = make_collection(strategy, n, dim);
  const auto q = random_rows(1, dim, 11);
  for (auto _ : state) {
    auto r = c.query(q, 10);
    benchmark::DoNotOptimize(r);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK_CAPTURE(BenchQuery, exact, index::IndexStrategy::Exact)->Arg(10'000)->Arg(50'000);
BENCHMARK_CAPTURE(BenchQuery, partitioned, index::IndexStrategy::Partitioned)->Arg(10'000)->Arg(50'000);

static void BenchPartitionedBuild(benchmark::State& state){
  const auto n = static_cast<std::size_t>(state.range(0));
  constexpr std::size_t dim = 128;
  auto c = make_collection(index::IndexStrategy::Partitioned, n, dim);
  for (auto _ : state) {
    if (!c.rebuild(true)) state.SkipWithError("rebuild failed");
  }
}
BENCHMARK(BenchPartitionedBuild)->Arg(10'000)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();

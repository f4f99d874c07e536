#include <benchmark/benchmark.h>
#include "detection/baseline_calculator.hpp"
#include <random>

using namespace apwatch;

namespace {

std::vector<Money> random_amounts(std::size_t n) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<Money::underlying_type> cents(1000, 500000);
    std::vector<Money> amounts;
    amounts.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        amounts.push_back(Money::from_cents(cents(rng)));
    }
    return amounts;
}

}  // namespace

// Benchmark single-pass statistics over a vendor's window
static void BM_ComputeStats(benchmark::State& state) {
    auto amounts = random_amounts(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        benchmark::DoNotOptimize(BaselineCalculator::compute_stats(amounts));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ComputeStats)->Range(8, 8192);

// Benchmark large amounts with tiny spread (numerical stability path)
static void BM_ComputeStatsNarrowSpread(benchmark::State& state) {
    std::vector<Money> amounts;
    for (int i = 0; i < 1000; ++i) {
        amounts.push_back(Money::from_cents(1'000'000'000 + (i % 3)));
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(BaselineCalculator::compute_stats(amounts));
    }
}
BENCHMARK(BM_ComputeStatsNarrowSpread);

BENCHMARK_MAIN();

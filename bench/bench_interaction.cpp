/**
 * @file  bench/bench_interaction.cpp
 * @brief Google Benchmark suite for neighbor search and the interaction tests.
 *
 * Benchmarks
 * ----------
 *   BM_Spatial_BruteForce / BM_Spatial_Indexed  — threshold relation build
 *   BM_Temporal_Sweep                           — sorted-window relation build
 *   BM_KNearest_Indexed                         — Jacquez k-NN build
 *   BM_Knox_Permutations                        — global Knox, 99 trials
 *   BM_LocalKnox_Permutations                   — local Knox, 99 trials
 *   BM_Mantel_Permutations                      — Mantel, 99 trials
 *
 * Build (CMake):
 *   cmake -DSTINT_BENCH=ON ..
 *   cmake --build build --target bench_interaction
 *   ./build/bench_interaction --benchmark_format=json
 *
 * Throughput units: items/second (events processed).
 */

#include "benchmark/benchmark.h"

#include "stint/knox.hpp"
#include "stint/mantel.hpp"
#include "stint/neighbors.hpp"

#include <cstddef>
#include <random>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N events uniform on a 1000 × 1000 square over one year, fixed seed.
static stint::EventSet make_events(std::size_t n) {
    std::mt19937 rng(12345u);
    std::uniform_real_distribution<double> coord(0.0, 1000.0);
    std::uniform_real_distribution<double> day(0.0, 365.0);
    std::vector<double> x(n), y(n), t(n);
    for (std::size_t i = 0; i < n; ++i) {
        x[i] = coord(rng);
        y[i] = coord(rng);
        t[i] = day(rng);
    }
    return stint::EventSet(x, y, t);
}

static void set_items(benchmark::State& state) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}

// ── Neighbor search ────────────────────────────────────────────────────────────

static void BM_Spatial_BruteForce(benchmark::State& state) {
    const auto events = make_events(static_cast<std::size_t>(state.range(0)));
    const Eigen::MatrixXd pts = events.space();
    for (auto _ : state) {
        auto sets = stint::brute_force_neighbors(pts, 20.0);
        benchmark::DoNotOptimize(sets);
    }
    set_items(state);
}
BENCHMARK(BM_Spatial_BruteForce)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

static void BM_Spatial_Indexed(benchmark::State& state) {
    const auto events = make_events(static_cast<std::size_t>(state.range(0)));
    const Eigen::MatrixXd pts = events.space();
    for (auto _ : state) {
        auto sets = stint::indexed_neighbors(pts, 20.0);
        benchmark::DoNotOptimize(sets);
    }
    set_items(state);
}
BENCHMARK(BM_Spatial_Indexed)->RangeMultiplier(4)->Range(64, 16384)->Unit(benchmark::kMicrosecond);

static void BM_Temporal_Sweep(benchmark::State& state) {
    const auto events = make_events(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto sets = stint::temporal_neighbors(events.time(), 2.0);
        benchmark::DoNotOptimize(sets);
    }
    set_items(state);
}
BENCHMARK(BM_Temporal_Sweep)->RangeMultiplier(4)->Range(64, 16384)->Unit(benchmark::kMicrosecond);

static void BM_KNearest_Indexed(benchmark::State& state) {
    const auto events = make_events(static_cast<std::size_t>(state.range(0)));
    const Eigen::MatrixXd pts = events.space();
    for (auto _ : state) {
        auto sets = stint::k_nearest_neighbors(pts, 5);
        benchmark::DoNotOptimize(sets);
    }
    set_items(state);
}
BENCHMARK(BM_KNearest_Indexed)->RangeMultiplier(4)->Range(64, 16384)->Unit(benchmark::kMicrosecond);

// ── Permutation tests ──────────────────────────────────────────────────────────

static void BM_Knox_Permutations(benchmark::State& state) {
    const auto events = make_events(static_cast<std::size_t>(state.range(0)));
    const stint::KnoxConfig config{.delta = 20.0, .tau = 2.0, .permutations = 99};
    stint::PermutationEngine engine(1u);
    for (auto _ : state) {
        auto r = stint::knox(events, config, engine);
        benchmark::DoNotOptimize(r);
    }
    set_items(state);
}
BENCHMARK(BM_Knox_Permutations)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMillisecond);

static void BM_LocalKnox_Permutations(benchmark::State& state) {
    const auto events = make_events(static_cast<std::size_t>(state.range(0)));
    const stint::KnoxConfig config{.delta = 20.0, .tau = 2.0, .permutations = 99};
    stint::PermutationEngine engine(1u);
    for (auto _ : state) {
        auto r = stint::local_knox(events, config, engine);
        benchmark::DoNotOptimize(r);
    }
    set_items(state);
}
BENCHMARK(BM_LocalKnox_Permutations)->RangeMultiplier(4)->Range(64, 1024)->Unit(benchmark::kMillisecond);

static void BM_Mantel_Permutations(benchmark::State& state) {
    const auto events = make_events(static_cast<std::size_t>(state.range(0)));
    stint::MantelConfig config;
    stint::PermutationEngine engine(1u);
    for (auto _ : state) {
        auto r = stint::mantel(events, config, engine);
        benchmark::DoNotOptimize(r);
    }
    set_items(state);
}
BENCHMARK(BM_Mantel_Permutations)->RangeMultiplier(4)->Range(64, 1024)->Unit(benchmark::kMillisecond);

/**
 * @file  bench/bench_estimators.cpp
 * @brief Google Benchmark suite for the information estimators and the CWT.
 *
 * Benchmarks
 * ----------
 *   BM_EQQ2_CMI / BM_GCM_CMI          binned families, d = 1 and d = 3
 *   BM_KSG_CMI_KdTree / _BruteForce   neighbour-search strategies
 *   BM_Wavelet_Decompose              one scale of the Morlet transform
 *   BM_Surrogate_Realize              FT realization
 *
 * Build (CMake):
 *   cmake -B build -DCMIMAP_BUILD_BENCH=ON
 *   cmake --build build --target bench_estimators
 *   ./build/bench_estimators --benchmark_format=json
 *
 * Throughput units: items/second (samples processed).
 */

#include "benchmark/benchmark.h"

#include "cmimap/information.hpp"
#include "cmimap/surrogates.hpp"
#include "cmimap/wavelet.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <random>
#include <vector>

using namespace cmimap;
using namespace cmimap::information;

// ── Fixture helpers ────────────────────────────────────────────────────────────

namespace {

struct Triple {
    std::vector<double> x;
    std::vector<double> y;
    SampleMatrix        z;
};

/// x drives y one step later; z holds `dim` lagged copies of y.
Triple make_triple(std::size_t n, int dim) {
    std::mt19937_64 rng(1);
    std::normal_distribution<double> g(0.0, 1.0);
    std::vector<double> raw_x(n + 8);
    std::vector<double> raw_y(n + 8);
    for (std::size_t t = 0; t < raw_x.size(); ++t) {
        raw_x[t] = g(rng);
        raw_y[t] = (t > 0 ? 0.6 * raw_x[t - 1] + 0.3 * raw_y[t - 1] : 0.0) + g(rng);
    }
    Triple tr;
    tr.x.assign(raw_x.begin() + 4, raw_x.begin() + 4 + static_cast<long>(n));
    tr.y.assign(raw_y.begin() + 5, raw_y.begin() + 5 + static_cast<long>(n));
    tr.z.resize(static_cast<Eigen::Index>(n), dim);
    for (std::size_t t = 0; t < n; ++t) {
        for (int c = 0; c < dim; ++c) {
            tr.z(static_cast<Eigen::Index>(t), c) = raw_y[t + 4 - static_cast<std::size_t>(c)];
        }
    }
    return tr;
}

std::vector<double> make_series(std::size_t n) {
    std::mt19937_64 rng(2);
    std::normal_distribution<double> g(0.0, 0.3);
    std::vector<double> s(n);
    for (std::size_t t = 0; t < n; ++t) {
        s[t] = std::sin(2.0 * std::numbers::pi * static_cast<double>(t) / 48.0) + g(rng);
    }
    return s;
}

void set_throughput(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

} // namespace

// ── Binned estimators ──────────────────────────────────────────────────────────

static void BM_EQQ2_CMI(benchmark::State& state) {
    const auto n  = static_cast<std::size_t>(state.range(0));
    const auto tr = make_triple(n, 1);
    for (auto _ : state) {
        auto v = conditional_mutual_information(tr.x, tr.y, tr.z, BinnedEstimator::EQQ2, 4);
        benchmark::DoNotOptimize(v);
    }
    set_throughput(state, n);
}
BENCHMARK(BM_EQQ2_CMI)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

static void BM_GCM_CMI(benchmark::State& state) {
    const auto n  = static_cast<std::size_t>(state.range(0));
    const auto tr = make_triple(n, 3);
    for (auto _ : state) {
        auto v = conditional_mutual_information(tr.x, tr.y, tr.z, BinnedEstimator::GCM, 4);
        benchmark::DoNotOptimize(v);
    }
    set_throughput(state, n);
}
BENCHMARK(BM_GCM_CMI)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

// ── KSG estimators ─────────────────────────────────────────────────────────────

static void BM_KSG_CMI_KdTree(benchmark::State& state) {
    const auto n  = static_cast<std::size_t>(state.range(0));
    const auto tr = make_triple(n, 3);
    for (auto _ : state) {
        auto v = knn_conditional_mutual_information(tr.x, tr.y, tr.z, 64, NeighborSearch::KdTree);
        benchmark::DoNotOptimize(v);
    }
    set_throughput(state, n);
}
BENCHMARK(BM_KSG_CMI_KdTree)->RangeMultiplier(2)->Range(256, 4096)->Unit(benchmark::kMillisecond);

static void BM_KSG_CMI_BruteForce(benchmark::State& state) {
    const auto n  = static_cast<std::size_t>(state.range(0));
    const auto tr = make_triple(n, 3);
    for (auto _ : state) {
        auto v = knn_conditional_mutual_information(tr.x, tr.y, tr.z, 64, NeighborSearch::BruteForce);
        benchmark::DoNotOptimize(v);
    }
    set_throughput(state, n);
}
BENCHMARK(BM_KSG_CMI_BruteForce)->RangeMultiplier(2)->Range(256, 4096)->Unit(benchmark::kMillisecond);

// ── Spectral ───────────────────────────────────────────────────────────────────

static void BM_Wavelet_Decompose(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto s = make_series(n);
    for (auto _ : state) {
        auto pa = spectral::WaveletTransform::decompose(s, 48.0);
        benchmark::DoNotOptimize(pa);
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Wavelet_Decompose)->RangeMultiplier(2)->Range(512, 8192)->Unit(benchmark::kMicrosecond);

static void BM_Surrogate_Realize(benchmark::State& state) {
    const auto n    = static_cast<std::size_t>(state.range(0));
    const auto tmpl = spectral::SurrogateTemplate::bind(make_series(n));
    spectral::Rng rng(3);
    for (auto _ : state) {
        auto y = tmpl->realize(rng);
        benchmark::DoNotOptimize(y.data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Surrogate_Realize)->RangeMultiplier(2)->Range(512, 8192)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();

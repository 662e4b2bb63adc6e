/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests: series → observed bundle + surrogate ensemble on disk.
///
/// These tests exercise the complete path:
///   CSV / TimeSeries → Pipeline::prepare → InformationGridEngine →
///   SurrogateCoordinator → ResultsContainer::save → from_saved_file

#include "cmimap/archive.hpp"
#include "cmimap/errors.hpp"
#include "cmimap/pipeline.hpp"
#include "cmimap/results.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <numbers>
#include <random>
#include <string>

using namespace cmimap;
using namespace cmimap::core;
namespace fs = std::filesystem;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

/// `years` of monthly data from 1970: annual cycle, a 4-year oscillation
/// and AR(1) noise.
TimeSeries enso_like(int years = 20, unsigned seed = 17) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> g(0.0, 1.0);
    TimeSeries ts;
    double red = 0.0;
    for (int t = 0; t < years * 12; ++t) {
        red = 0.5 * red + 0.4 * g(rng);
        const double tt = static_cast<double>(t);
        ts.timestamps.push_back(Date{1970 + t / 12, t % 12 + 1, 1});
        ts.values.push_back(26.0 + 1.5 * std::cos(2.0 * std::numbers::pi * tt / 12.0) +
                            std::sin(2.0 * std::numbers::pi * tt / 48.0) + red);
    }
    return ts;
}

/// Small, fast configuration writing into a fresh temp prefix.
RunConfig small_run(const std::string& tag) {
    RunConfig cfg;
    cfg.scales.first          = 5;
    cfg.scales.last           = 7;
    cfg.estimators.knn_k      = 8;
    cfg.surrogates.count      = 2;
    cfg.surrogates.workers    = 1;
    cfg.surrogates.seed       = 42;
    cfg.output.prefix =
        (fs::temp_directory_path() / fmt::format("cmimap_it_{}", tag)).string();
    fs::remove(cfg.output.data_file());
    fs::remove(cfg.output.surrogates_file());
    return cfg;
}

std::string slurp(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

} // namespace

// ─── Test 1: Both archives written and readable ───────────────────────────────

TEST(FullPipeline, WritesObservedAndEnsembleArchives) {
    const auto cfg = small_run("basic");
    const Pipeline pipeline(cfg);
    const auto summary = pipeline.run(enso_like());

    EXPECT_EQ(summary.scale_count, 3u);
    EXPECT_EQ(summary.series_length, 240u);
    EXPECT_EQ(summary.surrogate_count, 2u);
    ASSERT_TRUE(fs::exists(cfg.output.data_file()));
    ASSERT_TRUE(fs::exists(cfg.output.surrogates_file()));

    const auto observed = results::ResultsContainer::from_saved_file(cfg.output.data_file());
    EXPECT_FALSE(observed.is_ensemble());
    ASSERT_EQ(observed.bundle_count(), 1u);
    EXPECT_EQ(observed.bundles()[0].scale_count(), 3u);

    const auto ensemble = results::ResultsContainer::from_saved_file(cfg.output.surrogates_file());
    EXPECT_TRUE(ensemble.is_ensemble());
    EXPECT_EQ(ensemble.bundle_count(), 2u);

    const auto flat = ensemble.flatten();
    EXPECT_EQ(flat.size(), 8u);
    for (const auto& [key, array] : flat) {
        EXPECT_EQ(array.shape, (std::vector<std::size_t>{3, 3, 2})) << key;
        for (double v : array.data) EXPECT_TRUE(std::isfinite(v)) << key;
    }
}

TEST(FullPipeline, ObservedMatchesDirectComputation) {
    const auto cfg = small_run("direct");
    const Pipeline pipeline(cfg);
    (void)pipeline.run(enso_like());

    const auto field = pipeline.prepare(enso_like());
    const auto direct = pipeline.compute_observed(field);
    const auto loaded = results::ResultsContainer::from_saved_file(cfg.output.data_file());
    EXPECT_EQ(loaded.flatten(), direct.flatten());
}

// ─── Test 2: Reproducibility ──────────────────────────────────────────────────

TEST(FullPipeline, SameSeedGivesIdenticalArchives) {
    auto cfg_a = small_run("seed_a");
    auto cfg_b = small_run("seed_b");
    cfg_b.surrogates.workers = 2;

    (void)Pipeline(cfg_a).run(enso_like());
    (void)Pipeline(cfg_b).run(enso_like());

    EXPECT_EQ(slurp(cfg_a.output.data_file()), slurp(cfg_b.output.data_file()));

    // Arrival order may differ between worker counts; compare as multisets.
    const auto a = results::ResultsContainer::from_saved_file(cfg_a.output.surrogates_file());
    const auto b = results::ResultsContainer::from_saved_file(cfg_b.output.surrogates_file());
    auto sorted_cells = [](const results::ResultsContainer& c) {
        std::vector<double> v;
        for (const auto& bundle : c.bundles()) v.push_back(bundle.phase_amp_mi.knn(0, 0));
        std::sort(v.begin(), v.end());
        return v;
    };
    EXPECT_EQ(sorted_cells(a), sorted_cells(b));
}

TEST(FullPipeline, DifferentSeedChangesEnsemble) {
    auto cfg_a = small_run("diff_a");
    auto cfg_b = small_run("diff_b");
    cfg_b.surrogates.seed = 43;

    (void)Pipeline(cfg_a).run(enso_like());
    (void)Pipeline(cfg_b).run(enso_like());

    EXPECT_EQ(slurp(cfg_a.output.data_file()), slurp(cfg_b.output.data_file()));
    EXPECT_NE(slurp(cfg_a.output.surrogates_file()), slurp(cfg_b.output.surrogates_file()));
}

// ─── Test 3: Failure modes persist nothing ────────────────────────────────────

TEST(FullPipeline, InvalidConfigRejectedAtConstruction) {
    auto cfg = small_run("bad_cfg");
    cfg.estimators.max_lag = 1;
    EXPECT_THROW(Pipeline{cfg}, ConfigError);

    cfg = small_run("bad_scales");
    cfg.scales.first = 9;
    cfg.scales.last  = 7;
    EXPECT_THROW(Pipeline{cfg}, ConfigError);
}

TEST(FullPipeline, ShortSeriesIsPreconditionError) {
    const auto cfg = small_run("short");
    const Pipeline pipeline(cfg);
    EXPECT_THROW((void)pipeline.run(enso_like(3)), PreconditionError);
    EXPECT_FALSE(fs::exists(cfg.output.data_file()));
    EXPECT_FALSE(fs::exists(cfg.output.surrogates_file()));
}

TEST(FullPipeline, TooLargeKIsPreconditionError) {
    auto cfg = small_run("big_k");
    cfg.estimators.knn_k = 500;
    const Pipeline pipeline(cfg);
    EXPECT_THROW((void)pipeline.prepare(enso_like()), PreconditionError);
}

TEST(FullPipeline, ScaleBelowFourIsPreconditionError) {
    auto cfg = small_run("tiny_scale");
    cfg.scales.first = 3;
    const Pipeline pipeline(cfg);
    EXPECT_THROW((void)pipeline.prepare(enso_like()), PreconditionError);
}

// ─── Test 4: Loading from disk and the zero-surrogate run ─────────────────────

TEST(FullPipeline, RunLoadsCsvDataset) {
    const auto series = enso_like();
    const auto csv = fs::temp_directory_path() / "cmimap_it_input.csv";
    {
        std::ofstream out(csv);
        out << "time,value\n";
        for (std::size_t i = 0; i < series.size(); ++i) {
            out << series.timestamps[i].to_string() << ',' << fmt::format("{:.17g}", series.values[i])
                << '\n';
        }
    }

    auto cfg = small_run("csv");
    cfg.data.path = csv;
    const auto summary = Pipeline(cfg).run();
    EXPECT_EQ(summary.series_length, 240u);
    EXPECT_TRUE(fs::exists(cfg.output.data_file()));
}

TEST(FullPipeline, MissingDatasetIsIoError) {
    auto cfg = small_run("missing");
    cfg.data.path = fs::temp_directory_path() / "cmimap_it_does_not_exist.csv";
    EXPECT_THROW((void)Pipeline(cfg).run(), IoError);
}

TEST(FullPipeline, ZeroSurrogatesWritesOnlyObserved) {
    auto cfg = small_run("zero");
    cfg.surrogates.count = 0;
    const auto summary = Pipeline(cfg).run(enso_like());
    EXPECT_EQ(summary.surrogate_count, 0u);
    EXPECT_TRUE(fs::exists(cfg.output.data_file()));
    EXPECT_FALSE(fs::exists(cfg.output.surrogates_file()));
}

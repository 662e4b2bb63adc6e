/// @file src/core/pipeline.cpp
/// @brief Pipeline: prepare the field, compute observed and surrogate bundles.

#include "cmimap/pipeline.hpp"
#include "cmimap/coordinator.hpp"
#include "cmimap/data_loader.hpp"
#include "cmimap/errors.hpp"
#include "cmimap/grid_engine.hpp"

#include <fmt/format.h>

#include <cstdio>

namespace cmimap::core {

namespace {

RunConfig validated(RunConfig config) {
    if (auto problem = config.validate()) {
        throw ConfigError(*problem);
    }
    return config;
}

ScaleGrid checked_grid(const RunConfig& config) {
    auto grid = config.scale_grid();
    if (!grid) {
        throw ConfigError(fmt::format("empty scale range [{}, {}] step {}",
                                      config.scales.first, config.scales.last,
                                      config.scales.step));
    }
    return std::move(*grid);
}

grid::GridConfig grid_config(const RunConfig& config) noexcept {
    grid::GridConfig g;
    g.bins      = config.estimators.eqq_bins;
    g.k         = config.estimators.knn_k;
    g.max_lag   = config.estimators.max_lag;
    g.edge_trim = config.estimators.edge_trim;
    g.search    = config.estimators.kd_tree ? information::NeighborSearch::KdTree
                                            : information::NeighborSearch::BruteForce;
    return g;
}

} // namespace

Pipeline::Pipeline(RunConfig config)
    : config_(validated(std::move(config))), scales_(checked_grid(config_)) {}

// ─── prepare ──────────────────────────────────────────────────────────────────

PreparedField Pipeline::prepare(TimeSeries series) const {
    if (!series.is_valid() || series.empty()) {
        throw PreconditionError("input series is empty or has mismatched timestamps");
    }

    const auto& est = config_.estimators;
    const long n = static_cast<long>(series.size());
    const long min_length = 2L * constants::MONTHS_PER_YEAR +
                            2L * est.edge_trim * constants::MONTHS_PER_YEAR;
    if (n < min_length) {
        throw PreconditionError(fmt::format(
            "series has {} samples; at least {} needed (two years plus {} years trimmed per edge)",
            n, min_length, est.edge_trim));
    }

    // Shortest sample set any estimator sees: trimmed series minus the
    // largest lag and the widest phase-amplitude condition window.
    const long trimmed = n - 2L * est.edge_trim * constants::MONTHS_PER_YEAR;
    const long widest  = (constants::PHASE_AMP_CONDITION_DIM - 1) *
                         (scales_.values().back() / constants::PHASE_AMP_SMOOTHING_DIVISOR);
    const long shortest = trimmed - (est.max_lag - 1) - widest;
    if (shortest <= est.knn_k) {
        throw PreconditionError(fmt::format(
            "knn_k = {} needs more samples than the shortest lagged set ({})",
            est.knn_k, shortest));
    }
    if (scales_[0] < constants::PHASE_AMP_SMOOTHING_DIVISOR) {
        throw PreconditionError(fmt::format(
            "smallest scale {} gives zero phase-amplitude smoothing (need >= {})",
            scales_[0], constants::PHASE_AMP_SMOOTHING_DIVISOR));
    }

    // Surrogates are built from the deseasonalized copy; the observed series
    // keeps its seasonality and is only centered.
    TimeSeries anomalies = series;
    auto seasonality = spectral::extract_seasonality(anomalies);
    if (!seasonality) {
        throw PreconditionError("cannot extract seasonality: every calendar month needs a sample");
    }

    auto surrogate_template =
        spectral::SurrogateTemplate::bind(anomalies.values, config_.surrogates.algorithm);
    if (!surrogate_template) {
        throw PreconditionError("cannot bind surrogate template to the deseasonalized series");
    }

    spectral::recenter(series.values);
    return PreparedField{std::move(series), std::move(*seasonality), std::move(*surrogate_template)};
}

// ─── compute ──────────────────────────────────────────────────────────────────

results::ResultsContainer Pipeline::compute_observed(const PreparedField& field) const {
    const grid::InformationGridEngine engine(grid_config(config_));
    return results::ResultsContainer(engine.compute(field.observed.values, scales_));
}

results::ResultsContainer Pipeline::compute_surrogates(const PreparedField& field) const {
    const surrogate::SurrogateContext ctx{
        field.surrogate_template,
        field.seasonality,
        field.observed.timestamps,
        scales_,
        grid_config(config_),
        config_.surrogates.seed,
    };

    const surrogate::SurrogateCoordinator coordinator(
        surrogate::CoordinatorConfig{config_.surrogates.workers, config_.surrogates.timeout});

    auto bundles = coordinator.run(
        surrogate::make_surrogate_job(ctx), config_.surrogates.count,
        [](std::size_t done, std::size_t total) {
            fmt::print("[surrogates] {}/{}\n", done, total);
            std::fflush(stdout);
        });
    return results::ResultsContainer(std::move(bundles));
}

// ─── run ──────────────────────────────────────────────────────────────────────

RunSummary Pipeline::run() const {
    return run(DataLoader::load(config_.data));
}

RunSummary Pipeline::run(TimeSeries series) const {
    const PreparedField field = prepare(std::move(series));

    fmt::print("[cmimap] {} samples, {} scales ({}..{}), {} surrogates on {} workers\n",
               field.observed.size(), scales_.size(), scales_.values().front(),
               scales_.values().back(), config_.surrogates.count, config_.surrogates.workers);

    const auto observed = compute_observed(field);
    observed.save(config_.output.data_file());
    fmt::print("[cmimap] wrote {}\n", config_.output.data_file().string());

    RunSummary summary;
    summary.scale_count   = scales_.size();
    summary.series_length = field.observed.size();

    if (config_.surrogates.count == 0) {
        fmt::print("[cmimap] surrogate count is 0, no ensemble written\n");
        return summary;
    }

    const auto ensemble = compute_surrogates(field);
    ensemble.save(config_.output.surrogates_file());
    fmt::print("[cmimap] wrote {}\n", config_.output.surrogates_file().string());

    summary.surrogate_count = ensemble.bundle_count();
    return summary;
}

} // namespace cmimap::core

#pragma once

/// @file include/cmimap/pipeline.hpp
/// @brief Orchestrator: observed bundle, then the surrogate ensemble.
///
/// # Pipeline
///   1. Load the series (DataLoader)
///   2. Copy it, extract seasonality from the copy, bind the surrogate
///      template to the deseasonalized copy
///   3. Center the observed series and compute its bundle; validate; save
///   4. Run the coordinator for N surrogates; validate the ensemble; save
///
/// A stage that fails persists nothing.

#include "cmimap/config.hpp"
#include "cmimap/results.hpp"
#include "cmimap/seasonality.hpp"
#include "cmimap/surrogates.hpp"
#include "cmimap/types.hpp"

#include <functional>
#include <optional>

namespace cmimap::core {

/// The series and everything surrogate generation needs from it.
struct PreparedField {
    TimeSeries                         observed;     ///< centered, seasonality intact
    spectral::SeasonalityDecomposition seasonality;
    spectral::SurrogateTemplate        surrogate_template;
};

/// Outputs of a complete run.
struct RunSummary {
    std::size_t scale_count     = 0;
    std::size_t series_length   = 0;
    std::size_t surrogate_count = 0;
};

class Pipeline {
public:
    /// Throws `ConfigError` if `config.validate()` fails.
    explicit Pipeline(RunConfig config);

    /// Steps 2 and the centering of step 3. Throws `PreconditionError`.
    [[nodiscard]] PreparedField prepare(TimeSeries series) const;

    /// Observed-data bundle wrapped in a validated container.
    [[nodiscard]] results::ResultsContainer compute_observed(const PreparedField& field) const;

    /// Surrogate ensemble wrapped in a validated container.
    [[nodiscard]] results::ResultsContainer compute_surrogates(const PreparedField& field) const;

    /// Load, compute and save both outputs.
    RunSummary run() const;

    /// Same as `run` on an already-loaded series.
    RunSummary run(TimeSeries series) const;

    [[nodiscard]] const RunConfig& config() const noexcept { return config_; }

private:
    RunConfig config_;
    ScaleGrid scales_;
};

} // namespace cmimap::core

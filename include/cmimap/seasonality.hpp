#pragma once

/// @file include/cmimap/seasonality.hpp
/// @brief Monthly climatology: extraction, re-imposition, centering.
///
/// # Module: Seasonality
///
/// ## Responsibility
/// Split a monthly series into its seasonal cycle (per-calendar-month mean
/// and standard deviation) and standardized anomalies, and put the cycle
/// back onto a surrogate realization.
///
/// ## Formulas
///   anomaly_t  = (x_t − mean[m(t)]) / std[m(t)]
///   restored_t = anomaly_t · std[m(t)] + mean[m(t)]
///
/// A month whose standard deviation is below FLAT_STD_THRESHOLD is divided
/// by 1 so flat months never produce NaN.

#include "cmimap/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace cmimap::spectral {

/// Mean-cycle and variance-cycle of a monthly series.
///
/// The variance cycle is stored as a standard deviation (the factor that
/// re-imposition multiplies by). Both vectors have length 12, index 0 = Jan.
struct SeasonalityDecomposition {
    std::vector<double> mean_cycle;
    std::vector<double> std_cycle;

    [[nodiscard]] bool is_valid() const noexcept;
};

/// Compute the seasonal cycle of `series` and replace its values with
/// standardized anomalies.
///
/// # Returns
/// `nullopt` if the series is invalid or some calendar month has no sample.
[[nodiscard]] std::optional<SeasonalityDecomposition>
extract_seasonality(TimeSeries& series) noexcept;

/// values_t ← values_t · std[m(t)] + mean[m(t)]. Returns false (and leaves
/// the series untouched) if the decomposition is malformed or the series is
/// invalid.
[[nodiscard]] bool
reimpose_seasonality(TimeSeries& series, const SeasonalityDecomposition& s) noexcept;

/// Subtract the sample mean in place. No-op on empty input.
void recenter(std::span<double> values) noexcept;

/// Sample mean; 0 for empty input.
[[nodiscard]] double mean(std::span<const double> values) noexcept;

} // namespace cmimap::spectral

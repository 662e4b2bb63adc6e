#pragma once

/// @file include/cmimap/types.hpp
/// @brief Shared primitive types for the cross-scale CMI map (cmimap) system.
///
/// Every module includes this file. It defines the time-series value types,
/// the scale grid and the Eigen aliases used for measurement matrices.

#include <Eigen/Dense>

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cmimap {

// ─── Calendar ─────────────────────────────────────────────────────────────────

/// Calendar date of one sample. Monthly data uses day = 1.
struct Date {
    int year  = 1900;
    int month = 1;   ///< 1..12
    int day   = 1;   ///< 1..31

    /// Months elapsed since year 0, used for consecutiveness checks.
    [[nodiscard]] long month_index() const noexcept {
        return static_cast<long>(year) * 12 + (month - 1);
    }

    /// ISO form "YYYY-MM-DD".
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Date&, const Date&) = default;
    friend auto operator<=>(const Date&, const Date&) = default;
};

// ─── Time Series ──────────────────────────────────────────────────────────────

/// A 1-D real-valued series with one timestamp per sample (monthly sampling).
///
/// Invariant: values.size() == timestamps.size().
struct TimeSeries {
    std::vector<double> values;
    std::vector<Date>   timestamps;

    [[nodiscard]] std::size_t size() const noexcept { return values.size(); }
    [[nodiscard]] bool empty() const noexcept { return values.empty(); }

    /// True if lengths agree and the series is non-empty.
    [[nodiscard]] bool is_valid() const noexcept {
        return !values.empty() && values.size() == timestamps.size();
    }
};

// ─── Scale Grid ───────────────────────────────────────────────────────────────

/// Ordered set of integer timescales in sampling periods (months).
///
/// Defines both axes of every output matrix. Invariant: strictly increasing
/// and non-empty; the only way to build one is `make` or `from_values`.
class ScaleGrid {
public:
    /// Scales first, first+step, ..., up to and including `last`.
    ///
    /// # Returns
    /// `nullopt` if first < 1, step < 1 or last < first.
    [[nodiscard]] static std::optional<ScaleGrid>
    make(int first, int last, int step = 1) noexcept;

    /// Wrap an explicit list. `nullopt` unless strictly increasing, non-empty
    /// and all entries >= 1.
    [[nodiscard]] static std::optional<ScaleGrid>
    from_values(std::vector<int> scales) noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return scales_.size(); }
    [[nodiscard]] int operator[](std::size_t i) const noexcept { return scales_[i]; }
    [[nodiscard]] const std::vector<int>& values() const noexcept { return scales_; }

    [[nodiscard]] auto begin() const noexcept { return scales_.begin(); }
    [[nodiscard]] auto end() const noexcept { return scales_.end(); }

private:
    explicit ScaleGrid(std::vector<int> scales) noexcept : scales_(std::move(scales)) {}

    std::vector<int> scales_;
};

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// One S×S measurement matrix; cell (i,j) belongs to (scale_i, scale_j).
using Matrix = Eigen::MatrixXd;

/// Column-stacked samples, one variable per column (used by estimators).
using SampleMatrix = Eigen::MatrixXd;

// ─── Decomposition Output ─────────────────────────────────────────────────────

/// Instantaneous phase and amplitude of a series at one timescale.
/// Both vectors have the trimmed series length.
struct PhaseAmplitude {
    std::vector<double> phase;      ///< radians in (−π, π]
    std::vector<double> amplitude;  ///< ≥ 0
};

} // namespace cmimap

/// @file src/spectral/seasonality.cpp
/// @brief Monthly climatology extraction and re-imposition.

#include "cmimap/seasonality.hpp"
#include "cmimap/constants.hpp"

#include <array>
#include <cmath>
#include <new>

namespace cmimap::spectral {

namespace {

constexpr int PERIOD = constants::MONTHS_PER_YEAR;

double safe_divisor(double s) noexcept {
    return (std::isfinite(s) && s > constants::FLAT_STD_THRESHOLD) ? s : 1.0;
}

} // namespace

bool SeasonalityDecomposition::is_valid() const noexcept {
    return mean_cycle.size() == static_cast<std::size_t>(PERIOD) &&
           std_cycle.size()  == static_cast<std::size_t>(PERIOD);
}

// ─── extract_seasonality ──────────────────────────────────────────────────────

std::optional<SeasonalityDecomposition>
extract_seasonality(TimeSeries& series) noexcept {
    if (!series.is_valid()) {
        return std::nullopt;
    }

    std::array<double, PERIOD>      sum{};
    std::array<double, PERIOD>      sq_sum{};
    std::array<std::size_t, PERIOD> count{};

    for (std::size_t t = 0; t < series.size(); ++t) {
        const int m = series.timestamps[t].month - 1;
        if (m < 0 || m >= PERIOD) return std::nullopt;
        sum[m]    += series.values[t];
        count[m]  += 1;
    }

    SeasonalityDecomposition out;
    try {
        out.mean_cycle.assign(PERIOD, 0.0);
        out.std_cycle.assign(PERIOD, 0.0);
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }

    for (int m = 0; m < PERIOD; ++m) {
        if (count[m] == 0) {
            // A calendar month never observed: no climatology for it.
            return std::nullopt;
        }
        out.mean_cycle[m] = sum[m] / static_cast<double>(count[m]);
    }

    for (std::size_t t = 0; t < series.size(); ++t) {
        const int m = series.timestamps[t].month - 1;
        const double d = series.values[t] - out.mean_cycle[m];
        sq_sum[m] += d * d;
    }
    for (int m = 0; m < PERIOD; ++m) {
        // Population standard deviation.
        out.std_cycle[m] = std::sqrt(sq_sum[m] / static_cast<double>(count[m]));
    }

    for (std::size_t t = 0; t < series.size(); ++t) {
        const int m = series.timestamps[t].month - 1;
        series.values[t] = (series.values[t] - out.mean_cycle[m]) / safe_divisor(out.std_cycle[m]);
    }
    return out;
}

// ─── reimpose_seasonality ─────────────────────────────────────────────────────

bool reimpose_seasonality(TimeSeries& series, const SeasonalityDecomposition& s) noexcept {
    if (!s.is_valid() || !series.is_valid()) {
        return false;
    }
    for (const auto& d : series.timestamps) {
        if (d.month < 1 || d.month > PERIOD) return false;
    }
    for (std::size_t t = 0; t < series.size(); ++t) {
        const int m = series.timestamps[t].month - 1;
        series.values[t] = series.values[t] * safe_divisor(s.std_cycle[m]) + s.mean_cycle[m];
    }
    return true;
}

// ─── recenter / mean ──────────────────────────────────────────────────────────

double mean(std::span<const double> values) noexcept {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

void recenter(std::span<double> values) noexcept {
    const double m = mean(values);
    for (double& v : values) v -= m;
}

} // namespace cmimap::spectral

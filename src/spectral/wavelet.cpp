/// @file src/spectral/wavelet.cpp
/// @brief Morlet CWT at one scale via Eigen's FFT module.

#include "cmimap/wavelet.hpp"

#include <unsupported/Eigen/FFT>

#include <cmath>
#include <complex>
#include <new>
#include <numbers>
#include <vector>

namespace cmimap::spectral {

double WaveletTransform::fourier_factor(double k0) noexcept {
    return (4.0 * std::numbers::pi) / (k0 + std::sqrt(2.0 + k0 * k0));
}

std::optional<PhaseAmplitude>
WaveletTransform::decompose(std::span<const double> series,
                            double                  period,
                            ScaleUnit               unit,
                            int                     edge_trim) noexcept {
    if (!std::isfinite(period) || period <= 0.0 || edge_trim < 0) {
        return std::nullopt;
    }
    const std::size_t n    = series.size();
    const std::size_t trim = static_cast<std::size_t>(edge_trim) * constants::MONTHS_PER_YEAR;
    if (n < 2 || n <= 2 * trim) {
        return std::nullopt;
    }
    for (double v : series) {
        if (!std::isfinite(v)) return std::nullopt;
    }

    const double period_months = (unit == ScaleUnit::Years)
        ? period * constants::MONTHS_PER_YEAR
        : period;
    const double k0    = constants::MORLET_K0;
    const double scale = period_months / fourier_factor(k0);
    constexpr double dt = 1.0;

    try {
        // ── Demean and transform ─────────────────────────────────────────────
        double mu = 0.0;
        for (double v : series) mu += v;
        mu /= static_cast<double>(n);

        std::vector<double> x(n);
        for (std::size_t i = 0; i < n; ++i) x[i] = series[i] - mu;

        Eigen::FFT<double> fft;
        std::vector<std::complex<double>> spectrum;
        fft.fwd(spectrum, x);

        // ── Multiply by the daughter wavelet (positive frequencies only) ─────
        const double norm = std::sqrt(2.0 * std::numbers::pi * scale / dt) *
                            std::pow(std::numbers::pi, -0.25);
        const double dk = 2.0 * std::numbers::pi / (static_cast<double>(n) * dt);

        for (std::size_t j = 0; j < n; ++j) {
            // Bins 1..n/2 are positive frequencies; DC and the rest vanish.
            if (j == 0 || j > n / 2) {
                spectrum[j] = {0.0, 0.0};
                continue;
            }
            const double k    = dk * static_cast<double>(j);
            const double expo = -0.5 * (scale * k - k0) * (scale * k - k0);
            spectrum[j] *= norm * std::exp(expo);
        }

        std::vector<std::complex<double>> wave;
        fft.inv(wave, spectrum);

        // ── Phase / amplitude, trimmed ───────────────────────────────────────
        PhaseAmplitude out;
        const std::size_t m = n - 2 * trim;
        out.phase.reserve(m);
        out.amplitude.reserve(m);
        for (std::size_t i = trim; i < n - trim; ++i) {
            out.phase.push_back(std::atan2(wave[i].imag(), wave[i].real()));
            out.amplitude.push_back(std::abs(wave[i]));
        }
        return out;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

} // namespace cmimap::spectral

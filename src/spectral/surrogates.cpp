/// @file src/spectral/surrogates.cpp
/// @brief FT and AAFT surrogate realizations.

#include "cmimap/surrogates.hpp"

#include <unsupported/Eigen/FFT>

#include <algorithm>
#include <cmath>
#include <new>
#include <numbers>
#include <numeric>

namespace cmimap::spectral {

namespace {

/// Indices that sort `v` ascending (stable, so ties keep input order).
std::vector<std::size_t> argsort(const std::vector<double>& v) {
    std::vector<std::size_t> idx(v.size());
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    std::stable_sort(idx.begin(), idx.end(),
                     [&v](std::size_t a, std::size_t b) { return v[a] < v[b]; });
    return idx;
}

/// out[idx_of_rank_r in `order`] = values_sorted[r].
std::vector<double> rank_remap(const std::vector<double>& order,
                               const std::vector<double>& values_sorted) {
    const auto idx = argsort(order);
    std::vector<double> out(order.size());
    for (std::size_t r = 0; r < idx.size(); ++r) {
        out[idx[r]] = values_sorted[r];
    }
    return out;
}

} // namespace

// ─── SurrogateTemplate::bind ──────────────────────────────────────────────────

std::optional<SurrogateTemplate>
SurrogateTemplate::bind(std::span<const double> series, SurrogateAlgorithm algorithm) noexcept {
    if (series.size() < 4) {
        return std::nullopt;
    }
    for (double v : series) {
        if (!std::isfinite(v)) return std::nullopt;
    }

    try {
        SurrogateTemplate t;
        t.algorithm_ = algorithm;
        t.original_.assign(series.begin(), series.end());
        t.sorted_ = t.original_;
        std::sort(t.sorted_.begin(), t.sorted_.end());

        Eigen::FFT<double> fft;
        fft.fwd(t.spectrum_, t.original_);
        return t;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── SurrogateTemplate::phase_randomize ───────────────────────────────────────

std::vector<double>
SurrogateTemplate::phase_randomize(const std::vector<std::complex<double>>& spectrum,
                                   Rng& rng) const {
    const std::size_t n = spectrum.size();
    std::uniform_real_distribution<double> uniform(0.0, 2.0 * std::numbers::pi);

    std::vector<std::complex<double>> shuffled(spectrum);
    // Bin 0 (mean) is kept. For even n the Nyquist bin n/2 is real and kept.
    const std::size_t last_free = (n % 2 == 0) ? n / 2 - 1 : n / 2;
    for (std::size_t j = 1; j <= last_free; ++j) {
        const auto rotation = std::polar(1.0, uniform(rng));
        shuffled[j]     = spectrum[j] * rotation;
        shuffled[n - j] = std::conj(shuffled[j]);
    }

    Eigen::FFT<double> fft;
    std::vector<std::complex<double>> time_domain;
    fft.inv(time_domain, shuffled);

    std::vector<double> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = time_domain[i].real();
    }
    return out;
}

// ─── SurrogateTemplate::realize ───────────────────────────────────────────────

std::vector<double> SurrogateTemplate::realize(Rng& rng) const {
    if (algorithm_ == SurrogateAlgorithm::FT) {
        return phase_randomize(spectrum_, rng);
    }

    // AAFT: Gaussianize by rank, randomize, map back onto the data values.
    std::normal_distribution<double> normal(0.0, 1.0);
    std::vector<double> gaussian(original_.size());
    for (double& g : gaussian) g = normal(rng);
    std::sort(gaussian.begin(), gaussian.end());

    const auto gaussianized = rank_remap(original_, gaussian);

    Eigen::FFT<double> fft;
    std::vector<std::complex<double>> spectrum;
    fft.fwd(spectrum, gaussianized);

    const auto randomized = phase_randomize(spectrum, rng);
    return rank_remap(randomized, sorted_);
}

std::vector<double> SurrogateTemplate::amplitude_spectrum() const {
    std::vector<double> amp(spectrum_.size());
    for (std::size_t j = 0; j < spectrum_.size(); ++j) {
        amp[j] = std::abs(spectrum_[j]);
    }
    return amp;
}

// ─── job_seed ─────────────────────────────────────────────────────────────────

std::uint64_t job_seed(std::uint64_t base_seed, std::uint64_t index) noexcept {
    // splitmix64 over (base, index).
    std::uint64_t z = base_seed + (index + 1) * 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

} // namespace cmimap::spectral

#pragma once

/// @file include/cmimap/surrogates.hpp
/// @brief Randomization component: Fourier surrogates of one series.
///
/// # Module: SurrogateTemplate
///
/// ## Responsibility
/// Bind to the spectrum of a (deseasonalized) series once, then produce any
/// number of randomized realizations that share its amplitude spectrum:
///   - FT:   uniform random phases, Hermitian-mirrored, DC and Nyquist kept
///   - AAFT: Gaussianize by rank, FT-surrogate, rank-map back to the data
///
/// ## Sharing
/// `realize` is const and touches only the caller's engine, so one template
/// may be read concurrently by every worker. Reproducibility comes from
/// seeding the caller's engine, not from template state.

#include "cmimap/config.hpp"
#include "cmimap/types.hpp"

#include <complex>
#include <cstdint>
#include <optional>
#include <random>
#include <span>
#include <vector>

namespace cmimap::spectral {

using Rng = std::mt19937_64;

class SurrogateTemplate {
public:
    /// Capture spectrum and sorted values of `series`.
    ///
    /// # Returns
    /// `nullopt` for fewer than 4 samples or non-finite input.
    [[nodiscard]] static std::optional<SurrogateTemplate>
    bind(std::span<const double> series,
         SurrogateAlgorithm      algorithm = SurrogateAlgorithm::FT) noexcept;

    /// One fresh realization of template length.
    [[nodiscard]] std::vector<double> realize(Rng& rng) const;

    [[nodiscard]] std::size_t size() const noexcept { return original_.size(); }
    [[nodiscard]] SurrogateAlgorithm algorithm() const noexcept { return algorithm_; }

    /// |FFT| of the bound series, one entry per frequency bin.
    [[nodiscard]] std::vector<double> amplitude_spectrum() const;

private:
    SurrogateTemplate() = default;

    [[nodiscard]] std::vector<double>
    phase_randomize(const std::vector<std::complex<double>>& spectrum, Rng& rng) const;

    SurrogateAlgorithm                algorithm_ = SurrogateAlgorithm::FT;
    std::vector<double>               original_;
    std::vector<double>               sorted_;     ///< ascending copy (AAFT)
    std::vector<std::complex<double>> spectrum_;   ///< FFT of original_
};

/// Seed for job `index` of a run seeded with `base_seed`. Independent of
/// which worker executes the job.
[[nodiscard]] std::uint64_t job_seed(std::uint64_t base_seed, std::uint64_t index) noexcept;

} // namespace cmimap::spectral

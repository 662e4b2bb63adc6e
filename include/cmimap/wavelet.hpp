#pragma once

/// @file include/cmimap/wavelet.hpp
/// @brief Transform provider: Morlet continuous wavelet at a single scale.
///
/// # Module: WaveletTransform
///
/// ## Responsibility
/// Given a series and a period, return instantaneous phase and amplitude of
/// the oscillatory component at that period.
///
/// ## Method (Torrence & Compo 1998)
///   fourier_factor = 4π / (k0 + √(2 + k0²))            k0 = 6
///   s              = period / fourier_factor          (dt = 1 month)
///   ψ̂(sω)          = √(2πs) · π^(−1/4) · exp(−(sω − k0)² / 2),  ω > 0
///   W              = IFFT( FFT(x − x̄) · ψ̂ )
///   phase          = atan2(Im W, Re W),   amplitude = |W|
///
/// The outputs are trimmed by `edge_trim` years at both ends to drop the
/// cone-of-influence contamination.
///
/// ## Guarantees
/// - Pure function of (series, period, unit, edge_trim)
/// - Output vectors have length n − 2·edge_trim·12
/// - noexcept; `nullopt` for non-positive period or a series shorter than
///   the trim

#include "cmimap/constants.hpp"
#include "cmimap/types.hpp"

#include <optional>
#include <span>

namespace cmimap::spectral {

enum class ScaleUnit {
    Months,
    Years,
};

class WaveletTransform {
public:
    WaveletTransform() = delete;

    [[nodiscard]] static std::optional<PhaseAmplitude>
    decompose(std::span<const double> series,
              double                  period,
              ScaleUnit               unit      = ScaleUnit::Months,
              int                     edge_trim = constants::DEFAULT_EDGE_TRIM_YEARS) noexcept;

    /// Morlet Fourier factor for non-dimensional frequency `k0`.
    [[nodiscard]] static double fourier_factor(double k0 = constants::MORLET_K0) noexcept;
};

} // namespace cmimap::spectral

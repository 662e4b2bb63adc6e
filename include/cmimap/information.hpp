#pragma once

/// @file include/cmimap/information.hpp
/// @brief Measurement backend: mutual and conditional mutual information.
///
/// # Module: Information Estimators
///
/// ## Responsibility
/// Scalar information quantities (in nats) from two or three aligned
/// signals, under two estimator families:
///   - binned:  EQQ2 (equiquantal histograms) or GCM (Gaussian covariance)
///   - KNN:     Kraskov–Stögbauer–Grassberger, max-norm, standardized data
///
/// ## Formulas
///   EQQ  I(X;Y)   = Σ p(x,y) log[p(x,y) / (p(x) p(y))]
///   EQQ  I(X;Y|Z) = H(X,Z) + H(Y,Z) − H(Z) − H(X,Y,Z)
///   GCM  I(X;Y|Z) = ½ log[ |Σ_XZ| |Σ_YZ| / (|Σ_Z| |Σ_XYZ|) ]
///   KSG  I(X;Y)   = ψ(k) + ψ(N) − ⟨ψ(n_x+1) + ψ(n_y+1)⟩
///   KSG  I(X;Y|Z) = ψ(k) − ⟨ψ(n_xz+1) + ψ(n_yz+1) − ψ(n_z+1)⟩
///
/// ## Guarantees
/// - All functions are noexcept and return `nullopt` for mismatched lengths,
///   too few samples, k ≥ N, bins < 2, non-finite input or a singular
///   covariance
/// - KdTree and BruteForce searches produce identical neighbour counts
///
/// ## NOT Responsible For
/// - Building lagged variables from raw series beyond `lagged_condition_triple`
/// - Averaging over lags (see causality.hpp)

#include "cmimap/types.hpp"

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace cmimap::information {

// ─── Estimator Selection ──────────────────────────────────────────────────────

enum class BinnedEstimator {
    EQQ2,  ///< equiquantal binning of each marginal
    GCM,   ///< Gaussian (covariance-determinant) estimator
};

[[nodiscard]] std::string_view to_string(BinnedEstimator e) noexcept;

/// Neighbour-search strategy for the KNN estimators.
enum class NeighborSearch {
    BruteForce,
    KdTree,  ///< accelerated path, same results
};

// ─── Lagged Variables ─────────────────────────────────────────────────────────

/// (effect, cause, condition) aligned sample sets for one lag.
/// `condition` has one column per conditioning dimension.
struct ConditionTriple {
    std::vector<double> effect;
    std::vector<double> cause;
    SampleMatrix        condition;

    [[nodiscard]] std::size_t size() const noexcept { return effect.size(); }
};

/// Build the triple for causality cause → effect at lag τ:
///
///   effect(t)    = b(t+τ) − b(t)  wrapped to (−π, π]   if phase_difference
///                = b(t+τ)                               otherwise
///   cause(t)     = a(t)
///   condition(t) = [b(t), b(t−η), …, b(t−(d−1)η)]
///
/// for t ∈ [(d−1)η, T−1−τ].
///
/// # Returns
/// `nullopt` if lengths differ, lag < 1, d < 1, d > 1 with η = 0, η < 0, or
/// the window is empty.
[[nodiscard]] std::optional<ConditionTriple>
lagged_condition_triple(std::span<const double> cause,
                        std::span<const double> effect,
                        int                     lag,
                        int                     condition_dim,
                        int                     smoothing,
                        bool                    phase_difference) noexcept;

/// Wrap an angle difference into (−π, π].
[[nodiscard]] double wrap_phase(double radians) noexcept;

// ─── Binned / Gaussian Estimators ─────────────────────────────────────────────

[[nodiscard]] std::optional<double>
mutual_information(std::span<const double> a,
                   std::span<const double> b,
                   BinnedEstimator         estimator,
                   int                     bins) noexcept;

[[nodiscard]] std::optional<double>
conditional_mutual_information(std::span<const double> x,
                               std::span<const double> y,
                               const SampleMatrix&     z,
                               BinnedEstimator         estimator,
                               int                     bins) noexcept;

/// Equiquantal bin index (0 .. bins−1) of every sample, by rank with ties
/// broken by position. Exposed for testing.
[[nodiscard]] std::vector<int>
equiquantal_bins(std::span<const double> values, int bins);

// ─── k-Nearest-Neighbour Estimators ───────────────────────────────────────────

[[nodiscard]] std::optional<double>
knn_mutual_information(std::span<const double> a,
                       std::span<const double> b,
                       int                     k,
                       NeighborSearch          search = NeighborSearch::KdTree) noexcept;

[[nodiscard]] std::optional<double>
knn_conditional_mutual_information(std::span<const double> x,
                                   std::span<const double> y,
                                   const SampleMatrix&     z,
                                   int                     k,
                                   NeighborSearch          search = NeighborSearch::KdTree) noexcept;

/// Digamma at a positive integer: ψ(n) = −γ + Σ_{i<n} 1/i.
[[nodiscard]] double digamma(int n) noexcept;

} // namespace cmimap::information

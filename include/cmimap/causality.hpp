#pragma once

/// @file include/cmimap/causality.hpp
/// @brief Causality Averager: lag-averaged conditional mutual information.
///
/// # Module: CausalityAverager
///
/// ## Responsibility
/// For one (cause, effect) signal pair, sweep τ = 1 … max_lag−1, build the
/// lagged condition triple at each lag, evaluate the binned CMI and the KNN
/// CMI, and return the arithmetic mean of each sequence.
///
/// Averaging over a lag window lowers estimator variance and avoids
/// choosing a single lag up front.
///
/// ## Preconditions
/// - max_lag ≥ 2, otherwise the lag range is empty and the mean undefined;
///   the call returns `nullopt`, never a silent zero
/// - cause and effect have equal length
///
/// ## Guarantees
/// - noexcept, stateless
/// - For max_lag = 2 the result is exactly the lag-1 value

#include "cmimap/constants.hpp"
#include "cmimap/information.hpp"

#include <optional>
#include <span>
#include <vector>

namespace cmimap::causality {

/// Parameters of one lag sweep.
struct CausalityParams {
    int                          max_lag          = constants::DEFAULT_MAX_LAG;
    information::BinnedEstimator binned           = information::BinnedEstimator::EQQ2;
    int                          condition_dim    = 1;
    int                          smoothing        = 0;     ///< η, lag step of the condition set
    bool                         phase_difference = false;
    int                          bins             = constants::DEFAULT_EQQ_BINS;
    int                          k                = constants::DEFAULT_KNN_K;
    information::NeighborSearch  search           = information::NeighborSearch::KdTree;
};

/// Lag-averaged causality under both estimator families.
struct CausalityEstimate {
    double eqq;  ///< binned family (EQQ2 or GCM, per params)
    double knn;
};

/// Per-lag values, index 0 = τ 1.
struct LagSweep {
    std::vector<double> eqq;
    std::vector<double> knn;
};

class CausalityAverager {
public:
    CausalityAverager() = delete;

    [[nodiscard]] static std::optional<CausalityEstimate>
    average(std::span<const double> cause,
            std::span<const double> effect,
            const CausalityParams&  params) noexcept;

    /// The sequences `average` reduces. `nullopt` under the same conditions.
    [[nodiscard]] static std::optional<LagSweep>
    per_lag(std::span<const double> cause,
            std::span<const double> effect,
            const CausalityParams&  params) noexcept;
};

} // namespace cmimap::causality

/// @file src/causality/causality_averager.cpp
/// @brief CausalityAverager: lag sweep and arithmetic mean.

#include "cmimap/causality.hpp"

#include <new>
#include <numeric>

namespace cmimap::causality {

std::optional<LagSweep>
CausalityAverager::per_lag(std::span<const double> cause,
                           std::span<const double> effect,
                           const CausalityParams&  params) noexcept {
    if (params.max_lag < 2 || cause.size() != effect.size()) {
        return std::nullopt;
    }

    try {
        LagSweep sweep;
        sweep.eqq.reserve(static_cast<std::size_t>(params.max_lag - 1));
        sweep.knn.reserve(static_cast<std::size_t>(params.max_lag - 1));

        for (int tau = 1; tau < params.max_lag; ++tau) {
            const auto triple = information::lagged_condition_triple(
                cause, effect, tau, params.condition_dim, params.smoothing,
                params.phase_difference);
            if (!triple) return std::nullopt;

            const auto binned = information::conditional_mutual_information(
                triple->effect, triple->cause, triple->condition, params.binned, params.bins);
            const auto knn = information::knn_conditional_mutual_information(
                triple->effect, triple->cause, triple->condition, params.k, params.search);
            if (!binned || !knn) return std::nullopt;

            sweep.eqq.push_back(*binned);
            sweep.knn.push_back(*knn);
        }
        return sweep;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

std::optional<CausalityEstimate>
CausalityAverager::average(std::span<const double> cause,
                           std::span<const double> effect,
                           const CausalityParams&  params) noexcept {
    const auto sweep = per_lag(cause, effect, params);
    if (!sweep) return std::nullopt;

    const auto lags = static_cast<double>(sweep->eqq.size());
    return CausalityEstimate{
        std::accumulate(sweep->eqq.begin(), sweep->eqq.end(), 0.0) / lags,
        std::accumulate(sweep->knn.begin(), sweep->knn.end(), 0.0) / lags,
    };
}

} // namespace cmimap::causality

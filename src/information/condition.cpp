/// @file src/information/condition.cpp
/// @brief Lagged (effect, cause, condition) triples and phase wrapping.

#include "cmimap/information.hpp"

#include <cmath>
#include <new>
#include <numbers>

namespace cmimap::information {

std::string_view to_string(BinnedEstimator e) noexcept {
    switch (e) {
        case BinnedEstimator::EQQ2: return "EQQ2";
        case BinnedEstimator::GCM:  return "GCM";
    }
    return "?";
}

double wrap_phase(double radians) noexcept {
    constexpr double two_pi = 2.0 * std::numbers::pi;
    double w = std::remainder(radians, two_pi);  // [−π, π]
    if (w <= -std::numbers::pi) w += two_pi;
    return w;
}

std::optional<ConditionTriple>
lagged_condition_triple(std::span<const double> cause,
                        std::span<const double> effect,
                        int                     lag,
                        int                     condition_dim,
                        int                     smoothing,
                        bool                    phase_difference) noexcept {
    if (cause.size() != effect.size()) return std::nullopt;
    if (lag < 1 || condition_dim < 1 || smoothing < 0) return std::nullopt;
    if (condition_dim > 1 && smoothing == 0) return std::nullopt;

    const long T     = static_cast<long>(effect.size());
    const long start = static_cast<long>(condition_dim - 1) * smoothing;
    const long stop  = T - 1 - lag;  // inclusive
    if (stop < start) return std::nullopt;

    const auto n = static_cast<std::size_t>(stop - start + 1);

    try {
        ConditionTriple triple;
        triple.effect.resize(n);
        triple.cause.resize(n);
        triple.condition.resize(static_cast<Eigen::Index>(n), condition_dim);

        for (std::size_t r = 0; r < n; ++r) {
            const auto t = static_cast<std::size_t>(start) + r;
            const double future = effect[t + static_cast<std::size_t>(lag)];
            triple.effect[r] = phase_difference ? wrap_phase(future - effect[t]) : future;
            triple.cause[r]  = cause[t];
            for (int c = 0; c < condition_dim; ++c) {
                triple.condition(static_cast<Eigen::Index>(r), c) =
                    effect[t - static_cast<std::size_t>(c * smoothing)];
            }
        }
        return triple;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

} // namespace cmimap::information

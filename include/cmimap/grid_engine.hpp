#pragma once

/// @file include/cmimap/grid_engine.hpp
/// @brief Information Grid Engine: all four coupling measures over S×S scales.
///
/// # Module: InformationGridEngine
///
/// ## Responsibility
/// For every ordered scale pair (scale_i, scale_j):
///   1. phase_i            ← decompose(field, scale_i)
///   2. phase_j, amp_j     ← decompose(field, scale_j)
///   3. coherence[i,j]     ← MI(phase_i, phase_j)            EQQ2 / KSG
///   4. phase_amp_mi[i,j]  ← MI(phase_i, amp_j)              EQQ2 / KSG
///   5. ph_ph_caus[i,j]    ← CausalityAverager(phase_i, phase_j;
///                              EQQ2, d = 1, η = 0, phase difference)
///   6. ph_amp_caus[i,j]   ← CausalityAverager(phase_i, amp_j²;
///                              GCM, d = 3, η = scale_i / 4)
///
/// The full grid is evaluated (not a triangle): the phase-amplitude and
/// causality measures are directional.
///
/// Decompositions are computed once per scale and reused; `decompose` is a
/// pure function of (field, scale) so this matches recomputation exactly.
///
/// ## Concurrency
/// Single-threaded. One engine instance per worker; `compute` is const and
/// holds no mutable state, so sharing is also safe.

#include "cmimap/causality.hpp"
#include "cmimap/constants.hpp"
#include "cmimap/information.hpp"
#include "cmimap/results.hpp"
#include "cmimap/types.hpp"

#include <span>

namespace cmimap::grid {

struct GridConfig {
    int                         bins      = constants::DEFAULT_EQQ_BINS;
    int                         k         = constants::DEFAULT_KNN_K;
    int                         max_lag   = constants::DEFAULT_MAX_LAG;
    int                         edge_trim = constants::DEFAULT_EDGE_TRIM_YEARS;
    information::NeighborSearch search    = information::NeighborSearch::KdTree;
};

class InformationGridEngine {
public:
    explicit InformationGridEngine(GridConfig config = GridConfig{});

    /// Compute one MeasurementBundle for a prepared (centered) field.
    ///
    /// Throws `PreconditionError` if max_lag < 2, the field is too short for
    /// the edge trim, or any estimator cannot produce a value (the message
    /// names the measure and the scale pair).
    [[nodiscard]] results::MeasurementBundle
    compute(std::span<const double> field, const ScaleGrid& scales) const;

    /// Parameters of the phase-phase causality sweep.
    [[nodiscard]] causality::CausalityParams phase_phase_params() const noexcept;

    /// Parameters of the phase-amplitude causality sweep for `scale_i`.
    [[nodiscard]] causality::CausalityParams phase_amp_params(int scale_i) const noexcept;

    [[nodiscard]] const GridConfig& config() const noexcept { return config_; }

private:
    GridConfig config_;
};

} // namespace cmimap::grid

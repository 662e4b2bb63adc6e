#pragma once

#include <cstddef>

/// @file include/cmimap/constants.hpp
/// @brief Default run parameters and numerical constants for cmimap.
///
/// These are the defaults of `RunConfig`; nothing reads them at run time
/// except through a config object.

namespace cmimap::constants {

// ─── Scale Grid ───────────────────────────────────────────────────────────────

/// Shortest timescale of the default grid, in months.
static constexpr int DEFAULT_PERIOD_FIRST = 5;

/// Longest timescale of the default grid, in months (inclusive).
static constexpr int DEFAULT_PERIOD_LAST = 96;

static constexpr int DEFAULT_PERIOD_STEP = 1;

/// Samples per seasonal cycle for monthly data.
static constexpr int MONTHS_PER_YEAR = 12;

// ─── Estimators ───────────────────────────────────────────────────────────────

/// Equiquantal bins per marginal for the binned estimators.
static constexpr int DEFAULT_EQQ_BINS = 4;

/// Neighbour count for the k-nearest-neighbour estimators.
static constexpr int DEFAULT_KNN_K = 64;

/// Causality is averaged over lags 1 .. MAX_LAG-1.
static constexpr int DEFAULT_MAX_LAG = 7;

/// Condition-set dimension for phase-amplitude causality.
static constexpr int PHASE_AMP_CONDITION_DIM = 3;

/// Phase-amplitude smoothing is scale_i / PHASE_AMP_SMOOTHING_DIVISOR.
static constexpr int PHASE_AMP_SMOOTHING_DIVISOR = 4;

// ─── Transform ────────────────────────────────────────────────────────────────

/// Morlet non-dimensional frequency.
static constexpr double MORLET_K0 = 6.0;

/// Years trimmed at each edge of a decomposed series.
static constexpr int DEFAULT_EDGE_TRIM_YEARS = 1;

// ─── Surrogate Ensemble ───────────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_NUM_SURROGATES = 100;
static constexpr std::size_t DEFAULT_WORKERS        = 20;
static constexpr unsigned long long DEFAULT_SEED    = 0x5EEDCAFEULL;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Below this standard deviation a seasonal month is treated as flat.
static constexpr double FLAT_STD_THRESHOLD = 1e-12;

/// A covariance block whose determinant, relative to the product of its
/// variances, falls below this is treated as singular.
static constexpr double COVARIANCE_SINGULARITY_EPSILON = 1e-14;

} // namespace cmimap::constants

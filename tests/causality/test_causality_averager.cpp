/// @file tests/causality/test_causality_averager.cpp
/// @brief Unit tests for the CausalityAverager lag sweep.
///
/// Test categories:
///   - Average equals the mean of the per-lag sequences
///   - max_lag = 2 reduces to the lag-1 value
///   - max_lag <= 1 is rejected rather than returning zero
///   - A directed coupling is detected in the right direction

#include "cmimap/causality.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <numeric>
#include <random>
#include <vector>

using namespace cmimap;
using namespace cmimap::causality;
using cmimap::information::BinnedEstimator;

namespace {

struct Pair {
    std::vector<double> driver;
    std::vector<double> follower;
};

/// follower(t+1) = 0.8 driver(t) + small noise; driver is white.
Pair coupled(std::size_t n, unsigned seed = 17) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> g(0.0, 1.0);
    Pair p;
    p.driver.resize(n);
    p.follower.resize(n);
    for (double& v : p.driver) v = g(rng);
    p.follower[0] = g(rng);
    for (std::size_t t = 1; t < n; ++t) {
        p.follower[t] = 0.8 * p.driver[t - 1] + 0.3 * g(rng);
    }
    return p;
}

CausalityParams params(int max_lag, BinnedEstimator est = BinnedEstimator::EQQ2) {
    CausalityParams p;
    p.max_lag = max_lag;
    p.binned  = est;
    p.k       = 8;
    return p;
}

double mean(const std::vector<double>& v) {
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

} // namespace

// ─── Test 1: Mean property ────────────────────────────────────────────────────

TEST(CausalityAverager, AverageIsMeanOfPerLagValues) {
    const auto p = coupled(600);
    for (int max_lag : {3, 7}) {
        const auto sweep = CausalityAverager::per_lag(p.driver, p.follower, params(max_lag));
        const auto avg   = CausalityAverager::average(p.driver, p.follower, params(max_lag));
        ASSERT_TRUE(sweep && avg);
        ASSERT_EQ(sweep->eqq.size(), static_cast<std::size_t>(max_lag - 1));
        ASSERT_EQ(sweep->knn.size(), static_cast<std::size_t>(max_lag - 1));
        EXPECT_NEAR(avg->eqq, mean(sweep->eqq), 1e-12);
        EXPECT_NEAR(avg->knn, mean(sweep->knn), 1e-12);
    }
}

TEST(CausalityAverager, MaxLagTwoIsLagOneValue) {
    const auto p = coupled(500);
    const auto sweep = CausalityAverager::per_lag(p.driver, p.follower, params(7));
    const auto avg   = CausalityAverager::average(p.driver, p.follower, params(2));
    ASSERT_TRUE(sweep && avg);
    EXPECT_DOUBLE_EQ(avg->eqq, sweep->eqq[0]);
    EXPECT_DOUBLE_EQ(avg->knn, sweep->knn[0]);
}

// ─── Test 2: Empty lag range ──────────────────────────────────────────────────

TEST(CausalityAverager, EmptyLagRangeIsRejected) {
    const auto p = coupled(200);
    EXPECT_FALSE(CausalityAverager::average(p.driver, p.follower, params(1)).has_value());
    EXPECT_FALSE(CausalityAverager::average(p.driver, p.follower, params(0)).has_value());
    EXPECT_FALSE(CausalityAverager::per_lag(p.driver, p.follower, params(-3)).has_value());
}

TEST(CausalityAverager, MismatchedLengthsAreRejected) {
    const auto p = coupled(200);
    std::vector<double> shorter(p.follower.begin(), p.follower.end() - 1);
    EXPECT_FALSE(CausalityAverager::average(p.driver, shorter, params(3)).has_value());
}

TEST(CausalityAverager, SeriesTooShortForWindowIsRejected) {
    const auto p = coupled(12);
    auto prm = params(7);
    prm.k = 8;  // the lag-6 window has 6 samples, fewer than k + 1
    EXPECT_FALSE(CausalityAverager::average(p.driver, p.follower, prm).has_value());
}

// ─── Test 3: Direction ────────────────────────────────────────────────────────

TEST(CausalityAverager, DetectsDirectedCoupling) {
    const auto p = coupled(1500);
    auto prm = params(2, BinnedEstimator::GCM);
    const auto forward  = CausalityAverager::average(p.driver, p.follower, prm);
    const auto backward = CausalityAverager::average(p.follower, p.driver, prm);
    ASSERT_TRUE(forward && backward);
    EXPECT_GT(forward->eqq, 0.5);
    EXPECT_LT(std::abs(backward->eqq), 0.05);
    EXPECT_GT(forward->knn, backward->knn + 0.3);
}

TEST(CausalityAverager, GcmWithSmoothedCondition) {
    const auto p = coupled(800);
    CausalityParams prm = params(4, BinnedEstimator::GCM);
    prm.condition_dim = 3;
    prm.smoothing     = 2;
    const auto est = CausalityAverager::average(p.driver, p.follower, prm);
    ASSERT_TRUE(est.has_value());
    EXPECT_TRUE(std::isfinite(est->eqq));
    EXPECT_TRUE(std::isfinite(est->knn));
}

/// @file tests/spectral/test_surrogates.cpp
/// @brief Unit tests for FT / AAFT SurrogateTemplate and job seeding.

#include "cmimap/surrogates.hpp"
#include "cmimap/seasonality.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <set>

using namespace cmimap;
using namespace cmimap::spectral;

namespace {

/// AR(1) red noise with a superposed oscillation.
std::vector<double> red_noise(std::size_t n, unsigned seed = 11) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> e(0.0, 1.0);
    std::vector<double> x(n);
    double prev = 0.0;
    for (std::size_t t = 0; t < n; ++t) {
        prev = 0.7 * prev + e(rng);
        x[t] = prev + 2.0 * std::sin(2.0 * std::numbers::pi * static_cast<double>(t) / 45.0);
    }
    return x;
}

} // namespace

// ─── Test 1: Binding ──────────────────────────────────────────────────────────

TEST(SurrogateTemplate, BindRejectsShortOrNonFinite) {
    EXPECT_FALSE(SurrogateTemplate::bind(std::vector<double>{1.0, 2.0, 3.0}).has_value());
    std::vector<double> x = red_noise(64);
    x[10] = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(SurrogateTemplate::bind(x).has_value());
}

TEST(SurrogateTemplate, BindKeepsLengthAndAlgorithm) {
    const auto t = SurrogateTemplate::bind(red_noise(100), SurrogateAlgorithm::AAFT);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->size(), 100u);
    EXPECT_EQ(t->algorithm(), SurrogateAlgorithm::AAFT);
}

// ─── Test 2: FT properties ────────────────────────────────────────────────────

TEST(SurrogateTemplate, FtPreservesAmplitudeSpectrum) {
    for (std::size_t n : {256u, 255u}) {  // even and odd lengths
        const auto t = SurrogateTemplate::bind(red_noise(n));
        ASSERT_TRUE(t.has_value());
        Rng rng(123);
        const auto realization = t->realize(rng);
        ASSERT_EQ(realization.size(), n);

        const auto again = SurrogateTemplate::bind(realization);
        ASSERT_TRUE(again.has_value());
        const auto a = t->amplitude_spectrum();
        const auto b = again->amplitude_spectrum();
        for (std::size_t j = 0; j < n; ++j) {
            EXPECT_NEAR(b[j], a[j], 1e-9 * (1.0 + a[j])) << "bin " << j << " n " << n;
        }
    }
}

TEST(SurrogateTemplate, FtKeepsMeanAndIsReal) {
    auto x = red_noise(200);
    for (double& v : x) v += 5.0;
    const auto t = SurrogateTemplate::bind(x);
    ASSERT_TRUE(t.has_value());
    Rng rng(9);
    const auto s = t->realize(rng);
    EXPECT_NEAR(mean(s), mean(x), 1e-10);
    for (double v : s) EXPECT_TRUE(std::isfinite(v));
}

TEST(SurrogateTemplate, FtChangesTheSeries) {
    const auto x = red_noise(128);
    const auto t = SurrogateTemplate::bind(x);
    ASSERT_TRUE(t.has_value());
    Rng rng(5);
    const auto s = t->realize(rng);
    double diff = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) diff += std::abs(s[i] - x[i]);
    EXPECT_GT(diff, 1.0);
}

// ─── Test 3: AAFT ─────────────────────────────────────────────────────────────

TEST(SurrogateTemplate, AaftPreservesValueDistributionExactly) {
    const auto x = red_noise(300);
    const auto t = SurrogateTemplate::bind(x, SurrogateAlgorithm::AAFT);
    ASSERT_TRUE(t.has_value());
    Rng rng(77);
    auto s = t->realize(rng);
    auto sorted_x = x;
    std::sort(sorted_x.begin(), sorted_x.end());
    std::sort(s.begin(), s.end());
    EXPECT_EQ(s, sorted_x);
}

// ─── Test 4: Reproducibility ──────────────────────────────────────────────────

TEST(SurrogateTemplate, SameSeedSameRealization) {
    const auto t = SurrogateTemplate::bind(red_noise(150));
    ASSERT_TRUE(t.has_value());
    Rng a(job_seed(42, 3));
    Rng b(job_seed(42, 3));
    Rng c(job_seed(42, 4));
    const auto sa = t->realize(a);
    EXPECT_EQ(sa, t->realize(b));
    EXPECT_NE(sa, t->realize(c));
}

TEST(JobSeed, DistinctAcrossIndicesAndBases) {
    std::set<std::uint64_t> seen;
    for (std::uint64_t i = 0; i < 1000; ++i) seen.insert(job_seed(1, i));
    EXPECT_EQ(seen.size(), 1000u);
    EXPECT_NE(job_seed(1, 0), job_seed(2, 0));
    EXPECT_EQ(job_seed(99, 17), job_seed(99, 17));
}

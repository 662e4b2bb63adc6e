/// @file tests/information/test_knn.cpp
/// @brief Unit tests for the KSG estimators, digamma and neighbour search.

#include "cmimap/information.hpp"

#include "information/kd_tree.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>
#include <random>
#include <vector>

using namespace cmimap;
using namespace cmimap::information;

namespace {

std::vector<double> gaussian(std::size_t n, std::mt19937_64& rng) {
    std::normal_distribution<double> g(0.0, 1.0);
    std::vector<double> v(n);
    for (double& x : v) x = g(rng);
    return v;
}

std::vector<double> mix(const std::vector<double>& a, const std::vector<double>& b, double rho) {
    std::vector<double> out(a.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        out[i] = rho * a[i] + std::sqrt(1.0 - rho * rho) * b[i];
    }
    return out;
}

SampleMatrix columns(std::initializer_list<const std::vector<double>*> cols) {
    const auto n = static_cast<Eigen::Index>((*cols.begin())->size());
    SampleMatrix m(n, static_cast<Eigen::Index>(cols.size()));
    Eigen::Index c = 0;
    for (const auto* col : cols) {
        for (Eigen::Index i = 0; i < n; ++i) m(i, c) = (*col)[static_cast<std::size_t>(i)];
        ++c;
    }
    return m;
}

} // namespace

// ─── Test 1: Digamma ──────────────────────────────────────────────────────────

TEST(Digamma, SmallIntegers) {
    EXPECT_NEAR(digamma(1), -std::numbers::egamma, 1e-15);
    EXPECT_NEAR(digamma(2), 1.0 - std::numbers::egamma, 1e-15);
    EXPECT_NEAR(digamma(4), 1.0 + 0.5 + 1.0 / 3.0 - std::numbers::egamma, 1e-15);
}

TEST(Digamma, AsymptoticBranchMatchesHarmonicSum) {
    for (int n : {32, 64, 500, 5000}) {
        double h = -std::numbers::egamma;
        for (int i = 1; i < n; ++i) h += 1.0 / i;
        EXPECT_NEAR(digamma(n), h, 1e-12) << "n " << n;
    }
}

TEST(Digamma, NonPositiveIsNaN) {
    EXPECT_TRUE(std::isnan(digamma(0)));
    EXPECT_TRUE(std::isnan(digamma(-3)));
}

// ─── Test 2: KSG mutual information ───────────────────────────────────────────

TEST(KnnMutualInformation, CorrelatedGaussianMatchesAnalytic) {
    std::mt19937_64 rng(21);
    const auto a = gaussian(3000, rng);
    const auto b = mix(a, gaussian(3000, rng), 0.8);
    const auto mi = knn_mutual_information(a, b, 8);
    ASSERT_TRUE(mi.has_value());
    EXPECT_NEAR(*mi, -0.5 * std::log(1.0 - 0.64), 0.05);
}

TEST(KnnMutualInformation, IndependentNearZero) {
    std::mt19937_64 rng(22);
    const auto a = gaussian(2000, rng);
    const auto b = gaussian(2000, rng);
    const auto mi = knn_mutual_information(a, b, 8);
    ASSERT_TRUE(mi.has_value());
    EXPECT_NEAR(*mi, 0.0, 0.04);
}

TEST(KnnMutualInformation, Symmetric) {
    std::mt19937_64 rng(23);
    const auto a = gaussian(500, rng);
    const auto b = mix(a, gaussian(500, rng), 0.5);
    const auto ab = knn_mutual_information(a, b, 6);
    const auto ba = knn_mutual_information(b, a, 6);
    ASSERT_TRUE(ab && ba);
    EXPECT_NEAR(*ab, *ba, 1e-12);
}

TEST(KnnMutualInformation, ScaleInvariantThroughStandardization) {
    std::mt19937_64 rng(24);
    const auto a = gaussian(400, rng);
    auto b = mix(a, gaussian(400, rng), 0.6);
    const auto before = knn_mutual_information(a, b, 5);
    for (double& v : b) v = 1000.0 * v + 3.0;
    const auto after = knn_mutual_information(a, b, 5);
    ASSERT_TRUE(before && after);
    EXPECT_NEAR(*before, *after, 1e-9);
}

// ─── Test 3: KSG conditional mutual information ───────────────────────────────

TEST(KnnConditionalMutualInformation, CommonDriverNearZero) {
    std::mt19937_64 rng(31);
    const auto z = gaussian(2000, rng);
    const auto x = mix(z, gaussian(2000, rng), 0.8);
    const auto y = mix(z, gaussian(2000, rng), 0.8);
    const auto cmi = knn_conditional_mutual_information(x, y, columns({&z}), 8);
    const auto mi  = knn_mutual_information(x, y, 8);
    ASSERT_TRUE(cmi && mi);
    EXPECT_NEAR(*cmi, 0.0, 0.05);
    EXPECT_GT(*mi, 0.2);
}

TEST(KnnConditionalMutualInformation, DirectLinkSurvivesConditioning) {
    std::mt19937_64 rng(32);
    const auto z = gaussian(2000, rng);
    const auto x = gaussian(2000, rng);
    const auto y = mix(x, z, 0.7);
    const auto cmi = knn_conditional_mutual_information(x, y, columns({&z}), 8);
    ASSERT_TRUE(cmi.has_value());
    EXPECT_GT(*cmi, 0.3);
}

// ─── Test 4: Search strategies agree ──────────────────────────────────────────

TEST(NeighborSearch, KdTreeMatchesBruteForce) {
    std::mt19937_64 rng(41);
    const auto a = gaussian(600, rng);
    const auto b = mix(a, gaussian(600, rng), 0.4);
    const auto c = gaussian(600, rng);
    const auto d = mix(c, b, 0.3);

    const auto mi_kd = knn_mutual_information(a, b, 7, NeighborSearch::KdTree);
    const auto mi_bf = knn_mutual_information(a, b, 7, NeighborSearch::BruteForce);
    ASSERT_TRUE(mi_kd && mi_bf);
    EXPECT_DOUBLE_EQ(*mi_kd, *mi_bf);

    const auto z = columns({&c, &d});
    const auto cmi_kd = knn_conditional_mutual_information(a, b, z, 7, NeighborSearch::KdTree);
    const auto cmi_bf = knn_conditional_mutual_information(a, b, z, 7, NeighborSearch::BruteForce);
    ASSERT_TRUE(cmi_kd && cmi_bf);
    EXPECT_DOUBLE_EQ(*cmi_kd, *cmi_bf);
}

TEST(NeighborSearch, KdTreeQueriesMatchScan) {
    std::mt19937_64 rng(42);
    std::uniform_real_distribution<double> u(-1.0, 1.0);
    SampleMatrix pts(300, 3);
    for (Eigen::Index i = 0; i < pts.rows(); ++i) {
        for (Eigen::Index c = 0; c < 3; ++c) pts(i, c) = u(rng);
    }
    // Exact duplicates exercise the zero-distance paths.
    pts.row(10) = pts.row(20);

    const detail::KdTree tree(pts, 8);
    const detail::BruteScan scan(pts);
    EXPECT_EQ(tree.size(), 300u);
    for (std::size_t i = 0; i < 300; i += 7) {
        for (int k : {1, 4, 25}) {
            EXPECT_DOUBLE_EQ(tree.kth_distance(i, k), scan.kth_distance(i, k));
        }
        for (double r : {0.0, 0.05, 0.3, 3.0}) {
            EXPECT_EQ(tree.count_within(i, r), scan.count_within(i, r));
        }
    }
    EXPECT_DOUBLE_EQ(tree.kth_distance(10, 1), 0.0);
    EXPECT_EQ(tree.count_within(5, 3.0), 299u);
}

// ─── Test 5: Rejections ───────────────────────────────────────────────────────

TEST(KnnEstimators, RejectDegenerateInput) {
    std::mt19937_64 rng(51);
    const auto a = gaussian(50, rng);
    const auto b = gaussian(50, rng);
    EXPECT_FALSE(knn_mutual_information(a, b, 50).has_value());
    EXPECT_FALSE(knn_mutual_information(a, b, 0).has_value());

    const std::vector<double> flat(50, 1.0);
    EXPECT_FALSE(knn_mutual_information(a, flat, 5).has_value());

    std::vector<double> shorter(a.begin(), a.end() - 1);
    EXPECT_FALSE(knn_mutual_information(a, shorter, 5).has_value());
    EXPECT_FALSE(knn_conditional_mutual_information(a, b, columns({&shorter}), 5).has_value());
    EXPECT_FALSE(knn_conditional_mutual_information(a, b, columns({&flat}), 5).has_value());
}

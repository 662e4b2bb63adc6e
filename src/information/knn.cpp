/// @file src/information/knn.cpp
/// @brief Kraskov–Stögbauer–Grassberger MI and CMI estimators.

#include "cmimap/constants.hpp"
#include "cmimap/information.hpp"

#include "information/kd_tree.hpp"

#include <cmath>
#include <limits>
#include <new>
#include <numbers>

namespace cmimap::information {

namespace {

/// Zero mean, unit variance copy. `nullopt` for flat or non-finite input.
std::optional<Eigen::VectorXd> standardize(std::span<const double> v) {
    const auto n = static_cast<Eigen::Index>(v.size());
    Eigen::VectorXd out = Eigen::Map<const Eigen::VectorXd>(v.data(), n);
    if (!out.allFinite()) return std::nullopt;

    out.array() -= out.mean();
    const double sd = std::sqrt(out.squaredNorm() / static_cast<double>(n));
    if (sd < constants::FLAT_STD_THRESHOLD) return std::nullopt;
    out /= sd;
    return out;
}

/// ψ(1) … ψ(n+1), index m holds ψ(m).
std::vector<double> digamma_table(std::size_t n) {
    std::vector<double> psi(n + 2);
    psi[1] = -std::numbers::egamma;
    for (std::size_t m = 2; m < psi.size(); ++m) {
        psi[m] = psi[m - 1] + 1.0 / static_cast<double>(m - 1);
    }
    return psi;
}

/// Stack columns into one sample matrix.
SampleMatrix stack(std::initializer_list<const Eigen::VectorXd*> columns, Eigen::Index rows) {
    SampleMatrix m(rows, static_cast<Eigen::Index>(columns.size()));
    Eigen::Index c = 0;
    for (const auto* col : columns) m.col(c++) = *col;
    return m;
}

} // namespace

double digamma(int n) noexcept {
    if (n < 1) return std::numeric_limits<double>::quiet_NaN();
    if (n < 32) {
        double psi = -std::numbers::egamma;
        for (int i = 1; i < n; ++i) psi += 1.0 / i;
        return psi;
    }
    // Asymptotic series; error below 1e-16 for n ≥ 32.
    const double x  = static_cast<double>(n);
    const double x2 = 1.0 / (x * x);
    return std::log(x) - 0.5 / x -
           x2 * (1.0 / 12.0 - x2 * (1.0 / 120.0 - x2 * (1.0 / 252.0)));
}

// ─── knn_mutual_information ───────────────────────────────────────────────────

std::optional<double>
knn_mutual_information(std::span<const double> a,
                       std::span<const double> b,
                       int                     k,
                       NeighborSearch          search) noexcept {
    const std::size_t n = a.size();
    if (b.size() != n || k < 1 || n <= static_cast<std::size_t>(k)) return std::nullopt;

    try {
        const auto xa = standardize(a);
        const auto xb = standardize(b);
        if (!xa || !xb) return std::nullopt;

        const auto rows = static_cast<Eigen::Index>(n);
        const bool kd = (search == NeighborSearch::KdTree);
        const auto joint = detail::make_index(stack({&*xa, &*xb}, rows), kd);
        const auto marg_a = detail::make_index(stack({&*xa}, rows), kd);
        const auto marg_b = detail::make_index(stack({&*xb}, rows), kd);

        const auto psi = digamma_table(n);
        double acc = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            const double eps = joint->kth_distance(i, k);
            acc += psi[marg_a->count_within(i, eps) + 1] + psi[marg_b->count_within(i, eps) + 1];
        }
        return psi[static_cast<std::size_t>(k)] + psi[n] - acc / static_cast<double>(n);
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── knn_conditional_mutual_information ───────────────────────────────────────

std::optional<double>
knn_conditional_mutual_information(std::span<const double> x,
                                   std::span<const double> y,
                                   const SampleMatrix&     z,
                                   int                     k,
                                   NeighborSearch          search) noexcept {
    const std::size_t n = x.size();
    if (y.size() != n || static_cast<std::size_t>(z.rows()) != n || z.cols() < 1) {
        return std::nullopt;
    }
    if (k < 1 || n <= static_cast<std::size_t>(k)) return std::nullopt;

    try {
        const auto xs = standardize(x);
        const auto ys = standardize(y);
        if (!xs || !ys) return std::nullopt;

        const auto rows = static_cast<Eigen::Index>(n);
        const Eigen::Index dz = z.cols();
        SampleMatrix zs(rows, dz);
        for (Eigen::Index c = 0; c < dz; ++c) {
            const Eigen::VectorXd col = z.col(c);
            const auto s = standardize(std::span<const double>(col.data(), n));
            if (!s) return std::nullopt;
            zs.col(c) = *s;
        }

        SampleMatrix xyz(rows, dz + 2);
        xyz.col(0) = *xs;
        xyz.col(1) = *ys;
        xyz.rightCols(dz) = zs;

        SampleMatrix xz(rows, dz + 1);
        xz.col(0) = *xs;
        xz.rightCols(dz) = zs;

        SampleMatrix yz(rows, dz + 1);
        yz.col(0) = *ys;
        yz.rightCols(dz) = zs;

        const bool kd = (search == NeighborSearch::KdTree);
        const auto joint = detail::make_index(std::move(xyz), kd);
        const auto idx_xz = detail::make_index(std::move(xz), kd);
        const auto idx_yz = detail::make_index(std::move(yz), kd);
        const auto idx_z  = detail::make_index(std::move(zs), kd);

        const auto psi = digamma_table(n);
        double acc = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            const double eps = joint->kth_distance(i, k);
            acc += psi[idx_xz->count_within(i, eps) + 1] +
                   psi[idx_yz->count_within(i, eps) + 1] -
                   psi[idx_z->count_within(i, eps) + 1];
        }
        return psi[static_cast<std::size_t>(k)] - acc / static_cast<double>(n);
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

} // namespace cmimap::information

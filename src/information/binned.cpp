/// @file src/information/binned.cpp
/// @brief EQQ2 histogram and Gaussian (GCM) information estimators.

#include "cmimap/constants.hpp"
#include "cmimap/information.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <new>
#include <numeric>

namespace cmimap::information {

namespace {

bool all_finite(std::span<const double> v) noexcept {
    return std::all_of(v.begin(), v.end(), [](double x) { return std::isfinite(x); });
}

bool all_finite(const SampleMatrix& m) noexcept {
    return m.allFinite();
}

/// Plug-in entropy (nats) of a code sequence.
double code_entropy(std::vector<std::uint64_t> codes) {
    std::sort(codes.begin(), codes.end());
    const double n = static_cast<double>(codes.size());
    double h = 0.0;
    std::size_t run = 1;
    for (std::size_t i = 1; i <= codes.size(); ++i) {
        if (i < codes.size() && codes[i] == codes[i - 1]) {
            ++run;
            continue;
        }
        const double p = static_cast<double>(run) / n;
        h -= p * std::log(p);
        run = 1;
    }
    return h;
}

/// Mixed-radix code of the selected binned columns for every sample.
std::vector<std::uint64_t>
joint_codes(const std::vector<std::vector<int>>& columns,
            const std::vector<std::size_t>&      select,
            int                                  bins) {
    const std::size_t n = columns.front().size();
    std::vector<std::uint64_t> codes(n, 0);
    for (std::size_t c : select) {
        for (std::size_t i = 0; i < n; ++i) {
            codes[i] = codes[i] * static_cast<std::uint64_t>(bins) +
                       static_cast<std::uint64_t>(columns[c][i]);
        }
    }
    return codes;
}

/// bins^dims fits in 64 bits.
bool codes_fit(int bins, std::size_t dims) noexcept {
    double capacity = 1.0;
    for (std::size_t d = 0; d < dims; ++d) capacity *= bins;
    return capacity < 1.8e19;
}

// ─── Gaussian ─────────────────────────────────────────────────────────────────

/// Sample covariance of the columns of `data` (rows are samples).
Eigen::MatrixXd covariance(const SampleMatrix& data) {
    const Eigen::RowVectorXd mean = data.colwise().mean();
    const Eigen::MatrixXd centered = data.rowwise() - mean;
    return (centered.transpose() * centered) / static_cast<double>(data.rows() - 1);
}

/// log det of the principal submatrix over `idx`; `nullopt` if singular
/// relative to its diagonal.
std::optional<double> sub_log_det(const Eigen::MatrixXd& cov, const std::vector<Eigen::Index>& idx) {
    const auto m = static_cast<Eigen::Index>(idx.size());
    Eigen::MatrixXd sub(m, m);
    for (Eigen::Index r = 0; r < m; ++r) {
        for (Eigen::Index c = 0; c < m; ++c) {
            sub(r, c) = cov(idx[static_cast<std::size_t>(r)], idx[static_cast<std::size_t>(c)]);
        }
    }
    const double diag = sub.diagonal().prod();
    if (!(diag > 0.0)) return std::nullopt;

    const double det = sub.determinant();
    if (!(det / diag > constants::COVARIANCE_SINGULARITY_EPSILON)) return std::nullopt;
    return std::log(det);
}

std::optional<double> gaussian_cmi(const SampleMatrix& data, Eigen::Index condition_dim) {
    const Eigen::MatrixXd cov = covariance(data);

    std::vector<Eigen::Index> z(static_cast<std::size_t>(condition_dim));
    std::iota(z.begin(), z.end(), Eigen::Index{2});

    auto with = [&z](std::initializer_list<Eigen::Index> head) {
        std::vector<Eigen::Index> idx(head);
        idx.insert(idx.end(), z.begin(), z.end());
        return idx;
    };

    const auto ld_xz  = sub_log_det(cov, with({0}));
    const auto ld_yz  = sub_log_det(cov, with({1}));
    const auto ld_xyz = sub_log_det(cov, with({0, 1}));
    const auto ld_z   = condition_dim > 0 ? sub_log_det(cov, z) : std::optional<double>(0.0);
    if (!ld_xz || !ld_yz || !ld_xyz || !ld_z) {
        return std::nullopt;
    }
    const double value = 0.5 * (*ld_xz + *ld_yz - *ld_z - *ld_xyz);
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

} // namespace

// ─── equiquantal_bins ─────────────────────────────────────────────────────────

std::vector<int> equiquantal_bins(std::span<const double> values, int bins) {
    const std::size_t n = values.size();
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&values](std::size_t a, std::size_t b) { return values[a] < values[b]; });

    std::vector<int> out(n);
    for (std::size_t rank = 0; rank < n; ++rank) {
        out[order[rank]] = static_cast<int>((rank * static_cast<std::size_t>(bins)) / n);
    }
    return out;
}

// ─── mutual_information ───────────────────────────────────────────────────────

std::optional<double>
mutual_information(std::span<const double> a,
                   std::span<const double> b,
                   BinnedEstimator         estimator,
                   int                     bins) noexcept {
    if (a.size() != b.size() || a.size() < 3) return std::nullopt;
    if (!all_finite(a) || !all_finite(b)) return std::nullopt;

    try {
        if (estimator == BinnedEstimator::GCM) {
            SampleMatrix data(static_cast<Eigen::Index>(a.size()), 2);
            for (std::size_t i = 0; i < a.size(); ++i) {
                data(static_cast<Eigen::Index>(i), 0) = a[i];
                data(static_cast<Eigen::Index>(i), 1) = b[i];
            }
            return gaussian_cmi(data, 0);
        }

        if (bins < 2) return std::nullopt;
        const std::vector<std::vector<int>> cols{equiquantal_bins(a, bins),
                                                 equiquantal_bins(b, bins)};
        const double h_a  = code_entropy(joint_codes(cols, {0}, bins));
        const double h_b  = code_entropy(joint_codes(cols, {1}, bins));
        const double h_ab = code_entropy(joint_codes(cols, {0, 1}, bins));
        return h_a + h_b - h_ab;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── conditional_mutual_information ───────────────────────────────────────────

std::optional<double>
conditional_mutual_information(std::span<const double> x,
                               std::span<const double> y,
                               const SampleMatrix&     z,
                               BinnedEstimator         estimator,
                               int                     bins) noexcept {
    const std::size_t n = x.size();
    if (y.size() != n || static_cast<std::size_t>(z.rows()) != n || z.cols() < 1) {
        return std::nullopt;
    }
    if (n < static_cast<std::size_t>(z.cols()) + 3) return std::nullopt;
    if (!all_finite(x) || !all_finite(y) || !all_finite(z)) return std::nullopt;

    try {
        if (estimator == BinnedEstimator::GCM) {
            SampleMatrix data(static_cast<Eigen::Index>(n), 2 + z.cols());
            for (std::size_t i = 0; i < n; ++i) {
                data(static_cast<Eigen::Index>(i), 0) = x[i];
                data(static_cast<Eigen::Index>(i), 1) = y[i];
            }
            data.rightCols(z.cols()) = z;
            return gaussian_cmi(data, z.cols());
        }

        if (bins < 2) return std::nullopt;
        const auto dims = static_cast<std::size_t>(z.cols()) + 2;
        if (!codes_fit(bins, dims)) return std::nullopt;

        std::vector<std::vector<int>> cols;
        cols.reserve(dims);
        cols.push_back(equiquantal_bins(x, bins));
        cols.push_back(equiquantal_bins(y, bins));
        std::vector<std::size_t> zi;
        for (Eigen::Index c = 0; c < z.cols(); ++c) {
            const Eigen::VectorXd col = z.col(c);
            cols.push_back(equiquantal_bins(std::span<const double>(col.data(), n), bins));
            zi.push_back(static_cast<std::size_t>(c) + 2);
        }

        auto sel = [&zi](std::initializer_list<std::size_t> head) {
            std::vector<std::size_t> idx(head);
            idx.insert(idx.end(), zi.begin(), zi.end());
            return idx;
        };

        const double h_xz  = code_entropy(joint_codes(cols, sel({0}), bins));
        const double h_yz  = code_entropy(joint_codes(cols, sel({1}), bins));
        const double h_z   = code_entropy(joint_codes(cols, zi, bins));
        const double h_xyz = code_entropy(joint_codes(cols, sel({0, 1}), bins));
        return h_xz + h_yz - h_z - h_xyz;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

} // namespace cmimap::information

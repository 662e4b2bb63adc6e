/// @file src/information/kd_tree.cpp
/// @brief Max-norm kd-tree and brute-force neighbour scans.

#include "kd_tree.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <queue>

namespace cmimap::information::detail {

double chebyshev(const SampleMatrix& points, std::size_t a, std::size_t b) noexcept {
    double d = 0.0;
    const auto ra = static_cast<Eigen::Index>(a);
    const auto rb = static_cast<Eigen::Index>(b);
    for (Eigen::Index c = 0; c < points.cols(); ++c) {
        d = std::max(d, std::abs(points(ra, c) - points(rb, c)));
    }
    return d;
}

// ─── BruteScan ────────────────────────────────────────────────────────────────

double BruteScan::kth_distance(std::size_t i, int k) const {
    const auto n = static_cast<std::size_t>(points_.rows());
    std::vector<double> dist;
    dist.reserve(n - 1);
    for (std::size_t j = 0; j < n; ++j) {
        if (j != i) dist.push_back(chebyshev(points_, i, j));
    }
    const auto kth = dist.begin() + (k - 1);
    std::nth_element(dist.begin(), kth, dist.end());
    return *kth;
}

std::size_t BruteScan::count_within(std::size_t i, double radius) const {
    const auto n = static_cast<std::size_t>(points_.rows());
    std::size_t count = 0;
    for (std::size_t j = 0; j < n; ++j) {
        if (j != i && chebyshev(points_, i, j) < radius) ++count;
    }
    return count;
}

// ─── KdTree ───────────────────────────────────────────────────────────────────

KdTree::KdTree(SampleMatrix points, std::size_t leaf_size)
    : points_(std::move(points)),
      perm_(static_cast<std::size_t>(points_.rows())),
      leaf_size_(std::max<std::size_t>(leaf_size, 1)) {
    std::iota(perm_.begin(), perm_.end(), std::size_t{0});
    if (!perm_.empty()) {
        nodes_.reserve(2 * perm_.size() / leaf_size_ + 1);
        build(0, perm_.size());
    }
}

int KdTree::build(std::size_t begin, std::size_t end) {
    const Eigen::Index dims = points_.cols();

    Node node;
    node.begin = begin;
    node.end   = end;
    node.lo    = Eigen::VectorXd::Constant(dims,  std::numeric_limits<double>::infinity());
    node.hi    = Eigen::VectorXd::Constant(dims, -std::numeric_limits<double>::infinity());
    for (std::size_t p = begin; p < end; ++p) {
        const auto row = static_cast<Eigen::Index>(perm_[p]);
        node.lo = node.lo.cwiseMin(points_.row(row).transpose());
        node.hi = node.hi.cwiseMax(points_.row(row).transpose());
    }

    const int id = static_cast<int>(nodes_.size());
    nodes_.push_back(node);

    if (end - begin <= leaf_size_) {
        return id;
    }

    // Split the widest dimension at the median.
    Eigen::Index split_dim = 0;
    (node.hi - node.lo).maxCoeff(&split_dim);
    if (node.hi(split_dim) == node.lo(split_dim)) {
        // All points coincide; keep as a leaf.
        return id;
    }

    const std::size_t mid = begin + (end - begin) / 2;
    std::nth_element(perm_.begin() + static_cast<std::ptrdiff_t>(begin),
                     perm_.begin() + static_cast<std::ptrdiff_t>(mid),
                     perm_.begin() + static_cast<std::ptrdiff_t>(end),
                     [this, split_dim](std::size_t a, std::size_t b) {
                         return points_(static_cast<Eigen::Index>(a), split_dim) <
                                points_(static_cast<Eigen::Index>(b), split_dim);
                     });

    const int left  = build(begin, mid);
    const int right = build(mid, end);
    nodes_[static_cast<std::size_t>(id)].left  = left;
    nodes_[static_cast<std::size_t>(id)].right = right;
    return id;
}

double KdTree::box_min_distance(const Node& node, std::size_t i) const noexcept {
    double d = 0.0;
    const auto row = static_cast<Eigen::Index>(i);
    for (Eigen::Index c = 0; c < points_.cols(); ++c) {
        const double q = points_(row, c);
        d = std::max(d, std::max({node.lo(c) - q, q - node.hi(c), 0.0}));
    }
    return d;
}

double KdTree::box_max_distance(const Node& node, std::size_t i) const noexcept {
    double d = 0.0;
    const auto row = static_cast<Eigen::Index>(i);
    for (Eigen::Index c = 0; c < points_.cols(); ++c) {
        const double q = points_(row, c);
        d = std::max(d, std::max(q - node.lo(c), node.hi(c) - q));
    }
    return d;
}

double KdTree::kth_distance(std::size_t i, int k) const {
    // Max-heap of the k smallest distances seen so far.
    std::priority_queue<double> best;
    const auto kk = static_cast<std::size_t>(k);

    std::vector<int> stack{0};
    while (!stack.empty()) {
        const Node& node = nodes_[static_cast<std::size_t>(stack.back())];
        stack.pop_back();

        if (best.size() == kk && box_min_distance(node, i) > best.top()) {
            continue;
        }
        if (node.left < 0) {
            for (std::size_t p = node.begin; p < node.end; ++p) {
                const std::size_t j = perm_[p];
                if (j == i) continue;
                const double d = chebyshev(points_, i, j);
                if (best.size() < kk) {
                    best.push(d);
                } else if (d < best.top()) {
                    best.pop();
                    best.push(d);
                }
            }
            continue;
        }
        // Visit the nearer child first (pushed last).
        const Node& l = nodes_[static_cast<std::size_t>(node.left)];
        const Node& r = nodes_[static_cast<std::size_t>(node.right)];
        if (box_min_distance(l, i) <= box_min_distance(r, i)) {
            stack.push_back(node.right);
            stack.push_back(node.left);
        } else {
            stack.push_back(node.left);
            stack.push_back(node.right);
        }
    }
    return best.top();
}

std::size_t KdTree::count_within(std::size_t i, double radius) const {
    std::size_t count = 0;
    std::vector<int> stack{0};
    while (!stack.empty()) {
        const Node& node = nodes_[static_cast<std::size_t>(stack.back())];
        stack.pop_back();

        if (box_min_distance(node, i) >= radius) {
            continue;
        }
        if (box_max_distance(node, i) < radius) {
            // Whole box inside; point i itself (distance 0) may be among them.
            const bool has_self = std::find(perm_.begin() + static_cast<std::ptrdiff_t>(node.begin),
                                            perm_.begin() + static_cast<std::ptrdiff_t>(node.end),
                                            i) != perm_.begin() + static_cast<std::ptrdiff_t>(node.end);
            count += (node.end - node.begin) - (has_self ? 1 : 0);
            continue;
        }
        if (node.left < 0) {
            for (std::size_t p = node.begin; p < node.end; ++p) {
                const std::size_t j = perm_[p];
                if (j != i && chebyshev(points_, i, j) < radius) ++count;
            }
            continue;
        }
        stack.push_back(node.left);
        stack.push_back(node.right);
    }
    return count;
}

// ─── make_index ───────────────────────────────────────────────────────────────

std::unique_ptr<NeighborIndex> make_index(SampleMatrix points, bool kd_tree) {
    if (kd_tree) {
        return std::make_unique<KdTree>(std::move(points));
    }
    return std::make_unique<BruteScan>(std::move(points));
}

} // namespace cmimap::information::detail

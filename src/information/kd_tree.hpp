#pragma once

/// @file src/information/kd_tree.hpp
/// @brief Max-norm kd-tree for the KSG neighbour queries (internal).
///
/// Two queries, both relative to a point that is itself in the tree:
///   - distance to its k-th nearest other point
///   - number of other points strictly closer than a radius
///
/// `BruteScan` answers the same two queries by linear scan; the estimators
/// pick one through `NeighborIndex`. Distances are computed by the same
/// expression in both, so results agree bit for bit.

#include "cmimap/types.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace cmimap::information::detail {

/// Max-norm distance between rows a and b of `points`.
[[nodiscard]] double chebyshev(const SampleMatrix& points, std::size_t a, std::size_t b) noexcept;

class NeighborIndex {
public:
    virtual ~NeighborIndex() = default;

    /// Distance from point i to its k-th nearest neighbour (self excluded).
    [[nodiscard]] virtual double kth_distance(std::size_t i, int k) const = 0;

    /// Points j ≠ i with distance(i, j) < radius.
    [[nodiscard]] virtual std::size_t count_within(std::size_t i, double radius) const = 0;
};

class BruteScan final : public NeighborIndex {
public:
    explicit BruteScan(SampleMatrix points) : points_(std::move(points)) {}

    [[nodiscard]] double kth_distance(std::size_t i, int k) const override;
    [[nodiscard]] std::size_t count_within(std::size_t i, double radius) const override;

private:
    SampleMatrix points_;
};

class KdTree final : public NeighborIndex {
public:
    /// Rows of `points` are samples, columns are dimensions.
    explicit KdTree(SampleMatrix points, std::size_t leaf_size = 16);

    [[nodiscard]] double kth_distance(std::size_t i, int k) const override;
    [[nodiscard]] std::size_t count_within(std::size_t i, double radius) const override;

    [[nodiscard]] std::size_t size() const noexcept { return perm_.size(); }

private:
    struct Node {
        std::size_t     begin;   ///< range into perm_
        std::size_t     end;
        int             left  = -1;
        int             right = -1;
        Eigen::VectorXd lo;      ///< bounding box
        Eigen::VectorXd hi;
    };

    int build(std::size_t begin, std::size_t end);

    /// Max-norm distance from point i to the node's box (0 if inside).
    [[nodiscard]] double box_min_distance(const Node& node, std::size_t i) const noexcept;
    [[nodiscard]] double box_max_distance(const Node& node, std::size_t i) const noexcept;

    SampleMatrix             points_;
    std::vector<std::size_t> perm_;
    std::vector<Node>        nodes_;
    std::size_t              leaf_size_;
};

/// Build the index matching `search` (see information.hpp).
[[nodiscard]] std::unique_ptr<NeighborIndex>
make_index(SampleMatrix points, bool kd_tree);

} // namespace cmimap::information::detail

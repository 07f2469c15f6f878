#pragma once

/// @file src/neighbors/ann_index.hpp
/// @brief Owning wrapper around an ANN k-d tree over the rows of a matrix.
///
/// ANN answers fixed-radius and k-nearest queries on squared distances with
/// its own accumulation order. Both queries here use ANN to collect
/// candidates under a slightly widened bound, then re-check each candidate
/// with the exact predicate of the brute-force scan:
///   - within:  sqrt(Σ d²) ≤ radius
///   - nearest: order by (Σ d², index)
/// so indexed and brute-force relations agree bit for bit, ties included.

#include "stint/types.hpp"

#include <ANN/ANN.h>

#include <cstddef>
#include <memory>

namespace stint::detail {

class AnnIndex {
public:
    /// Index the rows of `points` (n × d, n ≥ 1, d ≥ 1).
    explicit AnnIndex(const Eigen::MatrixXd& points);

    AnnIndex(const AnnIndex&)            = delete;
    AnnIndex& operator=(const AnnIndex&) = delete;

    [[nodiscard]] std::size_t size() const noexcept {
        return static_cast<std::size_t>(points_.rows());
    }

    /// Other points within `radius` (inclusive) of point `query`, ascending.
    [[nodiscard]] IndexList within(std::size_t query, double radius) const;

    /// The `k` nearest other points of `query`, ordered by (distance, index).
    /// Returns every other point when k ≥ size().
    [[nodiscard]] IndexList nearest(std::size_t query, std::size_t k) const;

private:
    struct PointArrayDeleter {
        void operator()(ANNpointArray points) const noexcept { annDeallocPts(points); }
    };

    [[nodiscard]] double squared_distance(std::size_t a, std::size_t b) const noexcept;

    /// Squared-distance candidates of `query` within `squared_radius`,
    /// self included.
    [[nodiscard]] IndexList candidates(std::size_t query, double squared_radius) const;

    Eigen::MatrixXd                             points_;
    std::unique_ptr<ANNpoint, PointArrayDeleter> data_;  // outlives tree_
    std::unique_ptr<ANNkd_tree>                  tree_;
};

}  // namespace stint::detail

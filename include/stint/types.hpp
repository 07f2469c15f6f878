#pragma once

/// @file include/stint/types.hpp
/// @brief Shared primitive types for the space-time interaction (stint) library.
///
/// All modules include this file. It defines the coordinate containers,
/// neighbor relations, relabelings and contingency tables used throughout
/// the test battery, together with the Eigen-based aliases they rest on.

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace stint {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Spatial coordinates: one row per event, columns (x, y).
using SpatialCoords = Eigen::Matrix<double, Eigen::Dynamic, 2>;

/// Temporal coordinates: one entry per event.
using TemporalCoords = Eigen::VectorXd;

/// Dense symmetric pairwise distance matrix (zero diagonal).
using DistanceMatrix = Eigen::MatrixXd;

/// Dense symmetric boolean adjacency matrix ("within threshold").
using AdjacencyMatrix = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;

// ─── Index Types ──────────────────────────────────────────────────────────────

/// Sorted list of event indices.
using IndexList = std::vector<std::size_t>;

/// A relabeling of n events: `labeling[i]` is the event whose temporal
/// coordinate is assigned to slot i. Always a permutation of 0..n-1.
using Labeling = std::vector<std::size_t>;

/// Statistic values realised under permutation, one per trial in draw order.
using PermutationDistribution = std::vector<double>;

/// An unordered event pair stored with `first < second`.
struct IndexPair {
    std::size_t first;
    std::size_t second;

    friend bool operator==(const IndexPair&, const IndexPair&) = default;
    friend auto operator<=>(const IndexPair&, const IndexPair&) = default;
};

// ─── ContingencyTable ─────────────────────────────────────────────────────────

/// 2x2 cross-tabulation of event pairs by spatial × temporal neighbor status.
///
/// Layout (row = spatial neighbor?, column = temporal neighbor?):
/// ```
///            temporal     not temporal
/// spatial      NST            NS_
/// not spatial  NT_            N__
/// ```
/// Cells may be fractional for tables of expected counts.
struct ContingencyTable {
    Eigen::Matrix2d cells = Eigen::Matrix2d::Zero();

    [[nodiscard]] double space_time()   const noexcept { return cells(0, 0); }
    [[nodiscard]] double space_only()   const noexcept { return cells(0, 1); }
    [[nodiscard]] double time_only()    const noexcept { return cells(1, 0); }
    [[nodiscard]] double neither()      const noexcept { return cells(1, 1); }
    [[nodiscard]] double total()        const noexcept { return cells.sum(); }
};

}  // namespace stint

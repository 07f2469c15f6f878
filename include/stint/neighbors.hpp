#pragma once

/// @file include/stint/neighbors.hpp
/// @brief NeighborSets: threshold and k-nearest neighbor relations.
///
/// # Module: Neighbor Sets
///
/// ## Responsibility
/// For every event i, compute the set of other events j ≠ i that are
/// "neighbors" of i in one coordinate domain:
///   - space: Euclidean distance(i, j) ≤ delta
///   - time:  |t_i − t_j| ≤ tau
///   - k-NN:  the k closest other events (directed relation)
///
/// ## Threshold Semantics
/// - threshold < 0                       → every set is empty
/// - threshold ≥ max pairwise distance   → the complete graph
/// - threshold = 0                       → coincident events only
///
/// ## Search Strategy
/// Threshold relations query an ANN k-d tree (libANN) once n exceeds
/// BRUTE_FORCE_CUTOFF; the O(n²) scan is kept for small inputs and as the
/// reference the tree must agree with exactly. k-NN relations always use
/// the tree.
///
/// ## Guarantees
/// - Every set is sorted ascending and never contains its owner
/// - Threshold relations are symmetric: j ∈ N(i) ⇔ i ∈ N(j)
/// - Results do not depend on which search strategy produced them

#include "stint/types.hpp"

#include <cstddef>
#include <vector>

namespace stint {

/// Immutable neighbor relation over n events.
class NeighborSets {
public:
    NeighborSets() = default;

    /// Adopt prebuilt sets. Each set must be sorted and exclude its owner.
    explicit NeighborSets(std::vector<IndexList> sets) noexcept;

    /// Number of events the relation is defined over.
    [[nodiscard]] std::size_t size() const noexcept { return sets_.size(); }

    /// Neighbors of event i (sorted ascending).
    [[nodiscard]] const IndexList& of(std::size_t i) const noexcept {
        return sets_[i];
    }

    /// |N(i)|.
    [[nodiscard]] std::size_t degree(std::size_t i) const noexcept {
        return sets_[i].size();
    }

    /// Whether j ∈ N(i). O(log |N(i)|).
    [[nodiscard]] bool contains(std::size_t i, std::size_t j) const noexcept;

    /// Σ|N(i)|, i.e. the number of ordered neighbor pairs.
    [[nodiscard]] std::size_t ordered_pair_count() const noexcept;

    /// Number of unordered neighbor pairs, Σ|N(i)| / 2. Only meaningful for
    /// symmetric relations.
    [[nodiscard]] std::size_t pair_count() const noexcept {
        return ordered_pair_count() / 2;
    }

    /// Whether j ∈ N(i) ⇔ i ∈ N(j) for every pair.
    [[nodiscard]] bool is_symmetric() const noexcept;

    /// |N(i) ∩ other.N(i)|.
    [[nodiscard]] std::size_t intersection_size(const NeighborSets& other,
                                                std::size_t i) const noexcept;

    friend bool operator==(const NeighborSets&, const NeighborSets&) = default;

private:
    std::vector<IndexList> sets_;
};

// ─── Threshold relations ──────────────────────────────────────────────────────

/// Spatial neighbors: Euclidean distance ≤ delta. Uses the ANN k-d tree
/// when worthwhile.
[[nodiscard]] NeighborSets
spatial_neighbors(const SpatialCoords& coords, double delta);

/// Temporal neighbors: |t_i − t_j| ≤ tau. Uses a sort-and-sweep over the
/// ordered times, O(n log n + m).
[[nodiscard]] NeighborSets
temporal_neighbors(const TemporalCoords& times, double tau);

/// Reference O(n²) scan over the rows of `points` (any dimension).
[[nodiscard]] NeighborSets
brute_force_neighbors(const Eigen::MatrixXd& points, double threshold);

/// ANN k-d tree search over the rows of `points` (any dimension).
[[nodiscard]] NeighborSets
indexed_neighbors(const Eigen::MatrixXd& points, double threshold);

// ─── k-nearest relations ──────────────────────────────────────────────────────

/// The k nearest other events of every event (ties → lower index).
/// Precondition: 1 ≤ k < number of rows.
[[nodiscard]] NeighborSets
k_nearest_neighbors(const Eigen::MatrixXd& points, std::size_t k);

/// Reference O(n² log n) k-NN scan used to validate the tree.
[[nodiscard]] NeighborSets
brute_force_k_nearest(const Eigen::MatrixXd& points, std::size_t k);

}  // namespace stint

/// @file src/neighbors/neighbor_sets.cpp
/// @brief Threshold and k-nearest neighbor relations.

#include "stint/neighbors.hpp"
#include "stint/constants.hpp"

#include "ann_index.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace stint {

// ─── NeighborSets ─────────────────────────────────────────────────────────────

NeighborSets::NeighborSets(std::vector<IndexList> sets) noexcept
    : sets_(std::move(sets)) {}

bool NeighborSets::contains(std::size_t i, std::size_t j) const noexcept {
    const auto& s = sets_[i];
    return std::binary_search(s.begin(), s.end(), j);
}

std::size_t NeighborSets::ordered_pair_count() const noexcept {
    std::size_t total = 0;
    for (const auto& s : sets_) total += s.size();
    return total;
}

bool NeighborSets::is_symmetric() const noexcept {
    for (std::size_t i = 0; i < sets_.size(); ++i) {
        for (std::size_t j : sets_[i]) {
            if (j >= sets_.size() || !contains(j, i)) return false;
        }
    }
    return true;
}

std::size_t NeighborSets::intersection_size(const NeighborSets& other,
                                            std::size_t i) const noexcept {
    // Both sides are sorted: linear merge.
    const auto& a = sets_[i];
    const auto& b = other.sets_[i];
    std::size_t count = 0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) {
            ++ia;
        } else if (*ib < *ia) {
            ++ib;
        } else {
            ++count;
            ++ia;
            ++ib;
        }
    }
    return count;
}

// ─── Threshold relations ──────────────────────────────────────────────────────

NeighborSets brute_force_neighbors(const Eigen::MatrixXd& points, double threshold) {
    const auto n = static_cast<std::size_t>(points.rows());
    std::vector<IndexList> sets(n);
    if (threshold < 0.0) {
        return NeighborSets(std::move(sets));
    }
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            // Same accumulation order as AnnIndex::squared_distance so both
            // paths agree at the boundary.
            double sq = 0.0;
            for (Eigen::Index c = 0; c < points.cols(); ++c) {
                const double d = points(static_cast<Eigen::Index>(i), c) -
                                 points(static_cast<Eigen::Index>(j), c);
                sq += d * d;
            }
            if (std::sqrt(sq) <= threshold) {
                sets[i].push_back(j);
                sets[j].push_back(i);
            }
        }
    }
    // Appending in increasing (i, j) order leaves every list sorted.
    return NeighborSets(std::move(sets));
}

NeighborSets indexed_neighbors(const Eigen::MatrixXd& points, double threshold) {
    const auto n = static_cast<std::size_t>(points.rows());
    std::vector<IndexList> sets(n);
    if (threshold < 0.0) {
        return NeighborSets(std::move(sets));
    }
    const detail::AnnIndex index(points);
    for (std::size_t i = 0; i < n; ++i) {
        sets[i] = index.within(i, threshold);
    }
    return NeighborSets(std::move(sets));
}

NeighborSets spatial_neighbors(const SpatialCoords& coords, double delta) {
    const Eigen::MatrixXd points = coords;
    if (static_cast<std::size_t>(points.rows()) <= constants::BRUTE_FORCE_CUTOFF) {
        return brute_force_neighbors(points, delta);
    }
    return indexed_neighbors(points, delta);
}

NeighborSets temporal_neighbors(const TemporalCoords& times, double tau) {
    const auto n = static_cast<std::size_t>(times.size());
    std::vector<IndexList> sets(n);
    if (tau < 0.0) {
        return NeighborSets(std::move(sets));
    }

    // Sort once by time; neighbors of the k-th earliest event form a
    // contiguous window of the sorted order.
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        const double ta = times(static_cast<Eigen::Index>(a));
        const double tb = times(static_cast<Eigen::Index>(b));
        return ta < tb || (ta == tb && a < b);
    });

    for (std::size_t lo = 0; lo < n; ++lo) {
        const std::size_t i  = order[lo];
        const double      ti = times(static_cast<Eigen::Index>(i));
        for (std::size_t hi = lo + 1; hi < n; ++hi) {
            const std::size_t j = order[hi];
            if (std::abs(times(static_cast<Eigen::Index>(j)) - ti) > tau) break;
            sets[i].push_back(j);
            sets[j].push_back(i);
        }
    }
    for (auto& s : sets) std::sort(s.begin(), s.end());
    return NeighborSets(std::move(sets));
}

// ─── k-nearest relations ──────────────────────────────────────────────────────

NeighborSets k_nearest_neighbors(const Eigen::MatrixXd& points, std::size_t k) {
    const auto n = static_cast<std::size_t>(points.rows());
    std::vector<IndexList> sets(n);
    if (n == 0) return NeighborSets(std::move(sets));
    const detail::AnnIndex index(points);
    for (std::size_t i = 0; i < n; ++i) {
        sets[i] = index.nearest(i, k);
        std::sort(sets[i].begin(), sets[i].end());
    }
    return NeighborSets(std::move(sets));
}

NeighborSets brute_force_k_nearest(const Eigen::MatrixXd& points, std::size_t k) {
    const auto n = static_cast<std::size_t>(points.rows());
    std::vector<IndexList> sets(n);
    std::vector<std::pair<double, std::size_t>> ranked;
    ranked.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        ranked.clear();
        for (std::size_t j = 0; j < n; ++j) {
            if (j == i) continue;
            double sq = 0.0;
            for (Eigen::Index c = 0; c < points.cols(); ++c) {
                const double d = points(static_cast<Eigen::Index>(i), c) -
                                 points(static_cast<Eigen::Index>(j), c);
                sq += d * d;
            }
            ranked.emplace_back(sq, j);
        }
        std::sort(ranked.begin(), ranked.end());
        const std::size_t take = std::min(k, ranked.size());
        for (std::size_t r = 0; r < take; ++r) sets[i].push_back(ranked[r].second);
        std::sort(sets[i].begin(), sets[i].end());
    }
    return NeighborSets(std::move(sets));
}

}  // namespace stint

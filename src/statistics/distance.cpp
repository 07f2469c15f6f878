/// @file src/statistics/distance.cpp
/// @brief Dense distance matrices, adjacency, transforms and correlation.

#include "stint/distance.hpp"
#include "stint/constants.hpp"
#include "stint/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace stint::distance {

// ─── Matrices ─────────────────────────────────────────────────────────────────

DistanceMatrix pairwise(const Eigen::MatrixXd& points) {
    const Eigen::Index n = points.rows();
    DistanceMatrix d = DistanceMatrix::Zero(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < i; ++j) {
            // Accumulate coordinate by coordinate, matching the neighbor
            // search, so "d ≤ threshold" agrees with NeighborSets.
            double sq = 0.0;
            for (Eigen::Index c = 0; c < points.cols(); ++c) {
                const double diff = points(i, c) - points(j, c);
                sq += diff * diff;
            }
            d(i, j) = d(j, i) = std::sqrt(sq);
        }
    }
    return d;
}

DistanceMatrix spatial(const SpatialCoords& coords) {
    return pairwise(Eigen::MatrixXd(coords));
}

DistanceMatrix temporal(const TemporalCoords& times) {
    return pairwise(Eigen::MatrixXd(times));
}

AdjacencyMatrix within(const DistanceMatrix& distances, double threshold) {
    return distances.array() <= threshold;
}

Eigen::VectorXd lower_triangle(const DistanceMatrix& m) {
    const Eigen::Index n = m.rows();
    Eigen::VectorXd out(n * (n - 1) / 2);
    Eigen::Index k = 0;
    for (Eigen::Index i = 1; i < n; ++i) {
        for (Eigen::Index j = 0; j < i; ++j) {
            out(k++) = m(i, j);
        }
    }
    return out;
}

Eigen::ArrayXXd power_transform(const Eigen::ArrayXXd& d, double constant, double power) {
    return d.unaryExpr([constant, power](double v) { return std::pow(v + constant, power); });
}

// ─── Correlation ──────────────────────────────────────────────────────────────

double pearson(const Eigen::VectorXd& a, const Eigen::VectorXd& b) {
    if (a.size() != b.size()) {
        throw InvalidInputSize(fmt::format(
            "correlation inputs differ in length ({} vs {})", a.size(), b.size()));
    }
    if (a.size() < 2) {
        // A single pair has no spread: the coefficient is undefined.
        throw NumericDegeneracy("correlation needs at least 2 observations");
    }
    if (!a.allFinite() || !b.allFinite()) {
        throw NumericDegeneracy("correlation input contains NaN or infinity");
    }

    const Eigen::ArrayXd ca = a.array() - a.mean();
    const Eigen::ArrayXd cb = b.array() - b.mean();
    const double saa = ca.square().sum();
    const double sbb = cb.square().sum();
    if (saa <= constants::ZERO_VARIANCE_EPSILON || sbb <= constants::ZERO_VARIANCE_EPSILON) {
        throw NumericDegeneracy("correlation is undefined for a constant vector");
    }

    const double r = (ca * cb).sum() / std::sqrt(saa * sbb);
    // Rounding can push |r| marginally past 1.
    return std::max(-1.0, std::min(1.0, r));
}

}  // namespace stint::distance

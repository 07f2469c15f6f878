#pragma once

/// @file include/stint/distance.hpp
/// @brief Dense distance matrices and the correlation primitives built on them.
///
/// # Module: Distance
///
/// ## Responsibility
/// Numeric building blocks shared by the matrix-based tests (Mantel, modified
/// Knox): pairwise distance matrices, threshold adjacency, lower-triangle
/// extraction, the `(d + c)^p` transform, and Pearson correlation.
///
/// ## Complexity
/// Every matrix here is dense: O(n²) time and memory.

#include "stint/types.hpp"

namespace stint::distance {

/// Euclidean distance matrix of the rows of `points`.
[[nodiscard]] DistanceMatrix pairwise(const Eigen::MatrixXd& points);

/// Spatial distance matrix.
[[nodiscard]] DistanceMatrix spatial(const SpatialCoords& coords);

/// Absolute time-difference matrix.
[[nodiscard]] DistanceMatrix temporal(const TemporalCoords& times);

/// `distances <= threshold`, elementwise. The diagonal is always true for a
/// non-negative threshold.
[[nodiscard]] AdjacencyMatrix within(const DistanceMatrix& distances,
                                     double threshold);

/// Strictly-lower-triangular entries in row-major order:
/// (1,0), (2,0), (2,1), (3,0), ...
[[nodiscard]] Eigen::VectorXd lower_triangle(const DistanceMatrix& m);

/// Elementwise `(d + constant)^power`.
[[nodiscard]] Eigen::ArrayXXd power_transform(const Eigen::ArrayXXd& d,
                                              double constant,
                                              double power);

/// Pearson correlation coefficient of two equal-length vectors.
///
/// # Throws
/// - `InvalidInputSize`   if lengths differ
/// - `NumericDegeneracy`  if either vector has fewer than 2 entries, zero
///                        variance or a non-finite entry
[[nodiscard]] double pearson(const Eigen::VectorXd& a, const Eigen::VectorXd& b);

}  // namespace stint::distance

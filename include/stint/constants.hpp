#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/stint/constants.hpp
/// @brief Library-wide defaults for the stint test battery.

namespace stint::constants {

// ─── Inference ────────────────────────────────────────────────────────────────

/// Default number of random relabelings used for pseudo-significance.
static constexpr std::size_t DEFAULT_PERMUTATIONS = 99;

/// Seed of the process-wide default permutation engine.
static constexpr std::uint32_t DEFAULT_SEED = 5489u;

// ─── Mantel Transform ─────────────────────────────────────────────────────────

/// Constant added to spatial distances before the power transform.
static constexpr double MANTEL_SPATIAL_CONSTANT = 1.0;

/// Power applied to (spatial distance + constant).
static constexpr double MANTEL_SPATIAL_POWER = -1.0;

/// Constant added to temporal distances before the power transform.
static constexpr double MANTEL_TEMPORAL_CONSTANT = 1.0;

/// Power applied to (temporal distance + constant).
static constexpr double MANTEL_TEMPORAL_POWER = -1.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Variance below which a distance vector is treated as constant.
static constexpr double ZERO_VARIANCE_EPSILON = 1e-24;

// ─── Spatial Index ────────────────────────────────────────────────────────────

/// Below this many events neighbor search skips the ANN k-d tree.
static constexpr std::size_t BRUTE_FORCE_CUTOFF = 32;

/// Bucket size passed to ANNkd_tree (points per leaf).
static constexpr std::size_t ANN_BUCKET_SIZE = 8;

// ─── Minimum Sizes ────────────────────────────────────────────────────────────

/// Every test needs at least one pair of events.
static constexpr std::size_t MIN_EVENTS = 2;

}  // namespace stint::constants

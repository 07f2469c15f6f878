#pragma once

/// @file include/stint/mantel.hpp
/// @brief Standardized Mantel test for space-time interaction.
///
/// # Module: Mantel
///
/// ## Formula
/// Let d_s and d_t be the strictly-lower-triangular entries of the spatial
/// and temporal distance matrices. The statistic is
///
///     r = pearson( (d_s + scon)^spow , (d_t + tcon)^tpow )
///
/// The constants and powers linearise or reweight each distance type; the
/// defaults (1, −1, 1, −1) turn distances into proximities.
///
/// ## Inference
/// Each trial relabels rows and columns of the transformed temporal matrix
/// with one random permutation (symmetry preserved) and recomputes r against
/// the fixed spatial vector. p = (#trials ≥ r + 1) / (permutations + 1).
///
/// ## Complexity
/// O(n²) memory; O(n²) per trial.

#include "stint/constants.hpp"
#include "stint/event_set.hpp"
#include "stint/permutation.hpp"
#include "stint/result.hpp"

#include <cstddef>

namespace stint {

struct MantelConfig {
    std::size_t permutations = constants::DEFAULT_PERMUTATIONS;
    double      scon         = constants::MANTEL_SPATIAL_CONSTANT;
    double      spow         = constants::MANTEL_SPATIAL_POWER;
    double      tcon         = constants::MANTEL_TEMPORAL_CONSTANT;
    double      tpow         = constants::MANTEL_TEMPORAL_POWER;
    bool        keep         = false;
    bool        verbose      = false;
};

/// Mantel test. With `permutations == 0` only `stat` is set.
///
/// # Throws
/// `NumericDegeneracy` if either transformed distance vector is constant or
/// contains a non-finite value (e.g. `0^-1` when a constant is 0 and two
/// events coincide).
[[nodiscard]] TestResult
mantel(const EventSet& events, const MantelConfig& config, PermutationEngine& engine);

[[nodiscard]] TestResult
mantel(const EventSet& events, const MantelConfig& config);

}  // namespace stint

#pragma once

/// @file include/stint/jacquez.hpp
/// @brief Jacquez k-nearest-neighbor test for space-time interaction.
///
/// # Module: Jacquez
///
/// ## Statistic
///     J = Σ_i | kNN_space(i) ∩ kNN_time(i) |
///
/// The k-NN relation is directed, so a pair that are mutual neighbors in
/// both domains contributes twice. 0 ≤ J ≤ n·k.
///
/// ## Inference
/// Each trial permutes which event's time is attached to each location,
/// rebuilds the temporal k-NN sets on the permuted times (spatial sets
/// fixed) and recomputes J. p = (#trials ≥ J + 1) / (permutations + 1).
///
/// ## Ties
/// Equal distances are broken toward the lower index, so with repeated
/// times the temporal k-NN sets depend on the order of the permuted times.
///
/// ## Complexity
/// O(n k log n) per k-NN rebuild, once per trial.

#include "stint/constants.hpp"
#include "stint/event_set.hpp"
#include "stint/neighbors.hpp"
#include "stint/permutation.hpp"
#include "stint/result.hpp"

#include <cstddef>

namespace stint {

struct JacquezConfig {
    std::size_t k            = 3;
    std::size_t permutations = constants::DEFAULT_PERMUTATIONS;
    bool        keep         = false;
    bool        verbose      = false;
};

/// Jacquez test. With `permutations == 0` only `stat` is set.
///
/// # Throws
/// `InvalidThreshold` if k < 1 or k ≥ n.
[[nodiscard]] TestResult
jacquez(const EventSet& events, const JacquezConfig& config, PermutationEngine& engine);

[[nodiscard]] TestResult
jacquez(const EventSet& events, const JacquezConfig& config);

/// Σ_i |space.of(i) ∩ time.of(i)|.
[[nodiscard]] std::size_t
shared_neighbor_count(const NeighborSets& space, const NeighborSets& time) noexcept;

}  // namespace stint

#pragma once

/// @file include/stint/modified_knox.hpp
/// @brief Baker's modified Knox test.
///
/// # Module: Modified Knox
///
/// ## Formula
/// With S and T the n×n "within delta" / "within tau" adjacency matrices
/// (diagonal included) and degrees excluding self:
///
///     obsstat = Σ_ij (S ∧ T)_ij − n
///     expstat = Σ_i sdeg_i · tdeg_i
///     stat    = (obsstat − expstat / (n − 1)) / 2
///
/// stat is the excess of unordered space-time pairs over the count expected
/// from each unit's own spatial and temporal degrees.
///
/// ## Inference
/// Rows and columns of T are relabeled jointly by one random permutation
/// per trial; S is fixed. p = (#trials ≥ stat + 1) / (permutations + 1).
///
/// ## Complexity
/// O(n²) memory for both matrices; O(n²) per trial.

#include "stint/constants.hpp"
#include "stint/event_set.hpp"
#include "stint/permutation.hpp"
#include "stint/result.hpp"

#include <cstddef>

namespace stint {

struct ModifiedKnoxConfig {
    double      delta        = 0.0;
    double      tau          = 0.0;
    std::size_t permutations = constants::DEFAULT_PERMUTATIONS;
    bool        keep         = false;
    bool        verbose      = false;
};

/// Modified Knox test.
///
/// # Throws
/// `InvalidThreshold` for negative or non-finite delta / tau.
[[nodiscard]] TestResult
modified_knox(const EventSet& events, const ModifiedKnoxConfig& config,
              PermutationEngine& engine);

[[nodiscard]] TestResult
modified_knox(const EventSet& events, const ModifiedKnoxConfig& config);

/// The modified Knox statistic for adjacency matrices `space` and `time`
/// (time read through `labeling` on both axes).
[[nodiscard]] double
modified_knox_statistic(const AdjacencyMatrix& space,
                        const AdjacencyMatrix& time,
                        const Labeling&        labeling) noexcept;

}  // namespace stint

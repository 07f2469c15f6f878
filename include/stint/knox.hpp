#pragma once

/// @file include/stint/knox.hpp
/// @brief Global, local and classic Knox tests for space-time interaction.
///
/// # Module: Knox Tests
///
/// ## The Core Idea
/// Two events are spatial neighbors when they lie within `delta` of each
/// other and temporal neighbors when their times differ by at most `tau`.
/// Under independence of space and time, the number of pairs that are both
/// (NST) should be close to NS·NT / C(n,2). An excess of space-time pairs
/// indicates interaction.
///
/// ## Tests
/// - `knox`         — global statistic, 2×2 tables, Poisson and permutation
///                    p-values
/// - `local_knox`   — per-unit statistic with conditional permutation and
///                    averaged hypergeometric p-values, plus all global output
/// - `classic_knox` — the one-shot count with a folded permutation p-value
///
/// ## Inference
/// Spatial neighbor sets are fixed. A trial relabels which event's time sits
/// at each location; temporal neighbor sets are reused through the
/// relabeling rather than searched again.
///
/// ## Thresholds
/// A threshold of exactly 0 empties its own relation only, which
/// degenerates to the independence result (NST = 0, p_poisson = 1) while
/// the other domain's count stays exact. Negative or non-finite thresholds throw
/// `InvalidThreshold`.
///
/// ## Complexity
/// Neighbor search O(n log n + m). Each global trial is O(m log d), each
/// local trial O(n + m log d), where m is the number of spatial neighbor
/// pairs and d the largest temporal degree.

#include "stint/constants.hpp"
#include "stint/event_set.hpp"
#include "stint/neighbors.hpp"
#include "stint/permutation.hpp"
#include "stint/result.hpp"

#include <cstddef>

namespace stint {

/// Parameters shared by every Knox variant.
struct KnoxConfig {
    double      delta        = 0.0;   ///< Spatial threshold
    double      tau          = 0.0;   ///< Temporal threshold
    std::size_t permutations = constants::DEFAULT_PERMUTATIONS;
    bool        keep         = false; ///< Retain permutation distributions
    bool        verbose      = false; ///< Stage summaries on stderr
};

// ─── Global ───────────────────────────────────────────────────────────────────

/// Global Knox test.
///
/// # Throws
/// `InvalidThreshold` for negative or non-finite delta / tau.
[[nodiscard]] KnoxResult
knox(const EventSet& events, const KnoxConfig& config, PermutationEngine& engine);

/// Global Knox test drawing from `default_engine()`.
[[nodiscard]] KnoxResult
knox(const EventSet& events, const KnoxConfig& config);

/// Global Knox test over precomputed neighbor sets. Both relations must be
/// symmetric and defined over the same n ≥ 2 events.
///
/// # Throws
/// `InvalidInputSize` if the relations disagree in size or n < 2.
[[nodiscard]] KnoxResult
knox(const NeighborSets& space, const NeighborSets& time,
     const KnoxConfig& config, PermutationEngine& engine);

/// Space-time pair count under a relabeling:
/// Σ_i |{ j ∈ S(i) : r[j] ∈ T(r[i]) }| / 2.
[[nodiscard]] std::size_t
relabeled_space_time_pairs(const NeighborSets& space,
                           const NeighborSets& time,
                           const Labeling&     labeling) noexcept;

// ─── Local ────────────────────────────────────────────────────────────────────

/// Local Knox test.
///
/// The global trials run first, then the conditional trials, both drawing
/// from `engine`.
///
/// # Throws
/// `InvalidThreshold` for negative or non-finite delta / tau.
[[nodiscard]] LocalKnoxResult
local_knox(const EventSet& events, const KnoxConfig& config, PermutationEngine& engine);

/// Local Knox test drawing from `default_engine()`.
[[nodiscard]] LocalKnoxResult
local_knox(const EventSet& events, const KnoxConfig& config);

/// Local space-time count of `focal` under a conditional relabeling:
/// |{ s ∈ S(focal) : r'[s] ∈ T(focal) }|.
[[nodiscard]] std::size_t
conditional_local_count(const NeighborSets&        space,
                        const NeighborSets&        time,
                        const ConditionalLabeling& labeling,
                        std::size_t                focal) noexcept;

// ─── Classic ──────────────────────────────────────────────────────────────────

/// Classic Knox test.
///
/// Each trial reshuffles the running time assignment in place, so trials
/// compose. The p-value is folded toward the nearer tail (see
/// `folded_pseudo_p_value`). `config.keep` retains the trial counts.
///
/// # Throws
/// `InvalidThreshold` for negative or non-finite delta / tau.
[[nodiscard]] TestResult
classic_knox(const EventSet& events, const KnoxConfig& config, PermutationEngine& engine);

[[nodiscard]] TestResult
classic_knox(const EventSet& events, const KnoxConfig& config);

}  // namespace stint

#pragma once

/// @file include/stint/analytic.hpp
/// @brief Closed-form p-values for the Knox family.
///
/// # Module: Analytical Inference
///
/// ## Responsibility
/// Evaluate the two distribution tails the Knox tests report alongside their
/// permutation p-values:
///   - global: Poisson upper tail of the space-time pair count
///   - local:  hypergeometric upper tail of a unit's space-time count,
///             averaged over a family of success counts
///
/// Distributions are Boost.Math's. Both functions handle the degenerate
/// parameter values Boost rejects (zero Poisson mean, counts outside the
/// hypergeometric support) before constructing a distribution.

#include <cstddef>
#include <span>

namespace stint::analytic {

/// 1 − PoissonCDF(observed; mean) = P(X > observed).
///
/// A zero mean (no spatial or no temporal pairs) returns 1.0: with no pairs
/// to test there is no evidence against independence.
[[nodiscard]] double poisson_upper_tail(double observed, double mean);

/// P(X ≥ successes_needed) for X ~ Hypergeometric(population, successes,
/// draws).
[[nodiscard]] double hypergeometric_survival(std::size_t successes_needed,
                                             std::size_t population,
                                             std::size_t successes,
                                             std::size_t draws);

/// Mean of `hypergeometric_survival(observed, population, s, draws)` over
/// every `s` in `success_counts`.
///
/// This averaged family is not the textbook single-table test; it is kept
/// as documented and flagged for statistical review.
[[nodiscard]] double
mean_hypergeometric_survival(std::size_t observed,
                             std::size_t population,
                             std::span<const std::size_t> success_counts,
                             std::size_t draws);

}  // namespace stint::analytic

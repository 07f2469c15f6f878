/// @file src/statistics/analytic.cpp
/// @brief Poisson and hypergeometric tails for the Knox family (Boost.Math).

#include "stint/analytic.hpp"

#include <boost/math/distributions/hypergeometric.hpp>
#include <boost/math/distributions/poisson.hpp>

#include <algorithm>
#include <cmath>

namespace stint::analytic {

// ─── Poisson ──────────────────────────────────────────────────────────────────

double poisson_upper_tail(double observed, double mean) {
    if (mean <= 0.0) {
        return 1.0;
    }
    const boost::math::poisson_distribution<double> dist(mean);
    // cdf(complement(d, k)) = 1 − cdf(d, k) = P(X > k), without cancellation.
    return boost::math::cdf(boost::math::complement(dist, std::floor(observed)));
}

// ─── Hypergeometric ───────────────────────────────────────────────────────────

double hypergeometric_survival(std::size_t successes_needed,
                               std::size_t population,
                               std::size_t successes,
                               std::size_t draws) {
    // Boost rejects evaluation points outside the support
    // [max(0, draws + successes − population), min(successes, draws)].
    const std::size_t lower = (draws + successes > population)
                                  ? draws + successes - population
                                  : 0;
    const std::size_t upper = std::min(successes, draws);

    if (successes_needed <= lower) {
        return 1.0;
    }
    if (successes_needed > upper) {
        return 0.0;
    }

    const boost::math::hypergeometric_distribution<double> dist(
        static_cast<unsigned>(successes),
        static_cast<unsigned>(draws),
        static_cast<unsigned>(population));
    // P(X ≥ k) = P(X > k − 1).
    return boost::math::cdf(boost::math::complement(
        dist, static_cast<unsigned>(successes_needed - 1)));
}

double mean_hypergeometric_survival(std::size_t observed,
                                    std::size_t population,
                                    std::span<const std::size_t> success_counts,
                                    std::size_t draws) {
    if (success_counts.empty()) {
        return 1.0;
    }
    double sum = 0.0;
    for (std::size_t successes : success_counts) {
        sum += hypergeometric_survival(observed, population, successes, draws);
    }
    return sum / static_cast<double>(success_counts.size());
}

}  // namespace stint::analytic

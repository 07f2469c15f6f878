/// @file src/statistics/jacquez.cpp
/// @brief Jacquez k-nearest-neighbor test.

#include "stint/jacquez.hpp"
#include "stint/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace stint {

std::size_t shared_neighbor_count(const NeighborSets& space, const NeighborSets& time) noexcept {
    std::size_t total = 0;
    for (std::size_t i = 0; i < space.size(); ++i) {
        total += space.intersection_size(time, i);
    }
    return total;
}

TestResult jacquez(const EventSet& events, const JacquezConfig& config,
                   PermutationEngine& engine) {
    const std::size_t n = events.size();
    if (config.k < 1 || config.k >= n) {
        throw InvalidThreshold(fmt::format(
            "k must satisfy 1 <= k < n (got k={}, n={})", config.k, n));
    }

    const NeighborSets space = k_nearest_neighbors(Eigen::MatrixXd(events.space()), config.k);
    const NeighborSets time  = k_nearest_neighbors(Eigen::MatrixXd(events.time()), config.k);

    TestResult result;
    result.stat = static_cast<double>(shared_neighbor_count(space, time));
    if (config.permutations == 0) {
        return result;
    }

    const TemporalCoords& times = events.time();
    Eigen::MatrixXd permuted(static_cast<Eigen::Index>(n), 1);

    PermutationDistribution distribution;
    distribution.reserve(config.permutations);
    for (std::size_t trial = 0; trial < config.permutations; ++trial) {
        const Labeling labels = engine.permutation(n);
        for (std::size_t i = 0; i < n; ++i) {
            permuted(static_cast<Eigen::Index>(i), 0) =
                times(static_cast<Eigen::Index>(labels[i]));
        }
        const NeighborSets trial_time = k_nearest_neighbors(permuted, config.k);
        distribution.push_back(static_cast<double>(shared_neighbor_count(space, trial_time)));
    }

    const std::size_t exceedance = count_at_least(distribution, result.stat);
    result.pvalue = pseudo_p_value(exceedance, config.permutations);
    if (config.keep) result.distribution = std::move(distribution);

    if (config.verbose) {
        fmt::print(stderr, "[jacquez] k={} J={} exceedance={} p={:.4f}\n",
                   config.k, result.stat, exceedance, *result.pvalue);
    }
    return result;
}

TestResult jacquez(const EventSet& events, const JacquezConfig& config) {
    return jacquez(events, config, default_engine());
}

}  // namespace stint

/// @file src/statistics/mantel.cpp
/// @brief Standardized Mantel test.

#include "stint/mantel.hpp"
#include "stint/distance.hpp"

#include <fmt/format.h>

#include <utility>

namespace stint {

namespace {

// Lower triangle of m after relabeling rows and columns with r, in the
// same (i > j, row-major) order as distance::lower_triangle.
Eigen::VectorXd relabeled_lower_triangle(const Eigen::ArrayXXd& m, const Labeling& r) {
    const auto n = static_cast<Eigen::Index>(r.size());
    Eigen::VectorXd out(n * (n - 1) / 2);
    Eigen::Index k = 0;
    for (Eigen::Index i = 1; i < n; ++i) {
        const auto ri = static_cast<Eigen::Index>(r[static_cast<std::size_t>(i)]);
        for (Eigen::Index j = 0; j < i; ++j) {
            out(k++) = m(ri, static_cast<Eigen::Index>(r[static_cast<std::size_t>(j)]));
        }
    }
    return out;
}

}  // namespace

TestResult mantel(const EventSet& events, const MantelConfig& config,
                  PermutationEngine& engine) {
    const std::size_t n = events.size();

    const Eigen::ArrayXXd spatial = distance::power_transform(
        distance::spatial(events.space()).array(), config.scon, config.spow);
    const Eigen::ArrayXXd temporal = distance::power_transform(
        distance::temporal(events.time()).array(), config.tcon, config.tpow);

    const Eigen::VectorXd distvec = distance::lower_triangle(spatial.matrix());

    TestResult result;
    result.stat = distance::pearson(distance::lower_triangle(temporal.matrix()), distvec);
    if (config.permutations == 0) {
        return result;
    }

    PermutationDistribution distribution;
    distribution.reserve(config.permutations);
    for (std::size_t trial = 0; trial < config.permutations; ++trial) {
        const Labeling labels = engine.permutation(n);
        distribution.push_back(
            distance::pearson(relabeled_lower_triangle(temporal, labels), distvec));
    }

    const std::size_t exceedance = count_at_least(distribution, result.stat);
    result.pvalue = pseudo_p_value(exceedance, config.permutations);
    if (config.keep) result.distribution = std::move(distribution);

    if (config.verbose) {
        fmt::print(stderr, "[mantel] r={:.6f} exceedance={} p={:.4f}\n",
                   result.stat, exceedance, *result.pvalue);
    }
    return result;
}

TestResult mantel(const EventSet& events, const MantelConfig& config) {
    return mantel(events, config, default_engine());
}

}  // namespace stint

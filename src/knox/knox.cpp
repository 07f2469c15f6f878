/// @file src/knox/knox.cpp
/// @brief Global and classic Knox tests.
///
/// Both tests count unordered pairs that are neighbors in space and in time.
/// The global test compares the count with its expectation under
/// independence (2×2 tables, Poisson tail) and with fresh random
/// relabelings; the classic test reshuffles one running relabeling and folds
/// its p-value toward the nearer tail.

#include "stint/knox.hpp"
#include "stint/analytic.hpp"
#include "stint/errors.hpp"
#include "knox_detail.hpp"

#include <fmt/format.h>

#include <utility>

namespace stint {

// ─── Shared helpers ───────────────────────────────────────────────────────────

namespace detail {

KnoxRelations knox_relations(const EventSet& events, const KnoxConfig& config) {
    require_threshold(config.delta, "delta");
    require_threshold(config.tau, "tau");

    // A zero threshold is the degenerate "no neighbors" case for its own
    // domain, not the coincident-points relation. The other relation is
    // still built so NS or NT stay exact.
    const std::size_t n = events.size();
    return KnoxRelations{
        .space = config.delta == 0.0 ? NeighborSets(std::vector<IndexList>(n))
                                     : spatial_neighbors(events.space(), config.delta),
        .time  = config.tau == 0.0 ? NeighborSets(std::vector<IndexList>(n))
                                   : temporal_neighbors(events.time(), config.tau),
    };
}

}  // namespace detail

std::size_t relabeled_space_time_pairs(const NeighborSets& space,
                                       const NeighborSets& time,
                                       const Labeling&     labeling) noexcept {
    std::size_t ordered = 0;
    for (std::size_t i = 0; i < space.size(); ++i) {
        const std::size_t ri = labeling[i];
        for (std::size_t j : space.of(i)) {
            if (time.contains(ri, labeling[j])) ++ordered;
        }
    }
    return ordered / 2;
}

// ─── Global ───────────────────────────────────────────────────────────────────

KnoxResult knox(const NeighborSets& space, const NeighborSets& time,
                const KnoxConfig& config, PermutationEngine& engine) {
    if (space.size() != time.size()) {
        throw InvalidInputSize(fmt::format(
            "spatial and temporal relations differ in size ({} vs {})",
            space.size(), time.size()));
    }
    const std::size_t n = space.size();
    if (n < constants::MIN_EVENTS) {
        throw InvalidInputSize(fmt::format(
            "at least {} events are required (got {})", constants::MIN_EVENTS, n));
    }

    KnoxResult result;
    result.pairs = n * (n - 1) / 2;
    result.ns    = space.pair_count();
    result.nt    = time.pair_count();

    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j : space.of(i)) {
            if (j > i && time.contains(i, j)) {
                result.st_pairs.push_back(IndexPair{i, j});
            }
        }
    }
    result.nst = result.st_pairs.size();

    const double pairs = static_cast<double>(result.pairs);
    const double ns    = static_cast<double>(result.ns);
    const double nt    = static_cast<double>(result.nt);
    const double nst   = static_cast<double>(result.nst);

    result.observed.cells << nst,      ns - nst,
                             nt - nst, pairs - ns - nt + nst;

    const double expected_nst = ns * nt / pairs;
    result.expected.cells << expected_nst,      ns - expected_nst,
                             nt - expected_nst, pairs - ns - nt + expected_nst;

    result.p_poisson = analytic::poisson_upper_tail(nst, expected_nst);

    if (config.verbose) {
        fmt::print(stderr, "[knox] n={} NS={} NT={} NST={} E[NST]={:.4f}\n",
                   n, result.ns, result.nt, result.nst, expected_nst);
    }

    if (config.permutations == 0) {
        return result;
    }

    std::size_t exceedance = 0;
    PermutationDistribution sim;
    if (config.keep) sim.reserve(config.permutations);

    for (std::size_t trial = 0; trial < config.permutations; ++trial) {
        const Labeling labels = engine.permutation(n);
        const std::size_t st = relabeled_space_time_pairs(space, time, labels);
        if (st >= result.nst) ++exceedance;
        if (config.keep) sim.push_back(static_cast<double>(st));
    }

    result.exceedance = exceedance;
    result.p_sim      = pseudo_p_value(exceedance, config.permutations);
    if (config.keep) result.sim = std::move(sim);

    if (config.verbose) {
        fmt::print(stderr, "[knox] {} of {} permutations >= observed, p_sim={:.4f}\n",
                   exceedance, config.permutations, *result.p_sim);
    }
    return result;
}

KnoxResult knox(const EventSet& events, const KnoxConfig& config,
                PermutationEngine& engine) {
    const auto relations = detail::knox_relations(events, config);
    return knox(relations.space, relations.time, config, engine);
}

KnoxResult knox(const EventSet& events, const KnoxConfig& config) {
    return knox(events, config, default_engine());
}

// ─── Classic ──────────────────────────────────────────────────────────────────

TestResult classic_knox(const EventSet& events, const KnoxConfig& config,
                        PermutationEngine& engine) {
    const auto relations = detail::knox_relations(events, config);
    const std::size_t n = events.size();

    Labeling labels = identity_labeling(n);
    const std::size_t observed = relabeled_space_time_pairs(relations.space, relations.time, labels);

    TestResult result;
    result.stat = static_cast<double>(observed);
    if (config.permutations == 0) {
        return result;
    }

    std::size_t larger = 0;
    PermutationDistribution sim;
    if (config.keep) sim.reserve(config.permutations);

    for (std::size_t trial = 0; trial < config.permutations; ++trial) {
        // Reshuffle the running assignment: successive trials compose.
        engine.shuffle(labels);
        const std::size_t st = relabeled_space_time_pairs(relations.space, relations.time, labels);
        if (st >= observed) ++larger;
        if (config.keep) sim.push_back(static_cast<double>(st));
    }

    result.pvalue = folded_pseudo_p_value(larger, config.permutations);
    if (config.keep) result.distribution = std::move(sim);

    if (config.verbose) {
        fmt::print(stderr, "[classic_knox] NST={} larger={} p={:.4f}\n",
                   observed, larger, *result.pvalue);
    }
    return result;
}

TestResult classic_knox(const EventSet& events, const KnoxConfig& config) {
    return classic_knox(events, config, default_engine());
}

}  // namespace stint

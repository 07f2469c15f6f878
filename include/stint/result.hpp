#pragma once

/// @file include/stint/result.hpp
/// @brief Result records returned by the space-time interaction tests.
///
/// Every test returns its result by value, fully populated; nothing in a
/// result is mutated after the test returns. Optional members are absent
/// exactly when the corresponding inference was not requested:
///   - `pvalue` / `p_sim`      ← permutations == 0
///   - `distribution` / `sim`  ← keep == false or permutations == 0

#include "stint/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace stint {

// ─── TestResult ───────────────────────────────────────────────────────────────

/// Scalar statistic with optional permutation inference
/// (Mantel, Jacquez, modified Knox, classic Knox).
struct TestResult {
    double                                 stat = 0.0;
    std::optional<double>                  pvalue;
    std::optional<PermutationDistribution> distribution;

    /// One-line summary, e.g. "stat=13.000000  p=0.1700".
    [[nodiscard]] std::string to_string() const;
};

// ─── KnoxResult ───────────────────────────────────────────────────────────────

/// Global Knox test outcome.
struct KnoxResult {
    std::size_t nst   = 0;  ///< Observed space-time neighbor pairs
    std::size_t ns    = 0;  ///< Spatial neighbor pairs
    std::size_t nt    = 0;  ///< Temporal neighbor pairs
    std::size_t pairs = 0;  ///< n(n−1)/2

    ContingencyTable observed;
    ContingencyTable expected;

    double                                 p_poisson = 1.0;
    std::optional<double>                  p_sim;
    std::optional<std::size_t>             exceedance;
    std::optional<PermutationDistribution> sim;

    std::vector<IndexPair> st_pairs;  ///< Sorted space-time pairs (i < j)

    /// Expected space-time pair count under independence, NS·NT / C(n,2).
    [[nodiscard]] double expected_nst() const noexcept {
        return expected.space_time();
    }

    /// Multi-line report of counts, tables and p-values.
    [[nodiscard]] std::string to_string() const;
};

// ─── LocalKnoxResult ──────────────────────────────────────────────────────────

/// Local Knox test outcome: the global result plus per-unit arrays.
struct LocalKnoxResult {
    KnoxResult global;

    std::vector<std::size_t> nsti;         ///< Space-time pairs touching unit i
    std::vector<std::size_t> nsi;          ///< Spatial neighbors of unit i
    std::vector<std::size_t> nti;          ///< Temporal neighbors of unit i
    std::vector<double>      p_hypergeom;  ///< Averaged hypergeometric p-values

    std::optional<std::vector<double>>      p_sims;       ///< Conditional pseudo p-values
    std::optional<std::vector<std::size_t>> exceedances;  ///< Conditional exceedance counts
    /// Conditional local statistics, `sims[i][trial]` (if keep).
    std::optional<std::vector<std::vector<std::size_t>>> sims;

    [[nodiscard]] std::size_t size() const noexcept { return nsti.size(); }

    /// Global report followed by one line per unit.
    [[nodiscard]] std::string to_string() const;
};

}  // namespace stint

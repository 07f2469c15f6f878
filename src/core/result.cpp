/// @file src/core/result.cpp
/// @brief Text reports for test results.

#include "stint/result.hpp"

#include <fmt/format.h>

#include <iterator>

namespace stint {

namespace {

std::string format_p(const std::optional<double>& p) {
    return p ? fmt::format("{:.4f}", *p) : std::string("n/a");
}

}  // namespace

// ─── TestResult ───────────────────────────────────────────────────────────────

std::string TestResult::to_string() const {
    return fmt::format("stat={:.6f}  p={}", stat, format_p(pvalue));
}

// ─── KnoxResult ───────────────────────────────────────────────────────────────

std::string KnoxResult::to_string() const {
    std::string out = fmt::format(
        "Knox: NST={}  NS={}  NT={}  pairs={}\n"
        "                 time-near    time-far\n"
        "  observed  S    {:10.2f}  {:10.2f}\n"
        "            ~S   {:10.2f}  {:10.2f}\n"
        "  expected  S    {:10.4f}  {:10.4f}\n"
        "            ~S   {:10.4f}  {:10.4f}\n"
        "  p_poisson={:.6f}  p_sim={}",
        nst, ns, nt, pairs,
        observed.space_time(), observed.space_only(),
        observed.time_only(),  observed.neither(),
        expected.space_time(), expected.space_only(),
        expected.time_only(),  expected.neither(),
        p_poisson, format_p(p_sim));
    if (exceedance) {
        fmt::format_to(std::back_inserter(out), "  exceedance={}", *exceedance);
    }
    out += '\n';
    return out;
}

// ─── LocalKnoxResult ──────────────────────────────────────────────────────────

std::string LocalKnoxResult::to_string() const {
    std::string out = global.to_string();
    fmt::format_to(std::back_inserter(out), "{:>6}  {:>5}  {:>5}  {:>5}  {:>10}  {:>8}\n",
                   "unit", "NSTi", "NSi", "NTi", "p_hypergeom", "p_sim");
    for (std::size_t i = 0; i < size(); ++i) {
        const std::optional<double> p =
            p_sims ? std::optional<double>((*p_sims)[i]) : std::nullopt;
        fmt::format_to(std::back_inserter(out), "{:>6}  {:>5}  {:>5}  {:>5}  {:>10.6f}  {:>8}\n",
                       i, nsti[i], nsi[i], nti[i], p_hypergeom[i], format_p(p));
    }
    return out;
}

}  // namespace stint

/// @file src/permutation/permutation_engine.cpp
/// @brief PermutationEngine, labelings and pseudo p-values.

#include "stint/permutation.hpp"
#include "stint/constants.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace stint {

// ─── PermutationEngine ────────────────────────────────────────────────────────

PermutationEngine::PermutationEngine(std::uint32_t seed) : rng_(seed) {}

void PermutationEngine::seed(std::uint32_t seed) {
    rng_.seed(seed);
}

std::size_t PermutationEngine::bounded(std::size_t max) {
    if (max == 0) {
        return 0;
    }
    // Smallest all-ones mask covering max; redraw until the masked value
    // falls in range (expected < 2 draws).
    std::uint64_t mask = max;
    mask |= mask >> 1;
    mask |= mask >> 2;
    mask |= mask >> 4;
    mask |= mask >> 8;
    mask |= mask >> 16;
    mask |= mask >> 32;

    std::uint64_t value = 0;
    if (max <= 0xffffffffULL) {
        do {
            value = next32() & mask;
        } while (value > max);
    } else {
        do {
            const std::uint64_t hi = next32();
            const std::uint64_t lo = next32();
            value = ((hi << 32) | lo) & mask;
        } while (value > max);
    }
    return static_cast<std::size_t>(value);
}

void PermutationEngine::shuffle(std::span<std::size_t> labels) {
    if (labels.size() < 2) {
        return;
    }
    for (std::size_t i = labels.size() - 1; i > 0; --i) {
        const std::size_t j = bounded(i);
        std::swap(labels[i], labels[j]);
    }
}

Labeling PermutationEngine::permutation(std::size_t n) {
    Labeling labels = identity_labeling(n);
    shuffle(labels);
    return labels;
}

PermutationEngine& default_engine() noexcept {
    static PermutationEngine engine(constants::DEFAULT_SEED);
    return engine;
}

// ─── Labelings ────────────────────────────────────────────────────────────────

Labeling identity_labeling(std::size_t n) {
    Labeling labels(n);
    std::iota(labels.begin(), labels.end(), std::size_t{0});
    return labels;
}

Labeling inverse_labeling(const Labeling& labeling) {
    Labeling inverse(labeling.size());
    for (std::size_t i = 0; i < labeling.size(); ++i) {
        inverse[labeling[i]] = i;
    }
    return inverse;
}

bool is_permutation(const Labeling& labeling) noexcept {
    std::vector<bool> seen(labeling.size(), false);
    for (std::size_t label : labeling) {
        if (label >= labeling.size() || seen[label]) return false;
        seen[label] = true;
    }
    return true;
}

Labeling ConditionalLabeling::materialize() const {
    Labeling out(size());
    for (std::size_t slot = 0; slot < out.size(); ++slot) {
        out[slot] = (*this)[slot];
    }
    return out;
}

// ─── Pseudo p-values ──────────────────────────────────────────────────────────

std::size_t count_at_least(std::span<const double> distribution, double observed) noexcept {
    return static_cast<std::size_t>(
        std::count_if(distribution.begin(), distribution.end(),
                      [observed](double v) { return v >= observed; }));
}

double pseudo_p_value(std::size_t exceedance, std::size_t permutations) noexcept {
    return (static_cast<double>(exceedance) + 1.0) /
           (static_cast<double>(permutations) + 1.0);
}

double folded_pseudo_p_value(std::size_t exceedance, std::size_t permutations) noexcept {
    const std::size_t below = permutations - std::min(exceedance, permutations);
    return pseudo_p_value(std::min(exceedance, below), permutations);
}

}  // namespace stint

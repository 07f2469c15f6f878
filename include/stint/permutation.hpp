#pragma once

/// @file include/stint/permutation.hpp
/// @brief PermutationEngine: seedable source of random relabelings.
///
/// # Module: Permutation Engine
///
/// ## Responsibility
/// Produce the random relabelings every permutation test draws from and
/// reduce realised statistics to pseudo p-values.
///
/// ## Relabeling Model
/// A relabeling is an index permutation r applied at lookup time: under r,
/// slot i carries the temporal identity of event r[i]. Coordinate arrays and
/// distance matrices are never reordered in place.
///
/// ## Reproducibility
/// The engine wraps a 32-bit Mersenne Twister. Shuffles are a descending
/// Fisher–Yates pass whose bounded draws use bitmask rejection on raw 32-bit
/// outputs, so a given seed yields the same stream with every standard
/// library (std::uniform_int_distribution is implementation-defined).
///
/// ## Thread Safety
/// An engine is NOT thread-safe. Give each thread its own engine.
/// `default_engine()` is a single process-wide instance intended for the
/// convenience overloads and the command-line tool only.

#include "stint/types.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>

namespace stint {

class PermutationEngine {
public:
    /// Construct seeded with `seed`.
    explicit PermutationEngine(std::uint32_t seed);

    /// Reseed, restarting the stream.
    void seed(std::uint32_t seed);

    /// Uniform integer in [0, max] (inclusive).
    [[nodiscard]] std::size_t bounded(std::size_t max);

    /// Shuffle `labels` in place (descending Fisher–Yates).
    void shuffle(std::span<std::size_t> labels);

    /// A fresh uniformly random permutation of 0..n−1.
    [[nodiscard]] Labeling permutation(std::size_t n);

private:
    [[nodiscard]] std::uint32_t next32() { return static_cast<std::uint32_t>(rng_()); }

    std::mt19937 rng_;
};

/// Process-wide engine seeded with `constants::DEFAULT_SEED`.
[[nodiscard]] PermutationEngine& default_engine() noexcept;

// ─── Labelings ────────────────────────────────────────────────────────────────

/// The identity labeling 0..n−1.
[[nodiscard]] Labeling identity_labeling(std::size_t n);

/// `inverse[labeling[i]] == i` for every i.
[[nodiscard]] Labeling inverse_labeling(const Labeling& labeling);

/// Whether `labeling` is a permutation of 0..n−1.
[[nodiscard]] bool is_permutation(const Labeling& labeling) noexcept;

/// A full random relabeling conditioned on one focal unit keeping its own
/// label.
///
/// Given a base relabeling r and a focal unit f, the conditional relabeling
/// r' is:
///   - r'[f] = f
///   - r'[s] = r[f] for the slot s that held f in r (s = inverse[f])
///   - r'[k] = r[k] everywhere else
///
/// If r already fixes f the view equals r. The view is O(1) to build and
/// O(1) per lookup; `base` and `inverse` must outlive it.
class ConditionalLabeling {
public:
    ConditionalLabeling(const Labeling& base,
                        const Labeling& inverse,
                        std::size_t     focal) noexcept
        : base_(base),
          focal_(focal),
          displaced_slot_(inverse[focal]),
          displaced_label_(base[focal]) {}

    [[nodiscard]] std::size_t operator[](std::size_t slot) const noexcept {
        if (slot == focal_)          return focal_;
        if (slot == displaced_slot_) return displaced_label_;
        return base_[slot];
    }

    [[nodiscard]] std::size_t size() const noexcept { return base_.size(); }

    /// Materialise the view (for tests and inspection).
    [[nodiscard]] Labeling materialize() const;

private:
    const Labeling& base_;
    std::size_t     focal_;
    std::size_t     displaced_slot_;
    std::size_t     displaced_label_;
};

// ─── Pseudo p-values ──────────────────────────────────────────────────────────

/// Number of values in `distribution` that are ≥ `observed`.
[[nodiscard]] std::size_t
count_at_least(std::span<const double> distribution, double observed) noexcept;

/// (exceedance + 1) / (permutations + 1).
[[nodiscard]] double
pseudo_p_value(std::size_t exceedance, std::size_t permutations) noexcept;

/// Folded variant used by the classic Knox test: the exceedance count is
/// replaced by permutations − exceedance when that is smaller.
[[nodiscard]] double
folded_pseudo_p_value(std::size_t exceedance, std::size_t permutations) noexcept;

}  // namespace stint

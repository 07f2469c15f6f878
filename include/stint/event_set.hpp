#pragma once

/// @file include/stint/event_set.hpp
/// @brief EventSet: immutable collection of space-time point events.
///
/// # Module: Event Set
///
/// ## Responsibility
/// Hold n events, each with a 2-D spatial coordinate and a 1-D temporal
/// coordinate, and guarantee the invariants every test relies on:
///   - spatial and temporal arrays have the same length n
///   - row i of each array refers to the same event
///   - n ≥ 2 (at least one pair exists)
///   - every coordinate is finite
///
/// ## Guarantees
/// - Immutable after construction: only const accessors are exposed
/// - Construction validates eagerly and throws before any test can run
///
/// ## NOT Responsible For
/// - Reading data from disk (see event_loader.hpp)

#include "stint/types.hpp"

#include <cstddef>
#include <span>

namespace stint {

class EventSet {
public:
    /// Build from coordinate matrices.
    ///
    /// # Throws
    /// - `InvalidInputSize`  if the row counts differ or are < 2
    /// - `InvalidCoordinate` if any coordinate is NaN or ±Inf
    EventSet(SpatialCoords space, TemporalCoords time);

    /// Build from three parallel columns.
    ///
    /// # Throws
    /// Same as the matrix constructor.
    EventSet(std::span<const double> x,
             std::span<const double> y,
             std::span<const double> t);

    /// Number of events.
    [[nodiscard]] std::size_t size() const noexcept {
        return static_cast<std::size_t>(time_.size());
    }

    /// Spatial coordinates (n × 2).
    [[nodiscard]] const SpatialCoords& space() const noexcept { return space_; }

    /// Temporal coordinates (n).
    [[nodiscard]] const TemporalCoords& time() const noexcept { return time_; }

    /// Total number of unordered event pairs, n(n−1)/2.
    [[nodiscard]] std::size_t pair_count() const noexcept {
        return size() * (size() - 1) / 2;
    }

private:
    void validate() const;

    SpatialCoords  space_;
    TemporalCoords time_;
};

}  // namespace stint

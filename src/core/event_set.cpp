/// @file src/core/event_set.cpp
/// @brief EventSet construction and validation.

#include "stint/event_set.hpp"
#include "stint/constants.hpp"
#include "stint/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace stint {

// ─── Constructors ─────────────────────────────────────────────────────────────

EventSet::EventSet(SpatialCoords space, TemporalCoords time)
    : space_(std::move(space)), time_(std::move(time)) {
    validate();
}

EventSet::EventSet(std::span<const double> x,
                   std::span<const double> y,
                   std::span<const double> t) {
    if (x.size() != t.size() || y.size() != t.size()) {
        throw InvalidInputSize(fmt::format(
            "coordinate columns differ in length (x={}, y={}, t={})",
            x.size(), y.size(), t.size()));
    }
    const auto n = static_cast<Eigen::Index>(t.size());
    space_.resize(n, 2);
    time_.resize(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto k = static_cast<std::size_t>(i);
        space_(i, 0) = x[k];
        space_(i, 1) = y[k];
        time_(i)     = t[k];
    }
    validate();
}

// ─── validate ─────────────────────────────────────────────────────────────────

void EventSet::validate() const {
    if (space_.rows() != time_.size()) {
        throw InvalidInputSize(fmt::format(
            "spatial and temporal arrays differ in length ({} vs {})",
            space_.rows(), time_.size()));
    }
    if (size() < constants::MIN_EVENTS) {
        throw InvalidInputSize(fmt::format(
            "at least {} events are required (got {})",
            constants::MIN_EVENTS, size()));
    }
    if (!space_.allFinite()) {
        throw InvalidCoordinate("spatial coordinates contain NaN or infinity");
    }
    if (!time_.allFinite()) {
        throw InvalidCoordinate("temporal coordinates contain NaN or infinity");
    }
}

}  // namespace stint

#pragma once

/// @file src/knox/knox_detail.hpp
/// @brief Internal helpers shared by the global, local and classic Knox tests.

#include "stint/event_set.hpp"
#include "stint/knox.hpp"
#include "stint/neighbors.hpp"

namespace stint::detail {

/// Spatial and temporal neighbor relations of one Knox invocation.
struct KnoxRelations {
    NeighborSets space;
    NeighborSets time;
};

/// Validate the thresholds and build both relations. A zero delta (tau)
/// yields an empty spatial (temporal) relation; the other is built as usual.
///
/// # Throws
/// `InvalidThreshold` for negative or non-finite delta / tau.
[[nodiscard]] KnoxRelations
knox_relations(const EventSet& events, const KnoxConfig& config);

}  // namespace stint::detail

/// @file src/core/errors.cpp
/// @brief StintError hierarchy and shared argument checks.

#include "stint/errors.hpp"

#include <fmt/format.h>

#include <cmath>

namespace stint {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInputSize:  return "InvalidInputSize";
        case ErrorKind::InvalidThreshold:  return "InvalidThreshold";
        case ErrorKind::InvalidCoordinate: return "InvalidCoordinate";
        case ErrorKind::NumericDegeneracy: return "NumericDegeneracy";
    }
    return "Unknown";
}

StintError::StintError(ErrorKind kind, const std::string& message)
    : std::runtime_error(fmt::format("{}: {}", to_string(kind), message)),
      kind_(kind) {}

void require_threshold(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw InvalidThreshold(fmt::format("{} must be finite (got {})", name, value));
    }
    if (value < 0.0) {
        throw InvalidThreshold(fmt::format("{} must be >= 0 (got {})", name, value));
    }
}

}  // namespace stint

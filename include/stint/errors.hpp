#pragma once

/// @file include/stint/errors.hpp
/// @brief Exception hierarchy raised by the stint test battery.
///
/// # Module: Errors
///
/// ## Responsibility
/// Name every way a test call can be rejected. All failures are usage
/// errors detected before (or, for NumericDegeneracy, during) computation;
/// none are transient and none are retried.
///
/// | Kind               | Raised when                                         |
/// |--------------------|-----------------------------------------------------|
/// | InvalidInputSize   | fewer than 2 events, or length mismatch             |
/// | InvalidThreshold   | negative / non-finite delta or tau, k out of range  |
/// | InvalidCoordinate  | a coordinate is NaN or infinite                     |
/// | NumericDegeneracy  | a correlation is undefined (zero variance, non-finite) |
///
/// Parsing code (see event_loader.hpp) never throws; it returns
/// `std::optional` instead.

#include <stdexcept>
#include <string>

namespace stint {

/// Discriminator carried by every StintError.
enum class ErrorKind {
    InvalidInputSize,
    InvalidThreshold,
    InvalidCoordinate,
    NumericDegeneracy,
};

/// Convert ErrorKind to a human-readable string.
[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

/// Base class of all stint errors.
class StintError : public std::runtime_error {
public:
    StintError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidInputSize : public StintError {
public:
    explicit InvalidInputSize(const std::string& message)
        : StintError(ErrorKind::InvalidInputSize, message) {}
};

class InvalidThreshold : public StintError {
public:
    explicit InvalidThreshold(const std::string& message)
        : StintError(ErrorKind::InvalidThreshold, message) {}
};

class InvalidCoordinate : public StintError {
public:
    explicit InvalidCoordinate(const std::string& message)
        : StintError(ErrorKind::InvalidCoordinate, message) {}
};

class NumericDegeneracy : public StintError {
public:
    explicit NumericDegeneracy(const std::string& message)
        : StintError(ErrorKind::NumericDegeneracy, message) {}
};

// ─── Validation helpers ───────────────────────────────────────────────────────

/// Throw InvalidThreshold unless `value` is finite and ≥ 0.
/// `name` is used in the message ("delta", "tau", ...).
void require_threshold(double value, const char* name);

}  // namespace stint

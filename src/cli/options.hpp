#pragma once

/// @file src/cli/options.hpp
/// @brief Command-line options of the stint CLI.

#include "stint/constants.hpp"
#include "stint/event_loader.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace stint::cli {

struct Options {
    std::string   test;
    std::string   path;
    LoaderConfig  loader;
    double        delta        = 0.0;
    double        tau          = 0.0;
    std::size_t   k            = 3;
    std::size_t   permutations = constants::DEFAULT_PERMUTATIONS;
    std::uint32_t seed         = constants::DEFAULT_SEED;
    bool          keep         = false;
    bool          verbose      = false;
};

/// Whether `test` names one of the CLI's tests (or `all`).
[[nodiscard]] bool is_known_test(std::string_view test) noexcept;

/// Parse a decimal integer that fits `std::size_t`. Signs, fractions,
/// exponents and out-of-range values are rejected.
[[nodiscard]] std::optional<std::size_t> parse_count(std::string_view text) noexcept;

/// Parse a decimal seed that fits 32 bits.
[[nodiscard]] std::optional<std::uint32_t> parse_seed(std::string_view text) noexcept;

/// Parse argv (argv[1] = test, argv[2] = CSV path, then flags). Returns
/// nullopt, after printing a message to stderr, on any malformed argument.
/// Precondition: argc ≥ 3.
[[nodiscard]] std::optional<Options> parse_args(int argc, const char* const argv[]);

}  // namespace stint::cli

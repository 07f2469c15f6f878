/// @file src/cli/options.cpp
/// @brief Argument parsing for the stint CLI.

#include "options.hpp"

#include <fmt/core.h>

#include <charconv>
#include <system_error>

namespace stint::cli {

namespace {

template <typename Unsigned>
std::optional<Unsigned> parse_unsigned(std::string_view text) noexcept {
    Unsigned value{};
    const char* first = text.data();
    const char* last  = first + text.size();
    // from_chars rejects a leading sign for unsigned types and reports
    // values above the type's maximum as result_out_of_range.
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}  // anonymous namespace

bool is_known_test(std::string_view test) noexcept {
    return test == "knox" || test == "local-knox" || test == "classic-knox" ||
           test == "modified-knox" || test == "mantel" || test == "jacquez" ||
           test == "all";
}

std::optional<std::size_t> parse_count(std::string_view text) noexcept {
    return parse_unsigned<std::size_t>(text);
}

std::optional<std::uint32_t> parse_seed(std::string_view text) noexcept {
    return parse_unsigned<std::uint32_t>(text);
}

std::optional<Options> parse_args(int argc, const char* const argv[]) {
    Options opts;
    opts.test = argv[1];
    opts.path = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string_view flag(argv[i]);
        if (flag == "--infer-dates") { opts.loader.infer_timestamp = true; continue; }
        if (flag == "--keep")        { opts.keep = true; continue; }
        if (flag == "--verbose")     { opts.verbose = true; opts.loader.verbose = true; continue; }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string_view value(argv[++i]);

        if (flag == "--x")         { opts.loader.x_column = value; continue; }
        if (flag == "--y")         { opts.loader.y_column = value; continue; }
        if (flag == "--time")      { opts.loader.time_column = value; continue; }

        if (flag == "--delta" || flag == "--tau") {
            const auto number = EventLoader::parse_number(value);
            if (!number) {
                fmt::print(stderr, "Error: {} expects a number (got '{}')\n", flag, value);
                return std::nullopt;
            }
            (flag == "--delta" ? opts.delta : opts.tau) = *number;
            continue;
        }

        if (flag == "--k" || flag == "--permutations") {
            const auto count = parse_count(value);
            if (!count) {
                fmt::print(stderr, "Error: {} expects a non-negative integer (got '{}')\n",
                           flag, value);
                return std::nullopt;
            }
            (flag == "--k" ? opts.k : opts.permutations) = *count;
            continue;
        }

        if (flag == "--seed") {
            const auto seed = parse_seed(value);
            if (!seed) {
                fmt::print(stderr, "Error: --seed expects an integer in [0, {}] (got '{}')\n",
                           UINT32_MAX, value);
                return std::nullopt;
            }
            opts.seed = *seed;
            continue;
        }

        fmt::print(stderr, "Unknown option: {}\n", flag);
        return std::nullopt;
    }
    return opts;
}

}  // namespace stint::cli

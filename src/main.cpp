/// @file src/main.cpp
/// @brief stint CLI entry point.
///
/// Usage:
///   stint <test> <csv_file> [options]   Run a space-time interaction test
///   stint --help                        Print usage

#include "stint/errors.hpp"
#include "stint/event_loader.hpp"
#include "stint/event_set.hpp"
#include "stint/jacquez.hpp"
#include "stint/knox.hpp"
#include "stint/mantel.hpp"
#include "stint/modified_knox.hpp"
#include "cli/options.hpp"

#include <fmt/core.h>

#include <optional>
#include <string_view>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  stint <test> <csv_file> [options]\n"
        "\n"
        "Tests:\n"
        "  knox            Global Knox test (Poisson and permutation p-values)\n"
        "  local-knox      Per-event Knox statistics\n"
        "  classic-knox    Knox count with a folded permutation p-value\n"
        "  modified-knox   Baker's modified Knox test\n"
        "  mantel          Standardized Mantel test\n"
        "  jacquez         Jacquez k-nearest-neighbor test\n"
        "  all             Every test above\n"
        "\n"
        "Options:\n"
        "  --x COL            x column name (default: x)\n"
        "  --y COL            y column name (default: y)\n"
        "  --time COL         time column name (default: t)\n"
        "  --infer-dates      Read the time column as YYYY-MM-DD dates\n"
        "  --delta D          Spatial threshold\n"
        "  --tau T            Temporal threshold\n"
        "  --k K              Jacquez neighbor count (default: 3)\n"
        "  --permutations P   Permutation trials (default: 99)\n"
        "  --seed S           Random seed (default: 5489)\n"
        "  --keep             Print the permutation distributions' size\n"
        "  --verbose          Stage summaries on stderr\n"
    );
}

using stint::cli::Options;

void print_distribution_size(const Options& opts,
                             const std::optional<stint::PermutationDistribution>& dist) {
    if (opts.keep && dist) {
        fmt::print("  kept {} permutation statistics\n", dist->size());
    }
}

/// Run the selected test(s). Returns 0 on success, 1 on error.
int run(const Options& opts) {
    auto columns = stint::EventLoader::load_csv(opts.path, opts.loader);
    if (!columns) {
        fmt::print(stderr, "Error: cannot load events from '{}'\n", opts.path);
        return 1;
    }
    fmt::print("Loaded {} events from '{}' ({} rows skipped{})\n",
               columns->size(), opts.path, columns->skipped_rows,
               columns->dates_converted ? ", times are day offsets" : "");

    const stint::EventSet events(columns->x, columns->y, columns->t);
    stint::PermutationEngine engine(opts.seed);
    const bool all = opts.test == "all";

    const stint::KnoxConfig knox_config{
        .delta = opts.delta, .tau = opts.tau, .permutations = opts.permutations,
        .keep = opts.keep, .verbose = opts.verbose,
    };

    if (all || opts.test == "knox") {
        const auto result = stint::knox(events, knox_config, engine);
        fmt::print("{}", result.to_string());
        print_distribution_size(opts, result.sim);
    }
    if (all || opts.test == "local-knox") {
        const auto result = stint::local_knox(events, knox_config, engine);
        fmt::print("{}", result.to_string());
    }
    if (all || opts.test == "classic-knox") {
        const auto result = stint::classic_knox(events, knox_config, engine);
        fmt::print("Classic Knox: {}\n", result.to_string());
        print_distribution_size(opts, result.distribution);
    }
    if (all || opts.test == "modified-knox") {
        const stint::ModifiedKnoxConfig config{
            .delta = opts.delta, .tau = opts.tau, .permutations = opts.permutations,
            .keep = opts.keep, .verbose = opts.verbose,
        };
        const auto result = stint::modified_knox(events, config, engine);
        fmt::print("Modified Knox: {}\n", result.to_string());
        print_distribution_size(opts, result.distribution);
    }
    if (all || opts.test == "mantel") {
        stint::MantelConfig config;
        config.permutations = opts.permutations;
        config.keep         = opts.keep;
        config.verbose      = opts.verbose;
        const auto result = stint::mantel(events, config, engine);
        fmt::print("Mantel: {}\n", result.to_string());
        print_distribution_size(opts, result.distribution);
    }
    if (all || opts.test == "jacquez") {
        const stint::JacquezConfig config{
            .k = opts.k, .permutations = opts.permutations,
            .keep = opts.keep, .verbose = opts.verbose,
        };
        const auto result = stint::jacquez(events, config, engine);
        fmt::print("Jacquez (k={}): {}\n", opts.k, result.to_string());
        print_distribution_size(opts, result.distribution);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc >= 2) {
        const std::string_view mode(argv[1]);
        if (mode == "--help" || mode == "-h") {
            print_usage();
            return 0;
        }
    }
    if (argc < 3) {
        print_usage();
        return 1;
    }
    if (!stint::cli::is_known_test(argv[1])) {
        fmt::print(stderr, "Unknown test: {}\n", argv[1]);
        print_usage();
        return 1;
    }

    const auto opts = stint::cli::parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    try {
        return run(*opts);
    } catch (const stint::StintError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}

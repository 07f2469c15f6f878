/**
 * @file  fuzz_event_loader.cpp
 * @brief libFuzzer target for the CSV event loader and the event pipeline.
 *
 * Build:
 *   cmake -DSTINT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_event_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_event_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. If columns are returned:
 *      a. x, y and t have equal length
 *      b. every value is finite
 *      c. converted dates start at day 0
 *   3. When at least two events load, Knox counts stay consistent.
 *
 * Fuzzer strategy:
 *   The first input byte selects loader options (date inference, column
 *   names); the rest is passed as CSV text.  The parser must handle binary
 *   garbage, missing headers, ragged rows, "nan"/"inf" tokens, CR line
 *   endings and malformed dates.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "stint/errors.hpp"
#include "stint/event_loader.hpp"
#include "stint/event_set.hpp"
#include "stint/knox.hpp"

using namespace stint;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) {
        return 0;
    }

    LoaderConfig config;
    config.infer_timestamp = (data[0] & 0x1) != 0;
    if ((data[0] & 0x2) != 0) {
        config.time_column = "date";
    }
    const std::string_view input{reinterpret_cast<const char*>(data + 1), size - 1};

    const auto cols = EventLoader::parse_csv_string(input, config);
    if (!cols.has_value()) {
        return 0;
    }

    // Invariant 2a
    assert(cols->x.size() == cols->t.size());
    assert(cols->y.size() == cols->t.size());

    // Invariant 2b
    for (std::size_t i = 0; i < cols->size(); ++i) {
        assert(std::isfinite(cols->x[i]));
        assert(std::isfinite(cols->y[i]));
        assert(std::isfinite(cols->t[i]));
    }

    // Invariant 2c
    if (cols->dates_converted && cols->size() > 0) {
        assert(*std::min_element(cols->t.begin(), cols->t.end()) == 0.0);
    }

    // Invariant 3: keep n small so each input stays fast.
    if (cols->size() < 2 || cols->size() > 64) {
        return 0;
    }
    const EventSet events(cols->x, cols->y, cols->t);
    const auto r = knox(events, KnoxConfig{.delta = 1.0, .tau = 1.0, .permutations = 0});
    assert(r.nst <= r.ns && r.nst <= r.nt);
    assert(r.pairs == events.pair_count());
    assert(r.p_poisson >= 0.0 && r.p_poisson <= 1.0);

    return 0;
}

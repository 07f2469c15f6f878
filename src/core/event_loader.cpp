/// @file src/core/event_loader.cpp
/// @brief CSV EventLoader for space-time event data.

#include "stint/event_loader.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace stint {

namespace {

/// A data row whose spatial fields parsed; the time field is kept as text
/// until the column's interpretation is decided.
struct RawRow {
    double      x;
    double      y;
    std::string t;
};

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n\"");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n\"");
    return s.substr(first, last - first + 1);
}

/// Split a CSV line on commas (no quoted-comma handling needed for
/// coordinate data).
std::vector<std::string_view> split_csv(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Column index of `name` in `header` (case-insensitive), or -1.
int find_col(const std::vector<std::string_view>& header, const std::string& name) {
    const std::string wanted = lower(name);
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (lower(header[i]) == wanted) return static_cast<int>(i);
    }
    return -1;
}

bool is_skippable(std::string_view line) noexcept {
    return trim(line).empty() || line.front() == '#';
}

}  // namespace

// ─── EventLoader::parse_number ────────────────────────────────────────────────

std::optional<double> EventLoader::parse_number(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.front() == '+') {
        text.remove_prefix(1);
    }
    double value = 0.0;
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;  // malformed or trailing garbage
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// ─── EventLoader::parse_iso_date ──────────────────────────────────────────────

std::optional<long> EventLoader::parse_iso_date(std::string_view text) noexcept {
    text = trim(text);
    // YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    const auto parse_part = [&](std::size_t pos, std::size_t len, auto& out) {
        const auto* first = text.data() + pos;
        const auto* last  = first + len;
        const auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc{} && ptr == last;
    };
    if (!parse_part(0, 4, y) || !parse_part(5, 2, m) || !parse_part(8, 2, d)) {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!ymd.ok()) {
        return std::nullopt;  // e.g. 2023-02-30
    }
    const std::chrono::sys_days days{ymd};
    return static_cast<long>(days.time_since_epoch().count());
}

// ─── EventLoader::parse_csv_string ────────────────────────────────────────────

std::optional<EventColumns>
EventLoader::parse_csv_string(std::string_view csv_content,
                              const LoaderConfig& config) noexcept {
    std::vector<RawRow> rows;
    std::size_t skipped = 0;
    int col_x = -1;
    int col_y = -1;
    int col_t = -1;
    bool header_found = false;

    std::size_t pos = 0;
    while (pos <= csv_content.size()) {
        auto eol = csv_content.find('\n', pos);
        if (eol == std::string_view::npos) eol = csv_content.size();
        std::string_view line = csv_content.substr(pos, eol - pos);
        pos = eol + 1;

        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (is_skippable(line)) {
            continue;
        }

        const auto fields = split_csv(line);
        if (!header_found) {
            // First non-empty, non-comment line is the header.
            header_found = true;
            col_x = find_col(fields, config.x_column);
            col_y = find_col(fields, config.y_column);
            col_t = find_col(fields, config.time_column);
            if (col_x < 0 || col_y < 0 || col_t < 0) {
                fmt::print(stderr,
                    "[event_loader] header lacks column(s): x='{}' y='{}' t='{}'\n",
                    config.x_column, config.y_column, config.time_column);
                return std::nullopt;
            }
            continue;
        }

        const auto needed = static_cast<std::size_t>(std::max({col_x, col_y, col_t}));
        if (fields.size() <= needed) {
            ++skipped;
            continue;
        }
        const auto x = parse_number(fields[static_cast<std::size_t>(col_x)]);
        const auto y = parse_number(fields[static_cast<std::size_t>(col_y)]);
        const auto t = fields[static_cast<std::size_t>(col_t)];
        if (!x || !y || t.empty()) {
            ++skipped;
            continue;
        }
        rows.push_back(RawRow{.x = *x, .y = *y, .t = std::string(t)});
    }

    if (!header_found) {
        return std::nullopt;
    }

    EventColumns out;

    // Date interpretation applies only when every kept row is a date.
    if (config.infer_timestamp) {
        std::vector<long> days;
        days.reserve(rows.size());
        for (const auto& row : rows) {
            const auto d = parse_iso_date(row.t);
            if (!d) break;
            days.push_back(*d);
        }
        if (days.size() == rows.size() && !rows.empty()) {
            const long day1 = *std::min_element(days.begin(), days.end());
            for (std::size_t i = 0; i < rows.size(); ++i) {
                out.x.push_back(rows[i].x);
                out.y.push_back(rows[i].y);
                out.t.push_back(static_cast<double>(days[i] - day1));
            }
            out.skipped_rows    = skipped;
            out.dates_converted = true;
            return out;
        }
        fmt::print(stderr,
            "[event_loader] unable to parse column '{}' as calendar dates, "
            "proceeding as numbers\n", config.time_column);
    }

    for (const auto& row : rows) {
        const auto t = parse_number(row.t);
        if (!t) {
            ++skipped;
            continue;
        }
        out.x.push_back(row.x);
        out.y.push_back(row.y);
        out.t.push_back(*t);
    }
    out.skipped_rows = skipped;

    if (config.verbose && skipped > 0) {
        fmt::print(stderr, "[event_loader] skipped {} malformed rows\n", skipped);
    }
    return out;
}

// ─── EventLoader::load_csv ────────────────────────────────────────────────────

std::optional<EventColumns>
EventLoader::load_csv(const std::string& filepath, const LoaderConfig& config) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return parse_csv_string(contents.str(), config);
}

}  // namespace stint

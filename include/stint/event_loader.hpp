#pragma once

/// @file include/stint/event_loader.hpp
/// @brief CSV loader for space-time event data.
///
/// # Module: Event Loader
///
/// ## Responsibility
/// Parse CSV files holding one event per row into parallel x / y / t columns
/// ready for `EventSet`. Columns are selected by header name
/// (case-insensitive). Rows with a missing, malformed or non-finite value in
/// any selected column are skipped.
///
/// ## Expected CSV Format
/// ```
/// id,x,y,t
/// 1,300.0,302.0,413
/// 2,312.5,291.0,472
/// ```
/// Extra columns are ignored. The first non-empty, non-comment line is the
/// header.
///
/// ## Calendar Dates
/// With `infer_timestamp = true` the time column is read as ISO dates
/// (`YYYY-MM-DD`) and converted to whole-day offsets from the earliest date
/// in the file. If any kept row fails to parse as a date, the whole column is
/// re-read as numeric and a notice is written to stderr.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stint {

/// Which columns to read and how to interpret the time column.
struct LoaderConfig {
    std::string x_column        = "x";
    std::string y_column        = "y";
    std::string time_column     = "t";
    bool        infer_timestamp = false;
    bool        verbose         = false;
};

/// Parallel coordinate columns extracted from a data source.
struct EventColumns {
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> t;
    std::size_t         skipped_rows    = 0;     ///< Rows rejected as malformed
    bool                dates_converted = false; ///< t holds day offsets

    [[nodiscard]] std::size_t size() const noexcept { return t.size(); }
};

/// Loads space-time events from CSV files and strings.
class EventLoader {
public:
    EventLoader() = delete;

    /// Load events from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened, has no header, or lacks a
    ///   requested column
    /// - Columns of parsed events otherwise (possibly empty)
    [[nodiscard]] static std::optional<EventColumns>
    load_csv(const std::string& filepath, const LoaderConfig& config) noexcept;

    /// Parse events from CSV-formatted text (useful for testing).
    ///
    /// Same format and return contract as `load_csv`.
    [[nodiscard]] static std::optional<EventColumns>
    parse_csv_string(std::string_view csv_content,
                     const LoaderConfig& config) noexcept;

    /// Parse an ISO `YYYY-MM-DD` date into days since 1970-01-01.
    ///
    /// # Returns
    /// `nullopt` for malformed text or an impossible calendar date.
    [[nodiscard]] static std::optional<long>
    parse_iso_date(std::string_view text) noexcept;

    /// Parse a finite double occupying the whole of `text`.
    [[nodiscard]] static std::optional<double>
    parse_number(std::string_view text) noexcept;
};

}  // namespace stint

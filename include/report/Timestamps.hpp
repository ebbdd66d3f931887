#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace report {

// Parses "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.fff][Z|+hh:mm|-hh:mm]" into
// seconds since the Unix epoch (UTC). Returns nullopt for anything else.
std::optional<std::int64_t> parse_iso8601(const std::string& s);

// "2026-01-15T00:00:00Z"
std::string format_iso8601(std::int64_t epoch_seconds);

std::string current_utc_iso8601();

// "Jan 15" for chart axes; empty when the timestamp does not parse.
std::string short_date_label(const std::string& iso);

// "January 15, 2026"
std::string long_date_label(const std::string& iso);

struct CivilTime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

CivilTime to_civil(std::int64_t epoch_seconds);

}  // namespace report

#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>
#include <cstdint>

namespace core {
namespace utils {

    // Timestamp -> ISO 8601 UTC string, e.g. "2024-01-31T00:00:00Z"
    std::string timestampToString(const Timestamp& ts);

    // Timestamp -> "YYYY-MM-DD" (UTC)
    std::string timestampToDateString(const Timestamp& ts);

    // Parses "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.fff]" and "YYYY-MM-DD HH:MM:SS",
    // with an optional "Z" or "+HH:MM"/"-HH:MM" suffix. No suffix means UTC.
    Timestamp stringToTimestamp(const std::string& iso_string);

    std::int64_t toEpochSeconds(const Timestamp& ts);
    Timestamp fromEpochSeconds(std::int64_t seconds);

    // Truncates anything finer than a millisecond
    std::int64_t toEpochMillis(const Timestamp& ts);
    Timestamp fromEpochMillis(std::int64_t millis);

    // Elapsed calendar time in 365.25-day years (negative if end < start)
    double yearsBetween(const Timestamp& start, const Timestamp& end);

} // namespace utils
} // namespace core

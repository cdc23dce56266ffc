#pragma once

#include "synccore/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace synccore {

/// Calendar time used for persisted and exchanged timestamps.
using Timestamp = std::chrono::system_clock::time_point;

/// Monotonic time used for durations and cache recency.
using MonotonicTime = std::chrono::steady_clock::time_point;

/**
 * @brief Format as ISO-8601 UTC with microsecond precision
 *
 * Output is fixed width ("2024-01-02T03:04:05.000006Z") so that
 * lexicographic order of the strings equals chronological order.
 * Returns an empty string for times outside the platform's calendar range.
 */
std::string format_timestamp(Timestamp timestamp);

/**
 * @brief Parse the format produced by format_timestamp()
 *
 * The fractional part is optional and may carry 1-9 digits.
 */
Result<Timestamp> parse_timestamp(const std::string& text);

/// Build a timestamp from milliseconds since the Unix epoch.
Timestamp timestamp_from_millis(std::int64_t millis);

} // namespace synccore

#pragma once

#include "ulidgen/core/result.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace ulidgen::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// parse_rfc3339_millis converts an RFC 3339 datetime to signed Unix milliseconds.
//
// Accepts: YYYY-MM-DD(T|t| )HH:MM:SS[.fraction](Z|z|+HH:MM|-HH:MM)
// Fractional seconds beyond millisecond precision are truncated.
// Leap seconds (SS == 60) are rejected.
// Pre-epoch datetimes yield negative values; range checks are the caller's concern.
//
// Returns: milliseconds on success, a short reason string on failure.
[[nodiscard]] Result<std::int64_t, std::string> parse_rfc3339_millis(std::string_view text);

// format_rfc3339_millis renders Unix milliseconds as RFC 3339 in UTC with a
// "+00:00" offset. The ".mmm" fraction is only emitted when non-zero, and
// years past 9999 are signed ("+10889-...").
// Example: 1469922850259 -> "2016-07-30T23:54:10.259+00:00"
[[nodiscard]] std::string format_rfc3339_millis(std::int64_t unix_millis);

}  // namespace ulidgen::core

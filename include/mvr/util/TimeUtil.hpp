#pragma once

#include "mvr/Result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mvr::util {

constexpr std::int64_t kMsPerSecond = 1000;
constexpr std::int64_t kMsPerMinute = 60 * kMsPerSecond;

// Values below this are unix seconds, at or above it milliseconds.
constexpr std::int64_t kSecondsCutoff = 10'000'000'000LL;

std::int64_t nowMs();

// Floor to the enclosing unit (correct for negative values too).
std::int64_t floorTo(std::int64_t ms, std::int64_t unitMs);
inline std::int64_t truncateToMinute(std::int64_t ms) { return floorTo(ms, kMsPerMinute); }
inline std::int64_t truncateToSecond(std::int64_t ms) { return floorTo(ms, kMsPerSecond); }

// UTC civil time -> unix milliseconds. Returns nullopt on out-of-range fields.
std::optional<std::int64_t> civilToMs(int year, int month, int day,
                                      int hour = 0, int minute = 0, int second = 0);

// Accepts integer seconds/milliseconds, RFC 3339 and "YYYY-MM-DD HH:MM:SS" (UTC).
Result<std::int64_t> parseDateTime(const std::string& value);

// "YYYY-MM-DD HH:MM:SS" UTC
std::string formatDateTime(std::int64_t ms);
// "YYYY-MM-DDTHH:MM:SSZ"; with fraction=true trailing millisecond digits are kept
// (trailing zeros trimmed).
std::string formatRfc3339(std::int64_t ms, bool fraction = false);

struct TimeRange {
  std::int64_t startMs = 0;
  std::int64_t endMs = 0;
};

// Empty start -> now-60min, empty end -> now (both minute-truncated).
Result<TimeRange> parseTimeRange(const std::string& start, const std::string& end,
                                 std::int64_t now);

} // namespace mvr::util

#pragma once

#include <chrono>
#include <cstdint>
#include <ratio>
#include <string>

#include "hlid/common.hpp"

namespace hlid::util {

// One tick is 10^-4 seconds (a tenth of a millisecond)
using Ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10000>>;
using TickTime = std::chrono::time_point<std::chrono::system_clock, Ticks>;

// Broken-down UTC instant at tick resolution
struct DateTime {
  int year = 1970;
  unsigned month = 1;
  unsigned day = 1;
  unsigned hour = 0;
  unsigned minute = 0;
  unsigned second = 0;
  unsigned tick = 0;  // 0-9999

  unsigned microsecond() const { return tick * 100; }

  bool operator==(const DateTime& other) const = default;
};

// Time utilities for tick arithmetic, UTC calendar math and RFC3339
class Time {
 public:
  // Truncate a wall-clock time to tick resolution (floor, never rounds up)
  static TickTime toTicks(std::chrono::system_clock::time_point time);

  // First and last instants an identifier can carry
  static TickTime minTime();
  static TickTime maxTime();
  static bool inRange(TickTime time);

  // Decompose into UTC calendar fields
  static DateTime toDateTime(TickTime time);

  // Compose from UTC calendar fields; rejects impossible dates and times
  static Result<TickTime> fromDateTime(const DateTime& fields);

  // Seconds since the epoch as a floating point value
  static double toSeconds(TickTime time);

  // Format as RFC3339 with four fractional digits, e.g. 2024-11-05T11:08:52.5200Z
  static std::string toRfc3339(TickTime time);

  // Parse RFC3339 with a mandatory zone designator (Z or +HH:MM), converting to UTC.
  // Fractions are truncated to ticks; years outside 1970..9999 are kOutOfRange.
  static Result<TickTime> fromRfc3339(const std::string& str);

  // Get current time
  static std::chrono::system_clock::time_point now();

  // Format duration for human reading
  static std::string formatDuration(std::chrono::nanoseconds duration);
};

}  // namespace hlid::util

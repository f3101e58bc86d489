#pragma once

#include <chrono>
#include <string>

#include "rem/common.hpp"

namespace rem::util {

// Time utilities for RFC3339 formatting and relative descriptions
class Time {
 public:
  // Format time as RFC3339 string in UTC (ISO 8601)
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Parse RFC3339 UTC string to time_point
  static Result<std::chrono::system_clock::time_point> fromRfc3339(const std::string& str);

  // Get current time
  static std::chrono::system_clock::time_point now();

  // Describe target relative to now in natural language, e.g. "in 2 hours",
  // "3 days ago" or "now"
  static std::string formatRelative(std::chrono::system_clock::time_point target,
                                    std::chrono::system_clock::time_point now);

  // Whole seconds since the Unix epoch, truncated toward zero
  static long long toEpochSeconds(std::chrono::system_clock::time_point time);

  // Seconds since the Unix epoch with sub-second precision
  static double toEpochSecondsFractional(std::chrono::system_clock::time_point time);
};

}  // namespace rem::util

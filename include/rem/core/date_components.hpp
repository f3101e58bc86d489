#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "rem/common.hpp"

namespace rem::core {

/**
 * @brief Calendar-based due date
 *
 * Stored the way the user entered it rather than as an instant. The instant
 * is resolved in the local time zone whenever it is needed; a date without a
 * time of day resolves to local midnight.
 */
struct DateComponents {
  int year = 1970;
  int month = 1;
  int day = 1;
  std::optional<int> hour;
  std::optional<int> minute;
  std::optional<int> second;

  bool hasTime() const { return hour.has_value(); }

  /**
   * @brief Resolve to a concrete instant in the local time zone
   */
  std::chrono::system_clock::time_point date() const;

  /**
   * @brief Check ranges of every present component
   */
  Result<void> validate() const;

  /**
   * @brief Build components from an instant in the local time zone
   * @param include_time Keep hour, minute and second
   */
  static DateComponents fromTimePoint(std::chrono::system_clock::time_point time,
                                      bool include_time = true);

  /**
   * @brief Parse a due date as typed on the command line
   *
   * Accepts "today", "tomorrow", "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]",
   * "YYYY-MM-DDTHH:MM[:SS]" and "in N minutes|hours|days|weeks".
   * @param now Reference instant for the relative forms
   */
  static Result<DateComponents> parse(const std::string& text,
                                      std::chrono::system_clock::time_point now);

  // Canonical text form: "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS"
  std::string toString() const;

  bool operator==(const DateComponents& other) const = default;
};

}  // namespace rem::core

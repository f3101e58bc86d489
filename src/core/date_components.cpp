#include "rem/core/date_components.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace rem::core {

namespace {

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

constexpr int kMinYear = 1;
constexpr int kMaxYear = 9999;

// Relative due dates further out than this are rejected
constexpr long long kMaxRelativeSeconds = 1000LL * 366 * 24 * 3600;

std::string toLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

}  // namespace

std::chrono::system_clock::time_point DateComponents::date() const {
  std::tm tm = {};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour.value_or(0);
  tm.tm_min = minute.value_or(0);
  tm.tm_sec = second.value_or(0);
  tm.tm_isdst = -1;
  tm.tm_wday = -1;

  std::tm requested = tm;
  std::time_t resolved = std::mktime(&tm);

  // -1 is also a valid instant; mktime only fills tm_wday on success
  if (resolved == -1 && tm.tm_wday == -1) {
    resolved = timegm(&requested);
  }
  return std::chrono::system_clock::from_time_t(resolved);
}

Result<void> DateComponents::validate() const {
  if (year < kMinYear || year > kMaxYear) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Year out of range: " + std::to_string(year)));
  }
  if (month < 1 || month > 12) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Month out of range: " + std::to_string(month)));
  }
  if (day < 1 || day > daysInMonth(year, month)) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Day out of range: " + std::to_string(day)));
  }
  if (hour && (*hour < 0 || *hour > 23)) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Hour out of range: " + std::to_string(*hour)));
  }
  if (minute && (*minute < 0 || *minute > 59)) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Minute out of range: " + std::to_string(*minute)));
  }
  if (second && (*second < 0 || *second > 59)) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Second out of range: " + std::to_string(*second)));
  }
  if ((minute || second) && !hour) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Minutes or seconds given without an hour"));
  }
  return {};
}

DateComponents DateComponents::fromTimePoint(std::chrono::system_clock::time_point time,
                                             bool include_time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  std::tm tm = {};
  localtime_r(&time_t, &tm);

  DateComponents components;
  components.year = tm.tm_year + 1900;
  components.month = tm.tm_mon + 1;
  components.day = tm.tm_mday;
  if (include_time) {
    components.hour = tm.tm_hour;
    components.minute = tm.tm_min;
    components.second = tm.tm_sec;
  }
  return components;
}

Result<DateComponents> DateComponents::parse(const std::string& text,
                                             std::chrono::system_clock::time_point now) {
  std::string input = toLower(text);

  if (input == "today") {
    return fromTimePoint(now, false);
  }
  if (input == "tomorrow") {
    return fromTimePoint(now + std::chrono::hours(24), false);
  }

  static const std::regex relative_regex(R"(in\s+(\d+)\s*(minute|hour|day|week)s?)");
  static const std::regex absolute_regex(
      R"((\d{4})-(\d{2})-(\d{2})(?:[ t](\d{2}):(\d{2})(?::(\d{2}))?)?)");

  std::smatch match;
  if (std::regex_match(input, match, relative_regex)) {
    std::string unit = match[2];
    long long unit_seconds = 60;
    if (unit == "hour") {
      unit_seconds = 3600;
    } else if (unit == "day") {
      unit_seconds = 24 * 3600;
    } else if (unit == "week") {
      unit_seconds = 7 * 24 * 3600;
    }

    std::string digits = match[1];
    long long amount = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), amount);
    if (ec != std::errc() || end != digits.data() + digits.size() ||
        amount > kMaxRelativeSeconds / unit_seconds) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Invalid due date '" + text + "': too far in the future"));
    }

    auto components = fromTimePoint(now + std::chrono::seconds(amount * unit_seconds),
                                    unit == "minute" || unit == "hour");
    auto validation = components.validate();
    if (!validation.has_value()) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Invalid due date '" + text + "': " +
                                       validation.error().message()));
    }
    return components;
  }

  if (std::regex_match(input, match, absolute_regex)) {
    DateComponents components;
    components.year = std::stoi(match[1]);
    components.month = std::stoi(match[2]);
    components.day = std::stoi(match[3]);
    if (match[4].matched) {
      components.hour = std::stoi(match[4]);
      components.minute = std::stoi(match[5]);
      if (match[6].matched) {
        components.second = std::stoi(match[6]);
      }
    }

    auto validation = components.validate();
    if (!validation.has_value()) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Invalid due date '" + text + "': " +
                                       validation.error().message()));
    }
    return components;
  }

  return std::unexpected(makeError(ErrorCode::kParseError,
      "Invalid due date '" + text + "'. Expected today, tomorrow, YYYY-MM-DD, "
      "YYYY-MM-DD HH:MM or 'in N hours'"));
}

std::string DateComponents::toString() const {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << year << '-'
      << std::setw(2) << month << '-' << std::setw(2) << day;
  if (hour) {
    oss << 'T' << std::setw(2) << *hour << ':' << std::setw(2) << minute.value_or(0)
        << ':' << std::setw(2) << second.value_or(0);
  }
  return oss.str();
}

}  // namespace rem::core

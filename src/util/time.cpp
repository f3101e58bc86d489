#include "rem/util/time.hpp"

#include <array>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace rem::util {

namespace {

struct RelativeUnit {
  const char* name;
  long long seconds;
};

// Largest first; month and year are approximations
constexpr std::array<RelativeUnit, 7> kRelativeUnits = {{
    {"year", 365LL * 24 * 3600},
    {"month", 30LL * 24 * 3600},
    {"week", 7LL * 24 * 3600},
    {"day", 24LL * 3600},
    {"hour", 3600},
    {"minute", 60},
    {"second", 1},
}};

}  // namespace

std::string Time::toRfc3339(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()) % 1000;
  if (milliseconds.count() < 0) {
    milliseconds += std::chrono::milliseconds(1000);
  }

  std::tm tm = {};
  gmtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << milliseconds.count() << 'Z';

  return oss.str();
}

Result<std::chrono::system_clock::time_point> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(?:\.(\d{3}))?Z?)");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  std::tm tm = {};
  tm.tm_year = std::stoi(match[1]) - 1900;
  tm.tm_mon = std::stoi(match[2]) - 1;
  tm.tm_mday = std::stoi(match[3]);
  tm.tm_hour = std::stoi(match[4]);
  tm.tm_min = std::stoi(match[5]);
  tm.tm_sec = std::stoi(match[6]);

  auto time_t = timegm(&tm);
  if (time_t == -1) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  auto time_point = std::chrono::system_clock::from_time_t(time_t);

  if (match[7].matched) {
    time_point += std::chrono::milliseconds(std::stoi(match[7]));
  }

  return time_point;
}

std::chrono::system_clock::time_point Time::now() {
  return std::chrono::system_clock::now();
}

std::string Time::formatRelative(std::chrono::system_clock::time_point target,
                                 std::chrono::system_clock::time_point now) {
  auto delta_ms = std::chrono::duration_cast<std::chrono::milliseconds>(target - now).count();
  bool future = delta_ms >= 0;
  long long seconds = std::llround(static_cast<double>(std::llabs(delta_ms)) / 1000.0);

  if (seconds == 0) {
    return "now";
  }

  // Pick the largest unit that fits, then round to it. Rounding can reach the
  // next unit up (59.6 minutes), in which case that unit is used instead.
  size_t unit_index = kRelativeUnits.size() - 1;
  for (size_t i = 0; i < kRelativeUnits.size(); ++i) {
    if (seconds >= kRelativeUnits[i].seconds) {
      unit_index = i;
      break;
    }
  }

  long long value = std::llround(static_cast<double>(seconds) /
                                 static_cast<double>(kRelativeUnits[unit_index].seconds));
  if (unit_index > 0) {
    const auto& larger = kRelativeUnits[unit_index - 1];
    if (value * kRelativeUnits[unit_index].seconds >= larger.seconds) {
      unit_index -= 1;
      value = std::llround(static_cast<double>(seconds) / static_cast<double>(larger.seconds));
    }
  }

  std::ostringstream oss;
  if (future) {
    oss << "in ";
  }
  oss << value << ' ' << kRelativeUnits[unit_index].name;
  if (value != 1) {
    oss << 's';
  }
  if (!future) {
    oss << " ago";
  }
  return oss.str();
}

long long Time::toEpochSeconds(std::chrono::system_clock::time_point time) {
  return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

double Time::toEpochSecondsFractional(std::chrono::system_clock::time_point time) {
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()).count();
  return static_cast<double>(milliseconds) / 1000.0;
}

}  // namespace rem::util

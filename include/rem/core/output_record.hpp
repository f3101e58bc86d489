#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rem/common.hpp"
#include "rem/core/reminder.hpp"

namespace rem::core {

// Output format for reminder listings
enum class OutputFormat {
  kPlainText,
  kJson
};

/**
 * @brief Display projection of a reminder
 *
 * The due date fields are set together or not at all; creation_date is set
 * only when the reminder carries a creation timestamp.
 */
struct OutputRecord {
  std::optional<std::string> title;
  std::optional<std::string> due_date_human_readable;
  std::optional<long long> due_date_epoch;
  std::optional<double> creation_date;

  static OutputRecord from(const Reminder& reminder, std::chrono::system_clock::time_point now);

  // {"title", "dueDateEpoch"?, "dueDateHumanReadable"?, "creationDate"?}
  nlohmann::json toJson() const;

  // "<index>: <title>[ (<relative due date>)]"
  std::string toLine(size_t index) const;
};

// Encode records as a single-line JSON array
Result<std::string> encodeJson(const std::vector<OutputRecord>& records);

}  // namespace rem::core

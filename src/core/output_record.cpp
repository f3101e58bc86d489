#include "rem/core/output_record.hpp"

#include <sstream>

#include "rem/util/time.hpp"

namespace rem::core {

OutputRecord OutputRecord::from(const Reminder& reminder,
                                std::chrono::system_clock::time_point now) {
  OutputRecord record;
  record.title = reminder.title();

  if (const auto& due = reminder.dueDateComponents()) {
    auto due_date = due->date();
    record.due_date_human_readable = util::Time::formatRelative(due_date, now);
    record.due_date_epoch = util::Time::toEpochSeconds(due_date);
  }

  if (const auto& created = reminder.creationDate()) {
    record.creation_date = util::Time::toEpochSecondsFractional(*created);
  }

  return record;
}

nlohmann::json OutputRecord::toJson() const {
  nlohmann::json json;
  json["title"] = title ? nlohmann::json(*title) : nlohmann::json(nullptr);
  if (due_date_epoch && due_date_human_readable) {
    json["dueDateHumanReadable"] = *due_date_human_readable;
    json["dueDateEpoch"] = *due_date_epoch;
  }
  if (creation_date) {
    json["creationDate"] = *creation_date;
  }
  return json;
}

std::string OutputRecord::toLine(size_t index) const {
  std::ostringstream oss;
  oss << index << ": " << title.value_or("<unknown>");
  if (due_date_human_readable) {
    oss << " (" << *due_date_human_readable << ")";
  }
  return oss.str();
}

Result<std::string> encodeJson(const std::vector<OutputRecord>& records) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& record : records) {
    array.push_back(record.toJson());
  }

  try {
    return array.dump();
  } catch (const nlohmann::json::type_error& e) {
    return std::unexpected(makeError(ErrorCode::kEncodingError,
                                     "Failed to encode reminders as JSON: " + std::string(e.what())));
  }
}

}  // namespace rem::core

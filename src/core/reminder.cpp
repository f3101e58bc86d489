#include "rem/core/reminder.hpp"

#include <algorithm>
#include <cctype>

#include "rem/util/time.hpp"

namespace rem::core {

namespace {

std::string toLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

nlohmann::json dueToJson(const DateComponents& due) {
  nlohmann::json json;
  json["year"] = due.year;
  json["month"] = due.month;
  json["day"] = due.day;
  if (due.hour) json["hour"] = *due.hour;
  if (due.minute) json["minute"] = *due.minute;
  if (due.second) json["second"] = *due.second;
  return json;
}

Result<DateComponents> dueFromJson(const nlohmann::json& json) {
  DateComponents due;
  due.year = json.at("year").get<int>();
  due.month = json.at("month").get<int>();
  due.day = json.at("day").get<int>();
  if (json.contains("hour")) due.hour = json["hour"].get<int>();
  if (json.contains("minute")) due.minute = json["minute"].get<int>();
  if (json.contains("second")) due.second = json["second"].get<int>();

  auto validation = due.validate();
  if (!validation.has_value()) {
    return std::unexpected(validation.error());
  }
  return due;
}

Result<std::optional<std::chrono::system_clock::time_point>> timestampFromJson(
    const nlohmann::json& json, const char* key) {
  if (!json.contains(key) || json[key].is_null()) {
    return std::optional<std::chrono::system_clock::time_point>{};
  }
  auto parsed = util::Time::fromRfc3339(json[key].get<std::string>());
  if (!parsed.has_value()) {
    return std::unexpected(parsed.error());
  }
  return std::optional<std::chrono::system_clock::time_point>{*parsed};
}

}  // namespace

ReminderList::ReminderList(ObjectId id, std::string title, bool allows_modifications)
    : id_(std::move(id)), title_(std::move(title)), allows_modifications_(allows_modifications) {}

ReminderList ReminderList::create(const std::string& title) {
  return ReminderList(ObjectId::generate(), title, true);
}

bool ReminderList::matchesName(const std::string& name) const {
  return toLower(title_) == toLower(name);
}

nlohmann::json ReminderList::toJson() const {
  nlohmann::json json;
  json["id"] = id_.toString();
  json["title"] = title_;
  json["allows_modifications"] = allows_modifications_;
  return json;
}

Result<ReminderList> ReminderList::fromJson(const nlohmann::json& json) {
  try {
    auto id = ObjectId::fromString(json.at("id").get<std::string>());
    if (!id.has_value()) {
      return std::unexpected(id.error());
    }
    return ReminderList(*id, json.at("title").get<std::string>(),
                        json.value("allows_modifications", true));
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Malformed list entry: " + std::string(e.what())));
  }
}

Reminder Reminder::create(const ReminderList& list, const std::string& title) {
  Reminder reminder;
  reminder.id_ = ObjectId::generate();
  reminder.list_id_ = list.id();
  reminder.title_ = title;
  return reminder;
}

void Reminder::setCompleted(bool completed, std::chrono::system_clock::time_point when) {
  completed_ = completed;
  if (completed) {
    completion_date_ = when;
  } else {
    completion_date_.reset();
  }
}

Result<void> Reminder::validate() const {
  if (!id_.isValid()) {
    return std::unexpected(makeError(ErrorCode::kValidationError, "Reminder has no valid id"));
  }
  if (!list_id_.isValid()) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Reminder is not attached to a list"));
  }
  if (due_) {
    return due_->validate();
  }
  return {};
}

nlohmann::json Reminder::toJson() const {
  nlohmann::json json;
  json["id"] = id_.toString();
  json["list"] = list_id_.toString();
  json["title"] = title_ ? nlohmann::json(*title_) : nlohmann::json(nullptr);
  if (due_) {
    json["due"] = dueToJson(*due_);
  }
  if (creation_date_) {
    json["created"] = util::Time::toRfc3339(*creation_date_);
  }
  json["completed"] = completed_;
  if (completion_date_) {
    json["completed_at"] = util::Time::toRfc3339(*completion_date_);
  }
  return json;
}

Result<Reminder> Reminder::fromJson(const nlohmann::json& json) {
  try {
    Reminder reminder;

    auto id = ObjectId::fromString(json.at("id").get<std::string>());
    if (!id.has_value()) {
      return std::unexpected(id.error());
    }
    reminder.id_ = *id;

    auto list_id = ObjectId::fromString(json.at("list").get<std::string>());
    if (!list_id.has_value()) {
      return std::unexpected(list_id.error());
    }
    reminder.list_id_ = *list_id;

    if (json.contains("title") && !json["title"].is_null()) {
      reminder.title_ = json["title"].get<std::string>();
    }

    if (json.contains("due") && !json["due"].is_null()) {
      auto due = dueFromJson(json["due"]);
      if (!due.has_value()) {
        return std::unexpected(due.error());
      }
      reminder.due_ = *due;
    }

    auto created = timestampFromJson(json, "created");
    if (!created.has_value()) {
      return std::unexpected(created.error());
    }
    reminder.creation_date_ = *created;

    reminder.completed_ = json.value("completed", false);

    auto completed_at = timestampFromJson(json, "completed_at");
    if (!completed_at.has_value()) {
      return std::unexpected(completed_at.error());
    }
    reminder.completion_date_ = *completed_at;

    return reminder;
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Malformed reminder entry: " + std::string(e.what())));
  }
}

}  // namespace rem::core

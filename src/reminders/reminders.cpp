#include "rem/reminders/reminders.hpp"

#include <algorithm>
#include <future>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "rem/util/time.hpp"

namespace rem::reminders {

using rem::core::OutputFormat;
using rem::core::OutputRecord;
using rem::core::Reminder;
using rem::core::ReminderList;

Reminders::Reminders(rem::store::ReminderStore& store, std::ostream& out)
    : store_(store), out_(out), clock_(&rem::util::Time::now) {}

bool Reminders::requestAccess() {
  std::promise<bool> granted;
  auto result = granted.get_future();

  store_.requestAccess([&granted](bool ok, std::optional<Error> error) {
    if (error) {
      spdlog::info("Reminders access refused: {}", error->message());
    }
    granted.set_value(ok);
  });

  return result.get();
}

Result<void> Reminders::showLists(OutputFormat format) {
  auto lists = writableLists();
  if (!lists.has_value()) {
    return std::unexpected(lists.error());
  }

  if (format == OutputFormat::kJson) {
    nlohmann::json titles = nlohmann::json::array();
    for (const auto& list : *lists) {
      titles.push_back(list.title());
    }
    try {
      out_ << titles.dump() << "\n";
    } catch (const nlohmann::json::type_error& e) {
      return std::unexpected(makeError(ErrorCode::kEncodingError,
                                       "Failed to encode lists as JSON: " + std::string(e.what())));
    }
    return {};
  }

  for (const auto& list : *lists) {
    out_ << list.title() << "\n";
  }
  return {};
}

Result<void> Reminders::showListItems(const std::vector<std::string>& names, OutputFormat format,
                                      bool due_date_only) {
  auto matched = lists(names);
  if (!matched.has_value()) {
    return std::unexpected(matched.error());
  }
  if (matched->empty()) {
    spdlog::debug("No writable list matches any of {} names", names.size());
    return {};
  }

  auto reminders = incompleteReminders(*matched);
  if (!reminders.has_value()) {
    return std::unexpected(reminders.error());
  }

  if (due_date_only) {
    std::erase_if(*reminders, [](const Reminder& reminder) {
      return !reminder.dueDateComponents().has_value();
    });
  }

  auto now = clock_();
  std::vector<OutputRecord> records;
  records.reserve(reminders->size());
  for (const auto& reminder : *reminders) {
    records.push_back(OutputRecord::from(reminder, now));
  }

  if (format == OutputFormat::kJson) {
    auto encoded = rem::core::encodeJson(records);
    if (!encoded.has_value()) {
      return std::unexpected(encoded.error());
    }
    out_ << *encoded << "\n";
    return {};
  }

  for (size_t i = 0; i < records.size(); ++i) {
    out_ << records[i].toLine(i) << "\n";
  }
  return {};
}

Result<void> Reminders::complete(int index, const std::string& list_name) {
  auto target = list(list_name);
  if (!target.has_value()) {
    return std::unexpected(target.error());
  }

  auto reminders = incompleteReminders({*target});
  if (!reminders.has_value()) {
    return std::unexpected(reminders.error());
  }

  if (index < 0 || static_cast<size_t>(index) >= reminders->size()) {
    return std::unexpected(makeError(ErrorCode::kOutOfRange,
        "No reminder at index " + std::to_string(index) + " on " + list_name));
  }

  Reminder reminder = (*reminders)[static_cast<size_t>(index)];
  reminder.setCompleted(true, clock_());

  auto saved = store_.save(reminder, true);
  if (!saved.has_value()) {
    return std::unexpected(makeError(ErrorCode::kSaveError,
        "Failed to save reminder with error: " + saved.error().message()));
  }

  spdlog::info("Completed reminder {} on '{}'", reminder.id().toString(), target->title());
  out_ << "Completed '" << reminder.title().value_or("<unknown>") << "'\n";
  return {};
}

Result<void> Reminders::addReminder(const std::string& title, const std::string& list_name,
                                    const std::optional<rem::core::DateComponents>& due_date) {
  auto target = list(list_name);
  if (!target.has_value()) {
    return std::unexpected(target.error());
  }

  auto reminder = Reminder::create(*target, title);
  reminder.setDueDateComponents(due_date);
  reminder.setCreationDate(clock_());

  auto saved = store_.save(reminder, true);
  if (!saved.has_value()) {
    return std::unexpected(makeError(ErrorCode::kSaveError,
        "Failed to save reminder with error: " + saved.error().message()));
  }

  spdlog::info("Added reminder {} to '{}'", reminder.id().toString(), target->title());
  out_ << "Added '" << title << "' to '" << target->title() << "'\n";
  return {};
}

Result<std::vector<ReminderList>> Reminders::writableLists() {
  auto all = store_.lists();
  if (!all.has_value()) {
    return std::unexpected(all.error());
  }

  std::erase_if(*all, [](const ReminderList& list) {
    return !list.allowsContentModifications();
  });
  return all;
}

Result<ReminderList> Reminders::list(const std::string& name) {
  auto writable = writableLists();
  if (!writable.has_value()) {
    return std::unexpected(writable.error());
  }

  auto found = std::find_if(writable->begin(), writable->end(),
                            [&](const ReminderList& list) { return list.matchesName(name); });
  if (found == writable->end()) {
    return makeErrorResult<ReminderList>(ErrorCode::kNotFound, "No reminders list matching " + name);
  }
  return *found;
}

Result<std::vector<ReminderList>> Reminders::lists(const std::vector<std::string>& names) {
  auto writable = writableLists();
  if (!writable.has_value()) {
    return std::unexpected(writable.error());
  }

  std::erase_if(*writable, [&](const ReminderList& list) {
    return std::none_of(names.begin(), names.end(),
                        [&](const std::string& name) { return list.matchesName(name); });
  });
  return writable;
}

Result<std::vector<Reminder>> Reminders::incompleteReminders(
    const std::vector<ReminderList>& lists) {
  std::promise<std::optional<std::vector<Reminder>>> fetched;
  auto result = fetched.get_future();

  store_.fetchReminders(store_.predicateForReminders(lists),
                        [&fetched](std::optional<std::vector<Reminder>> reminders) {
                          fetched.set_value(std::move(reminders));
                        });

  // A failed fetch reads as an empty list
  auto reminders = result.get();
  if (!reminders) {
    spdlog::warn("Fetching reminders from {} lists failed", lists.size());
    return std::vector<Reminder>{};
  }

  std::erase_if(*reminders, [](const Reminder& reminder) { return reminder.isCompleted(); });
  return std::move(*reminders);
}

}  // namespace rem::reminders

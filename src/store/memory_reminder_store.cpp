#include "rem/store/memory_reminder_store.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace rem::store {

using rem::core::Reminder;
using rem::core::ReminderList;

MemoryReminderStore::MemoryReminderStore() = default;

MemoryReminderStore::~MemoryReminderStore() {
  joinWorkers();
}

void MemoryReminderStore::requestAccess(AccessCallback callback) {
  dispatch([this, callback = std::move(callback)]() {
    std::optional<Error> error;
    bool granted = checkAccess(error);
    spdlog::debug("Reminders access {}", granted ? "granted" : "denied");
    callback(granted, std::move(error));
  });
}

Result<std::vector<ReminderList>> MemoryReminderStore::lists() {
  std::lock_guard<std::mutex> lock(mutex_);
  return lists_;
}

void MemoryReminderStore::fetchReminders(const ReminderPredicate& predicate,
                                         FetchCallback callback) {
  dispatch([this, predicate, callback = std::move(callback)]() {
    std::optional<std::vector<Reminder>> result;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!fail_fetch_) {
        std::vector<Reminder> matching;
        for (const auto& reminder : reminders_) {
          if (predicate.matches(reminder)) {
            matching.push_back(reminder);
          }
        }
        result = std::move(matching);
      }
    }

    if (result) {
      spdlog::debug("Fetched {} reminders from {} lists", result->size(),
                    predicate.list_ids.size());
    } else {
      spdlog::warn("Reminder fetch failed");
    }
    callback(std::move(result));
  });
}

Result<void> MemoryReminderStore::save(const Reminder& reminder, bool commit) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (save_failure_) {
    return std::unexpected(*save_failure_);
  }

  auto validation = validateReminder(reminder);
  if (!validation.has_value()) {
    return validation;
  }

  upsert(staged_, reminder);
  if (!commit) {
    return {};
  }
  return applyStaged();
}

Result<void> MemoryReminderStore::commit() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (save_failure_) {
    return std::unexpected(*save_failure_);
  }
  return applyStaged();
}

Result<ReminderList> MemoryReminderStore::createList(const std::string& title) {
  if (title.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "List title must not be empty"));
  }

  std::lock_guard<std::mutex> lock(mutex_);

  auto duplicate = std::find_if(lists_.begin(), lists_.end(),
                                [&](const ReminderList& list) { return list.matchesName(title); });
  if (duplicate != lists_.end()) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "A list named '" + duplicate->title() + "' already exists"));
  }

  auto list = ReminderList::create(title);
  lists_.push_back(list);

  auto persisted = persist();
  if (!persisted.has_value()) {
    lists_.pop_back();
    return std::unexpected(persisted.error());
  }

  spdlog::info("Created list '{}' ({})", list.title(), list.id().toString());
  return list;
}

ReminderList MemoryReminderStore::addList(const std::string& title, bool allows_modifications) {
  std::lock_guard<std::mutex> lock(mutex_);
  ReminderList list(rem::core::ObjectId::generate(), title, allows_modifications);
  lists_.push_back(list);
  return list;
}

void MemoryReminderStore::addReminder(const Reminder& reminder) {
  std::lock_guard<std::mutex> lock(mutex_);
  upsert(reminders_, reminder);
}

void MemoryReminderStore::setAccessGranted(bool granted) {
  std::lock_guard<std::mutex> lock(mutex_);
  access_granted_ = granted;
}

void MemoryReminderStore::setFetchFailure(bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_fetch_ = fail;
}

void MemoryReminderStore::setSaveFailure(std::optional<Error> error) {
  std::lock_guard<std::mutex> lock(mutex_);
  save_failure_ = std::move(error);
}

size_t MemoryReminderStore::stagedChanges() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return staged_.size();
}

size_t MemoryReminderStore::reminderCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reminders_.size();
}

Result<void> MemoryReminderStore::persist() {
  return {};
}

bool MemoryReminderStore::checkAccess(std::optional<Error>& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!access_granted_) {
    error = makeError(ErrorCode::kAccessDenied, "Access to reminders was denied");
  }
  return access_granted_;
}

void MemoryReminderStore::dispatch(std::function<void()> task) {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  workers_.emplace_back(std::move(task));
}

void MemoryReminderStore::joinWorkers() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

Result<void> MemoryReminderStore::validateReminder(const Reminder& reminder) const {
  auto validation = reminder.validate();
  if (!validation.has_value()) {
    return validation;
  }

  auto list = std::find_if(lists_.begin(), lists_.end(),
                           [&](const ReminderList& l) { return l.id() == reminder.listId(); });
  if (list == lists_.end()) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "No list with id " + reminder.listId().toString()));
  }
  if (!list->allowsContentModifications()) {
    return std::unexpected(makeError(ErrorCode::kPermissionDenied,
                                     "List '" + list->title() + "' does not allow modifications"));
  }
  return {};
}

void MemoryReminderStore::upsert(std::vector<Reminder>& reminders, const Reminder& reminder) {
  auto existing = std::find_if(reminders.begin(), reminders.end(),
                               [&](const Reminder& r) { return r.id() == reminder.id(); });
  if (existing != reminders.end()) {
    *existing = reminder;
  } else {
    reminders.push_back(reminder);
  }
}

Result<void> MemoryReminderStore::applyStaged() {
  if (staged_.empty()) {
    return {};
  }

  auto previous = reminders_;
  for (const auto& reminder : staged_) {
    upsert(reminders_, reminder);
  }

  auto persisted = persist();
  if (!persisted.has_value()) {
    reminders_ = std::move(previous);
    staged_.clear();
    return persisted;
  }

  spdlog::debug("Committed {} reminder changes", staged_.size());
  staged_.clear();
  return {};
}

}  // namespace rem::store

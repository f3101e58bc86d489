#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "rem/common.hpp"
#include "rem/core/object_id.hpp"
#include "rem/core/reminder.hpp"

namespace rem::store {

// Selects the reminders belonging to a set of lists
struct ReminderPredicate {
  std::vector<rem::core::ObjectId> list_ids;

  bool matches(const rem::core::Reminder& reminder) const;
};

// Invoked exactly once with the access decision
using AccessCallback = std::function<void(bool granted, std::optional<Error> error)>;

// Invoked exactly once; std::nullopt when the store could not be read
using FetchCallback =
    std::function<void(std::optional<std::vector<rem::core::Reminder>> reminders)>;

/**
 * @brief Abstract interface to a reminders backend
 *
 * Authorization and fetches are asynchronous: the callback may run on a
 * thread owned by the store, before or after the call returns. Enumeration
 * and saves are synchronous.
 */
class ReminderStore {
 public:
  virtual ~ReminderStore() = default;

  // Authorization
  virtual void requestAccess(AccessCallback callback) = 0;

  // All lists, read-only ones included, in store order
  virtual Result<std::vector<rem::core::ReminderList>> lists() = 0;

  // Query
  virtual ReminderPredicate predicateForReminders(
      const std::vector<rem::core::ReminderList>& lists) const;
  virtual void fetchReminders(const ReminderPredicate& predicate, FetchCallback callback) = 0;

  // Insert or update a reminder; with commit == false it is staged until commit()
  virtual Result<void> save(const rem::core::Reminder& reminder, bool commit) = 0;
  virtual Result<void> commit() = 0;

  // Create a new writable list
  virtual Result<rem::core::ReminderList> createList(const std::string& title) = 0;
};

}  // namespace rem::store

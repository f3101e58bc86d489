#include "rem/store/reminder_store.hpp"

#include <algorithm>

namespace rem::store {

bool ReminderPredicate::matches(const rem::core::Reminder& reminder) const {
  return std::find(list_ids.begin(), list_ids.end(), reminder.listId()) != list_ids.end();
}

ReminderPredicate ReminderStore::predicateForReminders(
    const std::vector<rem::core::ReminderList>& lists) const {
  ReminderPredicate predicate;
  predicate.list_ids.reserve(lists.size());
  for (const auto& list : lists) {
    predicate.list_ids.push_back(list.id());
  }
  return predicate;
}

}  // namespace rem::store

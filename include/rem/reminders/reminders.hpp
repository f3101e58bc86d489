#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "rem/common.hpp"
#include "rem/core/date_components.hpp"
#include "rem/core/output_record.hpp"
#include "rem/core/reminder.hpp"
#include "rem/store/reminder_store.hpp"

namespace rem::reminders {

/**
 * @brief Synchronous facade over a ReminderStore
 *
 * Every operation blocks until the store's asynchronous work for it has
 * completed, then writes its result to the output stream. Failures are
 * returned, never printed; presenting them is the caller's job.
 */
class Reminders {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit Reminders(rem::store::ReminderStore& store, std::ostream& out = std::cout);

  /**
   * @brief Ask the store for read/write access
   * @return true when access was granted
   */
  bool requestAccess();

  /**
   * @brief Print the title of every writable list, one per line
   */
  Result<void> showLists(rem::core::OutputFormat format = rem::core::OutputFormat::kPlainText);

  /**
   * @brief Print the incomplete reminders of the named lists
   *
   * Names that match no writable list are ignored; when none match nothing is
   * printed.
   * @param names List names, matched case-insensitively
   * @param due_date_only Skip reminders without a due date
   */
  Result<void> showListItems(const std::vector<std::string>& names,
                             rem::core::OutputFormat format = rem::core::OutputFormat::kPlainText,
                             bool due_date_only = false);

  /**
   * @brief Mark a reminder completed
   * @param index Position among the incomplete reminders of the list
   */
  Result<void> complete(int index, const std::string& list_name);

  /**
   * @brief Create a reminder on a list
   */
  Result<void> addReminder(const std::string& title, const std::string& list_name,
                           const std::optional<rem::core::DateComponents>& due_date);

  // Replace the source of "now" used for relative due dates and timestamps
  void setClock(Clock clock) { clock_ = std::move(clock); }

 private:
  rem::store::ReminderStore& store_;
  std::ostream& out_;
  Clock clock_;

  Result<std::vector<rem::core::ReminderList>> writableLists();
  Result<rem::core::ReminderList> list(const std::string& name);
  Result<std::vector<rem::core::ReminderList>> lists(const std::vector<std::string>& names);
  Result<std::vector<rem::core::Reminder>> incompleteReminders(
      const std::vector<rem::core::ReminderList>& lists);
};

}  // namespace rem::reminders

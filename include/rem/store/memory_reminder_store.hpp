#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "rem/store/reminder_store.hpp"

namespace rem::store {

/**
 * @brief Reminder store held entirely in process memory
 *
 * Callbacks are delivered on worker threads owned by the store and joined on
 * destruction. Subclasses add durability by overriding persist().
 */
class MemoryReminderStore : public ReminderStore {
 public:
  MemoryReminderStore();
  ~MemoryReminderStore() override;

  MemoryReminderStore(const MemoryReminderStore&) = delete;
  MemoryReminderStore& operator=(const MemoryReminderStore&) = delete;

  // ReminderStore interface implementation
  void requestAccess(AccessCallback callback) override;
  Result<std::vector<rem::core::ReminderList>> lists() override;
  void fetchReminders(const ReminderPredicate& predicate, FetchCallback callback) override;
  Result<void> save(const rem::core::Reminder& reminder, bool commit) override;
  Result<void> commit() override;
  Result<rem::core::ReminderList> createList(const std::string& title) override;

  // Seeding, bypassing validation; used to build fixtures
  rem::core::ReminderList addList(const std::string& title, bool allows_modifications = true);
  void addReminder(const rem::core::Reminder& reminder);

  // Failure injection
  void setAccessGranted(bool granted);
  void setFetchFailure(bool fail);
  void setSaveFailure(std::optional<Error> error);

  size_t stagedChanges() const;
  size_t reminderCount() const;

 protected:
  // Write the current state somewhere durable; called with mutex_ held
  virtual Result<void> persist();

  // Decide whether access is granted; runs on a worker thread
  virtual bool checkAccess(std::optional<Error>& error);

  // Run a task on a worker thread owned by this store
  void dispatch(std::function<void()> task);

  // Wait for every dispatched task; subclasses call this from their destructor
  void joinWorkers();

  mutable std::mutex mutex_;
  std::vector<rem::core::ReminderList> lists_;
  std::vector<rem::core::Reminder> reminders_;

 private:
  std::vector<rem::core::Reminder> staged_;
  bool access_granted_ = true;
  bool fail_fetch_ = false;
  std::optional<Error> save_failure_;

  std::mutex workers_mutex_;
  std::vector<std::thread> workers_;

  Result<void> validateReminder(const rem::core::Reminder& reminder) const;
  static void upsert(std::vector<rem::core::Reminder>& reminders,
                     const rem::core::Reminder& reminder);
  Result<void> applyStaged();
};

}  // namespace rem::store

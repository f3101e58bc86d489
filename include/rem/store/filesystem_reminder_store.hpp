#pragma once

#include <filesystem>
#include <string>

#include "rem/store/memory_reminder_store.hpp"

namespace rem::store {

// Reminder store persisted as a single JSON document
class FilesystemReminderStore : public MemoryReminderStore {
 public:
  struct Config {
    std::filesystem::path store_file;
    std::string default_list = "Reminders";
  };

  explicit FilesystemReminderStore(Config config);
  ~FilesystemReminderStore() override;

  /**
   * @brief Read the store document
   *
   * A missing document is not an error: the store starts with a single
   * writable list named after Config::default_list, written on first change.
   */
  Result<void> load();

  const std::filesystem::path& storeFile() const { return config_.store_file; }

  static constexpr int kFormatVersion = 1;

 protected:
  Result<void> persist() override;
  bool checkAccess(std::optional<Error>& error) override;

 private:
  Config config_;

  Result<void> parseDocument(const std::string& content);
};

}  // namespace rem::store

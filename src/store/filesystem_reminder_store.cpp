#include "rem/store/filesystem_reminder_store.hpp"

#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "rem/util/filesystem.hpp"
#include "rem/util/xdg.hpp"

namespace rem::store {

using rem::core::Reminder;
using rem::core::ReminderList;

FilesystemReminderStore::FilesystemReminderStore(Config config) : config_(std::move(config)) {
  if (config_.store_file.empty()) {
    config_.store_file = rem::util::Xdg::storeFile();
  }
}

FilesystemReminderStore::~FilesystemReminderStore() {
  joinWorkers();
}

Result<void> FilesystemReminderStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);

  lists_.clear();
  reminders_.clear();

  if (!std::filesystem::exists(config_.store_file)) {
    spdlog::info("No store at {}, starting with list '{}'", config_.store_file.string(),
                 config_.default_list);
    lists_.push_back(ReminderList::create(config_.default_list));
    return {};
  }

  auto content = rem::util::FileSystem::readFile(config_.store_file);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  auto parsed = parseDocument(*content);
  if (!parsed.has_value()) {
    lists_.clear();
    reminders_.clear();
    return parsed;
  }

  spdlog::debug("Loaded {} lists and {} reminders from {}", lists_.size(), reminders_.size(),
                config_.store_file.string());
  return {};
}

Result<void> FilesystemReminderStore::parseDocument(const std::string& content) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
        "Corrupt store " + config_.store_file.string() + ": " + e.what()));
  }

  if (!document.is_object()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
        "Corrupt store " + config_.store_file.string() + ": expected an object"));
  }

  int version = document.value("version", 0);
  if (version != kFormatVersion) {
    return std::unexpected(makeError(ErrorCode::kStoreError,
        "Unsupported store version " + std::to_string(version) + " in " +
        config_.store_file.string()));
  }

  for (const auto& entry : document.value("lists", nlohmann::json::array())) {
    auto list = ReminderList::fromJson(entry);
    if (!list.has_value()) {
      return std::unexpected(list.error());
    }
    lists_.push_back(*list);
  }

  for (const auto& entry : document.value("reminders", nlohmann::json::array())) {
    auto reminder = Reminder::fromJson(entry);
    if (!reminder.has_value()) {
      return std::unexpected(reminder.error());
    }
    reminders_.push_back(*reminder);
  }

  return {};
}

Result<void> FilesystemReminderStore::persist() {
  nlohmann::json document;
  document["version"] = kFormatVersion;

  auto lists = nlohmann::json::array();
  for (const auto& list : lists_) {
    lists.push_back(list.toJson());
  }
  document["lists"] = std::move(lists);

  auto reminders = nlohmann::json::array();
  for (const auto& reminder : reminders_) {
    reminders.push_back(reminder.toJson());
  }
  document["reminders"] = std::move(reminders);

  std::string content;
  try {
    content = document.dump(2) + "\n";
  } catch (const nlohmann::json::type_error& e) {
    return std::unexpected(makeError(ErrorCode::kEncodingError,
                                     "Cannot encode store: " + std::string(e.what())));
  }

  auto written = rem::util::FileSystem::writeFileAtomic(config_.store_file, content);
  if (!written.has_value()) {
    spdlog::error("Failed to write {}: {}", config_.store_file.string(),
                  written.error().message());
    return written;
  }

  spdlog::debug("Wrote {} lists and {} reminders to {}", lists_.size(), reminders_.size(),
                config_.store_file.string());
  return {};
}

bool FilesystemReminderStore::checkAccess(std::optional<Error>& error) {
  auto directory = config_.store_file.parent_path();
  if (directory.empty()) {
    directory = std::filesystem::current_path();
  }

  auto created = rem::util::FileSystem::createDirectories(directory);
  if (!created.has_value()) {
    error = makeError(ErrorCode::kAccessDenied, created.error().message());
    return false;
  }

  if (!rem::util::FileSystem::isWritableDirectory(directory)) {
    error = makeError(ErrorCode::kAccessDenied,
                      "Store directory is not writable: " + directory.string());
    return false;
  }

  std::error_code ec;
  if (std::filesystem::exists(config_.store_file, ec) &&
      access(config_.store_file.c_str(), R_OK | W_OK) != 0) {
    error = makeError(ErrorCode::kAccessDenied,
                      "Store file is not readable and writable: " + config_.store_file.string());
    return false;
  }

  return true;
}

}  // namespace rem::store

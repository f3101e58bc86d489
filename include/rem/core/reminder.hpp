#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "rem/common.hpp"
#include "rem/core/date_components.hpp"
#include "rem/core/object_id.hpp"

namespace rem::core {

// Named container of reminders, owned by a store
class ReminderList {
 public:
  ReminderList() = default;
  ReminderList(ObjectId id, std::string title, bool allows_modifications = true);

  static ReminderList create(const std::string& title);

  const ObjectId& id() const noexcept { return id_; }
  const std::string& title() const noexcept { return title_; }
  bool allowsContentModifications() const noexcept { return allows_modifications_; }

  void setTitle(const std::string& title) { title_ = title; }
  void setAllowsContentModifications(bool allows) { allows_modifications_ = allows; }

  // Case-insensitive comparison against a user supplied list name
  bool matchesName(const std::string& name) const;

  nlohmann::json toJson() const;
  static Result<ReminderList> fromJson(const nlohmann::json& json);

 private:
  ObjectId id_;
  std::string title_;
  bool allows_modifications_ = true;
};

// A single reminder item belonging to exactly one list
class Reminder {
 public:
  Reminder() = default;

  // New reminder on a list, with a fresh id and no creation date yet
  static Reminder create(const ReminderList& list, const std::string& title);

  const ObjectId& id() const noexcept { return id_; }
  const ObjectId& listId() const noexcept { return list_id_; }
  const std::optional<std::string>& title() const noexcept { return title_; }
  const std::optional<DateComponents>& dueDateComponents() const noexcept { return due_; }
  const std::optional<std::chrono::system_clock::time_point>& creationDate() const noexcept {
    return creation_date_;
  }
  const std::optional<std::chrono::system_clock::time_point>& completionDate() const noexcept {
    return completion_date_;
  }
  bool isCompleted() const noexcept { return completed_; }

  void setId(const ObjectId& id) { id_ = id; }
  void setList(const ReminderList& list) { list_id_ = list.id(); }
  void setListId(const ObjectId& list_id) { list_id_ = list_id; }
  void setTitle(std::optional<std::string> title) { title_ = std::move(title); }
  void setDueDateComponents(std::optional<DateComponents> due) { due_ = std::move(due); }
  void setCreationDate(std::optional<std::chrono::system_clock::time_point> date) {
    creation_date_ = date;
  }

  // Flip the completed flag; completing records the completion time
  void setCompleted(bool completed,
                    std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

  Result<void> validate() const;

  nlohmann::json toJson() const;
  static Result<Reminder> fromJson(const nlohmann::json& json);

 private:
  ObjectId id_;
  ObjectId list_id_;
  std::optional<std::string> title_;
  std::optional<DateComponents> due_;
  std::optional<std::chrono::system_clock::time_point> creation_date_;
  std::optional<std::chrono::system_clock::time_point> completion_date_;
  bool completed_ = false;
};

}  // namespace rem::core

#include "rem/cli/commands/add_command.hpp"

#include <optional>

#include "rem/core/date_components.hpp"
#include "rem/util/time.hpp"

namespace rem::cli {

AddCommand::AddCommand(Application& app) : app_(app) {
}

Result<int> AddCommand::execute(const GlobalOptions& options) {
  (void)options;

  std::optional<rem::core::DateComponents> due;
  if (!due_date_.empty()) {
    auto parsed = rem::core::DateComponents::parse(due_date_, rem::util::Time::now());
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    due = *parsed;
  }

  auto result = app_.reminders().addReminder(title(), list_name_, due);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  return 0;
}

void AddCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("list", list_name_, "The list to add to")->required();
  cmd->add_option("title", title_words_, "The reminder contents")->required();
  cmd->add_option("-d,--due-date", due_date_,
                  "When the reminder is due (today, tomorrow, YYYY-MM-DD [HH:MM], in N hours)");
}

std::string AddCommand::title() const {
  std::string joined;
  for (const auto& word : title_words_) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += word;
  }
  return joined;
}

} // namespace rem::cli

#include "rem/cli/commands/show_command.hpp"

namespace rem::cli {

ShowCommand::ShowCommand(Application& app) : app_(app) {
}

Result<int> ShowCommand::execute(const GlobalOptions& options) {
  auto format = options.json ? rem::core::OutputFormat::kJson
                             : rem::core::OutputFormat::kPlainText;
  auto result = app_.reminders().showListItems(list_names_, format, due_date_only_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  return 0;
}

void ShowCommand::setupCommand(CLI::App* cmd) {
  cmd->alias("ls");
  cmd->add_option("lists", list_names_, "Names of the lists to show")->required();
  cmd->add_flag("--due-date-only", due_date_only_, "Only show reminders with a due date");
}

} // namespace rem::cli

#include "rem/cli/commands/complete_command.hpp"

namespace rem::cli {

CompleteCommand::CompleteCommand(Application& app) : app_(app) {
}

Result<int> CompleteCommand::execute(const GlobalOptions& options) {
  (void)options;
  auto result = app_.reminders().complete(index_, list_name_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  return 0;
}

void CompleteCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("list", list_name_, "The list the reminder is on")->required();
  cmd->add_option("index", index_, "Index of the reminder, as printed by 'show'")->required();
}

} // namespace rem::cli

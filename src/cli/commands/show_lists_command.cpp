#include "rem/cli/commands/show_lists_command.hpp"

namespace rem::cli {

ShowListsCommand::ShowListsCommand(Application& app) : app_(app) {
}

Result<int> ShowListsCommand::execute(const GlobalOptions& options) {
  auto format = options.json ? rem::core::OutputFormat::kJson
                             : rem::core::OutputFormat::kPlainText;
  auto result = app_.reminders().showLists(format);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  return 0;
}

} // namespace rem::cli

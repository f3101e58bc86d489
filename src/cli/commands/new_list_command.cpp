#include "rem/cli/commands/new_list_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace rem::cli {

NewListCommand::NewListCommand(Application& app) : app_(app) {
}

Result<int> NewListCommand::execute(const GlobalOptions& options) {
  auto list = app_.reminderStore().createList(title_);
  if (!list.has_value()) {
    return std::unexpected(list.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["id"] = list->id().toString();
    output["title"] = list->title();
    std::cout << output.dump() << "\n";
  } else {
    std::cout << "Created new list '" << list->title() << "'\n";
  }
  return 0;
}

void NewListCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("title", title_, "Name of the new list")->required();
}

} // namespace rem::cli

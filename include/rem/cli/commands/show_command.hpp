#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include "rem/cli/application.hpp"

namespace rem::cli {

/**
 * @brief Print the incomplete reminders of one or more lists
 * Usage: rem show <list>... [--due-date-only]
 */
class ShowCommand : public Command {
public:
  explicit ShowCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "show"; }
  std::string description() const override { return "Print the items on the given lists"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::vector<std::string> list_names_;
  bool due_date_only_ = false;
};

} // namespace rem::cli

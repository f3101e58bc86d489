#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include "rem/cli/application.hpp"

namespace rem::cli {

/**
 * @brief Add a reminder to a list
 * Usage: rem add <list> <title words>... [--due-date <when>]
 */
class AddCommand : public Command {
public:
  explicit AddCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "add"; }
  std::string description() const override { return "Add a reminder to a list"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string list_name_;
  std::vector<std::string> title_words_;
  std::string due_date_;

  std::string title() const;
};

} // namespace rem::cli

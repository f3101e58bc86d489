#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "rem/cli/application.hpp"

namespace rem::cli {

/**
 * @brief Mark a reminder completed by its index on a list
 * Usage: rem complete <list> <index>
 */
class CompleteCommand : public Command {
public:
  explicit CompleteCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "complete"; }
  std::string description() const override { return "Complete a reminder"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string list_name_;
  int index_ = 0;
};

} // namespace rem::cli

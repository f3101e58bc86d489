#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "rem/cli/application.hpp"

namespace rem::cli {

class NewListCommand : public Command {
public:
  explicit NewListCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "new-list"; }
  std::string description() const override { return "Create a new reminders list"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string title_;
};

} // namespace rem::cli

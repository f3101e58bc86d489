#pragma once

#include <string>

#include "rem/cli/application.hpp"

namespace rem::cli {

class ShowListsCommand : public Command {
public:
  explicit ShowListsCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "show-lists"; }
  std::string description() const override { return "Print the names of all writable lists"; }

private:
  Application& app_;
};

} // namespace rem::cli

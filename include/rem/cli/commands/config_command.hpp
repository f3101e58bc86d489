#pragma once

#include <string>

#include "rem/cli/application.hpp"
#include "rem/common.hpp"

namespace rem::cli {

/**
 * Command for managing configuration
 *
 * Subcommands:
 * - get <key>: Get configuration value
 * - set <key> <value>: Set configuration value
 * - list: List all configuration
 * - path: Show configuration file path
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "config"; }
  std::string description() const override { return "Manage configuration settings"; }
  bool usesReminders() const override { return false; }

private:
  Application& app_;

  enum class Mode { kNone, kGet, kSet, kList, kPath };
  Mode mode_ = Mode::kNone;

  std::string key_;
  std::string value_;

  Result<int> executeGet(bool json_output);
  Result<int> executeSet(bool json_output);
  Result<int> executeList(bool json_output);
  Result<int> executePath(bool json_output);
};

}  // namespace rem::cli

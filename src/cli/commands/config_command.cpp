#include "rem/cli/commands/config_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace rem::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { mode_ = Mode::kGet; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { mode_ = Mode::kSet; });

  auto list_cmd = cmd->add_subcommand("list", "List all configuration settings");
  list_cmd->callback([this]() { mode_ = Mode::kList; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { mode_ = Mode::kPath; });

  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  switch (mode_) {
    case Mode::kGet:
      return executeGet(options.json);
    case Mode::kSet:
      return executeSet(options.json);
    case Mode::kList:
      return executeList(options.json);
    case Mode::kPath:
      return executePath(options.json);
    case Mode::kNone:
      break;
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executeGet(bool json_output) {
  auto value = app_.config().get(key_);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }

  if (json_output) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = *value;
    std::cout << output.dump() << "\n";
  } else {
    std::cout << *value << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(bool json_output) {
  // Edit the file as written, without the --store and environment overrides
  rem::config::Config on_disk(app_.config().path());

  auto result = on_disk.set(key_, value_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  auto save_result = on_disk.save();
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }

  if (json_output) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = value_;
    output["saved"] = on_disk.path().string();
    std::cout << output.dump() << "\n";
  } else {
    std::cout << "Set " << key_ << " = " << value_ << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeList(bool json_output) {
  auto& config = app_.config();

  nlohmann::json output = nlohmann::json::object();
  for (const auto& key : rem::config::Config::keys()) {
    auto value = config.get(key);
    if (!value.has_value()) {
      return std::unexpected(value.error());
    }
    if (json_output) {
      output[key] = *value;
    } else {
      std::cout << key << " = " << *value << "\n";
    }
  }

  if (json_output) {
    std::cout << output.dump() << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executePath(bool json_output) {
  auto path = app_.config().path().string();
  if (json_output) {
    nlohmann::json output;
    output["path"] = path;
    std::cout << output.dump() << "\n";
  } else {
    std::cout << path << "\n";
  }
  return 0;
}

}  // namespace rem::cli

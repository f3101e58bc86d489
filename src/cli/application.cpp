#include "rem/cli/application.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "rem/store/filesystem_reminder_store.hpp"
#include "rem/util/logging.hpp"

#include "rem/cli/commands/add_command.hpp"
#include "rem/cli/commands/complete_command.hpp"
#include "rem/cli/commands/config_command.hpp"
#include "rem/cli/commands/new_list_command.hpp"
#include "rem/cli/commands/show_command.hpp"
#include "rem/cli/commands/show_lists_command.hpp"

namespace rem::cli {

Application::Application()
    : app_("rem", "Manage reminders from the command line") {
  app_.set_version_flag("--version", rem::getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

Application::Application(std::unique_ptr<rem::store::ReminderStore> store)
    : Application() {
  store_ = std::move(store);
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Log to stderr (repeat for debug)");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--store", global_options_.store_file, "Override reminders store file");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<ShowListsCommand>(*this));
  registerCommand(std::make_unique<ShowCommand>(*this));
  registerCommand(std::make_unique<CompleteCommand>(*this));
  registerCommand(std::make_unique<AddCommand>(*this));
  registerCommand(std::make_unique<NewListCommand>(*this));
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  rem show-lists
  rem show Home Work --due-date-only
  rem --json show Home
  rem add Home Buy milk --due-date tomorrow
  rem complete Home 0

For more information on a specific command, run:
  rem <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeConfig();
    if (init_result.has_value() && cmd_ptr->usesReminders()) {
      init_result = initializeStore();
      if (init_result.has_value()) {
        init_result = ensureAccess();
      }
    }
    if (!init_result.has_value()) {
      reportError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      spdlog::warn("{} failed ({}): {}", cmd_ptr->name(),
                   errorCodeToString(result.error().code()), result.error().message());
      reportError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeConfig() {
  if (config_) {
    return {};
  }

  if (!global_options_.config_file.empty()) {
    config_ = std::make_unique<rem::config::Config>(global_options_.config_file);
  } else {
    config_ = std::make_unique<rem::config::Config>();
  }

  config_->applyEnvironment();
  if (!global_options_.store_file.empty()) {
    config_->store_file = global_options_.store_file;
  }

  rem::util::LoggingOptions logging;
  logging.log_file = config_->log_file;
  logging.file_level = config_->log_level;
  logging.verbosity = global_options_.verbose;
  auto logging_result = rem::util::setupLogging(logging);
  if (!logging_result.has_value()) {
    spdlog::warn("{}", logging_result.error().message());
  }

  return {};
}

Result<void> Application::initializeStore() {
  if (!store_) {
    rem::store::FilesystemReminderStore::Config store_config;
    store_config.store_file = config_->store_file;
    store_config.default_list = config_->default_list;

    auto store = std::make_unique<rem::store::FilesystemReminderStore>(store_config);
    auto loaded = store->load();
    if (!loaded.has_value()) {
      return loaded;
    }
    store_ = std::move(store);
  }

  if (!reminders_) {
    reminders_ = std::make_unique<rem::reminders::Reminders>(*store_, std::cout);
  }
  return {};
}

Result<void> Application::ensureAccess() {
  if (access_granted_) {
    return {};
  }
  if (!reminders_->requestAccess()) {
    return std::unexpected(makeError(ErrorCode::kAccessDenied,
                                     "You need to grant reminders access"));
  }
  access_granted_ = true;
  return {};
}

void Application::reportError(const Error& error) const {
  if (global_options_.json) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = static_cast<int>(error.code());
    output["kind"] = std::string(errorCodeToString(error.code()));
    std::cout << output.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  } else {
    std::cout << "Error: " << error.message() << "\n";
  }
}

rem::config::Config& Application::config() {
  if (!config_) {
    throw std::runtime_error("Configuration not initialized");
  }
  return *config_;
}

rem::store::ReminderStore& Application::reminderStore() {
  if (!store_) {
    throw std::runtime_error("Reminders store not initialized");
  }
  return *store_;
}

rem::reminders::Reminders& Application::reminders() {
  if (!reminders_) {
    throw std::runtime_error("Reminders store not initialized");
  }
  return *reminders_;
}

} // namespace rem::cli

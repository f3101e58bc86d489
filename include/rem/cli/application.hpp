#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "rem/common.hpp"
#include "rem/config/config.hpp"
#include "rem/reminders/reminders.hpp"
#include "rem/store/reminder_store.hpp"

namespace rem::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Log to stderr (-v info, -vv debug)
  std::string config_file;     // --config: Path to config file
  std::string store_file;      // --store: Override reminders store file
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Whether the command talks to the reminders store (and so needs access)
   */
  virtual bool usesReminders() const { return true; }

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();

  /**
   * @brief Use an already constructed store instead of the configured one
   */
  explicit Application(std::unique_ptr<rem::store::ReminderStore> store);
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Service accessors for commands
  rem::config::Config& config();
  rem::store::ReminderStore& reminderStore();
  rem::reminders::Reminders& reminders();

private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  // Initialization
  Result<void> initializeConfig();
  Result<void> initializeStore();
  Result<void> ensureAccess();

  void reportError(const Error& error) const;

  CLI::App app_;
  GlobalOptions global_options_;

  std::unique_ptr<rem::config::Config> config_;
  std::unique_ptr<rem::store::ReminderStore> store_;
  std::unique_ptr<rem::reminders::Reminders> reminders_;
  bool access_granted_ = false;

  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace rem::cli

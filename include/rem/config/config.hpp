#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "rem/common.hpp"

namespace rem::config {

// Configuration for rem, read from a TOML file
class Config {
 public:
  // Defaults only, then the default config file if one exists
  Config();

  // Defaults, then the given file (missing or invalid files keep defaults)
  explicit Config(const std::filesystem::path& config_path);

  // Reminders store document
  std::filesystem::path store_file;

  // Title of the list seeded into a new store
  std::string default_list = "Reminders";

  // Logging
  std::filesystem::path log_file;
  std::string log_level = "info";

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file (defaults to the path it was loaded from)
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set by key name
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // All known keys, in file order
  static std::vector<std::string> keys();

  // Apply environment overrides (REM_STORE_FILE)
  void applyEnvironment();

  Result<void> validate() const;

  const std::filesystem::path& path() const { return config_path_; }

  static std::filesystem::path defaultConfigPath();

 private:
  std::filesystem::path config_path_;

  void setDefaults();
};

}  // namespace rem::config

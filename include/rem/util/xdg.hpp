#pragma once

#include <filesystem>
#include <string>

namespace rem::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/rem)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/rem)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

  // Get reminders store document path
  static std::filesystem::path storeFile();

  // Get log file path
  static std::filesystem::path logFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace rem::util

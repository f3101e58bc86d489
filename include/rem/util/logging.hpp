#pragma once

#include <filesystem>
#include <string>

#include "rem/common.hpp"

namespace rem::util {

struct LoggingOptions {
  std::filesystem::path log_file;   // rotating file sink; empty disables it
  std::string file_level = "info";  // spdlog level name for the file sink
  int verbosity = 0;                // 0: console off, 1: info, 2+: debug
};

// Install the default spdlog logger: rotating file sink plus a stderr sink
// whose level follows the -v count. Falls back to stderr only when the log
// file cannot be opened.
Result<void> setupLogging(const LoggingOptions& options);

}  // namespace rem::util

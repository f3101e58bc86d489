#include "rem/util/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rem::util {

namespace {

constexpr size_t kMaxLogFileSize = 1024 * 1024 * 5;
constexpr size_t kMaxLogFiles = 3;

spdlog::level::level_enum consoleLevel(int verbosity) {
  if (verbosity <= 0) {
    return spdlog::level::off;
  }
  return verbosity == 1 ? spdlog::level::info : spdlog::level::debug;
}

}  // namespace

Result<void> setupLogging(const LoggingOptions& options) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(consoleLevel(options.verbosity));

  std::vector<spdlog::sink_ptr> sinks = {console_sink};
  Result<void> result;

  if (!options.log_file.empty()) {
    try {
      std::filesystem::create_directories(options.log_file.parent_path());
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          options.log_file.string(), kMaxLogFileSize, kMaxLogFiles);
      file_sink->set_level(spdlog::level::from_str(options.file_level));
      sinks.push_back(file_sink);
    } catch (const std::exception& e) {
      result = std::unexpected(makeError(ErrorCode::kFileWriteError,
                                         "Failed to setup file logging: " + std::string(e.what())));
    }
  }

  auto logger = std::make_shared<spdlog::logger>("rem", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  logger->set_level(spdlog::level::debug);
  spdlog::set_default_logger(logger);

  return result;
}

}  // namespace rem::util

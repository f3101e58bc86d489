#include "rem/config/config.hpp"

#include <cstdlib>
#include <sstream>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "rem/util/filesystem.hpp"
#include "rem/util/xdg.hpp"

namespace rem::config {

namespace {

bool isValidLogLevel(const std::string& level) {
  return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
         level == "error" || level == "critical" || level == "off";
}

}  // namespace

Config::Config() {
  setDefaults();
  config_path_ = defaultConfigPath();

  if (std::filesystem::exists(config_path_)) {
    auto result = load(config_path_);
    if (!result.has_value()) {
      spdlog::warn("Ignoring config file: {}", result.error().message());
    }
  }
}

Config::Config(const std::filesystem::path& config_path) {
  setDefaults();
  config_path_ = config_path;

  auto result = load(config_path);
  if (!result.has_value()) {
    spdlog::debug("Using default configuration: {}", result.error().message());
  }
}

void Config::setDefaults() {
  store_file = rem::util::Xdg::storeFile();
  default_list = "Reminders";
  log_file = rem::util::Xdg::logFile();
  log_level = "info";
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["store_file"].value<std::string>()) {
      store_file = *value;
    }
    if (auto value = config_data["default_list"].value<std::string>()) {
      default_list = *value;
    }

    if (auto log_table = config_data["log"].as_table()) {
      if (auto value = (*log_table)["file"].value<std::string>()) {
        log_file = *value;
      }
      if (auto value = (*log_table)["level"].value<std::string>()) {
        log_level = *value;
      }
    }

    return validate();

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  toml::table config_data;
  config_data.insert_or_assign("store_file", store_file.string());
  config_data.insert_or_assign("default_list", default_list);

  auto log_table = toml::table{};
  log_table.insert_or_assign("file", log_file.string());
  log_table.insert_or_assign("level", log_level);
  config_data.insert_or_assign("log", log_table);

  std::stringstream ss;
  ss << config_data << "\n";

  auto write_result = rem::util::FileSystem::writeFileAtomic(save_path, ss.str());
  if (!write_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Cannot write config file: " + write_result.error().message()));
  }

  return {};
}

Result<std::string> Config::get(const std::string& key) const {
  if (key == "store_file") return store_file.string();
  if (key == "default_list") return default_list;
  if (key == "log.file") return log_file.string();
  if (key == "log.level") return log_level;

  return makeErrorResult<std::string>(ErrorCode::kConfigError, "Unknown config key: " + key);
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  Config candidate = *this;

  if (key == "store_file") {
    candidate.store_file = value;
  } else if (key == "default_list") {
    candidate.default_list = value;
  } else if (key == "log.file") {
    candidate.log_file = value;
  } else if (key == "log.level") {
    candidate.log_level = value;
  } else {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
  }

  auto validation = candidate.validate();
  if (!validation.has_value()) {
    return validation;
  }

  *this = std::move(candidate);
  return {};
}

std::vector<std::string> Config::keys() {
  return {"store_file", "default_list", "log.file", "log.level"};
}

void Config::applyEnvironment() {
  if (const char* value = std::getenv("REM_STORE_FILE"); value && *value) {
    store_file = value;
  }
}

Result<void> Config::validate() const {
  if (store_file.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "store_file must not be empty"));
  }
  if (default_list.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "default_list must not be empty"));
  }
  if (!isValidLogLevel(log_level)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid log level: " + log_level));
  }
  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return rem::util::Xdg::configFile();
}

}  // namespace rem::config

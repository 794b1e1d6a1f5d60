/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "app/configuration_manager.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <utility>

#include "utils/structured_log.h"

namespace monitorgate::app {

namespace {

constexpr const char* kFileLoggerName = "monitorgate";

std::optional<spdlog::level::level_enum> ParseLevel(const std::string& level) {
  if (level == "debug") {
    return spdlog::level::debug;
  }
  if (level == "info") {
    return spdlog::level::info;
  }
  if (level == "warn") {
    return spdlog::level::warn;
  }
  if (level == "error") {
    return spdlog::level::err;
  }
  return std::nullopt;
}

}  // namespace

Expected<std::unique_ptr<ConfigurationManager>, Error> ConfigurationManager::Create(const std::string& config_file,
                                                                                    const std::string& schema_file,
                                                                                    const config::EnvLookup& env) {
  config::Config config;
  if (!config_file.empty()) {
    auto config_result = config::LoadConfig(config_file, schema_file);
    if (!config_result) {
      return utils::MakeUnexpected(config_result.error());
    }
    config = std::move(*config_result);
  } else {
    spdlog::info("No configuration file given, using built-in defaults");
  }

  config::EnvLookup lookup = env;
  if (!lookup) {
    lookup = [](const char* name) -> const char* { return std::getenv(name); };
  }
  auto env_result = config::ApplyEnvironmentOverrides(config, lookup);
  if (!env_result) {
    return utils::MakeUnexpected(env_result.error());
  }

  return std::unique_ptr<ConfigurationManager>(new ConfigurationManager(config_file, schema_file, std::move(config)));
}

ConfigurationManager::ConfigurationManager(std::string config_file, std::string schema_file,
                                           config::Config initial_config)
    : config_file_(std::move(config_file)), schema_file_(std::move(schema_file)), config_(std::move(initial_config)) {}

int ConfigurationManager::PrintConfigTest() const {
  std::cout << "Configuration file syntax is OK\n";
  std::cout << "Configuration details:\n";
  std::cout << "  Prometheus: " << config_.prometheus.url << " (timeout " << config_.prometheus.timeout_ms << "ms)\n";
  std::cout << "  Alertmanager: " << config_.alertmanager.url << " (timeout " << config_.alertmanager.timeout_ms
            << "ms)\n";
  std::cout << "  API HTTP: " << config_.api.http.bind << ":" << config_.api.http.port << "\n";
  std::cout << "  CORS: " << (config_.api.http.enable_cors ? "enabled" : "disabled");
  if (config_.api.http.enable_cors) {
    std::cout << " (origins: ";
    if (config_.api.http.cors_allow_origins.empty()) {
      std::cout << "*";
    }
    for (size_t i = 0; i < config_.api.http.cors_allow_origins.size(); ++i) {
      std::cout << (i == 0 ? "" : ", ") << config_.api.http.cors_allow_origins[i];
    }
    std::cout << ")";
  }
  std::cout << "\n";
  std::cout << "  Page size: default " << config_.api.default_limit << ", max "
            << (config_.api.max_limit > 0 ? std::to_string(config_.api.max_limit) : "unlimited") << "\n";
  std::cout << "  Logging: " << config_.logging.level << " (" << config_.logging.format << ")\n";
  std::cout << "  Environment: " << config_.environment << "\n";
  return 0;
}

Expected<void, Error> ConfigurationManager::ApplyLoggingConfig() {
  // Configure log output (file or stdout) BEFORE setting level
  if (!config_.logging.file.empty()) {
    try {
      // Ensure log directory exists
      std::filesystem::path log_dir = std::filesystem::path(config_.logging.file).parent_path();
      if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
      }

      spdlog::drop(kFileLoggerName);
      auto file_logger = spdlog::basic_logger_mt(kFileLoggerName, config_.logging.file);
      spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kIOError, "Log file initialization failed: " + std::string(ex.what())));
    } catch (const std::filesystem::filesystem_error& ex) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kIOError, "Failed to create log directory: " + std::string(ex.what())));
    }
  }

  // Apply logging level (must be AFTER setting default logger)
  auto level = ParseLevel(config_.logging.level);
  if (!level) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "Unknown logging level: " + config_.logging.level));
  }
  spdlog::set_level(*level);

  auto format = utils::StructuredLog::ParseFormat(config_.logging.format);
  if (!format) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "Unknown logging format: " + config_.logging.format));
  }
  utils::StructuredLog::SetFormat(*format);

  if (!config_.logging.file.empty()) {
    spdlog::info("Logging to file: {}", config_.logging.file);
  }

  return {};
}

Expected<void, Error> ConfigurationManager::ReopenLogFile() const {
  // No-op if logging to stdout
  if (config_.logging.file.empty()) {
    return {};
  }

  try {
    auto current_level = spdlog::get_level();

    // Dropping the logger closes the rotated file descriptor
    spdlog::drop(kFileLoggerName);
    auto file_logger = spdlog::basic_logger_mt(kFileLoggerName, config_.logging.file);
    spdlog::set_default_logger(file_logger);
    spdlog::set_level(current_level);

    spdlog::info("Log file reopened for rotation");
  } catch (const spdlog::spdlog_ex& ex) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kIOError, "Log file reopen failed: " + std::string(ex.what())));
  }

  return {};
}

}  // namespace monitorgate::app

/**
 * @file configuration_manager.h
 * @brief Configuration manager for loading configuration and applying logging settings
 */

#ifndef MONITORGATE_APP_CONFIGURATION_MANAGER_H_
#define MONITORGATE_APP_CONFIGURATION_MANAGER_H_

#include <memory>
#include <string>

#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace monitorgate::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Configuration manager
 *
 * Owns the Config object for the lifetime of the process. The file is
 * optional: without one, built-in defaults are used. Environment overrides
 * (PORT, PROMETHEUS_URL, ALERTMANAGER_URL, ALLOWED_ORIGINS, NODE_ENV) are
 * applied on top in both cases.
 */
class ConfigurationManager {
 public:
  /**
   * @brief Create manager and load initial configuration
   * @param config_file Path to configuration file (empty = defaults)
   * @param schema_file Optional schema file path (empty = use built-in)
   * @param env Environment lookup (defaults to std::getenv)
   */
  static Expected<std::unique_ptr<ConfigurationManager>, Error> Create(const std::string& config_file,
                                                                       const std::string& schema_file = "",
                                                                       const config::EnvLookup& env = nullptr);

  ~ConfigurationManager() = default;

  // Non-copyable, non-movable (owns configuration state)
  ConfigurationManager(const ConfigurationManager&) = delete;
  ConfigurationManager& operator=(const ConfigurationManager&) = delete;
  ConfigurationManager(ConfigurationManager&&) = delete;
  ConfigurationManager& operator=(ConfigurationManager&&) = delete;

  const config::Config& GetConfig() const { return config_; }

  /**
   * @brief Test mode: print the effective configuration
   * @return Exit code (0 = success)
   */
  int PrintConfigTest() const;

  /**
   * @brief Apply logging configuration
   *
   * Sets the spdlog level, switches the default logger to a file sink when
   * logging.file is set (creating its directory), and selects the
   * structured log format.
   */
  Expected<void, Error> ApplyLoggingConfig();

  /**
   * @brief Reopen the log file after rotation (SIGUSR1); no-op for stdout
   */
  Expected<void, Error> ReopenLogFile() const;

  const std::string& GetConfigFilePath() const { return config_file_; }

  const std::string& GetSchemaFilePath() const { return schema_file_; }

 private:
  ConfigurationManager(std::string config_file, std::string schema_file, config::Config initial_config);

  std::string config_file_;
  std::string schema_file_;
  config::Config config_;
};

}  // namespace monitorgate::app

#endif  // MONITORGATE_APP_CONFIGURATION_MANAGER_H_

/**
 * @file config.h
 * @brief Configuration structures and YAML/JSON loader
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace monitorgate::config {

// Default values for configuration
namespace defaults {

// Upstream defaults
constexpr const char* kPrometheusUrl = "http://localhost:9090/prometheus";
constexpr const char* kAlertmanagerUrl = "http://localhost:9093";
constexpr int kUpstreamTimeoutMs = 10000;

// API defaults
constexpr int kHttpPort = 3001;
constexpr int kHttpReadTimeoutSec = 30;
constexpr int kHttpWriteTimeoutSec = 30;

// Query defaults
constexpr int kDefaultLimit = 100;
constexpr int kMaxLimit = 0;  // 0 = no cap

constexpr const char* kEnvironment = "development";

}  // namespace defaults

/**
 * @brief Prometheus upstream configuration
 */
struct PrometheusConfig {
  std::string url = defaults::kPrometheusUrl;
  int timeout_ms = defaults::kUpstreamTimeoutMs;
};

/**
 * @brief Alertmanager upstream configuration
 */
struct AlertmanagerConfig {
  std::string url = defaults::kAlertmanagerUrl;
  int timeout_ms = defaults::kUpstreamTimeoutMs;
};

/**
 * @brief API configuration
 */
struct ApiConfig {
  struct {
    std::string bind = "0.0.0.0";
    int port = defaults::kHttpPort;
    int read_timeout_sec = defaults::kHttpReadTimeoutSec;
    int write_timeout_sec = defaults::kHttpWriteTimeoutSec;
    bool enable_cors = true;
    std::vector<std::string> cors_allow_origins;  ///< Empty = any origin ("*")
  } http;

  /**
   * @brief Page size used when a request carries no valid limit
   */
  int default_limit = defaults::kDefaultLimit;

  /**
   * @brief Upper bound applied to a requested limit (0 = no cap)
   */
  int max_limit = defaults::kMaxLimit;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";
  std::string format = "json";  ///< "json" or "text"
  std::string file;             ///< Log file path (empty = stdout, path = file output)
};

/**
 * @brief Root configuration
 */
struct Config {
  PrometheusConfig prometheus;
  AlertmanagerConfig alertmanager;
  ApiConfig api;
  LoggingConfig logging;
  std::string environment = defaults::kEnvironment;  ///< Reported by /health
};

/**
 * @brief Environment lookup used by ApplyEnvironmentOverrides (nullptr = unset)
 */
using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Load configuration from YAML or JSON file
 *
 * Automatically detects file format based on extension (.yaml, .yml, .json).
 * The document is validated against the embedded JSON Schema, or against
 * schema_path when one is given.
 *
 * @param path Path to configuration file (YAML or JSON)
 * @param schema_path Optional path to JSON Schema file for validation
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Load configuration from YAML file
 */
utils::Expected<Config, utils::Error> LoadConfigYaml(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Load configuration from JSON file
 */
utils::Expected<Config, utils::Error> LoadConfigJson(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Validate JSON configuration against schema
 *
 * @param config_json_str JSON configuration string
 * @param schema_json_str JSON Schema string (empty = embedded schema)
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                       const std::string& schema_json_str);

/**
 * @brief Apply PORT, PROMETHEUS_URL, ALERTMANAGER_URL, ALLOWED_ORIGINS and NODE_ENV
 *
 * ALLOWED_ORIGINS is a comma-separated list; empty entries are dropped.
 *
 * @return kConfigInvalidValue when PORT is not a valid port number
 */
utils::Expected<void, utils::Error> ApplyEnvironmentOverrides(Config& config, const EnvLookup& lookup);

}  // namespace monitorgate::config

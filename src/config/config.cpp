/**
 * @file config.cpp
 * @brief Configuration parser implementation with JSON Schema validation
 */

#include "config/config.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

#include "config_schema_embedded.h"  // Auto-generated embedded schema
#include "utils/string_utils.h"

namespace monitorgate::config {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

using json = nlohmann::json;
using nlohmann::json_schema::json_validator;

constexpr int kMaxPort = 65535;

/**
 * @brief Convert YAML node to JSON object recursively
 */
json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar: {
      // Unquoted scalars keep their JSON type (numbers, booleans)
      const auto scalar = node.as<std::string>();
      if (node.Tag() == "!") {
        return scalar;
      }
      try {
        return json::parse(scalar);
      } catch (const json::exception&) {
        return scalar;
      }
    }
    case YAML::NodeType::Sequence: {
      json result = json::array();
      for (const auto& item : node) {
        result.push_back(YamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      json result = json::object();
      for (const auto& key_value : node) {
        result[key_value.first.as<std::string>()] = YamlToJson(key_value.second);
      }
      return result;
    }
    default:
      return {};
  }
}

template <typename Upstream>
Upstream ParseUpstreamConfig(const json& json_obj) {
  Upstream config;
  if (json_obj.contains("url")) {
    config.url = json_obj["url"].get<std::string>();
  }
  if (json_obj.contains("timeout_ms")) {
    config.timeout_ms = json_obj["timeout_ms"].get<int>();
  }
  return config;
}

/**
 * @brief Parse API configuration from JSON
 */
ApiConfig ParseApiConfig(const json& api) {
  ApiConfig config;

  if (api.contains("http")) {
    const auto& http = api["http"];
    if (http.contains("bind")) {
      config.http.bind = http["bind"].get<std::string>();
    }
    if (http.contains("port")) {
      config.http.port = http["port"].get<int>();
    }
    if (http.contains("read_timeout_sec")) {
      config.http.read_timeout_sec = http["read_timeout_sec"].get<int>();
    }
    if (http.contains("write_timeout_sec")) {
      config.http.write_timeout_sec = http["write_timeout_sec"].get<int>();
    }
    if (http.contains("enable_cors")) {
      config.http.enable_cors = http["enable_cors"].get<bool>();
    }
    if (http.contains("cors_allow_origins")) {
      config.http.cors_allow_origins = http["cors_allow_origins"].get<std::vector<std::string>>();
    }
  }
  if (api.contains("default_limit")) {
    config.default_limit = api["default_limit"].get<int>();
  }
  if (api.contains("max_limit")) {
    config.max_limit = api["max_limit"].get<int>();
  }

  return config;
}

Config ParseConfigFromJson(const json& root) {
  Config config;

  if (root.contains("prometheus")) {
    config.prometheus = ParseUpstreamConfig<PrometheusConfig>(root["prometheus"]);
  }
  if (root.contains("alertmanager")) {
    config.alertmanager = ParseUpstreamConfig<AlertmanagerConfig>(root["alertmanager"]);
  }
  if (root.contains("api")) {
    config.api = ParseApiConfig(root["api"]);
  }

  if (root.contains("logging")) {
    const auto& log = root["logging"];
    if (log.contains("level")) {
      config.logging.level = log["level"].get<std::string>();
    }
    if (log.contains("format")) {
      config.logging.format = log["format"].get<std::string>();
    }
    if (log.contains("file")) {
      config.logging.file = log["file"].get<std::string>();
    }
  }

  if (root.contains("environment")) {
    config.environment = root["environment"].get<std::string>();
  }

  return config;
}

/**
 * @brief Read file contents as string
 */
utils::Expected<std::string, utils::Error> ReadFileToString(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    std::stringstream err_msg;
    err_msg << "Failed to open configuration file: " << path << "\n";
    err_msg << "  Please verify the file exists and is readable.\n";
    err_msg << "  Example config: examples/config.yaml";
    return MakeUnexpected(MakeError(ErrorCode::kConfigFileNotFound, err_msg.str(), path));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::string content = buffer.str();
  if (content.empty()) {
    std::stringstream err_msg;
    err_msg << "Configuration file is empty: " << path << "\n";
    err_msg << "  Example config: examples/config.yaml";
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, err_msg.str(), path));
  }

  return content;
}

/**
 * @brief Read the optional custom schema (empty path = embedded schema)
 */
utils::Expected<std::string, utils::Error> ReadSchema(const std::string& schema_path) {
  if (schema_path.empty()) {
    return std::string();
  }
  return ReadFileToString(schema_path);
}

/**
 * @brief Validate the JSON document, then map it onto Config
 */
utils::Expected<Config, utils::Error> BuildConfig(const json& config_json, const std::string& path,
                                                  const std::string& schema_path) {
  auto schema_str = ReadSchema(schema_path);
  if (!schema_str) {
    return MakeUnexpected(schema_str.error());
  }
  auto validated = ValidateConfigJson(config_json.dump(), *schema_str);
  if (!validated) {
    return MakeUnexpected(validated.error());
  }

  Config config;
  try {
    config = ParseConfigFromJson(config_json);
  } catch (const json::exception& e) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigInvalidValue, std::string("Invalid configuration value: ") + e.what(), path));
  }

  spdlog::info("Configuration loaded successfully from {}", path);
  spdlog::info("  Prometheus: {}", config.prometheus.url);
  spdlog::info("  Alertmanager: {}", config.alertmanager.url);
  spdlog::info("  HTTP: {}:{}", config.api.http.bind, config.api.http.port);
  return config;
}

/**
 * @brief Detect file format based on extension
 */
enum class FileFormat : uint8_t { kYaml, kJson, kUnknown };

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

FileFormat DetectFileFormat(const std::string& path) {
  if (EndsWith(path, ".json")) {
    return FileFormat::kJson;
  }
  if (EndsWith(path, ".yaml") || EndsWith(path, ".yml")) {
    return FileFormat::kYaml;
  }
  return FileFormat::kUnknown;
}

}  // namespace

utils::Expected<void, utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                       const std::string& schema_json_str) {
  json config_json;
  json schema_json;
  try {
    config_json = json::parse(config_json_str);
    // Use embedded schema if no custom schema provided
    schema_json = json::parse(schema_json_str.empty() ? std::string(kConfigSchemaJson) : schema_json_str);
  } catch (const json::parse_error& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, std::string("JSON parse error: ") + e.what()));
  }

  try {
    json_validator validator;
    validator.set_root_schema(schema_json);
    validator.validate(config_json);
  } catch (const std::exception& e) {
    std::stringstream err_msg;
    err_msg << "Configuration validation failed:\n";
    err_msg << "  " << e.what() << "\n";
    err_msg << "  Common configuration issues:\n";
    err_msg << "    - Invalid data types (string instead of number, etc.)\n";
    err_msg << "    - Unknown keys (check spelling against examples/config.yaml)\n";
    err_msg << "    - Invalid enum values (logging.level, logging.format)";
    return MakeUnexpected(MakeError(ErrorCode::kConfigValidationError, err_msg.str()));
  }

  spdlog::debug("Configuration validation passed");
  return {};
}

utils::Expected<Config, utils::Error> LoadConfigJson(const std::string& path, const std::string& schema_path) {
  auto config_str = ReadFileToString(path);
  if (!config_str) {
    return MakeUnexpected(config_str.error());
  }

  json config_json;
  try {
    config_json = json::parse(*config_str);
  } catch (const json::parse_error& e) {
    std::stringstream err_msg;
    err_msg << "JSON parse error in configuration file: " << path << "\n";
    err_msg << "  Error details: " << e.what() << "\n";
    if (e.byte != 0) {
      err_msg << "  Error position: byte " << e.byte << "\n";
    }
    err_msg << "  Tip: Use a JSON validator to check syntax";
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, err_msg.str(), path));
  }

  return BuildConfig(config_json, path, schema_path);
}

utils::Expected<Config, utils::Error> LoadConfigYaml(const std::string& path, const std::string& schema_path) {
  json config_json;
  try {
    YAML::Node yaml_root = YAML::LoadFile(path);
    config_json = YamlToJson(yaml_root);
  } catch (const YAML::BadFile&) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigFileNotFound, "Failed to open configuration file: " + path, path));
  } catch (const YAML::Exception& e) {
    std::stringstream err_msg;
    err_msg << "YAML parse error in configuration file: " << path << "\n";
    err_msg << "  Error details: " << e.what() << "\n";
    if (e.mark.line != static_cast<int>(-1)) {
      err_msg << "  Error location: line " << (e.mark.line + 1) << ", column " << (e.mark.column + 1) << "\n";
    }
    err_msg << "  Tip: Check YAML syntax, especially indentation";
    return MakeUnexpected(MakeError(ErrorCode::kConfigYamlError, err_msg.str(), path));
  }

  if (config_json.is_null()) {
    // An empty YAML document means "all defaults"
    config_json = json::object();
  }
  return BuildConfig(config_json, path, schema_path);
}

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path, const std::string& schema_path) {
  switch (DetectFileFormat(path)) {
    case FileFormat::kJson:
      spdlog::debug("Detected JSON format for config file: {}", path);
      return LoadConfigJson(path, schema_path);

    case FileFormat::kYaml:
      spdlog::debug("Detected YAML format for config file: {}", path);
      return LoadConfigYaml(path, schema_path);

    case FileFormat::kUnknown:
    default: {
      // Try YAML first, then JSON
      spdlog::debug("Unknown file format, trying YAML first: {}", path);
      auto yaml_result = LoadConfigYaml(path, schema_path);
      if (yaml_result) {
        return yaml_result;
      }
      spdlog::debug("YAML parsing failed, trying JSON: {}", path);
      auto json_result = LoadConfigJson(path, schema_path);
      if (json_result) {
        return json_result;
      }
      std::stringstream err_msg;
      err_msg << "Failed to load configuration file: " << path << "\n";
      err_msg << "  File format could not be determined (.yaml, .yml, or .json expected)\n";
      err_msg << "  Attempted YAML parsing: " << yaml_result.error().message() << "\n";
      err_msg << "  Attempted JSON parsing: " << json_result.error().message();
      return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, err_msg.str(), path));
    }
  }
}

utils::Expected<void, utils::Error> ApplyEnvironmentOverrides(Config& config, const EnvLookup& lookup) {
  if (const char* port = lookup("PORT"); port != nullptr && *port != '\0') {
    auto parsed = utils::ParseInt64(port);
    if (!parsed || *parsed <= 0 || *parsed > kMaxPort) {
      return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, std::string("Invalid PORT: ") + port));
    }
    config.api.http.port = static_cast<int>(*parsed);
  }
  if (const char* url = lookup("PROMETHEUS_URL"); url != nullptr && *url != '\0') {
    config.prometheus.url = url;
  }
  if (const char* url = lookup("ALERTMANAGER_URL"); url != nullptr && *url != '\0') {
    config.alertmanager.url = url;
  }
  if (const char* origins = lookup("ALLOWED_ORIGINS"); origins != nullptr && *origins != '\0') {
    config.api.http.cors_allow_origins.clear();
    for (const auto& origin : utils::Split(origins, ',')) {
      auto trimmed = utils::Trim(origin);
      if (!trimmed.empty()) {
        config.api.http.cors_allow_origins.push_back(std::move(trimmed));
      }
    }
  }
  if (const char* env = lookup("NODE_ENV"); env != nullptr && *env != '\0') {
    config.environment = env;
  }
  return {};
}

}  // namespace monitorgate::config

/**
 * @file alerts_source.h
 * @brief Abstract interface for the alerting backend (Alertmanager) to enable unit testing
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace monitorgate::upstream {

/**
 * @brief Abstract interface for the alerting backend
 *
 * The optional filter is an Alertmanager label matcher string (e.g.
 * "severity=\"critical\"") passed through as the upstream "filter" parameter.
 */
class IAlertsSource {
 public:
  virtual ~IAlertsSource() = default;

  /**
   * @brief Alerts mapped to {id, name, severity, status, description, labels, startsAt}
   */
  virtual utils::Expected<nlohmann::json, utils::Error> GetAlerts(const std::optional<std::string>& filter) = 0;

  virtual utils::Expected<nlohmann::json, utils::Error> GetAlertGroups(const std::optional<std::string>& filter) = 0;

  /**
   * @brief Push alerts (body must be a JSON array)
   */
  virtual utils::Expected<void, utils::Error> PostAlerts(const nlohmann::json& alerts) = 0;

  virtual utils::Expected<nlohmann::json, utils::Error> GetSilences(const std::optional<std::string>& filter) = 0;

  virtual utils::Expected<nlohmann::json, utils::Error> GetSilence(const std::string& silence_id) = 0;

  /**
   * @brief Create or update a silence
   * @return {"silenceID": "..."}
   */
  virtual utils::Expected<nlohmann::json, utils::Error> CreateSilence(const nlohmann::json& silence) = 0;

  virtual utils::Expected<void, utils::Error> DeleteSilence(const std::string& silence_id) = 0;

  virtual utils::Expected<nlohmann::json, utils::Error> GetReceivers() = 0;

  virtual utils::Expected<nlohmann::json, utils::Error> GetStatus() = 0;

  /**
   * @brief {"status": "healthy" | "unhealthy"}
   */
  virtual utils::Expected<nlohmann::json, utils::Error> CheckHealth() = 0;
};

}  // namespace monitorgate::upstream

/**
 * @file alertmanager_client.h
 * @brief Alertmanager v2 API client
 */

#pragma once

#include "upstream/alerts_source.h"
#include "upstream/http_json_client.h"

namespace monitorgate::upstream {

/**
 * @brief IAlertsSource backed by the Alertmanager v2 API (/api/v2)
 */
class AlertmanagerClient : public IAlertsSource {
 public:
  explicit AlertmanagerClient(HttpClientOptions options);

  utils::Expected<nlohmann::json, utils::Error> GetAlerts(const std::optional<std::string>& filter) override;
  utils::Expected<nlohmann::json, utils::Error> GetAlertGroups(const std::optional<std::string>& filter) override;
  utils::Expected<void, utils::Error> PostAlerts(const nlohmann::json& alerts) override;
  utils::Expected<nlohmann::json, utils::Error> GetSilences(const std::optional<std::string>& filter) override;
  utils::Expected<nlohmann::json, utils::Error> GetSilence(const std::string& silence_id) override;
  utils::Expected<nlohmann::json, utils::Error> CreateSilence(const nlohmann::json& silence) override;
  utils::Expected<void, utils::Error> DeleteSilence(const std::string& silence_id) override;
  utils::Expected<nlohmann::json, utils::Error> GetReceivers() override;
  utils::Expected<nlohmann::json, utils::Error> GetStatus() override;
  utils::Expected<nlohmann::json, utils::Error> CheckHealth() override;

  /**
   * @brief Map one upstream alert to the flattened record returned by GetAlerts()
   */
  static nlohmann::json MapAlert(const nlohmann::json& alert);

 private:
  HttpJsonClient http_;
};

}  // namespace monitorgate::upstream

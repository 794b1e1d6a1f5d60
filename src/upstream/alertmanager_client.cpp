/**
 * @file alertmanager_client.cpp
 * @brief Alertmanager v2 API client implementation
 */

#include "upstream/alertmanager_client.h"

#include <utility>

namespace monitorgate::upstream {

using nlohmann::json;
using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr const char* kAlertsPath = "/api/v2/alerts";
constexpr const char* kAlertGroupsPath = "/api/v2/alerts/groups";
constexpr const char* kSilencesPath = "/api/v2/silences";
constexpr const char* kSilencePath = "/api/v2/silence/";
constexpr const char* kReceiversPath = "/api/v2/receivers";
constexpr const char* kStatusPath = "/api/v2/status";
constexpr const char* kHealthPath = "/-/healthy";

constexpr int kHttpOk = 200;

QueryParams FilterParams(const std::optional<std::string>& filter) {
  QueryParams params;
  if (filter && !filter->empty()) {
    params.emplace("filter", *filter);
  }
  return params;
}

void CopyIfPresent(json& dst, const std::string& dst_key, const json& src, const std::string& src_key) {
  if (src.is_object() && src.contains(src_key)) {
    dst[dst_key] = src.at(src_key);
  }
}

}  // namespace

AlertmanagerClient::AlertmanagerClient(HttpClientOptions options) : http_(std::move(options)) {}

json AlertmanagerClient::MapAlert(const json& alert) {
  static const json kEmptyObject = json::object();
  const json& labels = alert.is_object() && alert.contains("labels") ? alert.at("labels") : kEmptyObject;
  const json& annotations = alert.is_object() && alert.contains("annotations") ? alert.at("annotations") : kEmptyObject;

  json record = json::object();
  CopyIfPresent(record, "id", alert, "fingerprint");
  CopyIfPresent(record, "name", labels, "alertname");
  CopyIfPresent(record, "severity", labels, "severity");
  CopyIfPresent(record, "status", alert, "status");
  CopyIfPresent(record, "description", annotations, "description");

  json label_subset = json::object();
  CopyIfPresent(label_subset, "cluster", labels, "cluster");
  CopyIfPresent(label_subset, "alertname", labels, "alertname");
  CopyIfPresent(label_subset, "instance", labels, "instance");
  record["labels"] = std::move(label_subset);

  CopyIfPresent(record, "startsAt", alert, "startsAt");
  return record;
}

utils::Expected<json, Error> AlertmanagerClient::GetAlerts(const std::optional<std::string>& filter) {
  return http_.Get(kAlertsPath, FilterParams(filter))
      .and_then([](const json& body) -> utils::Expected<json, Error> {
        if (!body.is_array()) {
          return MakeUnexpected(MakeError(ErrorCode::kUpstreamInvalidResponse, "Expected an array of alerts"));
        }
        json alerts = json::array();
        for (const auto& alert : body) {
          alerts.push_back(MapAlert(alert));
        }
        return alerts;
      })
      .transform_error(Describe("Failed to fetch alerts"));
}

utils::Expected<json, Error> AlertmanagerClient::GetAlertGroups(const std::optional<std::string>& filter) {
  return http_.Get(kAlertGroupsPath, FilterParams(filter)).transform_error(Describe("Failed to fetch alert groups"));
}

utils::Expected<void, Error> AlertmanagerClient::PostAlerts(const json& alerts) {
  auto result = http_.Post(kAlertsPath, alerts);
  if (!result) {
    return MakeUnexpected(Describe("Failed to post alerts")(result.error()));
  }
  return {};
}

utils::Expected<json, Error> AlertmanagerClient::GetSilences(const std::optional<std::string>& filter) {
  return http_.Get(kSilencesPath, FilterParams(filter)).transform_error(Describe("Failed to fetch silences"));
}

utils::Expected<json, Error> AlertmanagerClient::GetSilence(const std::string& silence_id) {
  return http_.Get(kSilencePath + HttpJsonClient::EncodeSegment(silence_id))
      .transform_error(Describe("Failed to fetch silence"));
}

utils::Expected<json, Error> AlertmanagerClient::CreateSilence(const json& silence) {
  return http_.Post(kSilencesPath, silence).transform_error(Describe("Failed to create silence"));
}

utils::Expected<void, Error> AlertmanagerClient::DeleteSilence(const std::string& silence_id) {
  auto result = http_.Delete(kSilencePath + HttpJsonClient::EncodeSegment(silence_id));
  if (!result) {
    return MakeUnexpected(Describe("Failed to delete silence")(result.error()));
  }
  return {};
}

utils::Expected<json, Error> AlertmanagerClient::GetReceivers() {
  return http_.Get(kReceiversPath).transform_error(Describe("Failed to fetch receivers"));
}

utils::Expected<json, Error> AlertmanagerClient::GetStatus() {
  return http_.Get(kStatusPath).transform_error(Describe("Failed to fetch status"));
}

utils::Expected<json, Error> AlertmanagerClient::CheckHealth() {
  return http_.GetStatus(kHealthPath)
      .transform([](int status) { return json{{"status", status == kHttpOk ? "healthy" : "unhealthy"}}; })
      .transform_error(Describe("Alertmanager health check failed"));
}

}  // namespace monitorgate::upstream

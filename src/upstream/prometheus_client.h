/**
 * @file prometheus_client.h
 * @brief Prometheus HTTP API client
 */

#pragma once

#include "upstream/http_json_client.h"
#include "upstream/metrics_source.h"

namespace monitorgate::upstream {

/**
 * @brief IMetricsSource backed by the Prometheus HTTP API (/api/v1)
 *
 * Upstream failures are reported as upstream-range errors whose message
 * names the failed operation ("Failed to fetch rules: ...").
 */
class PrometheusClient : public IMetricsSource {
 public:
  explicit PrometheusClient(HttpClientOptions options);

  utils::Expected<nlohmann::json, utils::Error> Query(const std::string& query,
                                                      const std::optional<std::string>& time) override;
  utils::Expected<nlohmann::json, utils::Error> QueryRange(const std::string& query, const std::string& start,
                                                           const std::string& end, const std::string& step) override;
  utils::Expected<nlohmann::json, utils::Error> GetLabels() override;
  utils::Expected<nlohmann::json, utils::Error> GetLabelValues(const std::string& label) override;
  utils::Expected<nlohmann::json, utils::Error> GetMetricNames() override;
  utils::Expected<nlohmann::json, utils::Error> GetSeries(const std::vector<std::string>& matches,
                                                          const std::optional<std::string>& start,
                                                          const std::optional<std::string>& end) override;
  utils::Expected<nlohmann::json, utils::Error> GetTargets() override;
  utils::Expected<nlohmann::json, utils::Error> GetRules() override;
  utils::Expected<nlohmann::json, utils::Error> GetAlerts() override;
  utils::Expected<nlohmann::json, utils::Error> CheckHealth() override;

  /**
   * @brief One record per rule:
   * {id, name, groupName, state, query, duration, severity, annotations, alerts[], lastEvaluation}
   *
   * id is the rule name; each alert gets a fresh random UUID as its id,
   * merged with the upstream alert fields.
   */
  utils::Expected<nlohmann::json, utils::Error> GetRulesProcessed() override;
  utils::Expected<nlohmann::json, utils::Error> GetRuleGroups() override;

  /**
   * @brief {health, nodeCount, dataNodeCount, primaryShards, unassignedShards, documentCount, timestamp}
   */
  utils::Expected<nlohmann::json, utils::Error> GetClusterMetrics() override;
  utils::Expected<nlohmann::json, utils::Error> GetCpuMetrics(const std::string& start, const std::string& end,
                                                              const std::string& step) override;

  /**
   * @brief Heap values in KiB rounded to two decimals; heapPercent = heapUsed / heapMax * 100
   *
   * heapMax and heapPercent are null when no matching max sample exists.
   */
  utils::Expected<nlohmann::json, utils::Error> GetJvmMetrics(const std::string& start, const std::string& end,
                                                              const std::string& step) override;

 private:
  HttpJsonClient http_;

  /**
   * @brief GET an /api/v1 endpoint and return its "data" field
   */
  utils::Expected<nlohmann::json, utils::Error> GetData(const std::string& path, const QueryParams& params = {});

  /**
   * @brief Instant query returning the first sample as an integer
   */
  utils::Expected<int64_t, utils::Error> QueryGauge(const std::string& metric);
};

}  // namespace monitorgate::upstream

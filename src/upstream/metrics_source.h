/**
 * @file metrics_source.h
 * @brief Abstract interface for the metrics backend (Prometheus) to enable unit testing
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace monitorgate::upstream {

/**
 * @brief Abstract interface for the metrics backend
 *
 * This interface enables unit testing of the HTTP handlers without a running
 * Prometheus. Raw operations return the upstream payload untouched; the
 * processed operations return record arrays ready for the query pipeline.
 */
class IMetricsSource {
 public:
  virtual ~IMetricsSource() = default;

  // Raw API

  /**
   * @brief Instant query (/api/v1/query); returns the whole response body
   */
  virtual utils::Expected<nlohmann::json, utils::Error> Query(const std::string& query,
                                                              const std::optional<std::string>& time) = 0;

  /**
   * @brief Range query (/api/v1/query_range); returns the whole response body
   */
  virtual utils::Expected<nlohmann::json, utils::Error> QueryRange(const std::string& query, const std::string& start,
                                                                   const std::string& end,
                                                                   const std::string& step) = 0;

  virtual utils::Expected<nlohmann::json, utils::Error> GetLabels() = 0;

  virtual utils::Expected<nlohmann::json, utils::Error> GetLabelValues(const std::string& label) = 0;

  /**
   * @brief All metric names (values of the __name__ label)
   */
  virtual utils::Expected<nlohmann::json, utils::Error> GetMetricNames() = 0;

  virtual utils::Expected<nlohmann::json, utils::Error> GetSeries(const std::vector<std::string>& matches,
                                                                  const std::optional<std::string>& start,
                                                                  const std::optional<std::string>& end) = 0;

  virtual utils::Expected<nlohmann::json, utils::Error> GetTargets() = 0;

  /**
   * @brief Rule groups exactly as Prometheus reports them (data field)
   */
  virtual utils::Expected<nlohmann::json, utils::Error> GetRules() = 0;

  /**
   * @brief Active alerts (data.alerts)
   */
  virtual utils::Expected<nlohmann::json, utils::Error> GetAlerts() = 0;

  /**
   * @brief {"status": "healthy" | "unhealthy"}
   */
  virtual utils::Expected<nlohmann::json, utils::Error> CheckHealth() = 0;

  // Processed API

  /**
   * @brief Alerting rules flattened into one record per rule
   */
  virtual utils::Expected<nlohmann::json, utils::Error> GetRulesProcessed() = 0;

  /**
   * @brief Distinct rule group names, first-seen order
   */
  virtual utils::Expected<nlohmann::json, utils::Error> GetRuleGroups() = 0;

  /**
   * @brief Elasticsearch cluster summary built from exporter gauges
   */
  virtual utils::Expected<nlohmann::json, utils::Error> GetClusterMetrics() = 0;

  /**
   * @brief Per-node CPU usage samples: [{timestamp, nodeName, usage}]
   */
  virtual utils::Expected<nlohmann::json, utils::Error> GetCpuMetrics(const std::string& start, const std::string& end,
                                                                      const std::string& step) = 0;

  /**
   * @brief Per-node JVM heap samples: [{timestamp, nodeName, heapUsed, heapMax, heapPercent}]
   */
  virtual utils::Expected<nlohmann::json, utils::Error> GetJvmMetrics(const std::string& start, const std::string& end,
                                                                      const std::string& step) = 0;
};

}  // namespace monitorgate::upstream

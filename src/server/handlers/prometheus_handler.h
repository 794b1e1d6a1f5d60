/**
 * @file prometheus_handler.h
 * @brief Routes under /api/prometheus
 */

#pragma once

#include "server/handlers/route_handler.h"
#include "upstream/metrics_source.h"

namespace monitorgate::server {

/**
 * @brief Handler for the Prometheus-backed endpoints
 *
 * Processed views:
 * - GET /cluster-metrics, /rule-groups
 * - GET /cpu-metrics, /jvm-metrics (start, end, step required; full series, not paginated)
 * - GET /rules (paginated)
 *
 * Pass-through views under /raw: query, query_range, labels,
 * label/{label}/values, metrics, series, targets, rules, alerts, health.
 */
class PrometheusHandler : public RouteHandler {
 public:
  PrometheusHandler(upstream::IMetricsSource& source, query::QueryPipeline pipeline,
                    std::string prefix = "/api/prometheus");

  void Register(httplib::Server& server) override;

 private:
  upstream::IMetricsSource& source_;

  void HandleClusterMetrics(const httplib::Request& req, httplib::Response& res);
  void HandleCpuMetrics(const httplib::Request& req, httplib::Response& res);
  void HandleJvmMetrics(const httplib::Request& req, httplib::Response& res);
  void HandleRules(const httplib::Request& req, httplib::Response& res);
  void HandleRuleGroups(const httplib::Request& req, httplib::Response& res);

  void HandleQuery(const httplib::Request& req, httplib::Response& res);
  void HandleQueryRange(const httplib::Request& req, httplib::Response& res);
  void HandleSeries(const httplib::Request& req, httplib::Response& res);
  void HandleLabelValues(const httplib::Request& req, httplib::Response& res);
};

}  // namespace monitorgate::server

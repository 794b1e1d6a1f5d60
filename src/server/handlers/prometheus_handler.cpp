/**
 * @file prometheus_handler.cpp
 * @brief Routes under /api/prometheus
 */

#include "server/handlers/prometheus_handler.h"

#include <utility>

namespace monitorgate::server {

using utils::ErrorCode;
using utils::MakeError;

namespace {
constexpr const char* kRangeParamsRequired = "start, end, and step parameters are required";
}  // namespace

PrometheusHandler::PrometheusHandler(upstream::IMetricsSource& source, query::QueryPipeline pipeline,
                                     std::string prefix)
    : RouteHandler(std::move(prefix), pipeline), source_(source) {}

void PrometheusHandler::Register(httplib::Server& server) {
  server.Get(Route("/cluster-metrics"),
             [this](const httplib::Request& req, httplib::Response& res) { HandleClusterMetrics(req, res); });
  server.Get(Route("/cpu-metrics"),
             [this](const httplib::Request& req, httplib::Response& res) { HandleCpuMetrics(req, res); });
  server.Get(Route("/jvm-metrics"),
             [this](const httplib::Request& req, httplib::Response& res) { HandleJvmMetrics(req, res); });
  server.Get(Route("/rules"), [this](const httplib::Request& req, httplib::Response& res) { HandleRules(req, res); });
  server.Get(Route("/rule-groups"),
             [this](const httplib::Request& req, httplib::Response& res) { HandleRuleGroups(req, res); });

  // Raw pass-through endpoints
  server.Get(Route("/raw/query"), [this](const httplib::Request& req, httplib::Response& res) { HandleQuery(req, res); });
  server.Get(Route("/raw/query_range"),
             [this](const httplib::Request& req, httplib::Response& res) { HandleQueryRange(req, res); });
  server.Get(Route("/raw/labels"), [this](const httplib::Request& /*req*/, httplib::Response& res) {
    Guarded(res, [&] { SendResult(res, source_.GetLabels()); });
  });
  server.Get(Route(R"(/raw/label/([^/]+)/values)"),
             [this](const httplib::Request& req, httplib::Response& res) { HandleLabelValues(req, res); });
  server.Get(Route("/raw/metrics"), [this](const httplib::Request& /*req*/, httplib::Response& res) {
    Guarded(res, [&] { SendResult(res, source_.GetMetricNames()); });
  });
  server.Get(Route("/raw/series"), [this](const httplib::Request& req, httplib::Response& res) { HandleSeries(req, res); });
  server.Get(Route("/raw/targets"), [this](const httplib::Request& /*req*/, httplib::Response& res) {
    Guarded(res, [&] { SendResult(res, source_.GetTargets()); });
  });
  server.Get(Route("/raw/rules"), [this](const httplib::Request& /*req*/, httplib::Response& res) {
    Guarded(res, [&] { SendResult(res, source_.GetRules()); });
  });
  server.Get(Route("/raw/alerts"), [this](const httplib::Request& /*req*/, httplib::Response& res) {
    Guarded(res, [&] { SendResult(res, source_.GetAlerts()); });
  });
  server.Get(Route("/raw/health"), [this](const httplib::Request& /*req*/, httplib::Response& res) {
    Guarded(res, [&] { SendResult(res, source_.CheckHealth()); });
  });
}

void PrometheusHandler::HandleClusterMetrics(const httplib::Request& /*req*/, httplib::Response& res) {
  Guarded(res, [&] { SendResult(res, source_.GetClusterMetrics()); });
}

void PrometheusHandler::HandleCpuMetrics(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] {
    if (!HasParams(req, {"start", "end", "step"})) {
      SendError(res, MakeError(ErrorCode::kQueryMissingParameter, kRangeParamsRequired));
      return;
    }
    SendResult(res, source_.GetCpuMetrics(*GetParam(req, "start"), *GetParam(req, "end"), *GetParam(req, "step")));
  });
}

void PrometheusHandler::HandleJvmMetrics(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] {
    if (!HasParams(req, {"start", "end", "step"})) {
      SendError(res, MakeError(ErrorCode::kQueryMissingParameter, kRangeParamsRequired));
      return;
    }
    SendResult(res, source_.GetJvmMetrics(*GetParam(req, "start"), *GetParam(req, "end"), *GetParam(req, "step")));
  });
}

void PrometheusHandler::HandleRules(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] { SendQueryResult(req, res, source_.GetRulesProcessed()); });
}

void PrometheusHandler::HandleRuleGroups(const httplib::Request& /*req*/, httplib::Response& res) {
  Guarded(res, [&] { SendResult(res, source_.GetRuleGroups()); });
}

void PrometheusHandler::HandleQuery(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] {
    auto query = GetParam(req, "query");
    if (!query) {
      SendError(res, MakeError(ErrorCode::kQueryMissingParameter, "Query parameter is required"));
      return;
    }
    SendResult(res, source_.Query(*query, GetParam(req, "time")));
  });
}

void PrometheusHandler::HandleQueryRange(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] {
    if (!HasParams(req, {"query", "start", "end", "step"})) {
      SendError(res,
                MakeError(ErrorCode::kQueryMissingParameter, "Query, start, end, and step parameters are required"));
      return;
    }
    SendResult(res, source_.QueryRange(*GetParam(req, "query"), *GetParam(req, "start"), *GetParam(req, "end"),
                                       *GetParam(req, "step")));
  });
}

void PrometheusHandler::HandleSeries(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] {
    // Both "match" and the native "match[]" spelling are accepted
    auto matches = GetParams(req, "match");
    auto bracketed = GetParams(req, "match[]");
    matches.insert(matches.end(), bracketed.begin(), bracketed.end());
    if (matches.empty()) {
      SendError(res, MakeError(ErrorCode::kQueryMissingParameter, "Match parameter is required"));
      return;
    }
    SendResult(res, source_.GetSeries(matches, GetParam(req, "start"), GetParam(req, "end")));
  });
}

void PrometheusHandler::HandleLabelValues(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] { SendResult(res, source_.GetLabelValues(req.matches[1].str())); });
}

}  // namespace monitorgate::server

/**
 * @file alertmanager_handler.h
 * @brief Routes under /api/alertmanager
 */

#pragma once

#include "server/handlers/route_handler.h"
#include "upstream/alerts_source.h"

namespace monitorgate::server {

/**
 * @brief Handler for the Alertmanager-backed endpoints
 *
 * GET /alerts and GET /silences run through the query pipeline; their
 * "filter" parameter is forwarded upstream and is not a field filter.
 */
class AlertmanagerHandler : public RouteHandler {
 public:
  AlertmanagerHandler(upstream::IAlertsSource& source, query::QueryPipeline pipeline,
                      std::string prefix = "/api/alertmanager");

  void Register(httplib::Server& server) override;

  /**
   * @brief True when a silence body carries every required field with a non-empty value
   *
   * Required: matchers, startsAt, endsAt, createdBy, comment.
   */
  static bool IsCompleteSilence(const nlohmann::json& silence);

 private:
  upstream::IAlertsSource& source_;

  void HandleGetAlerts(const httplib::Request& req, httplib::Response& res);
  void HandlePostAlerts(const httplib::Request& req, httplib::Response& res);
  void HandleGetSilences(const httplib::Request& req, httplib::Response& res);
  void HandleCreateSilence(const httplib::Request& req, httplib::Response& res);
  void HandleDeleteSilence(const httplib::Request& req, httplib::Response& res);
};

}  // namespace monitorgate::server

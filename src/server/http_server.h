/**
 * @file http_server.h
 * @brief HTTP server for the gateway JSON API
 */

#pragma once

// Fix for httplib missing NI_MAXHOST on some platforms
#ifndef NI_MAXHOST
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage) - Required for compatibility with httplib C API
#define NI_MAXHOST 1025
#endif

#include <httplib.h>

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

#include "query/query_pipeline.h"
#include "server/handlers/route_handler.h"
#include "upstream/alerts_source.h"
#include "upstream/metrics_source.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace monitorgate::server {

// HTTP server configuration defaults
namespace defaults {
constexpr int kHttpPort = 3001;
constexpr int kHttpTimeoutSec = 30;
}  // namespace defaults

/**
 * @brief HTTP server configuration
 */
struct HttpServerConfig {
  std::string bind = "0.0.0.0";
  int port = defaults::kHttpPort;  ///< 0 = pick any free port
  int read_timeout_sec = defaults::kHttpTimeoutSec;
  int write_timeout_sec = defaults::kHttpTimeoutSec;
  bool enable_cors = true;
  std::vector<std::string> cors_allow_origins;  ///< Empty = any origin ("*")
  std::string environment;                      ///< Reported by GET /health
};

/**
 * @brief HTTP server for the gateway JSON API
 *
 * Routes:
 * - GET /health - Liveness of the gateway itself
 * - /api/prometheus/... - PrometheusHandler
 * - /api/alertmanager/... - AlertmanagerHandler
 *
 * Every request is logged as an "http_request" event with its duration.
 */
class HttpServer {
 public:
  /**
   * @brief Construct HTTP server
   * @param config Server configuration
   * @param metrics Metrics source backing /api/prometheus (must outlive the server)
   * @param alerts Alerts source backing /api/alertmanager (must outlive the server)
   * @param pipeline Query pipeline applied to list endpoints
   */
  HttpServer(HttpServerConfig config, upstream::IMetricsSource& metrics, upstream::IAlertsSource& alerts,
             query::QueryPipeline pipeline = query::QueryPipeline());

  ~HttpServer();

  // Non-copyable and non-movable (manages server thread)
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  /**
   * @brief Bind and start serving (non-blocking)
   * @return Expected<void, Error> - Success or error details
   */
  utils::Expected<void, utils::Error> Start();

  /**
   * @brief Stop server
   */
  void Stop();

  /**
   * @brief Check if server is running
   */
  bool IsRunning() const { return running_; }

  /**
   * @brief Get the bound port (the configured one until Start() succeeds)
   */
  int GetPort() const { return port_; }

  /**
   * @brief Access-Control-Allow-Origin value for a request origin
   * @return Empty string when the origin is not allowed
   */
  static std::string ResolveAllowOrigin(const std::vector<std::string>& allow_origins, const std::string& origin);

 private:
  HttpServerConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<int> port_;

  std::unique_ptr<httplib::Server> server_;
  std::unique_ptr<std::thread> server_thread_;
  std::vector<std::unique_ptr<RouteHandler>> handlers_;

  /**
   * @brief Setup routes
   */
  void SetupRoutes();

  /**
   * @brief CORS headers and preflight
   */
  void SetupCors();

  /**
   * @brief Per-request access log and JSON 404 bodies
   */
  void SetupRequestLogging();

  /**
   * @brief Handle GET /health
   */
  void HandleHealth(const httplib::Request& req, httplib::Response& res) const;
};

}  // namespace monitorgate::server

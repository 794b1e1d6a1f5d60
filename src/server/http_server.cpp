/**
 * @file http_server.cpp
 * @brief HTTP server implementation
 */

#include "server/http_server.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <utility>

#include "server/handlers/alertmanager_handler.h"
#include "server/handlers/prometheus_handler.h"
#include "server/response_formatter.h"
#include "utils/datetime_converter.h"
#include "utils/structured_log.h"

namespace monitorgate::server {

using json = nlohmann::json;

namespace {

// Startup wait for the accept loop (milliseconds)
constexpr int kStartupTimeoutMs = 2000;
constexpr int kStartupPollMs = 5;

constexpr const char* kCorsAllowMethods = "GET,HEAD,PUT,PATCH,POST,DELETE";

// Start of the request being handled on this worker thread
thread_local std::chrono::steady_clock::time_point request_start;

}  // namespace

HttpServer::HttpServer(HttpServerConfig config, upstream::IMetricsSource& metrics, upstream::IAlertsSource& alerts,
                       query::QueryPipeline pipeline)
    : config_(std::move(config)), port_(config_.port) {
  server_ = std::make_unique<httplib::Server>();

  // Set timeouts
  server_->set_read_timeout(config_.read_timeout_sec, 0);
  server_->set_write_timeout(config_.write_timeout_sec, 0);

  handlers_.push_back(std::make_unique<PrometheusHandler>(metrics, pipeline));
  handlers_.push_back(std::make_unique<AlertmanagerHandler>(alerts, pipeline));

  SetupRequestLogging();

  // Setup routes
  SetupRoutes();

  // Setup CORS if enabled
  if (config_.enable_cors) {
    SetupCors();
  }
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::SetupRoutes() {
  // GET /health - Health check
  server_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) { HandleHealth(req, res); });

  for (auto& handler : handlers_) {
    handler->Register(*server_);
  }
}

void HttpServer::SetupRequestLogging() {
  server_->set_pre_routing_handler([](const httplib::Request& /*req*/, httplib::Response& /*res*/) {
    request_start = std::chrono::steady_clock::now();
    return httplib::Server::HandlerResponse::Unhandled;
  });

  // Unrouted requests and failures without a body still answer with the JSON envelope
  server_->set_error_handler([](const httplib::Request& /*req*/, httplib::Response& res) {
    if (!res.body.empty()) {
      return;
    }
    const std::string message = res.status == kHttpNotFound ? "Not found" : "Request failed";
    res.set_content(ResponseFormatter::Failure(message).dump(), "application/json");
  });

  server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
    const auto elapsed = std::chrono::steady_clock::now() - request_start;
    const double duration_ms = std::chrono::duration<double, std::milli>(elapsed).count();
    utils::LogHttpRequest(req.method, req.path, res.status, duration_ms);
  });
}

std::string HttpServer::ResolveAllowOrigin(const std::vector<std::string>& allow_origins, const std::string& origin) {
  if (allow_origins.empty()) {
    return "*";
  }
  if (origin.empty()) {
    return "";
  }
  auto it = std::find(allow_origins.begin(), allow_origins.end(), origin);
  return it == allow_origins.end() ? "" : origin;
}

void HttpServer::SetupCors() {
  // CORS preflight
  server_->Options(".*", [](const httplib::Request& req, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Methods", kCorsAllowMethods);
    const std::string requested_headers = req.get_header_value("Access-Control-Request-Headers");
    res.set_header("Access-Control-Allow-Headers", requested_headers.empty() ? "Content-Type" : requested_headers);
    res.status = kHttpNoContent;
  });

  // Add CORS headers to all responses
  server_->set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
    const std::string allow_origin = ResolveAllowOrigin(config_.cors_allow_origins, req.get_header_value("Origin"));
    if (allow_origin.empty()) {
      return;
    }
    res.set_header("Access-Control-Allow-Origin", allow_origin);
    res.set_header("Access-Control-Allow-Credentials", "true");
    if (allow_origin != "*") {
      res.set_header("Vary", "Origin");
    }
  });
}

utils::Expected<void, utils::Error> HttpServer::Start() {
  using utils::ErrorCode;
  using utils::MakeError;
  using utils::MakeUnexpected;

  if (running_) {
    auto error = MakeError(ErrorCode::kNetworkAlreadyRunning, "Server already running");
    utils::StructuredLog()
        .Event("server_error")
        .Field("operation", "http_server_start")
        .Field("error", error.to_string())
        .Error();
    return MakeUnexpected(error);
  }

  utils::StructuredLog()
      .Event("http_server_starting")
      .Field("bind", config_.bind)
      .Field("port", static_cast<int64_t>(config_.port))
      .Info();

  bool bound = false;
  if (config_.port == 0) {
    const int port = server_->bind_to_any_port(config_.bind);
    bound = port > 0;
    if (bound) {
      port_ = port;
    }
  } else {
    bound = server_->bind_to_port(config_.bind, config_.port);
  }

  if (!bound) {
    auto error = MakeError(ErrorCode::kNetworkBindFailed,
                           "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port));
    utils::StructuredLog()
        .Event("server_error")
        .Field("operation", "http_server_bind")
        .Field("error", error.to_string())
        .Error();
    return MakeUnexpected(error);
  }

  running_ = true;
  server_thread_ = std::make_unique<std::thread>([this]() {
    if (!server_->listen_after_bind() && running_) {
      utils::StructuredLog()
          .Event("server_error")
          .Field("operation", "http_server_listen")
          .Field("port", static_cast<int64_t>(port_.load()))
          .Error();
    }
  });

  // Wait for the accept loop so that Stop() always reaches it
  for (int waited = 0; !server_->is_running() && waited < kStartupTimeoutMs; waited += kStartupPollMs) {
    std::this_thread::sleep_for(std::chrono::milliseconds(kStartupPollMs));
  }

  utils::StructuredLog()
      .Event("http_server_started")
      .Field("bind", config_.bind)
      .Field("port", static_cast<int64_t>(port_.load()))
      .Info();
  return {};
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }

  utils::StructuredLog().Event("http_server_stopping").Info();
  running_ = false;

  if (server_) {
    server_->stop();
  }

  if (server_thread_ && server_thread_->joinable()) {
    server_thread_->join();
  }

  utils::StructuredLog().Event("http_server_stopped").Info();
}

void HttpServer::HandleHealth(const httplib::Request& /*req*/, httplib::Response& res) const {
  json response;
  response["status"] = "ok";
  response["timestamp"] = utils::NowIso8601Utc();
  response["environment"] = config_.environment;

  res.status = kHttpOk;
  res.set_content(response.dump(), "application/json");
}

}  // namespace monitorgate::server

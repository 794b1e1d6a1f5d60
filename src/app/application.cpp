/**
 * @file application.cpp
 * @brief Main application class implementation
 */

#include "app/application.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

#include "query/query_pipeline.h"
#include "upstream/alertmanager_client.h"
#include "upstream/prometheus_client.h"
#include "utils/structured_log.h"
#include "version.h"

namespace monitorgate::app {

namespace {
constexpr int kShutdownCheckIntervalMs = 100;  // Shutdown check interval (ms)

void LogStartupFailure(const char* type, const Error& error) {
  utils::StructuredLog()
      .Event("application_error")
      .Field("type", type)
      .Field("phase", "startup")
      .Field("error", error.to_string())
      .Error();
}
}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<std::unique_ptr<Application>, Error> Application::Create(int argc, char* argv[]) {
  auto args_result = CommandLineParser::Parse(argc, argv);
  if (!args_result) {
    return utils::MakeUnexpected(args_result.error());
  }

  CommandLineArgs args = std::move(*args_result);

  // Help and version print and exit without loading configuration
  if (args.show_help) {
    CommandLineParser::PrintHelp(argv[0]);  // NOLINT
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }
  if (args.show_version) {
    CommandLineParser::PrintVersion();
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }

  auto config_mgr = ConfigurationManager::Create(args.config_file, args.schema_file);
  if (!config_mgr) {
    return utils::MakeUnexpected(config_mgr.error());
  }

  return std::unique_ptr<Application>(new Application(std::move(args), std::move(*config_mgr)));
}

Application::Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr)
    : args_(std::move(args)), config_manager_(std::move(config_mgr)) {}

Application::~Application() {
  if (started_) {
    Stop();
  }
}

int Application::Run() {
  int special_exit_code = HandleSpecialModes();
  if (special_exit_code >= 0) {
    return special_exit_code;
  }

  auto logging_result = config_manager_->ApplyLoggingConfig();
  if (!logging_result) {
    LogStartupFailure("logging_config_failed", logging_result.error());
    return 1;
  }

  spdlog::info("{} starting...", Version::FullString());

  auto init_result = Initialize();
  if (!init_result) {
    LogStartupFailure("initialization_failed", init_result.error());
    return 1;
  }

  auto start_result = Start();
  if (!start_result) {
    LogStartupFailure("server_startup_failed", start_result.error());
    return 1;
  }

  // Blocks until shutdown signal
  RunMainLoop();

  Stop();

  spdlog::info("MonitorGate stopped");
  return 0;
}

Expected<void, Error> Application::Initialize() {
  if (initialized_) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInternalError, "Application already initialized"));
  }

  auto signal_mgr = SignalManager::Create();
  if (!signal_mgr) {
    return utils::MakeUnexpected(signal_mgr.error());
  }
  signal_manager_ = std::move(*signal_mgr);

  const config::Config& config = config_manager_->GetConfig();

  metrics_source_ = std::make_unique<upstream::PrometheusClient>(
      upstream::HttpClientOptions{config.prometheus.url, config.prometheus.timeout_ms});
  alerts_source_ = std::make_unique<upstream::AlertmanagerClient>(
      upstream::HttpClientOptions{config.alertmanager.url, config.alertmanager.timeout_ms});

  server::HttpServerConfig server_config;
  server_config.bind = config.api.http.bind;
  server_config.port = config.api.http.port;
  server_config.read_timeout_sec = config.api.http.read_timeout_sec;
  server_config.write_timeout_sec = config.api.http.write_timeout_sec;
  server_config.enable_cors = config.api.http.enable_cors;
  server_config.cors_allow_origins = config.api.http.cors_allow_origins;
  server_config.environment = config.environment;

  query::PipelineOptions pipeline_options;
  pipeline_options.default_limit = config.api.default_limit;
  pipeline_options.max_limit = config.api.max_limit;

  http_server_ = std::make_unique<server::HttpServer>(server_config, *metrics_source_, *alerts_source_,
                                                      query::QueryPipeline(pipeline_options));

  utils::StructuredLog()
      .Event("upstreams_configured")
      .Field("prometheus", config.prometheus.url)
      .Field("alertmanager", config.alertmanager.url)
      .Field("environment", config.environment)
      .Info();

  initialized_ = true;
  return {};
}

Expected<void, Error> Application::Start() {
  if (!initialized_) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInternalError, "Cannot start: not initialized"));
  }
  if (started_) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInternalError, "Already started"));
  }

  auto start_result = http_server_->Start();
  if (!start_result) {
    return utils::MakeUnexpected(start_result.error());
  }

  started_ = true;
  return {};
}

void Application::RunMainLoop() {
  spdlog::debug("Entering main loop...");

  while (!SignalManager::IsShutdownRequested()) {
    // Log rotation (SIGUSR1)
    if (SignalManager::ConsumeLogReopenRequest()) {
      auto reopen_result = config_manager_->ReopenLogFile();
      if (!reopen_result) {
        // Log to stderr as file logging may be broken
        std::cerr << "Failed to reopen log file: " << reopen_result.error().to_string() << '\n';
      }
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(kShutdownCheckIntervalMs));
  }

  spdlog::debug("Shutdown requested, cleaning up...");
}

void Application::Stop() {
  if (!started_) {
    return;
  }

  if (http_server_) {
    http_server_->Stop();
  }

  started_ = false;
}

int Application::HandleSpecialModes() {
  // Help and version were printed in Create()
  if (args_.show_help || args_.show_version) {
    return 0;
  }

  if (args_.config_test_mode) {
    return config_manager_->PrintConfigTest();
  }

  return -1;
}

}  // namespace monitorgate::app

/**
 * @file application.h
 * @brief Main application class
 */

#ifndef MONITORGATE_APP_APPLICATION_H_
#define MONITORGATE_APP_APPLICATION_H_

#include <memory>

#include "app/command_line_parser.h"
#include "app/configuration_manager.h"
#include "app/signal_manager.h"
#include "server/http_server.h"
#include "upstream/alerts_source.h"
#include "upstream/metrics_source.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace monitorgate::app {

/**
 * @brief Main application class
 *
 * Orchestrates the application lifecycle:
 * 1. Parse command-line arguments
 * 2. Load configuration
 * 3. Setup signal handlers
 * 4. Build the upstream clients and the HTTP server
 * 5. Run main loop (poll signals for shutdown and log reopen)
 * 6. Graceful shutdown
 *
 * Usage:
 * @code
 * auto app = Application::Create(argc, argv);
 * if (!app) {
 *   std::cerr << "Failed to create application: " << app.error().to_string() << "\n";
 *   return 1;
 * }
 * return (*app)->Run();
 * @endcode
 */
class Application {
 public:
  /**
   * @brief Parse arguments and load configuration
   *
   * Does NOT apply logging config or start the server (Run() does).
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<std::unique_ptr<Application>, Error> Create(int argc, char* argv[]);

  ~Application();

  // Non-copyable, non-movable
  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;
  Application(Application&&) = delete;
  Application& operator=(Application&&) = delete;

  /**
   * @brief Run the application
   * @return Exit code (0 = success, non-zero = error)
   */
  int Run();

 private:
  Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr);

  // Lifecycle steps
  Expected<void, Error> Initialize();
  Expected<void, Error> Start();
  void RunMainLoop();
  void Stop();

  // Special modes (return exit code, -1 = not a special mode)
  int HandleSpecialModes();

  CommandLineArgs args_;

  // Components (initialization order)
  std::unique_ptr<ConfigurationManager> config_manager_;
  std::unique_ptr<SignalManager> signal_manager_;
  std::unique_ptr<upstream::IMetricsSource> metrics_source_;
  std::unique_ptr<upstream::IAlertsSource> alerts_source_;
  std::unique_ptr<server::HttpServer> http_server_;

  // State
  bool initialized_{false};
  bool started_{false};
};

}  // namespace monitorgate::app

#endif  // MONITORGATE_APP_APPLICATION_H_

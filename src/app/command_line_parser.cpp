/**
 * @file command_line_parser.cpp
 * @brief Command-line argument parser implementation
 */

#include "app/command_line_parser.h"

#include <iostream>

#include "version.h"

namespace monitorgate::app {

namespace {

bool MatchesOption(const std::string& arg, const char* short_opt, const char* long_opt) {
  return arg == short_opt || arg == long_opt;
}

Error InvalidArgument(const std::string& message) {
  return utils::MakeError(utils::ErrorCode::kInvalidArgument, message);
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<CommandLineArgs, Error> CommandLineParser::Parse(int argc, char* argv[]) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  CommandLineArgs args;

  if (argc < 1) {
    return utils::MakeUnexpected(InvalidArgument("Invalid argument count (argc < 1)"));
  }

  // Help and version win over everything else
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (MatchesOption(arg, "-h", "--help")) {
      args.show_help = true;
      return args;
    }
    if (MatchesOption(arg, "-v", "--version")) {
      args.show_version = true;
      return args;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (MatchesOption(arg, "-c", "--config")) {
      if (i + 1 >= argc) {
        return utils::MakeUnexpected(InvalidArgument("--config requires a file path argument"));
      }
      args.config_file = argv[++i];
    } else if (MatchesOption(arg, "-t", "--config-test")) {
      args.config_test_mode = true;
    } else if (MatchesOption(arg, "-s", "--schema")) {
      if (i + 1 >= argc) {
        return utils::MakeUnexpected(InvalidArgument("--schema requires a file path argument"));
      }
      args.schema_file = argv[++i];
    } else if (!arg.empty() && arg[0] == '-') {
      return utils::MakeUnexpected(InvalidArgument("Unknown option: " + arg));
    } else if (args.config_file.empty()) {
      args.config_file = arg;
    } else {
      return utils::MakeUnexpected(
          InvalidArgument("Unexpected positional argument: " + arg + " (config file already specified)"));
    }
  }

  if (args.config_test_mode && args.config_file.empty()) {
    return utils::MakeUnexpected(InvalidArgument("--config-test requires a configuration file. Use --help for usage."));
  }

  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return args;
}

void CommandLineParser::PrintHelp(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS] [config.yaml|config.json]\n";
  std::cout << "       " << program_name << " -c <config.yaml|config.json> [OPTIONS]\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -t, --config-test              Test configuration file and exit\n";
  std::cout << "  -s, --schema <schema.json>     Use custom JSON Schema (optional)\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Without a configuration file, built-in defaults are used.\n";
  std::cout << "\n";
  std::cout << "Environment overrides (applied after the configuration file):\n";
  std::cout << "  PORT               HTTP listen port\n";
  std::cout << "  PROMETHEUS_URL     Prometheus base URL\n";
  std::cout << "  ALERTMANAGER_URL   Alertmanager base URL\n";
  std::cout << "  ALLOWED_ORIGINS    Comma-separated CORS allow-list\n";
  std::cout << "  NODE_ENV           Environment name reported by /health\n";
}

void CommandLineParser::PrintVersion() {
  std::cout << Version::FullString() << "\n";
}

}  // namespace monitorgate::app

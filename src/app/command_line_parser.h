/**
 * @file command_line_parser.h
 * @brief Command-line argument parser
 */

#ifndef MONITORGATE_APP_COMMAND_LINE_PARSER_H_
#define MONITORGATE_APP_COMMAND_LINE_PARSER_H_

#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace monitorgate::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Parsed command-line arguments
 */
struct CommandLineArgs {
  std::string config_file;  ///< Empty = built-in defaults plus environment
  std::string schema_file;  ///< Optional JSON Schema file path
  bool config_test_mode = false;
  bool show_help = false;
  bool show_version = false;
};

/**
 * @brief Command-line argument parser
 *
 * Supported options:
 * - -c, --config <file>: Configuration file path
 * - -t, --config-test: Test configuration file and exit (requires a file)
 * - -s, --schema <file>: Use custom JSON Schema
 * - -h, --help: Show help message
 * - -v, --version: Show version information
 * - Positional argument: Configuration file path
 */
class CommandLineParser {
 public:
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<CommandLineArgs, Error> Parse(int argc, char* argv[]);

  static void PrintHelp(const char* program_name);

  static void PrintVersion();

 private:
  CommandLineParser() = default;
};

}  // namespace monitorgate::app

#endif  // MONITORGATE_APP_COMMAND_LINE_PARSER_H_

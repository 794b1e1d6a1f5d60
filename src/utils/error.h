/**
 * @file error.h
 * @brief Error codes and Error value type shared by all modules
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace monitorgate::utils {

/**
 * @brief Error codes grouped by module
 *
 * Ranges:
 * - 0-999: general
 * - 1000-1999: configuration
 * - 3000-3999: request / query
 * - 4000-4999: upstream (Prometheus, Alertmanager)
 * - 6000-6999: network
 */
enum class ErrorCode : int32_t {
  // General
  kSuccess = 0,
  kInvalidArgument = 2,
  kInternalError = 5,
  kIOError = 6,

  // Configuration
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigValidationError = 1002,
  kConfigInvalidValue = 1003,
  kConfigYamlError = 1004,
  kConfigJsonError = 1005,

  // Request / query
  kQueryMissingParameter = 3000,
  kQueryInvalidBody = 3001,

  // Upstream
  kUpstreamConnectionFailed = 4000,
  kUpstreamTimeout = 4001,
  kUpstreamBadRequest = 4002,
  kUpstreamNotFound = 4003,
  kUpstreamServerError = 4004,
  kUpstreamHttpError = 4005,
  kUpstreamInvalidResponse = 4006,

  // Network
  kNetworkBindFailed = 6000,
  kNetworkAlreadyRunning = 6001,
};

/**
 * @brief Human readable name of an error code
 */
const char* ErrorCodeToString(ErrorCode code);

/**
 * @brief Error value (code + message + optional context)
 *
 * Example:
 * @code
 * return MakeUnexpected(MakeError(ErrorCode::kUpstreamTimeout, "Prometheus did not answer"));
 * @endcode
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code) : code_(code), message_(ErrorCodeToString(code)) {}

  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::string context)
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::string& context() const { return context_; }

  bool is_error() const { return code_ != ErrorCode::kSuccess; }

  /**
   * @brief Format as "[<code name> (<code>)] <message> (context: <context>)"
   */
  std::string to_string() const;

  const char* what() const { return message_.c_str(); }

  operator std::string() const { return to_string(); }  // NOLINT(google-explicit-constructor)

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

inline Error MakeError(ErrorCode code) {
  return Error(code);
}

inline Error MakeError(ErrorCode code, std::string message) {
  return {code, std::move(message)};
}

inline Error MakeError(ErrorCode code, std::string message, std::string context) {
  return {code, std::move(message), std::move(context)};
}

}  // namespace monitorgate::utils

/**
 * @brief Create an Error carrying the current file:line as context
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MONITORGATE_ERROR(code, message) \
  ::monitorgate::utils::MakeError((code), (message), std::string(__FILE__) + ":" + std::to_string(__LINE__))

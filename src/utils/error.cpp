/**
 * @file error.cpp
 * @brief Error code names and formatting
 */

#include "utils/error.h"

#include <sstream>

namespace monitorgate::utils {

const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kIOError:
      return "I/O error";

    case ErrorCode::kConfigFileNotFound:
      return "Configuration file not found";
    case ErrorCode::kConfigParseError:
      return "Configuration parse error";
    case ErrorCode::kConfigValidationError:
      return "Configuration validation error";
    case ErrorCode::kConfigInvalidValue:
      return "Invalid configuration value";
    case ErrorCode::kConfigYamlError:
      return "YAML parsing error";
    case ErrorCode::kConfigJsonError:
      return "JSON parsing error";

    case ErrorCode::kQueryMissingParameter:
      return "Missing required parameter";
    case ErrorCode::kQueryInvalidBody:
      return "Invalid request body";

    case ErrorCode::kUpstreamConnectionFailed:
      return "Upstream connection failed";
    case ErrorCode::kUpstreamTimeout:
      return "Upstream timeout";
    case ErrorCode::kUpstreamBadRequest:
      return "Upstream rejected request";
    case ErrorCode::kUpstreamNotFound:
      return "Upstream resource not found";
    case ErrorCode::kUpstreamServerError:
      return "Upstream server error";
    case ErrorCode::kUpstreamHttpError:
      return "Upstream HTTP error";
    case ErrorCode::kUpstreamInvalidResponse:
      return "Invalid upstream response";

    case ErrorCode::kNetworkBindFailed:
      return "Bind failed";
    case ErrorCode::kNetworkAlreadyRunning:
      return "Already running";
  }
  return "Unknown error";
}

std::string Error::to_string() const {
  std::ostringstream oss;
  oss << "[" << ErrorCodeToString(code_) << " (" << static_cast<int32_t>(code_) << ")] " << message_;
  if (!context_.empty()) {
    oss << " (context: " << context_ << ")";
  }
  return oss.str();
}

}  // namespace monitorgate::utils

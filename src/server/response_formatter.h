/**
 * @file response_formatter.h
 * @brief JSON response envelopes for the HTTP API
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "query/query_pipeline.h"
#include "utils/error.h"

namespace monitorgate::server {

// HTTP status codes
constexpr int kHttpOk = 200;
constexpr int kHttpNoContent = 204;
constexpr int kHttpBadRequest = 400;
constexpr int kHttpNotFound = 404;
constexpr int kHttpInternalServerError = 500;
constexpr int kHttpBadGateway = 502;
constexpr int kHttpGatewayTimeout = 504;

/**
 * @brief Utility class for formatting API responses
 *
 * All methods are static and stateless for easy testing and reuse.
 */
class ResponseFormatter {
 public:
  /**
   * @brief {"success": true, "data": data}
   */
  static nlohmann::json Success(nlohmann::json data);

  /**
   * @brief {"success": true, "data": page, "pagination": meta}
   */
  static nlohmann::json Paginated(const query::QueryResult& result);

  /**
   * @brief {"success": true, "message": message}
   */
  static nlohmann::json Message(const std::string& message);

  /**
   * @brief {"success": false, "error": message}
   */
  static nlohmann::json Failure(const std::string& message);

  /**
   * @brief Map an error code to the HTTP status returned to the client
   *
   * - kInvalidArgument, kQuery*, kUpstreamBadRequest: 400
   * - kNotFound, kUpstreamNotFound: 404
   * - kTimeout, kUpstreamTimeout: 504
   * - other upstream errors: 502
   * - everything else: 500
   */
  static int HttpStatusFor(const utils::Error& error);
};

}  // namespace monitorgate::server

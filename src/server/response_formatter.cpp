/**
 * @file response_formatter.cpp
 * @brief JSON response envelopes for the HTTP API
 */

#include "server/response_formatter.h"

#include <utility>

namespace monitorgate::server {

using json = nlohmann::json;
using utils::ErrorCode;

json ResponseFormatter::Success(json data) {
  json body;
  body["success"] = true;
  body["data"] = std::move(data);
  return body;
}

json ResponseFormatter::Paginated(const query::QueryResult& result) {
  json body;
  body["success"] = true;
  body["data"] = result.data;
  body["pagination"] = result.pagination.ToJson();
  return body;
}

json ResponseFormatter::Message(const std::string& message) {
  json body;
  body["success"] = true;
  body["message"] = message;
  return body;
}

json ResponseFormatter::Failure(const std::string& message) {
  json body;
  body["success"] = false;
  body["error"] = message;
  return body;
}

int ResponseFormatter::HttpStatusFor(const utils::Error& error) {
  switch (error.code()) {
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kQueryMissingParameter:
    case ErrorCode::kQueryInvalidBody:
    case ErrorCode::kUpstreamBadRequest:
      return kHttpBadRequest;

    case ErrorCode::kUpstreamNotFound:
      return kHttpNotFound;

    case ErrorCode::kUpstreamTimeout:
      return kHttpGatewayTimeout;

    case ErrorCode::kUpstreamConnectionFailed:
    case ErrorCode::kUpstreamServerError:
    case ErrorCode::kUpstreamHttpError:
    case ErrorCode::kUpstreamInvalidResponse:
      return kHttpBadGateway;

    default:
      return kHttpInternalServerError;
  }
}

}  // namespace monitorgate::server

/**
 * @file route_handler.cpp
 * @brief Base class for HTTP route handlers
 */

#include "server/handlers/route_handler.h"

#include <utility>

#include "query/query_spec.h"
#include "server/response_formatter.h"
#include "utils/structured_log.h"

namespace monitorgate::server {

void RouteHandler::SendJson(httplib::Response& res, int status_code, const nlohmann::json& body) {
  res.status = status_code;
  res.set_content(body.dump(), "application/json");
}

void RouteHandler::SendSuccess(httplib::Response& res, nlohmann::json data) {
  SendJson(res, kHttpOk, ResponseFormatter::Success(std::move(data)));
}

void RouteHandler::SendPage(httplib::Response& res, const query::QueryResult& result) {
  SendJson(res, kHttpOk, ResponseFormatter::Paginated(result));
}

void RouteHandler::SendMessage(httplib::Response& res, const std::string& message) {
  SendJson(res, kHttpOk, ResponseFormatter::Message(message));
}

void RouteHandler::SendError(httplib::Response& res, int status_code, const std::string& message) {
  SendJson(res, status_code, ResponseFormatter::Failure(message));
}

void RouteHandler::SendError(httplib::Response& res, const utils::Error& error) {
  const int status = ResponseFormatter::HttpStatusFor(error);
  if (status >= kHttpInternalServerError) {
    utils::StructuredLog()
        .Event("request_failed")
        .Field("status", static_cast<int64_t>(status))
        .Field("error", error.to_string())
        .Warn();
  }
  SendError(res, status, error.message());
}

void RouteHandler::SendResult(httplib::Response& res, const utils::Expected<nlohmann::json, utils::Error>& result) {
  if (!result) {
    SendError(res, result.error());
    return;
  }
  SendSuccess(res, *result);
}

void RouteHandler::SendQueryResult(const httplib::Request& req, httplib::Response& res,
                                   const utils::Expected<nlohmann::json, utils::Error>& records,
                                   std::initializer_list<const char*> reserved) const {
  if (!records) {
    SendError(res, records.error());
    return;
  }
  if (!records->is_array()) {
    SendError(res, utils::MakeError(utils::ErrorCode::kUpstreamInvalidResponse, "Expected a list of records"));
    return;
  }

  auto spec = query::QuerySpec::FromParams(req.params);
  for (const char* key : reserved) {
    spec.Reserve(key);
  }

  query::RecordList input(records->begin(), records->end());
  SendPage(res, pipeline_.Execute(input, spec));
}

std::optional<std::string> RouteHandler::GetParam(const httplib::Request& req, const std::string& name) {
  auto range = req.params.equal_range(name);
  if (range.first == range.second || range.first->second.empty()) {
    return std::nullopt;
  }
  return range.first->second;
}

std::vector<std::string> RouteHandler::GetParams(const httplib::Request& req, const std::string& name) {
  std::vector<std::string> values;
  auto range = req.params.equal_range(name);
  for (auto it = range.first; it != range.second; ++it) {
    if (!it->second.empty()) {
      values.push_back(it->second);
    }
  }
  return values;
}

bool RouteHandler::HasParams(const httplib::Request& req, std::initializer_list<const char*> names) {
  for (const char* name : names) {
    if (!GetParam(req, name)) {
      return false;
    }
  }
  return true;
}

}  // namespace monitorgate::server

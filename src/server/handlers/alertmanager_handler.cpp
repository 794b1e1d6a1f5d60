/**
 * @file alertmanager_handler.cpp
 * @brief Routes under /api/alertmanager
 */

#include "server/handlers/alertmanager_handler.h"

#include <utility>

namespace monitorgate::server {

using json = nlohmann::json;
using utils::ErrorCode;
using utils::MakeError;

namespace {

constexpr const char* kFilterParam = "filter";
constexpr const char* kMissingSilenceFields = "Missing required fields: matchers, startsAt, endsAt, createdBy, comment";
constexpr const char* kAlertsBodyRequired = "Request body must be an array of alerts";

// A value counts as supplied unless it is null, false, zero or an empty string
bool IsSupplied(const json& value) {
  switch (value.type()) {
    case json::value_t::null:
    case json::value_t::discarded:
      return false;
    case json::value_t::boolean:
      return value.get<bool>();
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
      return value.get<double>() != 0.0;
    case json::value_t::string:
      return !value.get_ref<const std::string&>().empty();
    default:
      return true;
  }
}

/**
 * @brief Parse a request body, yielding a discarded value on malformed JSON
 */
json ParseBody(const httplib::Request& req) {
  return json::parse(req.body, nullptr, /*allow_exceptions=*/false);
}

}  // namespace

AlertmanagerHandler::AlertmanagerHandler(upstream::IAlertsSource& source, query::QueryPipeline pipeline,
                                         std::string prefix)
    : RouteHandler(std::move(prefix), pipeline), source_(source) {}

bool AlertmanagerHandler::IsCompleteSilence(const json& silence) {
  if (!silence.is_object()) {
    return false;
  }
  for (const char* field : {"matchers", "startsAt", "endsAt", "createdBy", "comment"}) {
    auto it = silence.find(field);
    if (it == silence.end() || !IsSupplied(*it)) {
      return false;
    }
  }
  return true;
}

void AlertmanagerHandler::Register(httplib::Server& server) {
  // Alert endpoints
  server.Get(Route("/alerts"),
             [this](const httplib::Request& req, httplib::Response& res) { HandleGetAlerts(req, res); });
  server.Get(Route("/alerts/groups"), [this](const httplib::Request& req, httplib::Response& res) {
    Guarded(res, [&] { SendResult(res, source_.GetAlertGroups(GetParam(req, kFilterParam))); });
  });
  server.Post(Route("/alerts"),
              [this](const httplib::Request& req, httplib::Response& res) { HandlePostAlerts(req, res); });

  // Silence endpoints
  server.Get(Route("/silences"),
             [this](const httplib::Request& req, httplib::Response& res) { HandleGetSilences(req, res); });
  server.Get(Route(R"(/silence/([^/]+))"), [this](const httplib::Request& req, httplib::Response& res) {
    Guarded(res, [&] { SendResult(res, source_.GetSilence(req.matches[1].str())); });
  });
  server.Post(Route("/silences"),
              [this](const httplib::Request& req, httplib::Response& res) { HandleCreateSilence(req, res); });
  server.Delete(Route(R"(/silence/([^/]+))"),
                [this](const httplib::Request& req, httplib::Response& res) { HandleDeleteSilence(req, res); });

  // Status endpoints
  server.Get(Route("/receivers"), [this](const httplib::Request& /*req*/, httplib::Response& res) {
    Guarded(res, [&] { SendResult(res, source_.GetReceivers()); });
  });
  server.Get(Route("/status"), [this](const httplib::Request& /*req*/, httplib::Response& res) {
    Guarded(res, [&] { SendResult(res, source_.GetStatus()); });
  });
  server.Get(Route("/health"), [this](const httplib::Request& /*req*/, httplib::Response& res) {
    Guarded(res, [&] { SendResult(res, source_.CheckHealth()); });
  });
}

void AlertmanagerHandler::HandleGetAlerts(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] { SendQueryResult(req, res, source_.GetAlerts(GetParam(req, kFilterParam)), {kFilterParam}); });
}

void AlertmanagerHandler::HandlePostAlerts(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] {
    json alerts = ParseBody(req);
    if (!alerts.is_array()) {
      SendError(res, MakeError(ErrorCode::kQueryInvalidBody, kAlertsBodyRequired));
      return;
    }
    auto result = source_.PostAlerts(alerts);
    if (!result) {
      SendError(res, result.error());
      return;
    }
    SendMessage(res, "Alerts posted successfully");
  });
}

void AlertmanagerHandler::HandleGetSilences(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] { SendQueryResult(req, res, source_.GetSilences(GetParam(req, kFilterParam)), {kFilterParam}); });
}

void AlertmanagerHandler::HandleCreateSilence(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] {
    json silence = ParseBody(req);
    if (!IsCompleteSilence(silence)) {
      SendError(res, MakeError(ErrorCode::kQueryInvalidBody, kMissingSilenceFields));
      return;
    }
    SendResult(res, source_.CreateSilence(silence));
  });
}

void AlertmanagerHandler::HandleDeleteSilence(const httplib::Request& req, httplib::Response& res) {
  Guarded(res, [&] {
    auto result = source_.DeleteSilence(req.matches[1].str());
    if (!result) {
      SendError(res, result.error());
      return;
    }
    SendMessage(res, "Silence deleted successfully");
  });
}

}  // namespace monitorgate::server

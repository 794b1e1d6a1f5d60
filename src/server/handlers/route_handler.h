/**
 * @file route_handler.h
 * @brief Base class for HTTP route handlers
 */

#pragma once

// Fix for httplib missing NI_MAXHOST on some platforms
#ifndef NI_MAXHOST
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage) - Required for compatibility with httplib C API
#define NI_MAXHOST 1025
#endif

#include <httplib.h>

#include <exception>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "query/query_pipeline.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace monitorgate::server {

/**
 * @brief Base class for a group of routes under one URL prefix
 *
 * Provides the response helpers shared by all handlers: JSON envelopes,
 * error-to-status mapping and query parameter access.
 */
class RouteHandler {
 public:
  RouteHandler(std::string prefix, query::QueryPipeline pipeline)
      : prefix_(std::move(prefix)), pipeline_(pipeline) {}
  virtual ~RouteHandler() = default;

  // Non-copyable and non-movable
  RouteHandler(const RouteHandler&) = delete;
  RouteHandler& operator=(const RouteHandler&) = delete;
  RouteHandler(RouteHandler&&) = delete;
  RouteHandler& operator=(RouteHandler&&) = delete;

  /**
   * @brief Register this handler's routes on the server
   */
  virtual void Register(httplib::Server& server) = 0;

  const std::string& prefix() const { return prefix_; }

 protected:
  /**
   * @brief Prefix a route pattern with this handler's mount point
   */
  std::string Route(const std::string& pattern) const { return prefix_ + pattern; }

  static void SendJson(httplib::Response& res, int status_code, const nlohmann::json& body);
  static void SendSuccess(httplib::Response& res, nlohmann::json data);
  static void SendPage(httplib::Response& res, const query::QueryResult& result);
  static void SendMessage(httplib::Response& res, const std::string& message);

  /**
   * @brief Send an upstream or validation error with its mapped status
   *
   * ResponseFormatter::HttpStatusFor picks the status for every failure,
   * including missing parameters (kQueryMissingParameter) and malformed
   * bodies (kQueryInvalidBody).
   */
  static void SendError(httplib::Response& res, const utils::Error& error);

  /**
   * @brief Send either the value or the error of a source call
   */
  static void SendResult(httplib::Response& res, const utils::Expected<nlohmann::json, utils::Error>& result);

  /**
   * @brief First value of a query parameter, or nullopt when absent or empty
   */
  static std::optional<std::string> GetParam(const httplib::Request& req, const std::string& name);

  /**
   * @brief All non-empty values of a (possibly repeated) query parameter
   */
  static std::vector<std::string> GetParams(const httplib::Request& req, const std::string& name);

  /**
   * @brief True when every listed parameter is present and non-empty
   */
  static bool HasParams(const httplib::Request& req, std::initializer_list<const char*> names);

  /**
   * @brief Filter, sort, project and paginate a record list from a source call
   *
   * The request's query parameters form the QuerySpec; the listed keys are
   * reserved so they never act as field filters.
   */
  void SendQueryResult(const httplib::Request& req, httplib::Response& res,
                       const utils::Expected<nlohmann::json, utils::Error>& records,
                       std::initializer_list<const char*> reserved = {}) const;

  /**
   * @brief Run a route body, answering 500 when it throws
   */
  template <typename Fn>
  static void Guarded(httplib::Response& res, Fn&& body) {
    try {
      body();
    } catch (const std::exception& e) {
      SendError(res, utils::MakeError(utils::ErrorCode::kInternalError, "Internal error: " + std::string(e.what())));
    }
  }

 private:
  static void SendError(httplib::Response& res, int status_code, const std::string& message);

  std::string prefix_;
  query::QueryPipeline pipeline_;
};

}  // namespace monitorgate::server

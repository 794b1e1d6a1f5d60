/**
 * @file http_json_client.h
 * @brief Minimal JSON-over-HTTP client used by the upstream sources
 */

#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "utils/error.h"
#include "utils/expected.h"

namespace monitorgate::upstream {

using utils::Error;
using utils::Expected;

/**
 * @brief Query parameters; a key may repeat (e.g. "match[]")
 *
 * Same type as httplib::Params, which encodes them on the wire.
 */
using QueryParams = std::multimap<std::string, std::string>;

/**
 * @brief Upstream endpoint settings
 */
struct HttpClientOptions {
  std::string base_url;    // "http://host:port[/path-prefix]"
  int timeout_ms = 10000;  // connect and read timeout
};

/**
 * @brief Error mapper for transform_error that prefixes the message
 *
 * Example:
 * @code
 * return http_.Get("/api/v1/labels").transform_error(Describe("Failed to fetch labels"));
 * // "Failed to fetch labels: Request failed with status code 503: ..."
 * @endcode
 */
inline auto Describe(std::string prefix) {
  return [prefix = std::move(prefix)](const Error& error) {
    return utils::MakeError(error.code(), prefix + ": " + error.message(), error.context());
  };
}

/**
 * @brief Blocking JSON client for one upstream base URL
 *
 * A fresh httplib::Client is created per call, so one instance can be
 * shared by all HTTP worker threads.
 *
 * Error mapping:
 * - connection refused / unreachable: kUpstreamConnectionFailed
 * - connect or read timeout: kUpstreamTimeout
 * - HTTP 400: kUpstreamBadRequest, 404: kUpstreamNotFound,
 *   5xx: kUpstreamServerError, other non-2xx: kUpstreamHttpError
 * - 2xx body that is not JSON: kUpstreamInvalidResponse
 */
class HttpJsonClient {
 public:
  explicit HttpJsonClient(HttpClientOptions options);

  /**
   * @brief GET path?params and parse the JSON body
   */
  Expected<nlohmann::json, Error> Get(const std::string& path, const QueryParams& params = {}) const;

  /**
   * @brief POST a JSON body; an empty response body yields null
   */
  Expected<nlohmann::json, Error> Post(const std::string& path, const nlohmann::json& body) const;

  /**
   * @brief DELETE path; an empty response body yields null
   */
  Expected<nlohmann::json, Error> Delete(const std::string& path) const;

  /**
   * @brief GET path and return the 2xx status code without parsing the body
   */
  Expected<int, Error> GetStatus(const std::string& path) const;

  const std::string& base_url() const { return options_.base_url; }

  /**
   * @brief Percent-encode one path segment ('/' included)
   */
  static std::string EncodeSegment(const std::string& segment);

 private:
  HttpClientOptions options_;
  std::string scheme_host_port_;
  std::string path_prefix_;
};

}  // namespace monitorgate::upstream

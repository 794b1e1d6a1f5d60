/**
 * @file http_json_client.cpp
 * @brief JSON-over-HTTP client implementation
 */

#include "upstream/http_json_client.h"

// Fix for httplib missing NI_MAXHOST on some platforms
#ifndef NI_MAXHOST
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage) - Required for compatibility with httplib C API
#define NI_MAXHOST 1025
#endif

#include <httplib.h>

#include <utility>

#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace monitorgate::upstream {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr int kHttpSuccessMin = 200;
constexpr int kHttpSuccessMax = 299;
constexpr int kHttpBadRequest = 400;
constexpr int kHttpNotFound = 404;
constexpr int kHttpServerErrorMin = 500;

constexpr int kMillisPerSecond = 1000;
constexpr int kMicrosPerMilli = 1000;

// Maximum upstream body length copied into error messages
constexpr size_t kMaxErrorDetailLength = 200;

bool IsSuccess(int status) {
  return status >= kHttpSuccessMin && status <= kHttpSuccessMax;
}

// Shorten to at most max_length bytes without splitting a UTF-8 sequence
std::string TruncateUtf8(const std::string& text, size_t max_length) {
  if (text.size() <= max_length) {
    return text;
  }
  constexpr unsigned char kContinuationMask = 0xC0;
  constexpr unsigned char kContinuationBits = 0x80;
  size_t cut = max_length;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & kContinuationMask) == kContinuationBits) {
    --cut;
  }
  return text.substr(0, cut);
}

/**
 * @brief Pull a readable reason out of an error body
 *
 * Prometheus answers {"status":"error","error":"..."}, Alertmanager a JSON
 * string or plain text.
 */
std::string ExtractErrorDetail(const std::string& body) {
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (!parsed.is_discarded()) {
    if (parsed.is_object() && parsed.contains("error") && parsed["error"].is_string()) {
      return parsed["error"].get<std::string>();
    }
    if (parsed.is_string()) {
      return parsed.get<std::string>();
    }
  }
  return utils::Trim(TruncateUtf8(body, kMaxErrorDetailLength));
}

Error StatusError(int status) {
  if (status == kHttpBadRequest) {
    return MakeError(ErrorCode::kUpstreamBadRequest);
  }
  if (status == kHttpNotFound) {
    return MakeError(ErrorCode::kUpstreamNotFound);
  }
  if (status >= kHttpServerErrorMin) {
    return MakeError(ErrorCode::kUpstreamServerError);
  }
  return MakeError(ErrorCode::kUpstreamHttpError);
}

Error ResponseError(int status, const std::string& body) {
  std::string message = "Request failed with status code " + std::to_string(status);
  std::string detail = ExtractErrorDetail(body);
  if (!detail.empty()) {
    message += ": " + detail;
  }
  return MakeError(StatusError(status).code(), message, "status=" + std::to_string(status));
}

Error TransportError(httplib::Error error) {
  std::string reason = httplib::to_string(error);
  if (error == httplib::Error::ConnectionTimeout || error == httplib::Error::Read) {
    return MakeError(ErrorCode::kUpstreamTimeout, "Request timed out: " + reason);
  }
  return MakeError(ErrorCode::kUpstreamConnectionFailed, "Connection failed: " + reason);
}

Expected<nlohmann::json, Error> ParseBody(const std::string& body) {
  if (body.empty()) {
    return nlohmann::json(nullptr);
  }
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kUpstreamInvalidResponse, "Response body is not valid JSON"));
  }
  return parsed;
}

}  // namespace

HttpJsonClient::HttpJsonClient(HttpClientOptions options) : options_(std::move(options)) {
  std::string url = options_.base_url;
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    url = "http://" + url;
    scheme_end = url.find("://");
  }
  size_t path_start = url.find('/', scheme_end + 3);
  if (path_start == std::string::npos) {
    scheme_host_port_ = url;
  } else {
    scheme_host_port_ = url.substr(0, path_start);
    path_prefix_ = url.substr(path_start);
    while (!path_prefix_.empty() && path_prefix_.back() == '/') {
      path_prefix_.pop_back();
    }
  }
}

std::string HttpJsonClient::EncodeSegment(const std::string& segment) {
  return httplib::detail::encode_query_param(segment);
}

namespace {

void Configure(httplib::Client& client, int timeout_ms) {
  auto sec = static_cast<time_t>(timeout_ms / kMillisPerSecond);
  auto usec = static_cast<time_t>((timeout_ms % kMillisPerSecond) * kMicrosPerMilli);
  client.set_connection_timeout(sec, usec);
  client.set_read_timeout(sec, usec);
  client.set_write_timeout(sec, usec);
}

Expected<nlohmann::json, Error> HandleResult(const httplib::Result& result, const std::string& origin,
                                             const std::string& target) {
  if (!result) {
    auto error = TransportError(result.error());
    utils::LogUpstreamError(origin, target, error.to_string());
    return MakeUnexpected(error);
  }
  if (!IsSuccess(result->status)) {
    auto error = ResponseError(result->status, result->body);
    utils::LogUpstreamError(origin, target, error.to_string());
    return MakeUnexpected(error);
  }
  return ParseBody(result->body);
}

Error InvalidClientError(const std::string& origin) {
  return MakeError(ErrorCode::kUpstreamConnectionFailed, "Unsupported upstream URL: " + origin);
}

}  // namespace

Expected<nlohmann::json, Error> HttpJsonClient::Get(const std::string& path, const QueryParams& params) const {
  httplib::Client client(scheme_host_port_);
  if (!client.is_valid()) {
    return MakeUnexpected(InvalidClientError(scheme_host_port_));
  }
  Configure(client, options_.timeout_ms);

  std::string path_with_prefix = path_prefix_ + path;
  httplib::Headers headers = {{"Accept", "application/json"}};
  auto result = client.Get(path_with_prefix, params, headers);
  return HandleResult(result, scheme_host_port_, httplib::append_query_params(path_with_prefix, params));
}

Expected<nlohmann::json, Error> HttpJsonClient::Post(const std::string& path, const nlohmann::json& body) const {
  httplib::Client client(scheme_host_port_);
  if (!client.is_valid()) {
    return MakeUnexpected(InvalidClientError(scheme_host_port_));
  }
  Configure(client, options_.timeout_ms);

  std::string target = path_prefix_ + path;
  auto result = client.Post(target, body.dump(), "application/json");
  return HandleResult(result, scheme_host_port_, target);
}

Expected<nlohmann::json, Error> HttpJsonClient::Delete(const std::string& path) const {
  httplib::Client client(scheme_host_port_);
  if (!client.is_valid()) {
    return MakeUnexpected(InvalidClientError(scheme_host_port_));
  }
  Configure(client, options_.timeout_ms);

  std::string target = path_prefix_ + path;
  auto result = client.Delete(target);
  return HandleResult(result, scheme_host_port_, target);
}

Expected<int, Error> HttpJsonClient::GetStatus(const std::string& path) const {
  httplib::Client client(scheme_host_port_);
  if (!client.is_valid()) {
    return MakeUnexpected(InvalidClientError(scheme_host_port_));
  }
  Configure(client, options_.timeout_ms);

  std::string target = path_prefix_ + path;
  auto result = client.Get(target);
  if (!result) {
    auto error = TransportError(result.error());
    utils::LogUpstreamError(scheme_host_port_, target, error.to_string());
    return MakeUnexpected(error);
  }
  if (!IsSuccess(result->status)) {
    auto error = ResponseError(result->status, result->body);
    utils::LogUpstreamError(scheme_host_port_, target, error.to_string());
    return MakeUnexpected(error);
  }
  return result->status;
}

}  // namespace monitorgate::upstream

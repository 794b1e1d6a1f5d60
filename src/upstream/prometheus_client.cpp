/**
 * @file prometheus_client.cpp
 * @brief Prometheus HTTP API client implementation
 */

#include "upstream/prometheus_client.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

#include "utils/datetime_converter.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"
#include "utils/uuid.h"

namespace monitorgate::upstream {

using nlohmann::json;
using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr const char* kQueryPath = "/api/v1/query";
constexpr const char* kQueryRangePath = "/api/v1/query_range";
constexpr const char* kLabelsPath = "/api/v1/labels";
constexpr const char* kSeriesPath = "/api/v1/series";
constexpr const char* kTargetsPath = "/api/v1/targets";
constexpr const char* kRulesPath = "/api/v1/rules";
constexpr const char* kAlertsPath = "/api/v1/alerts";
constexpr const char* kHealthPath = "/-/healthy";

// Elasticsearch exporter series
constexpr const char* kClusterHealthMetric = "elasticsearch_cluster_health_status";
constexpr const char* kNodeCountMetric = "elasticsearch_cluster_health_number_of_nodes";
constexpr const char* kDataNodeCountMetric = "elasticsearch_cluster_health_number_of_data_nodes";
constexpr const char* kPrimaryShardsMetric = "elasticsearch_cluster_health_active_primary_shards";
constexpr const char* kUnassignedShardsMetric = "elasticsearch_cluster_health_unassigned_shards";
constexpr const char* kDocsTotalMetric = "elasticsearch_indices_docs_total";
constexpr const char* kCpuPercentMetric = "elasticsearch_process_cpu_percent";
constexpr const char* kHeapUsedMetric = R"(elasticsearch_jvm_memory_used_bytes{area="heap"})";
constexpr const char* kHeapMaxMetric = "elasticsearch_jvm_memory_max_bytes";

constexpr int kHttpOk = 200;
constexpr double kMillisPerSecond = 1000.0;
constexpr double kBytesPerKibibyte = 1024.0;
constexpr double kPercentScale = 100.0;
constexpr double kTwoDecimals = 100.0;

double RoundTwoDecimals(double value) {
  return std::round(value * kTwoDecimals) / kTwoDecimals;
}

Error InvalidResponse(const std::string& detail) {
  return MakeError(ErrorCode::kUpstreamInvalidResponse, "Unexpected response shape: " + detail);
}

utils::Expected<json, Error> ExtractData(const json& body) {
  if (!body.is_object() || !body.contains("data")) {
    return MakeUnexpected(InvalidResponse("missing data field"));
  }
  return body.at("data");
}

/**
 * @brief Copy src[key] into dst[key] when present (absent fields stay absent)
 */
void CopyIfPresent(json& dst, const std::string& dst_key, const json& src, const std::string& src_key) {
  if (src.is_object() && src.contains(src_key)) {
    dst[dst_key] = src.at(src_key);
  }
}

/**
 * @brief Sample value "[<unix seconds>, \"<number>\"]" as a number, or nullopt
 */
std::optional<double> SampleNumber(const json& sample) {
  if (!sample.is_array() || sample.size() < 2 || !sample[1].is_string()) {
    return std::nullopt;
  }
  return utils::ParseDouble(sample[1].get<std::string>());
}

std::string SampleTimestamp(const json& sample) {
  double seconds = sample.at(0).get<double>();
  return utils::FormatIso8601Utc(static_cast<int64_t>(std::llround(seconds * kMillisPerSecond)));
}

/**
 * @brief One point of a range-query matrix
 */
struct RangePoint {
  std::string timestamp;
  json node_name;  // metric.name, null when absent
  std::optional<double> value;
};

/**
 * @brief Flatten data.result[].values[] of a range query (throws json::exception on bad shape)
 */
std::vector<RangePoint> FlattenMatrix(const json& data) {
  std::vector<RangePoint> points;
  if (!data.contains("result") || data.at("result").is_null()) {
    return points;
  }
  for (const auto& series : data.at("result")) {
    json node_name = nullptr;
    json metric = series.value("metric", json::object());
    if (metric.is_object() && metric.contains("name")) {
      node_name = metric.at("name");
    }
    if (!series.contains("values")) {
      continue;
    }
    for (const auto& sample : series.at("values")) {
      points.push_back({SampleTimestamp(sample), node_name, SampleNumber(sample)});
    }
  }
  return points;
}

json NumberOrNull(const std::optional<double>& value) {
  return value ? json(*value) : json(nullptr);
}

}  // namespace

PrometheusClient::PrometheusClient(HttpClientOptions options) : http_(std::move(options)) {}

utils::Expected<json, Error> PrometheusClient::GetData(const std::string& path, const QueryParams& params) {
  return http_.Get(path, params).and_then(ExtractData);
}

utils::Expected<json, Error> PrometheusClient::Query(const std::string& query, const std::optional<std::string>& time) {
  QueryParams params = {{"query", query}};
  if (time) {
    params.emplace("time", *time);
  }
  return http_.Get(kQueryPath, params).transform_error(Describe("Prometheus query failed"));
}

utils::Expected<json, Error> PrometheusClient::QueryRange(const std::string& query, const std::string& start,
                                                          const std::string& end, const std::string& step) {
  QueryParams params = {{"query", query}, {"start", start}, {"end", end}, {"step", step}};
  return http_.Get(kQueryRangePath, params).transform_error(Describe("Prometheus range query failed"));
}

utils::Expected<json, Error> PrometheusClient::GetLabels() {
  return GetData(kLabelsPath).transform_error(Describe("Failed to fetch labels"));
}

utils::Expected<json, Error> PrometheusClient::GetLabelValues(const std::string& label) {
  return GetData("/api/v1/label/" + HttpJsonClient::EncodeSegment(label) + "/values")
      .transform_error(Describe("Failed to fetch label values"));
}

utils::Expected<json, Error> PrometheusClient::GetMetricNames() {
  return GetData("/api/v1/label/__name__/values").transform_error(Describe("Failed to fetch metrics"));
}

utils::Expected<json, Error> PrometheusClient::GetSeries(const std::vector<std::string>& matches,
                                                         const std::optional<std::string>& start,
                                                         const std::optional<std::string>& end) {
  QueryParams params;
  for (const auto& match : matches) {
    params.emplace("match[]", match);
  }
  if (start) {
    params.emplace("start", *start);
  }
  if (end) {
    params.emplace("end", *end);
  }
  return GetData(kSeriesPath, params).transform_error(Describe("Failed to fetch series"));
}

utils::Expected<json, Error> PrometheusClient::GetTargets() {
  return GetData(kTargetsPath).transform_error(Describe("Failed to fetch targets"));
}

utils::Expected<json, Error> PrometheusClient::GetRules() {
  return GetData(kRulesPath).transform_error(Describe("Failed to fetch rules"));
}

utils::Expected<json, Error> PrometheusClient::GetAlerts() {
  return GetData(kAlertsPath)
      .and_then([](const json& data) -> utils::Expected<json, Error> {
        if (!data.is_object() || !data.contains("alerts")) {
          return MakeUnexpected(InvalidResponse("missing data.alerts"));
        }
        return data.at("alerts");
      })
      .transform_error(Describe("Failed to fetch alerts"));
}

utils::Expected<json, Error> PrometheusClient::CheckHealth() {
  return http_.GetStatus(kHealthPath)
      .transform([](int status) { return json{{"status", status == kHttpOk ? "healthy" : "unhealthy"}}; })
      .transform_error(Describe("Prometheus health check failed"));
}

utils::Expected<json, Error> PrometheusClient::GetRulesProcessed() {
  auto data = GetData(kRulesPath);
  if (!data) {
    return MakeUnexpected(Describe("Failed to fetch rules")(data.error()));
  }

  try {
    json records = json::array();
    for (const auto& group : data->at("groups")) {
      for (const auto& rule : group.at("rules")) {
        json record = json::object();
        CopyIfPresent(record, "id", rule, "name");
        CopyIfPresent(record, "name", rule, "name");
        CopyIfPresent(record, "groupName", group, "name");
        CopyIfPresent(record, "state", rule, "state");
        CopyIfPresent(record, "query", rule, "query");
        CopyIfPresent(record, "duration", rule, "duration");
        if (rule.contains("labels")) {
          CopyIfPresent(record, "severity", rule.at("labels"), "severity");
        }
        CopyIfPresent(record, "annotations", rule, "annotations");

        json alerts = json::array();
        if (rule.contains("alerts") && rule.at("alerts").is_array()) {
          for (const auto& alert : rule.at("alerts")) {
            json merged = {{"id", utils::GenerateUuidV4()}};
            if (alert.is_object()) {
              merged.update(alert);
            }
            alerts.push_back(std::move(merged));
          }
        }
        record["alerts"] = std::move(alerts);
        CopyIfPresent(record, "lastEvaluation", rule, "lastEvaluation");
        records.push_back(std::move(record));
      }
    }
    return records;
  } catch (const json::exception& e) {
    return MakeUnexpected(Describe("Failed to fetch rules")(InvalidResponse(e.what())));
  }
}

utils::Expected<json, Error> PrometheusClient::GetRuleGroups() {
  auto data = GetData(kRulesPath);
  if (!data) {
    return MakeUnexpected(Describe("Failed to fetch rules")(data.error()));
  }

  try {
    json groups = json::array();
    for (const auto& group : data->at("groups")) {
      const auto& name = group.at("name");
      if (std::find(groups.begin(), groups.end(), name) == groups.end()) {
        groups.push_back(name);
      }
    }
    return groups;
  } catch (const json::exception& e) {
    return MakeUnexpected(Describe("Failed to fetch rules")(InvalidResponse(e.what())));
  }
}

utils::Expected<int64_t, Error> PrometheusClient::QueryGauge(const std::string& metric) {
  auto data = GetData(kQueryPath, {{"query", metric}});
  if (!data) {
    return MakeUnexpected(data.error());
  }
  if (!data->contains("result") || !data->at("result").is_array() || data->at("result").empty()) {
    return MakeUnexpected(InvalidResponse("no samples for " + metric));
  }
  const auto& first = data->at("result").at(0);
  auto value = first.is_object() && first.contains("value") ? SampleNumber(first.at("value")) : std::nullopt;
  if (!value) {
    return MakeUnexpected(InvalidResponse("non-numeric sample for " + metric));
  }
  return static_cast<int64_t>(*value);
}

utils::Expected<json, Error> PrometheusClient::GetClusterMetrics() {
  auto describe = Describe("Failed to get Cluster metrics");

  auto health_data = GetData(kQueryPath, {{"query", kClusterHealthMetric}});
  if (!health_data) {
    return MakeUnexpected(describe(health_data.error()));
  }

  json metrics = json::object();
  try {
    // The health series carries one sample per color; the active one has value "1"
    std::string health;
    for (const auto& series : health_data->value("result", json::array())) {
      auto value = series.value("value", json());
      if (value.is_array() && value.size() >= 2 && value[1] == "1") {
        health = series.value("metric", json::object()).value("color", "");
        break;
      }
    }
    metrics["health"] = health;
  } catch (const json::exception& e) {
    return MakeUnexpected(describe(InvalidResponse(e.what())));
  }

  const std::pair<const char*, const char*> gauges[] = {  // NOLINT(modernize-avoid-c-arrays)
      {"nodeCount", kNodeCountMetric},
      {"dataNodeCount", kDataNodeCountMetric},
      {"primaryShards", kPrimaryShardsMetric},
      {"unassignedShards", kUnassignedShardsMetric},
  };
  for (const auto& [field, metric] : gauges) {
    auto value = QueryGauge(metric);
    if (!value) {
      return MakeUnexpected(describe(value.error()));
    }
    metrics[field] = *value;
  }

  auto docs_data = GetData(kQueryPath, {{"query", kDocsTotalMetric}});
  if (!docs_data) {
    return MakeUnexpected(describe(docs_data.error()));
  }
  try {
    int64_t document_count = 0;
    for (const auto& series : docs_data->value("result", json::array())) {
      auto value = SampleNumber(series.value("value", json()));
      if (value) {
        document_count += static_cast<int64_t>(*value);
      }
    }
    metrics["documentCount"] = document_count;
  } catch (const json::exception& e) {
    return MakeUnexpected(describe(InvalidResponse(e.what())));
  }
  metrics["timestamp"] = utils::NowIso8601Utc();
  return metrics;
}

utils::Expected<json, Error> PrometheusClient::GetCpuMetrics(const std::string& start, const std::string& end,
                                                             const std::string& step) {
  auto describe = Describe("Failed to get CPU metrics");
  QueryParams params = {{"query", kCpuPercentMetric}, {"start", start}, {"end", end}, {"step", step}};
  auto data = GetData(kQueryRangePath, params);
  if (!data) {
    return MakeUnexpected(describe(data.error()));
  }

  try {
    json records = json::array();
    for (auto& point : FlattenMatrix(*data)) {
      json record = {{"timestamp", point.timestamp}, {"usage", NumberOrNull(point.value)}};
      if (!point.node_name.is_null()) {
        record["nodeName"] = point.node_name;
      }
      records.push_back(std::move(record));
    }
    return records;
  } catch (const json::exception& e) {
    return MakeUnexpected(describe(InvalidResponse(e.what())));
  }
}

utils::Expected<json, Error> PrometheusClient::GetJvmMetrics(const std::string& start, const std::string& end,
                                                             const std::string& step) {
  auto describe = Describe("Failed to get JVM metrics");

  QueryParams used_params = {{"query", kHeapUsedMetric}, {"start", start}, {"end", end}, {"step", step}};
  auto used_data = GetData(kQueryRangePath, used_params);
  if (!used_data) {
    return MakeUnexpected(describe(used_data.error()));
  }

  QueryParams max_params = {{"query", kHeapMaxMetric}, {"start", start}, {"end", end}, {"step", step}};
  auto max_data = GetData(kQueryRangePath, max_params);
  if (!max_data) {
    return MakeUnexpected(describe(max_data.error()));
  }

  try {
    // (timestamp, node) -> heap max in KiB
    std::map<std::pair<std::string, std::string>, std::optional<double>> heap_max;
    for (auto& point : FlattenMatrix(*max_data)) {
      std::optional<double> kib;
      if (point.value) {
        kib = RoundTwoDecimals(*point.value / kBytesPerKibibyte);
      }
      heap_max.emplace(std::make_pair(point.timestamp, point.node_name.dump()), kib);
    }

    json records = json::array();
    for (auto& point : FlattenMatrix(*used_data)) {
      std::optional<double> used_kib;
      if (point.value) {
        used_kib = RoundTwoDecimals(*point.value / kBytesPerKibibyte);
      }

      std::optional<double> max_kib;
      auto iter = heap_max.find(std::make_pair(point.timestamp, point.node_name.dump()));
      if (iter != heap_max.end()) {
        max_kib = iter->second;
      }

      std::optional<double> percent;
      if (used_kib && max_kib && *max_kib > 0.0) {
        percent = RoundTwoDecimals(*used_kib / *max_kib * kPercentScale);
      }

      json record = {{"timestamp", point.timestamp},
                     {"heapUsed", NumberOrNull(used_kib)},
                     {"heapMax", NumberOrNull(max_kib)},
                     {"heapPercent", NumberOrNull(percent)}};
      if (!point.node_name.is_null()) {
        record["nodeName"] = point.node_name;
      }
      records.push_back(std::move(record));
    }
    return records;
  } catch (const json::exception& e) {
    return MakeUnexpected(describe(InvalidResponse(e.what())));
  }
}

}  // namespace monitorgate::upstream

/**
 * @file structured_log.h
 * @brief Structured event logging on top of spdlog
 *
 * Events are rendered either as one-line JSON objects or as key=value text,
 * selected process-wide by the logging.format setting.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace monitorgate::utils {

/**
 * @brief Output format of structured log lines
 */
enum class LogFormat : uint8_t {
  kJson,
  kText,
};

/**
 * @brief Structured log builder
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("upstream_error")
 *   .Field("source", "prometheus")
 *   .Field("path", "/api/v1/rules")
 *   .Field("status", static_cast<int64_t>(503))
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  /**
   * @brief Select the process-wide output format
   */
  static void SetFormat(LogFormat format) { Format().store(format); }

  static LogFormat GetFormat() { return Format().load(); }

  /**
   * @brief Parse "json" / "text" (case-sensitive)
   * @return std::nullopt for anything else
   */
  static std::optional<LogFormat> ParseFormat(std::string_view name) {
    if (name == "json") {
      return LogFormat::kJson;
    }
    if (name == "text") {
      return LogFormat::kText;
    }
    return std::nullopt;
  }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) {
    fields_.push_back({key, std::string(value), true});
    return *this;
  }

  StructuredLog& Field(const std::string& key, const std::string& value) {
    fields_.push_back({key, value, true});
    return *this;
  }

  StructuredLog& Field(const std::string& key, std::string_view value) {
    fields_.push_back({key, std::string(value), true});
    return *this;
  }

  StructuredLog& Field(const std::string& key, int64_t value) {
    fields_.push_back({key, std::to_string(value), false});
    return *this;
  }

  StructuredLog& Field(const std::string& key, uint64_t value) {
    fields_.push_back({key, std::to_string(value), false});
    return *this;
  }

  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    fields_.push_back({key, oss.str(), false});
    return *this;
  }

  StructuredLog& Field(const std::string& key, bool value) {
    fields_.push_back({key, value ? "true" : "false", false});
    return *this;
  }

  /**
   * @brief Add message field (optional, for human-readable context)
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Debug() { spdlog::debug("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Error() { spdlog::error("{}", Build()); }
  void Critical() { spdlog::critical("{}", Build()); }

  /**
   * @brief Render the event in the current format
   */
  std::string Build() const { return GetFormat() == LogFormat::kText ? BuildText() : BuildJson(); }

 private:
  struct LogField {
    std::string key;
    std::string value;
    bool quoted;
  };

  std::string event_;
  std::string message_;
  std::vector<LogField> fields_;

  static std::atomic<LogFormat>& Format() {
    static std::atomic<LogFormat> format{LogFormat::kJson};
    return format;
  }

  std::string BuildJson() const {
    std::ostringstream json;
    json << "{";

    bool first = true;
    auto append = [&](const std::string& key, const std::string& value, bool quoted) {
      if (!first) {
        json << ",";
      }
      json << "\"" << Escape(key) << "\":";
      if (quoted) {
        json << "\"" << Escape(value) << "\"";
      } else {
        json << value;
      }
      first = false;
    };

    if (!event_.empty()) {
      append("event", event_, true);
    }
    if (!message_.empty()) {
      append("message", message_, true);
    }
    for (const auto& field : fields_) {
      append(field.key, field.value, field.quoted);
    }

    json << "}";
    return json.str();
  }

  std::string BuildText() const {
    std::ostringstream text;
    text << event_;
    if (!message_.empty()) {
      text << ": " << message_;
    }
    for (const auto& field : fields_) {
      text << " " << field.key << "=";
      // Quote values containing whitespace so lines stay splittable
      if (field.quoted && (field.value.empty() || field.value.find_first_of(" \t\n\"") != std::string::npos)) {
        text << "\"" << Escape(field.value) << "\"";
      } else {
        text << field.value;
      }
    }
    return text.str();
  }

  static std::string Escape(const std::string& str) {
    // Control character threshold for JSON escaping (0x20 = space)
    constexpr char kControlCharThreshold = 0x20;

    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped << R"(\")";
          break;
        case '\\':
          escaped << R"(\\)";
          break;
        case '\b':
          escaped << R"(\b)";
          break;
        case '\f':
          escaped << R"(\f)";
          break;
        case '\n':
          escaped << R"(\n)";
          break;
        case '\r':
          escaped << R"(\r)";
          break;
        case '\t':
          escaped << R"(\t)";
          break;
        default:
          if (chr >= 0 && chr < kControlCharThreshold) {
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr);
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }
};

/**
 * @brief Log a failed upstream call in structured format
 */
inline void LogUpstreamError(const std::string& source, const std::string& path, const std::string& error_msg) {
  StructuredLog().Event("upstream_error").Field("source", source).Field("path", path).Field("error", error_msg).Error();
}

/**
 * @brief Log one served HTTP request
 */
inline void LogHttpRequest(const std::string& method, const std::string& path, int status, double duration_ms) {
  StructuredLog()
      .Event("http_request")
      .Field("method", method)
      .Field("path", path)
      .Field("status", static_cast<int64_t>(status))
      .Field("duration_ms", duration_ms)
      .Info();
}

}  // namespace monitorgate::utils

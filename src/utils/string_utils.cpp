/**
 * @file string_utils.cpp
 * @brief String utility implementations
 */

#include "utils/string_utils.h"

#include <unicode/unistr.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace monitorgate::utils {

namespace {

constexpr int kDecimalBase = 10;
constexpr char kWhitespace[] = " \t\n\r\f\v";  // NOLINT(modernize-avoid-c-arrays)

}  // namespace

std::string Trim(std::string_view text) {
  size_t start = text.find_first_not_of(kWhitespace);
  if (start == std::string_view::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(kWhitespace);
  return std::string(text.substr(start, end - start + 1));
}

std::vector<std::string> Split(std::string_view text, char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = text.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(text.substr(start));
      break;
    }
    parts.emplace_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string ToLower(const std::string& text) {
  icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(text);
  ustr.toLower();
  std::string result;
  ustr.toUTF8String(result);
  return result;
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) {
    return true;
  }
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

std::optional<double> ParseDouble(std::string_view text) {
  std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  // strtod also accepts hex floats, "inf" and "nan"; restrict to plain decimals
  for (char chr : trimmed) {
    bool allowed = (chr >= '0' && chr <= '9') || chr == '.' || chr == '-' || chr == '+' || chr == 'e' || chr == 'E';
    if (!allowed) {
      return std::nullopt;
    }
  }

  errno = 0;
  char* end = nullptr;
  double value = std::strtod(trimmed.c_str(), &end);
  if (end != trimmed.c_str() + trimmed.size() || errno == ERANGE || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<int64_t> ParseInt64(std::string_view text) {
  std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  size_t digits_start = (trimmed[0] == '-' || trimmed[0] == '+') ? 1 : 0;
  if (digits_start == trimmed.size()) {
    return std::nullopt;
  }
  for (size_t i = digits_start; i < trimmed.size(); ++i) {
    if (trimmed[i] < '0' || trimmed[i] > '9') {
      return std::nullopt;
    }
  }

  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(trimmed.c_str(), &end, kDecimalBase);
  if (errno == ERANGE || end != trimmed.c_str() + trimmed.size()) {
    return std::nullopt;
  }
  return static_cast<int64_t>(value);
}

}  // namespace monitorgate::utils

/**
 * @file query_spec.cpp
 * @brief Query parameter container implementation
 */

#include "query/query_spec.h"

// Fix for httplib missing NI_MAXHOST on some platforms
#ifndef NI_MAXHOST
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage) - Required for compatibility with httplib C API
#define NI_MAXHOST 1025
#endif

#include <httplib.h>

#include <algorithm>

namespace monitorgate::query {

QuerySpec QuerySpec::Parse(std::string_view query_string) {
  if (!query_string.empty() && query_string.front() == '?') {
    query_string.remove_prefix(1);
  }
  httplib::Params params;
  httplib::detail::parse_query_text(std::string(query_string), params);
  return FromParams(params);
}

QuerySpec QuerySpec::FromParams(const std::multimap<std::string, std::string>& params) {
  QuerySpec spec;
  for (const auto& [key, value] : params) {
    spec.Add(key, value);
  }
  return spec;
}

void QuerySpec::Add(const std::string& key, std::string value) {
  auto iter = std::find_if(entries_.begin(), entries_.end(), [&key](const Entry& entry) { return entry.first == key; });
  if (iter == entries_.end()) {
    entries_.emplace_back(key, std::vector<std::string>{std::move(value)});
  } else {
    iter->second.push_back(std::move(value));
  }
}

bool QuerySpec::IsReserved(const std::string& key) const {
  return key == kPageKey || key == kSortKey || key == kLimitKey || key == kFieldsKey ||
         extra_reserved_.count(key) > 0;
}

std::optional<std::string> QuerySpec::GetFirst(const std::string& key) const {
  const auto* values = Find(key);
  if (values == nullptr || values->empty()) {
    return std::nullopt;
  }
  return values->front();
}

std::vector<std::string> QuerySpec::GetAll(const std::string& key) const {
  const auto* values = Find(key);
  return values == nullptr ? std::vector<std::string>{} : *values;
}

std::vector<QuerySpec::Entry> QuerySpec::FilterEntries() const {
  std::vector<Entry> result;
  for (const auto& entry : entries_) {
    if (!IsReserved(entry.first)) {
      result.push_back(entry);
    }
  }
  return result;
}

const std::vector<std::string>* QuerySpec::Find(const std::string& key) const {
  for (const auto& entry : entries_) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

}  // namespace monitorgate::query

/**
 * @file record.cpp
 * @brief Record field access
 */

#include "query/record.h"

namespace monitorgate::query {

const nlohmann::json* FindField(const Record& record, const std::string& field) {
  if (!record.is_object()) {
    return nullptr;
  }
  auto iter = record.find(field);
  if (iter == record.end() || iter->is_null()) {
    return nullptr;
  }
  return &(*iter);
}

bool HasField(const Record& record, const std::string& field) {
  return record.is_object() && record.contains(field);
}

}  // namespace monitorgate::query

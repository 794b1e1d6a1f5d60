/**
 * @file record.h
 * @brief Schemaless record type processed by the query pipeline
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace monitorgate::query {

/**
 * @brief One record: a JSON object mapping field name to a dynamically typed value
 */
using Record = nlohmann::json;

using RecordList = std::vector<Record>;

/**
 * @brief Look up a top-level field
 *
 * Never throws. Non-object records have no fields.
 *
 * @return Pointer to the value, or nullptr when the field is absent or null
 */
const nlohmann::json* FindField(const Record& record, const std::string& field);

/**
 * @brief Check field presence (a null value counts as present)
 */
bool HasField(const Record& record, const std::string& field);

}  // namespace monitorgate::query

/**
 * @file record_filter.cpp
 * @brief Predicate filter implementation
 */

#include "query/record_filter.h"

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

#include "utils/datetime_converter.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace monitorgate::query {

namespace {

struct RangePrefix {
  const char* prefix;
  RangeOp op;
};

constexpr std::array<RangePrefix, 4> kRangePrefixes = {{
    {"gte:", RangeOp::GTE},
    {"gt:", RangeOp::GT},
    {"lte:", RangeOp::LTE},
    {"lt:", RangeOp::LT},
}};

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

Condition Condition::Parse(const std::string& raw) {
  Condition condition;

  for (const auto& range : kRangePrefixes) {
    std::string prefix(range.prefix);
    if (StartsWith(raw, prefix) && raw.size() > prefix.size()) {
      condition.kind = Kind::RANGE;
      condition.op = range.op;
      condition.operand = raw.substr(prefix.size());
      return condition;
    }
  }

  if (raw.find(',') != std::string::npos) {
    condition.kind = Kind::ANY_OF;
    for (const auto& part : utils::Split(raw, ',')) {
      condition.alternatives.push_back(utils::Trim(part));
    }
    return condition;
  }

  condition.kind = Kind::MATCH;
  condition.operand = raw;
  return condition;
}

bool Condition::Matches(const nlohmann::json& value) const {
  switch (kind) {
    case Kind::RANGE:
      return ValueComparator::CompareRange(value, op, operand);
    case Kind::ANY_OF:
      return std::any_of(alternatives.begin(), alternatives.end(),
                         [&value](const std::string& alternative) { return ValueComparator::Matches(value, alternative); });
    case Kind::MATCH:
      return ValueComparator::Matches(value, operand);
  }
  return false;
}

RecordFilter::RecordFilter(const QuerySpec& spec) {
  for (const auto& [field, raw_values] : spec.FilterEntries()) {
    FieldConditions field_conditions;
    field_conditions.field = field;
    for (const auto& raw : raw_values) {
      Condition condition = Condition::Parse(raw);
      if (condition.kind == Condition::Kind::RANGE && !utils::ParseIso8601ToEpochMillis(condition.operand) &&
          !utils::ParseDouble(condition.operand)) {
        utils::StructuredLog()
            .Event("malformed_range_operand")
            .Field("field", field)
            .Field("operand", condition.operand)
            .Debug();
      }
      field_conditions.conditions.push_back(std::move(condition));
    }
    conditions_.push_back(std::move(field_conditions));
  }
}

bool RecordFilter::Matches(const Record& record) const {
  for (const auto& field_conditions : conditions_) {
    const auto* value = FindField(record, field_conditions.field);
    if (value == nullptr) {
      return false;
    }
    for (const auto& condition : field_conditions.conditions) {
      if (!condition.Matches(*value)) {
        return false;
      }
    }
  }
  return true;
}

RecordList RecordFilter::Apply(const RecordList& records) const {
  if (conditions_.empty()) {
    return records;
  }
  RecordList result;
  std::copy_if(records.begin(), records.end(), std::back_inserter(result),
               [this](const Record& record) { return Matches(record); });
  return result;
}

}  // namespace monitorgate::query

/**
 * @file record_filter.h
 * @brief Predicate filter stage of the query pipeline
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "query/query_spec.h"
#include "query/record.h"
#include "query/value_comparator.h"

namespace monitorgate::query {

/**
 * @brief One condition derived from a single raw query value
 *
 * Raw value forms, checked in order:
 * - "gte:X", "gt:X", "lte:X", "lt:X" (X non-empty): RANGE
 * - contains ',': ANY_OF (trimmed alternatives; an empty one matches any text)
 * - anything else: MATCH
 */
struct Condition {
  enum class Kind : uint8_t { RANGE, ANY_OF, MATCH };

  Kind kind = Kind::MATCH;
  RangeOp op = RangeOp::GTE;               // RANGE only
  std::string operand;                     // RANGE and MATCH
  std::vector<std::string> alternatives;  // ANY_OF only

  /**
   * @brief Classify a raw query value
   */
  static Condition Parse(const std::string& raw);

  /**
   * @brief Evaluate against a present, non-null field value
   */
  bool Matches(const nlohmann::json& value) const;
};

/**
 * @brief All conditions attached to one field (combined with AND)
 */
struct FieldConditions {
  std::string field;
  std::vector<Condition> conditions;
};

/**
 * @brief Keeps records satisfying every non-reserved query key
 *
 * A record whose field is absent or null fails that key.
 */
class RecordFilter {
 public:
  explicit RecordFilter(const QuerySpec& spec);

  bool Matches(const Record& record) const;

  /**
   * @brief Return the matching records, in input order
   */
  RecordList Apply(const RecordList& records) const;

  const std::vector<FieldConditions>& conditions() const { return conditions_; }

 private:
  std::vector<FieldConditions> conditions_;
};

}  // namespace monitorgate::query

/**
 * @file value_comparator.h
 * @brief Comparison rules between record values and query operands
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace monitorgate::query {

/**
 * @brief Range operators accepted as "<op>:<operand>"
 */
enum class RangeOp : uint8_t {
  GT,   // Greater than
  GTE,  // Greater than or equal
  LT,   // Less than
  LTE   // Less than or equal
};

/**
 * @brief Stateless value comparison helpers
 *
 * Interpretation order for range operands: timestamp, then number. Text field
 * values are the only timestamp candidates; numbers and numeric text are the
 * number candidates. None of these functions throw.
 */
class ValueComparator {
 public:
  /**
   * @brief Interpret a value as an instant (epoch milliseconds)
   * @return std::nullopt unless the value is text holding an ISO-8601 date/date-time
   */
  static std::optional<int64_t> AsInstant(const nlohmann::json& value);

  /**
   * @brief Interpret a value as a number
   * @return The number, the parsed numeric text, or std::nullopt (booleans, nested values)
   */
  static std::optional<double> AsNumber(const nlohmann::json& value);

  /**
   * @brief Evaluate "value <op> operand"
   *
   * If both sides are timestamps they are compared as instants; otherwise the
   * operand must parse as a number and the value must be numeric. Anything
   * else yields false.
   */
  static bool CompareRange(const nlohmann::json& value, RangeOp op, const std::string& operand);

  /**
   * @brief Loose equality between a value and a raw operand
   *
   * - text: exact match
   * - number: operand parsed as number, compared numerically
   * - boolean: operand "true"/"1" or "false"/"0" (case-insensitive)
   * - null, objects, arrays: never equal
   */
  static bool LooseEquals(const nlohmann::json& value, const std::string& operand);

  /**
   * @brief Default match: case-insensitive substring for text, loose equality otherwise
   */
  static bool Matches(const nlohmann::json& value, const std::string& operand);

  /**
   * @brief Total order used by sorting
   *
   * missing/null < boolean < number < string < array < object. Within a
   * type: false < true, numbers numerically (exact across integers and
   * doubles; NaN last), strings by code point.
   *
   * @param lhs Value or nullptr (missing)
   * @param rhs Value or nullptr (missing)
   * @return Negative, zero or positive
   */
  static int CompareForSort(const nlohmann::json* lhs, const nlohmann::json* rhs);

 private:
  template <typename T>
  static bool ApplyOp(const T& lhs, RangeOp op, const T& rhs) {
    switch (op) {
      case RangeOp::GT:
        return lhs > rhs;
      case RangeOp::GTE:
        return lhs >= rhs;
      case RangeOp::LT:
        return lhs < rhs;
      case RangeOp::LTE:
        return lhs <= rhs;
    }
    return false;
  }

  static int TypeRank(const nlohmann::json* value);
};

}  // namespace monitorgate::query

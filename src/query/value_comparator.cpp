/**
 * @file value_comparator.cpp
 * @brief Value comparison implementation
 */

#include "query/value_comparator.h"

#include <cmath>

#include "utils/datetime_converter.h"
#include "utils/string_utils.h"

namespace monitorgate::query {

namespace {

// Sort ranks (lower sorts first in ascending order)
constexpr int kRankMissing = 0;
constexpr int kRankBoolean = 1;
constexpr int kRankNumber = 2;
constexpr int kRankString = 3;
constexpr int kRankArray = 4;
constexpr int kRankObject = 5;

template <typename T>
int ThreeWay(const T& lhs, const T& rhs) {
  if (lhs < rhs) {
    return -1;
  }
  if (rhs < lhs) {
    return 1;
  }
  return 0;
}

// 2^63 and 2^64, both exact in a double
constexpr double kTwoPow63 = 9223372036854775808.0;
constexpr double kTwoPow64 = 18446744073709551616.0;

// Exact integer-to-double ordering; other must not be NaN
template <typename Int>
int CompareIntegerToDouble(Int value, double other, double lower_bound, double upper_bound) {
  if (other >= upper_bound) {
    return -1;
  }
  if (other < lower_bound) {
    return 1;
  }
  double floor_value = std::floor(other);
  int result = ThreeWay(value, static_cast<Int>(floor_value));
  if (result != 0) {
    return result;
  }
  return floor_value < other ? -1 : 0;
}

int CompareNumbers(const nlohmann::json& lhs, const nlohmann::json& rhs) {
  bool lhs_nan = lhs.is_number_float() && std::isnan(lhs.get<double>());
  bool rhs_nan = rhs.is_number_float() && std::isnan(rhs.get<double>());
  if (lhs_nan || rhs_nan) {
    // NaN sorts after every other number
    return ThreeWay(lhs_nan, rhs_nan);
  }

  if (lhs.is_number_float() && rhs.is_number_float()) {
    return ThreeWay(lhs.get<double>(), rhs.get<double>());
  }
  if (lhs.is_number_float()) {
    return -CompareNumbers(rhs, lhs);
  }
  if (rhs.is_number_float()) {
    if (lhs.is_number_unsigned()) {
      return CompareIntegerToDouble(lhs.get<uint64_t>(), rhs.get<double>(), 0.0, kTwoPow64);
    }
    return CompareIntegerToDouble(lhs.get<int64_t>(), rhs.get<double>(), -kTwoPow63, kTwoPow63);
  }

  // Both integers
  if (lhs.is_number_unsigned() == rhs.is_number_unsigned()) {
    return lhs.is_number_unsigned() ? ThreeWay(lhs.get<uint64_t>(), rhs.get<uint64_t>())
                                    : ThreeWay(lhs.get<int64_t>(), rhs.get<int64_t>());
  }
  if (lhs.is_number_unsigned()) {
    return -CompareNumbers(rhs, lhs);
  }
  auto signed_value = lhs.get<int64_t>();
  if (signed_value < 0) {
    return -1;
  }
  return ThreeWay(static_cast<uint64_t>(signed_value), rhs.get<uint64_t>());
}

}  // namespace

std::optional<int64_t> ValueComparator::AsInstant(const nlohmann::json& value) {
  if (!value.is_string()) {
    return std::nullopt;
  }
  return utils::ParseIso8601ToEpochMillis(value.get_ref<const std::string&>());
}

std::optional<double> ValueComparator::AsNumber(const nlohmann::json& value) {
  if (value.is_number()) {
    return value.get<double>();
  }
  if (value.is_string()) {
    return utils::ParseDouble(value.get_ref<const std::string&>());
  }
  return std::nullopt;
}

bool ValueComparator::CompareRange(const nlohmann::json& value, RangeOp op, const std::string& operand) {
  auto operand_instant = utils::ParseIso8601ToEpochMillis(operand);
  if (operand_instant) {
    auto value_instant = AsInstant(value);
    if (value_instant) {
      return ApplyOp(*value_instant, op, *operand_instant);
    }
  }

  auto operand_number = utils::ParseDouble(operand);
  if (!operand_number) {
    return false;
  }
  auto value_number = AsNumber(value);
  if (!value_number) {
    return false;
  }
  return ApplyOp(*value_number, op, *operand_number);
}

bool ValueComparator::LooseEquals(const nlohmann::json& value, const std::string& operand) {
  if (value.is_string()) {
    return value.get_ref<const std::string&>() == operand;
  }
  if (value.is_number()) {
    auto number = utils::ParseDouble(operand);
    return number && *number == value.get<double>();
  }
  if (value.is_boolean()) {
    std::string lowered = utils::ToLower(utils::Trim(operand));
    if (lowered == "true" || lowered == "1") {
      return value.get<bool>();
    }
    if (lowered == "false" || lowered == "0") {
      return !value.get<bool>();
    }
    return false;
  }
  return false;
}

bool ValueComparator::Matches(const nlohmann::json& value, const std::string& operand) {
  if (value.is_string()) {
    return utils::ContainsIgnoreCase(value.get_ref<const std::string&>(), operand);
  }
  return LooseEquals(value, operand);
}

int ValueComparator::TypeRank(const nlohmann::json* value) {
  if (value == nullptr || value->is_null()) {
    return kRankMissing;
  }
  if (value->is_boolean()) {
    return kRankBoolean;
  }
  if (value->is_number()) {
    return kRankNumber;
  }
  if (value->is_string()) {
    return kRankString;
  }
  if (value->is_array()) {
    return kRankArray;
  }
  return kRankObject;
}

int ValueComparator::CompareForSort(const nlohmann::json* lhs, const nlohmann::json* rhs) {
  int lhs_rank = TypeRank(lhs);
  int rhs_rank = TypeRank(rhs);
  if (lhs_rank != rhs_rank) {
    return lhs_rank < rhs_rank ? -1 : 1;
  }

  switch (lhs_rank) {
    case kRankMissing:
      return 0;
    case kRankBoolean:
      return ThreeWay(lhs->get<bool>(), rhs->get<bool>());
    case kRankNumber:
      // Exact across integer and floating-point values
      return CompareNumbers(*lhs, *rhs);
    case kRankString:
      return ThreeWay(lhs->get_ref<const std::string&>(), rhs->get_ref<const std::string&>());
    default:
      // Arrays and objects: nlohmann's structural ordering
      return ThreeWay(*lhs, *rhs);
  }
}

}  // namespace monitorgate::query

/**
 * @file datetime_converter.cpp
 * @brief ISO-8601 timestamp parsing and formatting implementation
 */

#include "utils/datetime_converter.h"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace monitorgate::utils {

// ============================================================================
// Constants for datetime parsing
// ============================================================================

constexpr size_t kTimezoneOffsetLength = 6;  // Format: "+HH:MM" or "-HH:MM"
constexpr size_t kMinuteFirstDigitPos = 4;   // Position of minute's first digit in "+HH:MM"
constexpr size_t kMinuteSecondDigitPos = 5;  // Position of minute's second digit in "+HH:MM"
constexpr int kDecimalBase = 10;
constexpr int kMaxHour = 23;
constexpr int kMaxMinute = 59;
constexpr int kMaxSecond = 59;

constexpr int kSecondsPerHour = 3600;
constexpr int kSecondsPerMinute = 60;
constexpr int64_t kSecondsPerDay = 86400;
constexpr int64_t kMillisPerSecond = 1000;

// "YYYY-MM-DD"
constexpr size_t kDateLength = 10;
constexpr size_t kDateTimeSeparatorPos = 10;
// "YYYY-MM-DDTHH:MM"
constexpr size_t kHourMinuteEndPos = 16;
// "YYYY-MM-DDTHH:MM:SS"
constexpr size_t kSecondsEndPos = 19;

constexpr int kMinMonth = 1;
constexpr int kMaxMonth = 12;
constexpr int kMinDay = 1;

constexpr int kLeapYearDivisor4 = 4;
constexpr int kLeapYearDivisor100 = 100;
constexpr int kLeapYearDivisor400 = 400;
constexpr int kFebruaryMonth = 2;
constexpr int kFebruaryLeapDays = 29;

// Civil-from-days constants (proleptic Gregorian, 400-year eras)
constexpr int64_t kDaysPerEra = 146097;
constexpr int64_t kYearsPerEra = 400;
constexpr int64_t kDaysFromEpochToEra0 = 719468;
constexpr int kMillisWidth = 3;

// ============================================================================
// Calendar helpers
// ============================================================================

namespace {

bool IsLeapYear(int year) {
  return (year % kLeapYearDivisor4 == 0 && year % kLeapYearDivisor100 != 0) || (year % kLeapYearDivisor400 == 0);
}

int DaysInMonth(int year, int month) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays,cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
  static constexpr int kDaysInMonth[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  // NOLINTEND(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays,cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

  if (month < kMinMonth || month > kMaxMonth) {
    return 0;
  }
  if (month == kFebruaryMonth && IsLeapYear(year)) {
    return kFebruaryLeapDays;
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
  return kDaysInMonth[month];
}

bool IsValidCalendarDate(int year, int month, int day) {
  if (month < kMinMonth || month > kMaxMonth || day < kMinDay) {
    return false;
  }
  return day <= DaysInMonth(year, month);
}

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm)
// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
int64_t DaysFromCivil(int year, int month, int day) {
  int64_t adj_year = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
  int64_t era = (adj_year >= 0 ? adj_year : adj_year - (kYearsPerEra - 1)) / kYearsPerEra;
  int64_t year_of_era = adj_year - era * kYearsPerEra;
  int64_t day_of_year = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
  int64_t day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
  return era * kDaysPerEra + day_of_era - kDaysFromEpochToEra0;
}

void CivilFromDays(int64_t days, int& year, int& month, int& day) {
  days += kDaysFromEpochToEra0;
  int64_t era = (days >= 0 ? days : days - (kDaysPerEra - 1)) / kDaysPerEra;
  int64_t day_of_era = days - era * kDaysPerEra;
  int64_t year_of_era = (day_of_era - day_of_era / 1460 + day_of_era / 36524 - day_of_era / 146096) / 365;
  int64_t day_of_year = day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
  int64_t month_index = (5 * day_of_year + 2) / 153;
  day = static_cast<int>(day_of_year - (153 * month_index + 2) / 5 + 1);
  month = static_cast<int>(month_index < 10 ? month_index + 3 : month_index - 9);
  year = static_cast<int>(year_of_era + era * kYearsPerEra + (month <= 2 ? 1 : 0));
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

// Parse exactly `count` digits starting at `pos`
bool ParseDigits(std::string_view text, size_t pos, size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
    value = value * kDecimalBase + (text[i] - '0');
  }
  out = value;
  return true;
}

}  // namespace

// ============================================================================
// TimezoneOffset implementation
// ============================================================================

Expected<TimezoneOffset, Error> TimezoneOffset::Parse(std::string_view offset_str) {
  if (offset_str == "Z" || offset_str == "z") {
    return UTC();
  }

  // Expected format: [+-]HH:MM (e.g., "+09:00", "-05:30")
  if (offset_str.size() != kTimezoneOffsetLength) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid timezone offset format (expected +HH:MM)"));
  }

  char sign = offset_str[0];
  if (sign != '+' && sign != '-') {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Timezone offset must start with + or -"));
  }

  int hours = 0;
  if (!ParseDigits(offset_str, 1, 2, hours) || hours > kMaxHour) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Hours must be 0-23"));
  }

  if (offset_str[3] != ':') {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Missing colon separator in timezone offset"));
  }

  int minutes = 0;
  if (!ParseDigits(offset_str, kMinuteFirstDigitPos, kMinuteSecondDigitPos - kMinuteFirstDigitPos + 1, minutes) ||
      minutes > kMaxMinute) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Minutes must be 0-59"));
  }

  int32_t offset_seconds = hours * kSecondsPerHour + minutes * kSecondsPerMinute;
  if (sign == '-') {
    offset_seconds = -offset_seconds;
  }
  return TimezoneOffset(offset_seconds);
}

std::string TimezoneOffset::ToString() const {
  std::ostringstream oss;
  int32_t abs_offset = std::abs(offset_seconds_);
  int hours = abs_offset / kSecondsPerHour;
  int minutes = (abs_offset % kSecondsPerHour) / kSecondsPerMinute;

  oss << (offset_seconds_ >= 0 ? '+' : '-') << std::setfill('0') << std::setw(2) << hours << ':' << std::setw(2)
      << minutes;
  return oss.str();
}

// ============================================================================
// Parsing / formatting
// ============================================================================

std::optional<int64_t> ParseIso8601ToEpochMillis(std::string_view text) {
  // Format: "YYYY-MM-DD[THH:MM[:SS[.fff]]][Z|+HH:MM]"
  //          0123456789012345678901
  if (text.size() < kDateLength) {
    return std::nullopt;
  }

  int year = 0;
  int month = 0;
  int day = 0;
  if (!ParseDigits(text, 0, 4, year) || text[4] != '-' || !ParseDigits(text, 5, 2, month) || text[7] != '-' ||
      !ParseDigits(text, 8, 2, day)) {
    return std::nullopt;
  }
  if (!IsValidCalendarDate(year, month, day)) {
    return std::nullopt;
  }

  int64_t millis = DaysFromCivil(year, month, day) * kSecondsPerDay * kMillisPerSecond;
  if (text.size() == kDateLength) {
    return millis;
  }

  char separator = text[kDateTimeSeparatorPos];
  if (separator != 'T' && separator != 't' && separator != ' ') {
    return std::nullopt;
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!ParseDigits(text, 11, 2, hour) || text.size() < kHourMinuteEndPos || text[13] != ':' ||
      !ParseDigits(text, 14, 2, minute)) {
    return std::nullopt;
  }
  if (hour > kMaxHour || minute > kMaxMinute) {
    return std::nullopt;
  }

  size_t pos = kHourMinuteEndPos;
  int64_t fraction_millis = 0;
  if (pos < text.size() && text[pos] == ':') {
    if (!ParseDigits(text, 17, 2, second) || second > kMaxSecond) {
      return std::nullopt;
    }
    pos = kSecondsEndPos;

    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      size_t digits = 0;
      int64_t scale = kMillisPerSecond / kDecimalBase;
      while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        // Digits beyond millisecond precision are ignored
        if (scale > 0) {
          fraction_millis += (text[pos] - '0') * scale;
          scale /= kDecimalBase;
        }
        ++pos;
        ++digits;
      }
      if (digits == 0) {
        return std::nullopt;
      }
    }
  }

  int32_t offset_seconds = 0;
  if (pos < text.size()) {
    auto offset = TimezoneOffset::Parse(text.substr(pos));
    if (!offset) {
      return std::nullopt;
    }
    offset_seconds = offset->GetOffsetSeconds();
  }

  int64_t seconds_of_day = static_cast<int64_t>(hour) * kSecondsPerHour + minute * kSecondsPerMinute + second;
  millis += (seconds_of_day - offset_seconds) * kMillisPerSecond + fraction_millis;
  return millis;
}

std::string FormatIso8601Utc(int64_t epoch_millis) {
  int64_t total_seconds = epoch_millis / kMillisPerSecond;
  int64_t millis = epoch_millis % kMillisPerSecond;
  if (millis < 0) {
    millis += kMillisPerSecond;
    --total_seconds;
  }
  int64_t days = total_seconds / kSecondsPerDay;
  int64_t seconds_of_day = total_seconds % kSecondsPerDay;
  if (seconds_of_day < 0) {
    seconds_of_day += kSecondsPerDay;
    --days;
  }

  int year = 0;
  int month = 0;
  int day = 0;
  CivilFromDays(days, year, month, day);

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month << '-' << std::setw(2) << day
      << 'T' << std::setw(2) << (seconds_of_day / kSecondsPerHour) << ':' << std::setw(2)
      << ((seconds_of_day % kSecondsPerHour) / kSecondsPerMinute) << ':' << std::setw(2)
      << (seconds_of_day % kSecondsPerMinute) << '.' << std::setw(kMillisWidth) << millis << 'Z';
  return oss.str();
}

std::string NowIso8601Utc() {
  auto now = std::chrono::system_clock::now();
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return FormatIso8601Utc(static_cast<int64_t>(millis));
}

}  // namespace monitorgate::utils

/**
 * @file datetime_converter.h
 * @brief ISO-8601 timestamp parsing and formatting
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "utils/error.h"
#include "utils/expected.h"

namespace monitorgate::utils {

/**
 * @brief Timezone offset value object
 *
 * Represents a timezone offset in hours and minutes from UTC.
 * Immutable after construction.
 */
class TimezoneOffset {
 public:
  /**
   * @brief Parse timezone offset string
   * @param offset_str "Z", or "+HH:MM" / "-HH:MM" (e.g., "+09:00", "-05:30")
   * @return TimezoneOffset if valid, Error otherwise
   */
  static Expected<TimezoneOffset, Error> Parse(std::string_view offset_str);

  static TimezoneOffset UTC() { return TimezoneOffset(0); }

  int32_t GetOffsetSeconds() const { return offset_seconds_; }

  /**
   * @brief Get string representation (e.g., "+09:00")
   */
  std::string ToString() const;

 private:
  explicit TimezoneOffset(int32_t offset_seconds) : offset_seconds_(offset_seconds) {}

  int32_t offset_seconds_;
};

/**
 * @brief Parse an ISO-8601 date or date-time into Unix epoch milliseconds
 *
 * Accepted forms:
 * - "YYYY-MM-DD"
 * - "YYYY-MM-DDTHH:MM", "YYYY-MM-DDTHH:MM:SS", "YYYY-MM-DDTHH:MM:SS.fff..."
 *   (a space is accepted instead of 'T')
 * - any date-time form followed by "Z" or "+HH:MM" / "-HH:MM"
 *
 * A missing offset means UTC. Calendar validity is checked (no Feb 30).
 *
 * @return Epoch milliseconds, or std::nullopt when the text is not a timestamp
 */
std::optional<int64_t> ParseIso8601ToEpochMillis(std::string_view text);

/**
 * @brief Format epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ"
 */
std::string FormatIso8601Utc(int64_t epoch_millis);

/**
 * @brief Current wall-clock time formatted with FormatIso8601Utc
 */
std::string NowIso8601Utc();

}  // namespace monitorgate::utils

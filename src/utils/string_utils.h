/**
 * @file string_utils.h
 * @brief String utility functions for text matching and parsing
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace monitorgate::utils {

/**
 * @brief Remove leading and trailing ASCII whitespace
 */
std::string Trim(std::string_view text);

/**
 * @brief Split on a single delimiter character
 *
 * Empty pieces are kept, so Split("a,,b", ',') yields {"a", "", "b"}.
 * An empty input yields one empty piece.
 */
std::vector<std::string> Split(std::string_view text, char delimiter);

/**
 * @brief Unicode-aware lower-casing (ICU, root locale)
 *
 * @param text UTF-8 encoded string
 * @return Lower-cased UTF-8 string
 */
std::string ToLower(const std::string& text);

/**
 * @brief Case-insensitive substring test
 *
 * An empty needle is contained in every haystack.
 */
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

/**
 * @brief Parse a whole string as a finite decimal number
 *
 * Surrounding whitespace is allowed; anything else after the number makes
 * the parse fail ("12abc" is not a number, neither is "" nor "nan").
 */
std::optional<double> ParseDouble(std::string_view text);

/**
 * @brief Parse a whole string as a signed 64-bit integer (optional leading sign)
 */
std::optional<int64_t> ParseInt64(std::string_view text);

}  // namespace monitorgate::utils

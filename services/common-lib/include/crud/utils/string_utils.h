/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used across the CRUD API services.
 *
 * @version 1.0.0
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace crud {
namespace utils {

/**
 * @brief Convert string to lowercase
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Parse the leading integer of a string
 *
 * Skips leading whitespace, accepts an optional '+' or '-' sign, then reads
 * digits until the first non-digit. A "0x"/"0X" prefix switches to base 16.
 * Trailing characters are ignored, so "12abc" yields 12 and "0x1g" yields 1.
 *
 * @param str Input string
 * @return Parsed value, or std::nullopt when no digit follows the sign
 *         or the value does not fit in int64_t
 */
std::optional<int64_t> parseLeadingInteger(const std::string& str);

/**
 * @brief Parse a whole string as a decimal integer
 *
 * Surrounding whitespace is allowed, anything else is rejected.
 *
 * @param str Input string
 * @return Parsed value, or std::nullopt on error
 */
std::optional<int64_t> parseStrictInteger(const std::string& str);

} // namespace utils
} // namespace crud

/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * Formatting and parsing of ISO 8601 timestamps used in API payloads.
 *
 * @version 1.0.0
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace crud {
namespace utils {

/**
 * @brief Format time_point as ISO 8601 string (UTC)
 *
 * @param tp std::chrono time_point
 * @param includeMilliseconds Include milliseconds in output
 * @return ISO 8601 string (e.g., "2026-10-19T12:34:56Z" or
 *         "2026-10-19T12:34:56.789Z")
 */
std::string formatIso8601(
    const std::chrono::system_clock::time_point& tp,
    bool includeMilliseconds = false
);

/**
 * @brief Parse ISO 8601 UTC string to time_point
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with optional ".fff" fraction and
 * optional trailing 'Z'.
 *
 * @param iso8601 ISO 8601 formatted string
 * @return std::chrono time_point, or std::nullopt on error
 */
std::optional<std::chrono::system_clock::time_point> parseIso8601(
    const std::string& iso8601
);

/**
 * @brief Get current time as time_point
 *
 * @return Current system time
 */
inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

/**
 * @brief Current time formatted as ISO 8601 with milliseconds
 */
inline std::string nowIso8601() {
    return formatIso8601(now(), true);
}

/**
 * @brief Convert time_point to Unix timestamp in milliseconds
 *
 * @param tp std::chrono time_point
 * @return Milliseconds since epoch
 */
int64_t toUnixMillis(const std::chrono::system_clock::time_point& tp);

/**
 * @brief Convert Unix timestamp in milliseconds to time_point
 *
 * @param millis Milliseconds since epoch
 * @return std::chrono time_point
 */
std::chrono::system_clock::time_point fromUnixMillis(int64_t millis);

} // namespace utils
} // namespace crud

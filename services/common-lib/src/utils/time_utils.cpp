/**
 * @file time_utils.cpp
 * @brief ISO 8601 time utilities implementation
 */

#include "crud/utils/time_utils.h"
#include <sstream>
#include <iomanip>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace crud {
namespace utils {

int64_t toUnixMillis(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromUnixMillis(int64_t millis) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(millis)));
}

std::string formatIso8601(const std::chrono::system_clock::time_point& tp,
                          bool includeMilliseconds) {
    int64_t millis = toUnixMillis(tp);
    int64_t seconds = millis / 1000;
    int64_t fraction = millis % 1000;
    if (fraction < 0) {
        fraction += 1000;
        seconds -= 1;
    }

    std::time_t timeValue = static_cast<std::time_t>(seconds);
    struct tm tmTime;
    if (!gmtime_r(&timeValue, &tmTime)) {
        return "";
    }

    // YYYY-MM-DDTHH:MM:SS[.fff]Z
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec;
    if (includeMilliseconds) {
        oss << '.' << std::setw(3) << fraction;
    }
    oss << 'Z';

    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parseIso8601(
    const std::string& iso8601) {

    struct tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));

    int consumed = 0;
    int scanned = std::sscanf(iso8601.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                              &tmTime.tm_year, &tmTime.tm_mon, &tmTime.tm_mday,
                              &tmTime.tm_hour, &tmTime.tm_min, &tmTime.tm_sec,
                              &consumed);
    if (scanned != 6) {
        return std::nullopt;
    }

    if (tmTime.tm_mon < 1 || tmTime.tm_mon > 12 || tmTime.tm_mday < 1 || tmTime.tm_mday > 31 ||
        tmTime.tm_hour > 23 || tmTime.tm_min > 59 || tmTime.tm_sec > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    int millis = 0;
    if (pos < iso8601.length() && iso8601[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < iso8601.length() && iso8601[pos] >= '0' && iso8601[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (iso8601[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }
    if (pos < iso8601.length() && iso8601[pos] == 'Z') {
        ++pos;
    }
    if (pos != iso8601.length()) {
        return std::nullopt;
    }

    tmTime.tm_year -= 1900;
    tmTime.tm_mon -= 1;
    tmTime.tm_isdst = 0;

    std::time_t timeValue = timegm(&tmTime);
    if (timeValue == -1) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(timeValue) + std::chrono::milliseconds(millis);
}

} // namespace utils
} // namespace crud

/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "crud/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <limits>

namespace crud {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

namespace {

int digitValue(char c, int radix) {
    int value = -1;
    if (c >= '0' && c <= '9') {
        value = c - '0';
    } else if (c >= 'a' && c <= 'z') {
        value = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'Z') {
        value = c - 'A' + 10;
    }
    return (value >= 0 && value < radix) ? value : -1;
}

/**
 * @brief Read sign and digits starting at pos
 * @param allowHexPrefix Read "0x"/"0X" followed by hex digits in base 16
 * @param consumed Set to the index after the last digit
 */
std::optional<int64_t> readInteger(const std::string& str, size_t pos, bool allowHexPrefix,
                                   size_t& consumed) {
    bool negative = false;
    if (pos < str.length() && (str[pos] == '+' || str[pos] == '-')) {
        negative = (str[pos] == '-');
        ++pos;
    }

    int radix = 10;
    if (allowHexPrefix && pos + 1 < str.length() && str[pos] == '0' &&
        (str[pos + 1] == 'x' || str[pos + 1] == 'X')) {
        radix = 16;
        pos += 2;
    }

    if (pos >= str.length() || digitValue(str[pos], radix) < 0) {
        return std::nullopt;
    }

    // Accumulate as a negative number so INT64_MIN is representable
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
    int64_t value = 0;
    int digit = 0;
    while (pos < str.length() && (digit = digitValue(str[pos], radix)) >= 0) {
        if (value < (kMin + digit) / radix) {
            return std::nullopt;
        }
        value = value * radix - digit;
        ++pos;
    }

    consumed = pos;
    if (negative) {
        return value;
    }
    if (value == kMin) {
        return std::nullopt;
    }
    return -value;
}

} // anonymous namespace

std::optional<int64_t> parseLeadingInteger(const std::string& str) {
    size_t pos = 0;
    while (pos < str.length() && std::isspace(static_cast<unsigned char>(str[pos]))) {
        ++pos;
    }
    size_t consumed = 0;
    return readInteger(str, pos, true, consumed);
}

std::optional<int64_t> parseStrictInteger(const std::string& str) {
    std::string trimmed = trim(str);
    size_t consumed = 0;
    auto value = readInteger(trimmed, 0, false, consumed);
    if (!value || consumed != trimmed.length()) {
        return std::nullopt;
    }
    return value;
}

} // namespace utils
} // namespace crud

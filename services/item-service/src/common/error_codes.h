/**
 * @file error_codes.h
 * @brief Standardized error codes for Item Service
 *
 * Format: COMPONENT_ERROR_TYPE_DETAIL
 *
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <json/json.h>

namespace common {

/**
 * @brief Error code enumeration
 */
enum class ErrorCode {
    // Request Errors (1000-1999)
    REQUEST_INVALID_BODY = 1001,
    REQUEST_VALIDATION_FAILED = 1002,

    // Configuration Errors (8000-8999)
    CONFIG_INVALID_VALUE = 8001,

    // System Errors (9000-9999)
    SYSTEM_INTERNAL_ERROR = 9001,
};

/**
 * @brief Convert error code to string
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::REQUEST_INVALID_BODY: return "REQUEST_INVALID_BODY";
        case ErrorCode::REQUEST_VALIDATION_FAILED: return "REQUEST_VALIDATION_FAILED";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::SYSTEM_INTERNAL_ERROR: return "SYSTEM_INTERNAL_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Convert error code to HTTP status code
 */
inline int errorCodeToHttpStatus(ErrorCode code) {
    int numericCode = static_cast<int>(code);

    if (numericCode >= 1000 && numericCode < 2000) {
        return 400;  // Request errors -> Bad Request
    }

    return 500;
}

/**
 * @brief Reason phrase for the status codes this service emits
 */
inline std::string httpReasonPhrase(int status) {
    switch (status) {
        case 400: return "Bad Request";
        default: return "Internal Server Error";
    }
}

/**
 * @brief Error response builder
 *
 * Body shape: {"statusCode": 400, "error": "Bad Request", "message": "..."}
 */
class ErrorResponse {
private:
    ErrorCode code_;
    std::string message_;

public:
    ErrorResponse(ErrorCode code, const std::string& message)
        : code_(code), message_(message) {}

    Json::Value toJson() const {
        int status = getHttpStatus();
        Json::Value json;
        json["statusCode"] = status;
        json["error"] = httpReasonPhrase(status);
        json["message"] = message_;
        return json;
    }

    int getHttpStatus() const {
        return errorCodeToHttpStatus(code_);
    }
};

} // namespace common

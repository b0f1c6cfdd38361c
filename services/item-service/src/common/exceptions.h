/**
 * @file exceptions.h
 * @brief Exception hierarchy for Item Service
 *
 * The item store never throws; these cover request validation and startup
 * configuration.
 *
 * @date 2026-10-19
 */

#pragma once

#include <stdexcept>
#include <string>
#include "error_codes.h"

namespace common {

/**
 * @brief Base exception for all Item Service errors
 */
class ItemServiceException : public std::runtime_error {
private:
    ErrorCode code_;

public:
    explicit ItemServiceException(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    ErrorCode getCode() const {
        return code_;
    }

    ErrorResponse toErrorResponse() const {
        return ErrorResponse(code_, what());
    }
};

/**
 * @brief Request body failed schema validation
 */
class ValidationException : public ItemServiceException {
public:
    explicit ValidationException(const std::string& message,
                                 ErrorCode code = ErrorCode::REQUEST_VALIDATION_FAILED)
        : ItemServiceException(code, message) {}
};

/**
 * @brief Environment variable holds an unusable value
 */
class ConfigException : public ItemServiceException {
private:
    std::string key_;

public:
    ConfigException(const std::string& key, const std::string& message)
        : ItemServiceException(ErrorCode::CONFIG_INVALID_VALUE, key + ": " + message)
        , key_(key) {}

    const std::string& getKey() const {
        return key_;
    }
};

} // namespace common

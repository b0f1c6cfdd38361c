#pragma once

/**
 * @file request_validator.h
 * @brief Body schema checks for the /items endpoints
 *
 * Create: object with required string "name", optional string "description".
 * Update: object with optional string "name" and "description".
 * Scalar values for those two keys are coerced to strings (123 -> "123",
 * true -> "true", null -> ""); objects and arrays are rejected.
 * Any other member is accepted as-is.
 */

#include <string>
#include <json/json.h>

namespace common {

class RequestValidator {
public:
    /**
     * @brief Validate POST /items body
     * @param body Parsed JSON body, nullptr when missing or malformed
     * @return Body with string members coerced, ready for the store
     * @throws ValidationException with a message naming the offending property
     */
    static Json::Value validateCreate(const Json::Value* body);

    /**
     * @brief Validate PUT /items/{id} body ("name" not required)
     * @return Body with string members coerced
     * @throws ValidationException
     */
    static Json::Value validateUpdate(const Json::Value* body);

    /**
     * @brief Coerce a scalar JSON value to its string form
     * @throws ValidationException for objects and arrays
     */
    static std::string coerceToString(const Json::Value& value, const std::string& key);

private:
    static void requireObject(const Json::Value* body);
    static void coerceStringIfPresent(Json::Value& body, const std::string& key);
};

} // namespace common

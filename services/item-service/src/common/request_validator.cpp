/**
 * @file request_validator.cpp
 * @brief RequestValidator implementation
 */

#include "request_validator.h"
#include "exceptions.h"
#include <iomanip>
#include <sstream>

namespace common {

namespace {

/**
 * @brief Shortest decimal text that reads back as the same double
 */
std::string formatReal(double value) {
    for (int precision = 15; precision <= 17; ++precision) {
        std::ostringstream oss;
        oss << std::setprecision(precision) << value;
        if (std::stod(oss.str()) == value) {
            return oss.str();
        }
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    return oss.str();
}

} // anonymous namespace

std::string RequestValidator::coerceToString(const Json::Value& value, const std::string& key) {
    switch (value.type()) {
        case Json::stringValue:
            return value.asString();
        case Json::nullValue:
            return "";
        case Json::booleanValue:
            return value.asBool() ? "true" : "false";
        case Json::intValue:
            return std::to_string(value.asInt64());
        case Json::uintValue:
            return std::to_string(value.asUInt64());
        case Json::realValue:
            return formatReal(value.asDouble());
        default:
            throw ValidationException("body/" + key + " must be string");
    }
}

void RequestValidator::requireObject(const Json::Value* body) {
    if (!body || !body->isObject()) {
        throw ValidationException("body must be object", ErrorCode::REQUEST_INVALID_BODY);
    }
}

void RequestValidator::coerceStringIfPresent(Json::Value& body, const std::string& key) {
    if (body.isMember(key)) {
        body[key] = coerceToString(body[key], key);
    }
}

Json::Value RequestValidator::validateCreate(const Json::Value* body) {
    requireObject(body);

    if (!body->isMember("name")) {
        throw ValidationException("body must have required property 'name'");
    }

    Json::Value payload = *body;
    coerceStringIfPresent(payload, "name");
    coerceStringIfPresent(payload, "description");
    return payload;
}

Json::Value RequestValidator::validateUpdate(const Json::Value* body) {
    requireObject(body);

    Json::Value payload = *body;
    coerceStringIfPresent(payload, "name");
    coerceStringIfPresent(payload, "description");
    return payload;
}

} // namespace common

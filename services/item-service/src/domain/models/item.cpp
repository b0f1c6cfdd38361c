/**
 * @file item.cpp
 * @brief Item domain model implementation
 */

#include "item.h"
#include <crud/utils/time_utils.h>

namespace domain {
namespace models {

bool Item::isProtectedKey(const std::string& key) {
    return key == "id" || key == "createdAt" || key == "updatedAt";
}

void Item::mergeFields(const Json::Value& payload) {
    if (!payload.isObject()) {
        return;
    }
    if (!fields.isObject()) {
        fields = Json::Value(Json::objectValue);
    }

    for (const auto& key : payload.getMemberNames()) {
        if (isProtectedKey(key)) {
            continue;
        }
        fields[key] = payload[key];
    }
}

Json::Value Item::toJson() const {
    Json::Value json = fields.isObject() ? fields : Json::Value(Json::objectValue);
    json["id"] = static_cast<Json::Int64>(id);
    json["createdAt"] = crud::utils::formatIso8601(createdAt, true);
    json["updatedAt"] = crud::utils::formatIso8601(updatedAt, true);
    return json;
}

} // namespace models
} // namespace domain

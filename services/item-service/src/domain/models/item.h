#pragma once

/**
 * @file item.h
 * @brief Item domain model
 *
 * The only entity managed by the service. Caller-supplied fields are kept
 * as an opaque JSON object; identity and timestamps are owned by the store.
 */

#include <string>
#include <chrono>
#include <cstdint>
#include <json/json.h>

namespace domain {
namespace models {

struct Item {
    int64_t id = 0;
    Json::Value fields{Json::objectValue};  // name, description, any extra keys
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;

    /**
     * @brief Copy payload members into fields
     *
     * Members named like an existing field replace it; others are added.
     * Protected keys and non-object payloads are ignored.
     */
    void mergeFields(const Json::Value& payload);

    /**
     * @brief Serialize as API response body
     *
     * Payload fields followed by id, createdAt and updatedAt
     * (ISO 8601 with milliseconds).
     */
    Json::Value toJson() const;

    /** @brief true for id, createdAt, updatedAt */
    static bool isProtectedKey(const std::string& key);
};

} // namespace models
} // namespace domain

#pragma once

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <string>

namespace handlers {

/**
 * @brief Service information endpoint handler
 *
 * - GET / - Service description and endpoint listing
 *
 * No external dependencies required.
 */
class InfoHandler {
public:
    InfoHandler();

    /**
     * @brief Register info routes
     *
     * @param app Drogon application instance
     */
    void registerRoutes(drogon::HttpAppFramework& app);

    /**
     * @brief GET /
     *
     * Response:
     * {
     *   "message": "Item CRUD API",
     *   "version": "1.0.0",
     *   "endpoints": {
     *     "health": "GET /health",
     *     "items": { "getAll": "GET /items", ... }
     *   }
     * }
     */
    void handleRoot(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /** @brief Body served by GET / */
    static Json::Value serviceInfo();
};

} // namespace handlers

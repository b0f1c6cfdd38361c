#pragma once

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>
#include <string>

namespace handlers {

/**
 * @brief Health check endpoint handler
 *
 * - GET /health - Liveness/readiness probe target
 *
 * The timestamp source is injected so responses are reproducible in tests.
 */
class HealthHandler {
public:
    /**
     * @param getCurrentTimestamp Function that returns current ISO 8601 timestamp
     * @throws std::invalid_argument if getCurrentTimestamp is empty
     */
    explicit HealthHandler(std::function<std::string()> getCurrentTimestamp);

    /**
     * @brief Register health check routes
     *
     * @param app Drogon application instance
     */
    void registerRoutes(drogon::HttpAppFramework& app);

    /**
     * @brief GET /health
     *
     * Response:
     * {
     *   "status": "ok",
     *   "timestamp": "2026-10-19T10:00:00.000Z"
     * }
     */
    void handleHealth(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

private:
    std::function<std::string()> getCurrentTimestamp_;
};

} // namespace handlers

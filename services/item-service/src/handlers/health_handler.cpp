/** @file health_handler.cpp
 *  @brief HealthHandler implementation
 */

#include "health_handler.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace handlers {

HealthHandler::HealthHandler(std::function<std::string()> getCurrentTimestamp)
    : getCurrentTimestamp_(std::move(getCurrentTimestamp)) {

    if (!getCurrentTimestamp_) {
        throw std::invalid_argument("HealthHandler: timestamp function cannot be nullptr");
    }

    spdlog::info("[HealthHandler] Initialized");
}

void HealthHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /health
    app.registerHandler(
        "/health",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleHealth(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[HealthHandler] Routes registered");
}

void HealthHandler::handleHealth(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value result;
    result["status"] = "ok";
    result["timestamp"] = getCurrentTimestamp_();

    auto resp = drogon::HttpResponse::newHttpJsonResponse(result);
    callback(resp);
}

} // namespace handlers

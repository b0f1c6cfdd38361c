/** @file info_handler.cpp
 *  @brief InfoHandler implementation
 */

#include "info_handler.h"
#include <spdlog/spdlog.h>

namespace handlers {

namespace {
const char* const kServiceVersion = "1.0.0";
}

InfoHandler::InfoHandler() {
    spdlog::info("[InfoHandler] Initialized");
}

void InfoHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /
    app.registerHandler(
        "/",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleRoot(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[InfoHandler] Routes registered");
}

Json::Value InfoHandler::serviceInfo() {
    Json::Value result;
    result["message"] = "Item CRUD API";
    result["version"] = kServiceVersion;
    result["endpoints"]["health"] = "GET /health";

    Json::Value items;
    items["getAll"] = "GET /items";
    items["getOne"] = "GET /items/:id";
    items["create"] = "POST /items";
    items["update"] = "PUT /items/:id";
    items["delete"] = "DELETE /items/:id";
    result["endpoints"]["items"] = items;

    return result;
}

void InfoHandler::handleRoot(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    auto resp = drogon::HttpResponse::newHttpJsonResponse(serviceInfo());
    callback(resp);
}

} // namespace handlers

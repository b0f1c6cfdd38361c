#pragma once

/**
 * @file item_handler.h
 * @brief HTTP handler for Item API endpoints
 *
 * Maps the /items routes onto ItemStore operations:
 * - GET    /items       - List all items with count
 * - GET    /items/{id}  - Get single item
 * - POST   /items       - Create item (201)
 * - PUT    /items/{id}  - Merge fields into item
 * - DELETE /items/{id}  - Delete item (204)
 *
 * Missing items produce 404 {"error": "Item not found"}.
 */

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>
#include <string>

namespace common {
class ErrorResponse;
}

namespace repositories {
class ItemStore;
}

namespace handlers {

class ItemHandler {
public:
    using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

    /**
     * @param store Item store (not owned, must outlive the handler)
     * @throws std::invalid_argument if store is nullptr
     */
    explicit ItemHandler(repositories::ItemStore* store);

    void registerRoutes(drogon::HttpAppFramework& app);

    // Route bodies, invoked by the registered lambdas

    /** GET /items - {"items": [...], "count": N} */
    void handleGetAll(const drogon::HttpRequestPtr& req, Callback&& callback);

    /** GET /items/{id} */
    void handleGetById(const drogon::HttpRequestPtr& req, Callback&& callback,
                       const std::string& id);

    /** POST /items - body requires "name" */
    void handleCreate(const drogon::HttpRequestPtr& req, Callback&& callback);

    /** PUT /items/{id} - partial update, "name" optional */
    void handleUpdate(const drogon::HttpRequestPtr& req, Callback&& callback,
                      const std::string& id);

    /** DELETE /items/{id} */
    void handleDelete(const drogon::HttpRequestPtr& req, Callback&& callback,
                      const std::string& id);

private:
    repositories::ItemStore* store_;  // Not owned

    static void sendNotFound(Callback& callback);
    static void sendError(Callback& callback, const common::ErrorResponse& error);
};

} // namespace handlers

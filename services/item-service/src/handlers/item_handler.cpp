/** @file item_handler.cpp
 *  @brief ItemHandler implementation
 */

#include "item_handler.h"
#include "../common/exceptions.h"
#include "../common/request_validator.h"
#include "../repositories/item_store.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace drogon;

namespace handlers {

ItemHandler::ItemHandler(repositories::ItemStore* store)
    : store_(store) {
    if (!store_) {
        throw std::invalid_argument("ItemHandler: store cannot be nullptr");
    }
    spdlog::info("[ItemHandler] Initialized");
}

void ItemHandler::registerRoutes(HttpAppFramework& app) {
    // GET /items
    app.registerHandler(
        "/items",
        [this](const HttpRequestPtr& req, Callback&& callback) {
            this->handleGetAll(req, std::move(callback));
        },
        {Get});

    // GET /items/{id}
    app.registerHandler(
        "/items/{id}",
        [this](const HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            this->handleGetById(req, std::move(callback), id);
        },
        {Get});

    // POST /items
    app.registerHandler(
        "/items",
        [this](const HttpRequestPtr& req, Callback&& callback) {
            this->handleCreate(req, std::move(callback));
        },
        {Post});

    // PUT /items/{id}
    app.registerHandler(
        "/items/{id}",
        [this](const HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            this->handleUpdate(req, std::move(callback), id);
        },
        {Put});

    // DELETE /items/{id}
    app.registerHandler(
        "/items/{id}",
        [this](const HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            this->handleDelete(req, std::move(callback), id);
        },
        {Delete});

    spdlog::info("[ItemHandler] Routes registered: GET/POST /items, "
                "GET/PUT/DELETE /items/{{id}}");
}

void ItemHandler::sendNotFound(Callback& callback) {
    Json::Value error;
    error["error"] = "Item not found";
    auto resp = HttpResponse::newHttpJsonResponse(error);
    resp->setStatusCode(k404NotFound);
    callback(resp);
}

void ItemHandler::sendError(Callback& callback, const common::ErrorResponse& error) {
    auto resp = HttpResponse::newHttpJsonResponse(error.toJson());
    resp->setStatusCode(static_cast<HttpStatusCode>(error.getHttpStatus()));
    callback(resp);
}

void ItemHandler::handleGetAll(const HttpRequestPtr& /* req */, Callback&& callback) {
    try {
        auto items = store_->findAll();

        Json::Value itemsArray(Json::arrayValue);
        for (const auto& item : items) {
            itemsArray.append(item.toJson());
        }

        Json::Value response;
        response["items"] = itemsArray;
        response["count"] = static_cast<Json::UInt64>(items.size());

        callback(HttpResponse::newHttpJsonResponse(response));

    } catch (const std::exception& e) {
        spdlog::error("[ItemHandler] GET /items failed: {}", e.what());
        sendError(callback, common::ErrorResponse(common::ErrorCode::SYSTEM_INTERNAL_ERROR, e.what()));
    }
}

void ItemHandler::handleGetById(const HttpRequestPtr& /* req */, Callback&& callback,
                                const std::string& id) {
    try {
        auto item = store_->findById(id);
        if (!item.has_value()) {
            spdlog::debug("[ItemHandler] Item not found: {}", id);
            sendNotFound(callback);
            return;
        }

        callback(HttpResponse::newHttpJsonResponse(item->toJson()));

    } catch (const std::exception& e) {
        spdlog::error("[ItemHandler] GET /items/{} failed: {}", id, e.what());
        sendError(callback, common::ErrorResponse(common::ErrorCode::SYSTEM_INTERNAL_ERROR, e.what()));
    }
}

void ItemHandler::handleCreate(const HttpRequestPtr& req, Callback&& callback) {
    try {
        auto body = req->getJsonObject();
        auto payload = common::RequestValidator::validateCreate(body.get());

        auto item = store_->create(payload);
        spdlog::info("[ItemHandler] Item created: id={}", item.id);

        auto resp = HttpResponse::newHttpJsonResponse(item.toJson());
        resp->setStatusCode(k201Created);
        callback(resp);

    } catch (const common::ValidationException& e) {
        spdlog::warn("[ItemHandler] POST /items rejected: {}", e.what());
        sendError(callback, e.toErrorResponse());
    } catch (const std::exception& e) {
        spdlog::error("[ItemHandler] POST /items failed: {}", e.what());
        sendError(callback, common::ErrorResponse(common::ErrorCode::SYSTEM_INTERNAL_ERROR, e.what()));
    }
}

void ItemHandler::handleUpdate(const HttpRequestPtr& req, Callback&& callback,
                               const std::string& id) {
    try {
        auto body = req->getJsonObject();
        auto payload = common::RequestValidator::validateUpdate(body.get());

        auto item = store_->update(id, payload);
        if (!item.has_value()) {
            spdlog::debug("[ItemHandler] Update target not found: {}", id);
            sendNotFound(callback);
            return;
        }
        spdlog::info("[ItemHandler] Item updated: id={}", item->id);

        callback(HttpResponse::newHttpJsonResponse(item->toJson()));

    } catch (const common::ValidationException& e) {
        spdlog::warn("[ItemHandler] PUT /items/{} rejected: {}", id, e.what());
        sendError(callback, e.toErrorResponse());
    } catch (const std::exception& e) {
        spdlog::error("[ItemHandler] PUT /items/{} failed: {}", id, e.what());
        sendError(callback, common::ErrorResponse(common::ErrorCode::SYSTEM_INTERNAL_ERROR, e.what()));
    }
}

void ItemHandler::handleDelete(const HttpRequestPtr& /* req */, Callback&& callback,
                               const std::string& id) {
    try {
        if (!store_->remove(id)) {
            spdlog::debug("[ItemHandler] Delete target not found: {}", id);
            sendNotFound(callback);
            return;
        }
        spdlog::info("[ItemHandler] Item deleted: id={}", id);

        auto resp = HttpResponse::newHttpResponse();
        resp->setStatusCode(k204NoContent);
        callback(resp);

    } catch (const std::exception& e) {
        spdlog::error("[ItemHandler] DELETE /items/{} failed: {}", id, e.what());
        sendError(callback, common::ErrorResponse(common::ErrorCode::SYSTEM_INTERNAL_ERROR, e.what()));
    }
}

} // namespace handlers

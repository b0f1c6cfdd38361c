/**
 * @file item_handler_test.cpp
 * @brief Unit tests for ItemHandler HTTP translation
 *
 * Handlers are invoked directly with Drogon request objects; no listener
 * is started. Callbacks run synchronously.
 *
 * @date 2026-10-19
 */

#include <gtest/gtest.h>
#include <drogon/drogon.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include "handlers/item_handler.h"
#include "repositories/item_store.h"

namespace {

class ItemHandlerTest : public ::testing::Test {
protected:
    std::unique_ptr<repositories::ItemStore> store_;
    std::unique_ptr<handlers::ItemHandler> handler_;

    void SetUp() override {
        store_ = std::make_unique<repositories::ItemStore>();
        handler_ = std::make_unique<handlers::ItemHandler>(store_.get());
    }

    static drogon::HttpRequestPtr jsonRequest(drogon::HttpMethod method, const Json::Value& body) {
        auto req = drogon::HttpRequest::newHttpJsonRequest(body);
        req->setMethod(method);
        return req;
    }

    static drogon::HttpRequestPtr rawRequest(drogon::HttpMethod method, const std::string& body) {
        auto req = drogon::HttpRequest::newHttpRequest();
        req->setMethod(method);
        req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
        req->setBody(body);
        return req;
    }

    static drogon::HttpRequestPtr emptyRequest(drogon::HttpMethod method) {
        auto req = drogon::HttpRequest::newHttpRequest();
        req->setMethod(method);
        return req;
    }

    drogon::HttpResponsePtr create(const Json::Value& body) {
        drogon::HttpResponsePtr resp;
        handler_->handleCreate(jsonRequest(drogon::Post, body),
                               [&resp](const drogon::HttpResponsePtr& r) { resp = r; });
        return resp;
    }

    drogon::HttpResponsePtr getAll() {
        drogon::HttpResponsePtr resp;
        handler_->handleGetAll(emptyRequest(drogon::Get),
                               [&resp](const drogon::HttpResponsePtr& r) { resp = r; });
        return resp;
    }

    drogon::HttpResponsePtr getById(const std::string& id) {
        drogon::HttpResponsePtr resp;
        handler_->handleGetById(emptyRequest(drogon::Get),
                                [&resp](const drogon::HttpResponsePtr& r) { resp = r; }, id);
        return resp;
    }

    drogon::HttpResponsePtr update(const std::string& id, const drogon::HttpRequestPtr& req) {
        drogon::HttpResponsePtr resp;
        handler_->handleUpdate(req, [&resp](const drogon::HttpResponsePtr& r) { resp = r; }, id);
        return resp;
    }

    drogon::HttpResponsePtr remove(const std::string& id) {
        drogon::HttpResponsePtr resp;
        handler_->handleDelete(emptyRequest(drogon::Delete),
                               [&resp](const drogon::HttpResponsePtr& r) { resp = r; }, id);
        return resp;
    }

    static Json::Value named(const std::string& name) {
        Json::Value body;
        body["name"] = name;
        return body;
    }

    static void expectNotFound(const drogon::HttpResponsePtr& resp) {
        ASSERT_NE(resp, nullptr);
        EXPECT_EQ(resp->getStatusCode(), drogon::k404NotFound);
        auto json = resp->getJsonObject();
        ASSERT_NE(json, nullptr);
        EXPECT_EQ((*json)["error"].asString(), "Item not found");
    }
};

TEST_F(ItemHandlerTest, NullStoreRejected) {
    EXPECT_THROW(handlers::ItemHandler(nullptr), std::invalid_argument);
}

// --- POST /items ---

TEST_F(ItemHandlerTest, CreateReturns201WithEntity) {
    Json::Value body = named("Test Item");
    body["description"] = "Created by test";

    auto resp = create(body);

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k201Created);
    auto json = resp->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["id"].asInt64(), 1);
    EXPECT_EQ((*json)["name"].asString(), "Test Item");
    EXPECT_EQ((*json)["description"].asString(), "Created by test");
    EXPECT_EQ((*json)["createdAt"].asString(), (*json)["updatedAt"].asString());
}

TEST_F(ItemHandlerTest, CreateWithoutNameIs400) {
    Json::Value body;
    body["description"] = "missing name";

    auto resp = create(body);

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k400BadRequest);
    auto json = resp->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["statusCode"].asInt(), 400);
    EXPECT_EQ((*json)["error"].asString(), "Bad Request");
    EXPECT_EQ((*json)["message"].asString(), "body must have required property 'name'");
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(ItemHandlerTest, CreateWithMalformedJsonIs400) {
    drogon::HttpResponsePtr resp;
    handler_->handleCreate(rawRequest(drogon::Post, "{\"name\": "),
                           [&resp](const drogon::HttpResponsePtr& r) { resp = r; });

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k400BadRequest);
    auto json = resp->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["message"].asString(), "body must be object");
    EXPECT_EQ(store_->size(), 0u);
}

// --- GET /items ---

TEST_F(ItemHandlerTest, GetAllEmpty) {
    auto resp = getAll();

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k200OK);
    auto json = resp->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_TRUE((*json)["items"].isArray());
    EXPECT_EQ((*json)["items"].size(), 0u);
    EXPECT_EQ((*json)["count"].asUInt64(), 0u);
}

TEST_F(ItemHandlerTest, GetAllListsItemsWithCount) {
    create(named("A"));
    create(named("B"));

    auto json = getAll()->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["count"].asUInt64(), 2u);
    ASSERT_EQ((*json)["items"].size(), 2u);
    EXPECT_EQ((*json)["items"][0]["name"].asString(), "A");
    EXPECT_EQ((*json)["items"][1]["name"].asString(), "B");
}

// --- GET /items/{id} ---

TEST_F(ItemHandlerTest, GetByIdFound) {
    create(named("A"));

    auto resp = getById("1");

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k200OK);
    EXPECT_EQ((*resp->getJsonObject())["name"].asString(), "A");
}

TEST_F(ItemHandlerTest, GetByIdMissingIs404) {
    expectNotFound(getById("5"));
}

TEST_F(ItemHandlerTest, GetByNonNumericIdIs404) {
    create(named("A"));
    expectNotFound(getById("abc"));
}

// --- PUT /items/{id} ---

TEST_F(ItemHandlerTest, UpdateMergesAndKeepsIdentity) {
    Json::Value body = named("A");
    body["description"] = "old";
    auto created = create(body)->getJsonObject();

    Json::Value patch;
    patch["description"] = "new";
    patch["id"] = 99;
    auto resp = update("1", jsonRequest(drogon::Put, patch));

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k200OK);
    auto json = resp->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["id"].asInt64(), 1);
    EXPECT_EQ((*json)["name"].asString(), "A");
    EXPECT_EQ((*json)["description"].asString(), "new");
    EXPECT_EQ((*json)["createdAt"].asString(), (*created)["createdAt"].asString());
}

TEST_F(ItemHandlerTest, UpdateMissingIs404) {
    expectNotFound(update("3", jsonRequest(drogon::Put, named("X"))));
}

TEST_F(ItemHandlerTest, UpdateWithNumericNameIsCoerced) {
    create(named("A"));

    Json::Value patch;
    patch["name"] = 12;
    auto resp = update("1", jsonRequest(drogon::Put, patch));

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k200OK);
    EXPECT_EQ((*resp->getJsonObject())["name"], Json::Value("12"));
    EXPECT_EQ((*store_->findById(int64_t{1})).fields["name"], Json::Value("12"));
}

TEST_F(ItemHandlerTest, UpdateWithObjectNameIs400) {
    create(named("A"));

    Json::Value patch;
    patch["name"]["first"] = "B";
    auto resp = update("1", jsonRequest(drogon::Put, patch));

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k400BadRequest);
    EXPECT_EQ((*resp->getJsonObject())["message"].asString(), "body/name must be string");
    EXPECT_EQ((*store_->findById(int64_t{1})).fields["name"].asString(), "A");
}

TEST_F(ItemHandlerTest, CreateWithNumericNameIsCoerced) {
    Json::Value body;
    body["name"] = 123;
    auto resp = create(body);

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k201Created);
    EXPECT_EQ((*resp->getJsonObject())["name"], Json::Value("123"));
}

TEST_F(ItemHandlerTest, StoreFailureIs500) {
    store_ = std::make_unique<repositories::ItemStore>(
        []() -> std::chrono::system_clock::time_point {
            throw std::runtime_error("clock failure");
        });
    handler_ = std::make_unique<handlers::ItemHandler>(store_.get());

    auto resp = create(named("A"));

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k500InternalServerError);
    auto json = resp->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["statusCode"].asInt(), 500);
    EXPECT_EQ((*json)["error"].asString(), "Internal Server Error");
    EXPECT_EQ((*json)["message"].asString(), "clock failure");
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(ItemHandlerTest, UpdateWithMalformedJsonIs400) {
    create(named("A"));
    auto resp = update("1", rawRequest(drogon::Put, "not json"));

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k400BadRequest);
}

// --- DELETE /items/{id} ---

TEST_F(ItemHandlerTest, DeleteReturns204EmptyBody) {
    create(named("A"));

    auto resp = remove("1");

    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k204NoContent);
    EXPECT_TRUE(resp->getBody().empty());
    expectNotFound(getById("1"));
}

TEST_F(ItemHandlerTest, DeleteMissingIs404) {
    expectNotFound(remove("1"));
}

TEST_F(ItemHandlerTest, DeleteTwiceIs404Second) {
    create(named("A"));
    EXPECT_EQ(remove("1")->getStatusCode(), drogon::k204NoContent);
    expectNotFound(remove("1"));
}

} // namespace

/**
 * @file item_store.h
 * @brief In-memory store for items
 *
 * Sole owner of the item collection and the id counter. Process-local and
 * non-persistent: every replica of the service holds its own copy.
 *
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>
#include <json/json.h>
#include "../domain/models/item.h"

namespace repositories {

/**
 * @brief Item Store
 *
 * Responsibilities:
 * - Assign ids from a monotonic counter (starts at 1, never reused)
 * - Stamp createdAt/updatedAt
 * - CRUD on the collection, each operation under a single mutex
 *
 * "Not found" is reported through std::nullopt / false and is never thrown.
 * Operations return copies; the backing map is never exposed.
 */
class ItemStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Constructor
     * @param clock Time source for timestamps (defaults to system_clock::now)
     */
    explicit ItemStore(Clock clock = nullptr);

    ~ItemStore() = default;

    ItemStore(const ItemStore&) = delete;
    ItemStore& operator=(const ItemStore&) = delete;

    // ==========================================================================
    // CRUD Operations
    // ==========================================================================

    /**
     * @brief Create a new item from payload
     * @param payload JSON object; protected keys are ignored
     * @return Stored item with id and timestamps (createdAt == updatedAt)
     */
    domain::models::Item create(const Json::Value& payload);

    /**
     * @brief All stored items, ascending by id
     */
    std::vector<domain::models::Item> findAll() const;

    /**
     * @brief Find item by id
     * @return Item or std::nullopt if not found
     */
    std::optional<domain::models::Item> findById(int64_t id) const;

    /**
     * @brief Find item by id given as text (e.g. a path segment)
     *
     * Unparsable ids are reported as not found.
     */
    std::optional<domain::models::Item> findById(const std::string& id) const;

    /**
     * @brief Merge payload into an existing item
     *
     * Fields in payload replace same-named fields, other fields are kept.
     * id and createdAt are never changed; updatedAt is refreshed and never
     * moves backwards.
     *
     * @return Updated item or std::nullopt if not found
     */
    std::optional<domain::models::Item> update(int64_t id, const Json::Value& payload);
    std::optional<domain::models::Item> update(const std::string& id, const Json::Value& payload);

    /**
     * @brief Delete item by id
     * @return true if an item was removed, false if none existed
     */
    bool remove(int64_t id);
    bool remove(const std::string& id);

    /**
     * @brief Number of stored items
     */
    size_t size() const;

    /**
     * @brief Coerce a textual id into the counter's domain
     *
     * Leading whitespace and sign are accepted and trailing characters are
     * ignored ("12abc" -> 12).
     */
    static std::optional<int64_t> parseId(const std::string& id);

private:
    std::chrono::system_clock::time_point currentTime() const;

    Clock clock_;
    mutable std::mutex mutex_;
    std::map<int64_t, domain::models::Item> items_;
    int64_t nextId_ = 1;
};

} // namespace repositories

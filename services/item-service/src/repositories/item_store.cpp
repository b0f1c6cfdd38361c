/**
 * @file item_store.cpp
 * @brief ItemStore implementation
 */

#include "item_store.h"
#include <crud/utils/string_utils.h>
#include <spdlog/spdlog.h>

namespace repositories {

ItemStore::ItemStore(Clock clock)
    : clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {
    spdlog::debug("[ItemStore] Initialized");
}

std::chrono::system_clock::time_point ItemStore::currentTime() const {
    // Timestamps are serialized with millisecond precision
    return std::chrono::time_point_cast<std::chrono::milliseconds>(clock_());
}

std::optional<int64_t> ItemStore::parseId(const std::string& id) {
    return crud::utils::parseLeadingInteger(id);
}

domain::models::Item ItemStore::create(const Json::Value& payload) {
    std::lock_guard<std::mutex> lock(mutex_);

    domain::models::Item item;
    item.id = nextId_++;
    item.mergeFields(payload);
    item.createdAt = currentTime();
    item.updatedAt = item.createdAt;

    items_.emplace(item.id, item);
    spdlog::debug("[ItemStore] Created item id={}", item.id);
    return item;
}

std::vector<domain::models::Item> ItemStore::findAll() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<domain::models::Item> result;
    result.reserve(items_.size());
    for (const auto& entry : items_) {
        result.push_back(entry.second);
    }
    return result;
}

std::optional<domain::models::Item> ItemStore::findById(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = items_.find(id);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<domain::models::Item> ItemStore::findById(const std::string& id) const {
    auto parsed = parseId(id);
    if (!parsed) {
        return std::nullopt;
    }
    return findById(*parsed);
}

std::optional<domain::models::Item> ItemStore::update(int64_t id, const Json::Value& payload) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = items_.find(id);
    if (it == items_.end()) {
        return std::nullopt;
    }

    domain::models::Item updated = it->second;
    updated.mergeFields(payload);

    auto now = currentTime();
    updated.updatedAt = (now < it->second.updatedAt) ? it->second.updatedAt : now;

    it->second = updated;
    spdlog::debug("[ItemStore] Updated item id={}", id);
    return updated;
}

std::optional<domain::models::Item> ItemStore::update(const std::string& id, const Json::Value& payload) {
    auto parsed = parseId(id);
    if (!parsed) {
        return std::nullopt;
    }
    return update(*parsed, payload);
}

bool ItemStore::remove(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool removed = items_.erase(id) > 0;
    if (removed) {
        spdlog::debug("[ItemStore] Deleted item id={}", id);
    }
    return removed;
}

bool ItemStore::remove(const std::string& id) {
    auto parsed = parseId(id);
    if (!parsed) {
        return false;
    }
    return remove(*parsed);
}

size_t ItemStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

} // namespace repositories

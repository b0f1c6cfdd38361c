#pragma once

/**
 * @file service_container.h
 * @brief Centralized service container for Item Service dependency management
 *
 * Owns the item store and the handlers built on it.
 * Provides non-owning handler accessors for route registration.
 */

#include <memory>

namespace infrastructure {
struct AppConfig;
}

namespace handlers {
    class ItemHandler;
    class HealthHandler;
    class InfoHandler;
}

namespace infrastructure {

class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @param config Application configuration
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    // --- Handler Accessors ---
    handlers::ItemHandler* itemHandler() const;
    handlers::HealthHandler* healthHandler() const;
    handlers::InfoHandler* infoHandler() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure

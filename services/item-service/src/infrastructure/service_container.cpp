/**
 * @file service_container.cpp
 * @brief Item Service ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"

#include <spdlog/spdlog.h>
#include <crud/utils/time_utils.h>

// Repositories
#include "../repositories/item_store.h"

// Handlers
#include "../handlers/item_handler.h"
#include "../handlers/health_handler.h"
#include "../handlers/info_handler.h"

namespace infrastructure {

struct ServiceContainer::Impl {
    // Repositories
    std::unique_ptr<repositories::ItemStore> itemStore;

    // Handlers
    std::unique_ptr<handlers::ItemHandler> itemHandler;
    std::unique_ptr<handlers::HealthHandler> healthHandler;
    std::unique_ptr<handlers::InfoHandler> infoHandler;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("Initializing Item Service dependencies...");

    try {
        // Step 1: Store
        impl_->itemStore = std::make_unique<repositories::ItemStore>();

        // Step 2: Handlers
        impl_->itemHandler = std::make_unique<handlers::ItemHandler>(impl_->itemStore.get());
        impl_->healthHandler = std::make_unique<handlers::HealthHandler>(
            [] { return crud::utils::nowIso8601(); });
        impl_->infoHandler = std::make_unique<handlers::InfoHandler>();

        spdlog::info("All Item Service dependencies initialized (listen={}:{})",
                     config.host, config.serverPort);
        return true;

    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize Item Service: {}", e.what());
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    spdlog::info("Shutting down Item Service dependencies...");

    // Delete in reverse order of initialization
    impl_->infoHandler.reset();
    impl_->healthHandler.reset();
    impl_->itemHandler.reset();
    impl_->itemStore.reset();

    spdlog::info("Item Service dependencies shut down");
}

// --- Accessors ---
handlers::ItemHandler* ServiceContainer::itemHandler() const { return impl_->itemHandler.get(); }
handlers::HealthHandler* ServiceContainer::healthHandler() const { return impl_->healthHandler.get(); }
handlers::InfoHandler* ServiceContainer::infoHandler() const { return impl_->infoHandler.get(); }

} // namespace infrastructure

/**
 * @file main.cpp
 * @brief Item Service - CRUD REST API over an in-memory item store
 *
 * Exposes /items CRUD, /health and / on a Drogon HTTP server.
 * State is process-local; each replica keeps its own store.
 *
 * @date 2026-10-19
 * @version 1.0.0
 */

#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

#include "logging/logger.h"
#include "common/exceptions.h"
#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"
#include "handlers/item_handler.h"
#include "handlers/health_handler.h"
#include "handlers/info_handler.h"

namespace {

/**
 * @brief Print application banner
 */
void printBanner() {
    std::cout << R"(
  ___ _                   ____                  _
 |_ _| |_ ___ _ __ ___   / ___|  ___ _ ____   _(_) ___ ___
  | || __/ _ \ '_ ` _ \  \___ \ / _ \ '__\ \ / / |/ __/ _ \
  | || ||  __/ | | | | |  ___) |  __/ |   \ V /| | (_|  __/
 |___|\__\___|_| |_| |_| |____/ \___|_|    \_/ |_|\___\___|

)" << std::endl;
    std::cout << "  Item Service - CRUD API" << std::endl;
    std::cout << "  Version: 1.0.0" << std::endl;
    std::cout << std::endl;
}

/**
 * @brief Log one line per handled request
 */
void registerAccessLog(drogon::HttpAppFramework& app) {
    app.registerPostHandlingAdvice(
        [](const drogon::HttpRequestPtr& req, const drogon::HttpResponsePtr& resp) {
            spdlog::info("{} {} -> {}", req->methodString(), req->path(),
                         static_cast<int>(resp->getStatusCode()));
        });
}

} // anonymous namespace

/**
 * @brief Main entry point
 */
int main(int /* argc */, char* /* argv */[]) {
    printBanner();

    infrastructure::AppConfig appConfig;
    try {
        appConfig = infrastructure::AppConfig::fromEnvironment();
    } catch (const common::ConfigException& e) {
        spdlog::critical("Invalid configuration [{}]: {}",
                         common::errorCodeToString(e.getCode()), e.what());
        return 1;
    }

    common::Logger::initialize("item-service", appConfig.logLevel,
                               !appConfig.logFile.empty(), appConfig.logFile);

    spdlog::info("Starting Item Service...");
    spdlog::info("Listen: {}:{} (threads={}, maxBody={}MB)",
                 appConfig.host, appConfig.serverPort, appConfig.threadNum, appConfig.maxBodySizeMB);

    infrastructure::ServiceContainer container;
    if (!container.initialize(appConfig)) {
        spdlog::critical("Service initialization failed, exiting");
        return 1;
    }

    try {
        auto& app = drogon::app();

        // Server settings
        app.setLogLevel(trantor::Logger::kWarn)
           .addListener(appConfig.host, static_cast<uint16_t>(appConfig.serverPort))
           .setThreadNum(static_cast<size_t>(appConfig.threadNum))
           .setClientMaxBodySize(static_cast<size_t>(appConfig.maxBodySizeMB) * 1024 * 1024);

        registerAccessLog(app);

        // Register routes
        container.infoHandler()->registerRoutes(app);
        container.healthHandler()->registerRoutes(app);
        container.itemHandler()->registerRoutes(app);

        spdlog::info("Server starting on http://{}:{}", appConfig.host, appConfig.serverPort);

        // Run the server (returns on SIGINT/SIGTERM)
        app.run();

    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        return 1;
    }

    spdlog::info("Server stopped");
    common::Logger::flush();
    return 0;
}

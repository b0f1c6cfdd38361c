#pragma once

/**
 * @file app_config.h
 * @brief Item Service application configuration
 *
 * Loaded from environment variables at startup.
 */

#include <string>
#include <cstdlib>
#include <limits>
#include <spdlog/spdlog.h>
#include <crud/utils/string_utils.h>
#include "../common/exceptions.h"
#include "logging/logger.h"

namespace infrastructure {

struct AppConfig {
    std::string host = "0.0.0.0";  // all interfaces, required inside containers
    int serverPort = 3000;
    int threadNum = 4;
    int maxBodySizeMB = 1;

    std::string logLevel = "info";
    std::string logFile;

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("HOST")) config.host = val;
        if (auto val = std::getenv("PORT")) config.serverPort = parseInt("PORT", val);
        if (auto val = std::getenv("THREAD_NUM")) config.threadNum = parseInt("THREAD_NUM", val);
        if (auto val = std::getenv("MAX_BODY_SIZE_MB")) config.maxBodySizeMB = parseInt("MAX_BODY_SIZE_MB", val);

        if (auto val = std::getenv("LOG_LEVEL")) config.logLevel = crud::utils::toLower(crud::utils::trim(val));
        if (auto val = std::getenv("LOG_FILE")) config.logFile = val;

        config.validate();
        return config;
    }

    /**
     * @throws common::ConfigException on out-of-range values
     */
    void validate() const {
        if (host.empty()) {
            throw common::ConfigException("HOST", "must not be empty");
        }
        if (serverPort < 1 || serverPort > 65535) {
            throw common::ConfigException("PORT", "must be between 1 and 65535");
        }
        if (threadNum < 1) {
            throw common::ConfigException("THREAD_NUM", "must be at least 1");
        }
        if (maxBodySizeMB < 1) {
            throw common::ConfigException("MAX_BODY_SIZE_MB", "must be at least 1");
        }
        if (!common::Logger::parseLevel(logLevel)) {
            throw common::ConfigException("LOG_LEVEL", "unknown level '" + logLevel + "'");
        }
    }

private:
    static int parseInt(const std::string& key, const std::string& value) {
        auto parsed = crud::utils::parseStrictInteger(value);
        if (!parsed || *parsed < std::numeric_limits<int>::min() ||
            *parsed > std::numeric_limits<int>::max()) {
            throw common::ConfigException(key, "not an integer: '" + value + "'");
        }
        return static_cast<int>(*parsed);
    }
};

} // namespace infrastructure

/**
 * @file app_config.h
 * @brief Service configuration loaded from environment variables
 *
 * Nested settings use a double underscore: AUTH__URL, LOGIN__BOX_ID,
 * DATABASE__HOST, SCHEDULER__CRON, ...
 */
#pragma once

#include "../adapters/http/token_providers.h"

#include <functional>
#include <optional>
#include <string>

namespace certsync::infrastructure {

struct DatabaseSettings {
    std::string dsn;          // always set after load()
    std::string host;         // empty when DATABASE__DSN was given
    std::string schema = "certs";
    int poolMin = 1;
    int poolMax = 4;
};

struct AppConfig {
    adapters::http::AccessTokenSettings auth;
    adapters::http::SfcLoginSettings login;
    std::string downloadUrl;
    DatabaseSettings database;

    std::string cron = "0 */6 * * *";
    int httpTimeoutSeconds = 60;
    bool runOnStartup = true;
    std::string logLevel = "INFO";
    int serverPort = 8000;
    std::string logFile;

    /// Returns the variable's value, or nullopt when unset
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Load and validate every setting
     * @throws ConfigException naming the first missing or invalid variable
     */
    static AppConfig load(const EnvLookup& lookup);

    /// load() over the process environment
    static AppConfig loadFromEnv();

    /// @brief One-line summary without secrets (URLs and database host only)
    std::string summary() const;
};

} // namespace certsync::infrastructure

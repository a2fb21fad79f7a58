#include "app_config.h"
#include "cron_expression.h"
#include "exceptions.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace certsync::infrastructure {

using common::ConfigException;

namespace {

class EnvReader {
public:
    explicit EnvReader(const AppConfig::EnvLookup& lookup) : lookup_(lookup) {}

    std::optional<std::string> optional(const std::string& name) const {
        auto value = lookup_(name);
        if (!value || value->empty()) {
            return std::nullopt;
        }
        return value;
    }

    std::string required(const std::string& name) const {
        auto value = optional(name);
        if (!value) {
            throw ConfigException(name + " is required");
        }
        return *value;
    }

    std::string string(const std::string& name, const std::string& fallback) const {
        return optional(name).value_or(fallback);
    }

    int integer(const std::string& name, int fallback, int min, int max) const {
        auto value = optional(name);
        if (!value) {
            return fallback;
        }
        int parsed = 0;
        try {
            size_t pos = 0;
            parsed = std::stoi(*value, &pos);
            if (pos != value->size()) {
                throw ConfigException(name + " is not an integer: '" + *value + "'");
            }
        } catch (const std::invalid_argument&) {
            throw ConfigException(name + " is not an integer: '" + *value + "'");
        } catch (const std::out_of_range&) {
            throw ConfigException(name + " is out of range: '" + *value + "'");
        }
        if (parsed < min || parsed > max) {
            throw ConfigException(fmt::format("{} must be between {} and {}, got {}", name, min, max, parsed));
        }
        return parsed;
    }

    bool boolean(const std::string& name, bool fallback) const {
        auto value = optional(name);
        if (!value) {
            return fallback;
        }
        std::string v = *value;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
        if (v == "true" || v == "1" || v == "yes" || v == "on") {
            return true;
        }
        if (v == "false" || v == "0" || v == "no" || v == "off") {
            return false;
        }
        throw ConfigException(name + " is not a boolean: '" + *value + "'");
    }

private:
    const AppConfig::EnvLookup& lookup_;
};

DatabaseSettings loadDatabase(const EnvReader& env) {
    DatabaseSettings db;
    db.schema = env.string("DATABASE__SCHEMA", "certs");
    db.poolMin = env.integer("DATABASE__POOL_MIN", 1, 0, 64);
    db.poolMax = env.integer("DATABASE__POOL_MAX", 4, 1, 64);
    if (db.poolMin > db.poolMax) {
        throw ConfigException("DATABASE__POOL_MIN must not exceed DATABASE__POOL_MAX");
    }

    // Full DSN takes priority over the individual components
    if (auto dsn = env.optional("DATABASE__DSN")) {
        db.dsn = *dsn;
        return db;
    }

    std::vector<std::string> missing;
    auto component = [&](const char* name) {
        auto value = env.optional(name);
        if (!value) {
            missing.push_back(name);
        }
        return value.value_or("");
    };
    db.host = component("DATABASE__HOST");
    std::string name = component("DATABASE__NAME");
    std::string username = component("DATABASE__USERNAME");
    std::string password = component("DATABASE__PASSWORD");
    int port = env.integer("DATABASE__PORT", 5432, 1, 65535);

    if (!missing.empty()) {
        std::string list;
        for (size_t i = 0; i < missing.size(); i++) {
            list += (i ? ", " : "") + missing[i];
        }
        throw ConfigException("Set DATABASE__DSN or provide all of: " + list);
    }

    db.dsn = fmt::format("postgresql://{}:{}@{}:{}/{}", username, password, db.host, port, name);
    return db;
}

} // anonymous namespace

AppConfig AppConfig::load(const EnvLookup& lookup) {
    EnvReader env(lookup);
    AppConfig config;

    config.auth.url = env.required("AUTH__URL");
    config.auth.clientId = env.required("AUTH__CLIENT_ID");
    config.auth.clientSecret = env.required("AUTH__CLIENT_SECRET");
    config.auth.username = env.required("AUTH__USERNAME");
    config.auth.password = env.required("AUTH__PASSWORD");

    config.login.url = env.required("LOGIN__URL");
    config.login.borderPostId = env.required("LOGIN__BORDER_POST_ID");
    config.login.boxId = env.required("LOGIN__BOX_ID");
    config.login.passengerControlType = env.required("LOGIN__PASSENGER_CONTROL_TYPE");

    config.downloadUrl = env.required("DOWNLOAD__URL");

    config.database = loadDatabase(env);

    std::string cron = env.string("SCHEDULER__CRON", config.cron);
    config.cron = CronExpression::parse(cron).expression();

    config.httpTimeoutSeconds = env.integer("HTTP_TIMEOUT_SECONDS", 60, 1, 3600);
    config.runOnStartup = env.boolean("RUN_ON_STARTUP", true);
    config.logLevel = env.string("LOG_LEVEL", "INFO");
    config.serverPort = env.integer("SERVER_PORT", 8000, 1, 65535);
    config.logFile = env.string("LOG_FILE", "");

    return config;
}

AppConfig AppConfig::loadFromEnv() {
    return load([](const std::string& name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    });
}

std::string AppConfig::summary() const {
    return fmt::format("auth_url={}, login_url={}, download_url={}, db_host={}, schema={}, "
                       "cron='{}', run_on_startup={}, http_timeout={}s, port={}",
                       auth.url, login.url, downloadUrl,
                       database.host.empty() ? "(dsn)" : database.host, database.schema,
                       cron, runOnStartup, httpTimeoutSeconds, serverPort);
}

} // namespace certsync::infrastructure

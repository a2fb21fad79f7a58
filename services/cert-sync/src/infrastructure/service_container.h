#pragma once

/**
 * @file service_container.h
 * @brief Owns the connection pool, adapters, repository and pipeline
 *
 * Initialization order:
 * 1. PostgreSQL connection pool
 * 2. Certificate repository
 * 3. HTTP transport and the token/download adapters
 * 4. Master List parser
 * 5. Sync pipeline
 */

#include <memory>

namespace certsync::common {
    class IDbConnectionPool;
}

namespace certsync::services {
    class SyncPipeline;
}

namespace certsync::infrastructure {

struct AppConfig;

class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    common::IDbConnectionPool* dbPool() const;

    /// nullptr until initialize() succeeded
    services::SyncPipeline* pipeline() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace certsync::infrastructure

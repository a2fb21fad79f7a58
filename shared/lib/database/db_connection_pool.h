/**
 * @file db_connection_pool.h
 * @brief PostgreSQL Connection Pool Manager
 *
 * Thread-safe connection pooling for PostgreSQL database
 * Features:
 * - Configurable pool size (min/max connections)
 * - Connection timeout handling
 * - Automatic connection health checking
 * - Parameterized statements with binary (bytea) parameters
 */

#pragma once

#include "db_connection_interface.h"
#include <libpq-fe.h>
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <chrono>
#include <atomic>

namespace certsync::common {

/**
 * @brief RAII wrapper for PostgreSQL connection
 *
 * Automatically returns connection to pool when destroyed
 */
class DbConnection : public IDbConnection {
private:
    PGconn* conn_;
    class DbConnectionPool* pool_;  // Non-owning pointer to pool
    bool released_;

public:
    DbConnection(PGconn* conn, DbConnectionPool* pool)
        : conn_(conn), pool_(pool), released_(false) {}

    ~DbConnection();

    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    DbConnection(DbConnection&& other) noexcept
        : conn_(other.conn_), pool_(other.pool_), released_(other.released_) {
        other.conn_ = nullptr;
        other.released_ = true;
    }

    PGconn* get() const { return conn_; }

    bool isValid() const override {
        return conn_ != nullptr && !released_;
    }

    std::string getDatabaseType() const override {
        return "postgres";
    }

    void execute(const std::string& sql) override;

    int executeParams(const std::string& sql, const std::vector<SqlParam>& params) override;

    Json::Value query(const std::string& sql, const std::vector<SqlParam>& params = {}) override;

    void release() override;

private:
    /// @brief PQexecParams with text/binary parameter formats; caller owns the result
    PGresult* run(const std::string& sql, const std::vector<SqlParam>& params);

    static Json::Value pgResultToJson(PGresult* res);
};

/**
 * @brief PostgreSQL Connection Pool
 *
 * Thread-safe connection pool with configurable size and timeout
 */
class DbConnectionPool : public IDbConnectionPool {
private:
    std::string connString_;
    size_t minSize_;
    size_t maxSize_;
    std::chrono::seconds acquireTimeout_;

    std::queue<PGconn*> availableConnections_;
    std::atomic<size_t> totalConnections_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    bool shutdown_;

    friend class DbConnection;

public:
    /**
     * @brief Constructor
     * @param connString PostgreSQL connection string (keyword/value or URI)
     * @param minSize Minimum number of connections to maintain
     * @param maxSize Maximum number of connections allowed
     * @param acquireTimeoutSec Timeout for acquiring connection (seconds)
     * @throws std::invalid_argument if minSize > maxSize or maxSize == 0
     */
    explicit DbConnectionPool(
        const std::string& connString,
        size_t minSize = 1,
        size_t maxSize = 4,
        int acquireTimeoutSec = 5
    );

    ~DbConnectionPool();

    DbConnectionPool(const DbConnectionPool&) = delete;
    DbConnectionPool& operator=(const DbConnectionPool&) = delete;

    bool initialize() override;

    /**
     * @brief Acquire connection from pool (PostgreSQL specific)
     * @throws DatabaseException on pool shutdown or connect failure
     * @throws TimeoutException when the acquire timeout elapses
     */
    DbConnection acquire();

    std::unique_ptr<IDbConnection> acquireGeneric() override;

    void shutdown() override;

    std::string getDatabaseType() const override {
        return "postgres";
    }

private:
    PGconn* createConnection();

    bool isConnectionHealthy(PGconn* conn);

    /**
     * @brief Return connection to pool (called by DbConnection)
     */
    void releaseConnection(PGconn* conn);
};

} // namespace certsync::common

/**
 * @file db_connection_interface.h
 * @brief Database connection and connection pool interfaces
 *
 * Repositories work against IDbConnection so that they can be exercised
 * with an in-memory connection in unit tests and with libpq in production.
 */

#pragma once

#include <json/json.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace certsync::common {

/**
 * @brief Positional statement parameter ($1, $2, ...)
 *
 * An empty value binds SQL NULL. Binary parameters are sent in binary
 * format so that bytea columns receive the exact bytes.
 */
struct SqlParam {
    std::optional<std::string> value;
    bool binary = false;

    static SqlParam text(std::string v) { return SqlParam{std::move(v), false}; }

    static SqlParam bytes(const std::vector<unsigned char>& v) {
        return SqlParam{std::string(v.begin(), v.end()), true};
    }

    static SqlParam null() { return SqlParam{std::nullopt, false}; }

    /// NULL when the optional is empty, text otherwise
    static SqlParam optionalText(const std::optional<std::string>& v) {
        return v ? text(*v) : null();
    }
};

/**
 * @brief Abstract database connection
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    virtual bool isValid() const = 0;

    /**
     * @brief Get database type identifier
     * @return "postgres"
     */
    virtual std::string getDatabaseType() const = 0;

    /**
     * @brief Execute a statement without parameters
     * @throws DatabaseException on failure
     */
    virtual void execute(const std::string& sql) = 0;

    /**
     * @brief Execute a parameterized statement
     * @return Number of affected rows
     * @throws DatabaseException on failure
     */
    virtual int executeParams(const std::string& sql, const std::vector<SqlParam>& params) = 0;

    /**
     * @brief Execute a parameterized SELECT
     * @return JSON array of row objects keyed by column name
     * @throws DatabaseException on failure
     */
    virtual Json::Value query(const std::string& sql, const std::vector<SqlParam>& params = {}) = 0;

    /**
     * @brief Manually release connection back to pool
     */
    virtual void release() = 0;

protected:
    IDbConnection() = default;
};

/**
 * @brief Abstract database connection pool
 */
class IDbConnectionPool {
public:
    virtual ~IDbConnectionPool() = default;

    /**
     * @brief Initialize connection pool
     * @return true if successfully created minimum connections
     */
    virtual bool initialize() = 0;

    /**
     * @brief Acquire connection from pool
     * @throws DatabaseException on shutdown or connect failure
     * @throws TimeoutException when no connection frees up in time
     */
    virtual std::unique_ptr<IDbConnection> acquireGeneric() = 0;

    /**
     * @brief Shutdown pool and close all connections
     */
    virtual void shutdown() = 0;

    virtual std::string getDatabaseType() const = 0;

protected:
    IDbConnectionPool() = default;
};

} // namespace certsync::common

/**
 * @file db_connection_pool.cpp
 * @brief Implementation of PostgreSQL Connection Pool
 */

#include "db_connection_pool.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace certsync::common {

// =============================================================================
// DbConnection Implementation
// =============================================================================

DbConnection::~DbConnection() {
    if (!released_ && conn_) {
        release();
    }
}

PGresult* DbConnection::run(const std::string& sql, const std::vector<SqlParam>& params) {
    if (!isValid()) {
        throw DatabaseException("connection is not valid");
    }

    std::vector<const char*> paramValues;
    std::vector<int> paramLengths;
    std::vector<int> paramFormats;
    paramValues.reserve(params.size());
    paramLengths.reserve(params.size());
    paramFormats.reserve(params.size());

    for (const auto& param : params) {
        if (param.value) {
            paramValues.push_back(param.value->data());
            paramLengths.push_back(static_cast<int>(param.value->size()));
        } else {
            paramValues.push_back(nullptr);
            paramLengths.push_back(0);
        }
        paramFormats.push_back(param.binary ? 1 : 0);
    }

    PGresult* res = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,                       // Parameter types (nullptr = infer)
        paramValues.data(),
        paramLengths.data(),
        paramFormats.data(),
        0                              // Result format (0 = text)
    );

    if (!res) {
        throw DatabaseException(std::string("statement failed: ") + PQerrorMessage(conn_));
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        std::string error = PQresultErrorMessage(res);
        PQclear(res);
        throw DatabaseException("statement failed: " + error);
    }

    return res;
}

void DbConnection::execute(const std::string& sql) {
    PGresult* res = run(sql, {});
    PQclear(res);
}

int DbConnection::executeParams(const std::string& sql, const std::vector<SqlParam>& params) {
    PGresult* res = run(sql, params);

    const char* affectedRowsStr = PQcmdTuples(res);
    int affectedRows = 0;
    if (affectedRowsStr && affectedRowsStr[0] != '\0') {
        affectedRows = std::atoi(affectedRowsStr);
    }

    PQclear(res);
    return affectedRows;
}

Json::Value DbConnection::query(const std::string& sql, const std::vector<SqlParam>& params) {
    PGresult* res = run(sql, params);
    Json::Value rows = pgResultToJson(res);
    PQclear(res);
    return rows;
}

Json::Value DbConnection::pgResultToJson(PGresult* res) {
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    for (int i = 0; i < rows; ++i) {
        Json::Value row;
        for (int j = 0; j < cols; ++j) {
            const char* fieldName = PQfname(res, j);

            if (PQgetisnull(res, i, j)) {
                row[fieldName] = Json::nullValue;
                continue;
            }

            const char* value = PQgetvalue(res, i, j);
            Oid type = PQftype(res, j);

            // Type conversion based on PostgreSQL type OID
            if (type == 20) {  // INT8
                row[fieldName] = static_cast<Json::Int64>(std::atoll(value));
            } else if (type == 23 || type == 21) {  // INT4 / INT2
                row[fieldName] = std::atoi(value);
            } else if (type == 700 || type == 701) {  // FLOAT4 / FLOAT8
                row[fieldName] = std::atof(value);
            } else if (type == 16) {  // BOOL
                row[fieldName] = (value[0] == 't');
            } else {
                row[fieldName] = value;
            }
        }
        array.append(row);
    }

    return array;
}

void DbConnection::release() {
    if (released_ || !conn_) {
        return;
    }

    if (pool_) {
        pool_->releaseConnection(conn_);
    }

    conn_ = nullptr;
    released_ = true;
}

// =============================================================================
// DbConnectionPool Implementation
// =============================================================================

DbConnectionPool::DbConnectionPool(
    const std::string& connString,
    size_t minSize,
    size_t maxSize,
    int acquireTimeoutSec)
    : connString_(connString)
    , minSize_(minSize)
    , maxSize_(maxSize)
    , acquireTimeout_(acquireTimeoutSec)
    , totalConnections_(0)
    , shutdown_(false)
{
    if (maxSize == 0) {
        throw std::invalid_argument("maxSize must be at least 1");
    }
    if (minSize > maxSize) {
        throw std::invalid_argument("minSize cannot exceed maxSize");
    }

    spdlog::info("[DbConnectionPool] Created: minSize={}, maxSize={}, timeout={}s",
                 minSize_, maxSize_, acquireTimeoutSec);
}

DbConnectionPool::~DbConnectionPool() {
    shutdown();
}

bool DbConnectionPool::initialize() {
    spdlog::info("[DbConnectionPool] Initializing with {} minimum connections", minSize_);

    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < minSize_; i++) {
        PGconn* conn = createConnection();
        if (!conn) {
            spdlog::error("[DbConnectionPool] Failed to create minimum connection {}/{}", i + 1, minSize_);
            return false;
        }

        availableConnections_.push(conn);
        totalConnections_++;
    }

    spdlog::info("[DbConnectionPool] Initialized with {} connections", totalConnections_.load());
    return true;
}

DbConnection DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    while (true) {
        if (shutdown_) {
            throw DatabaseException("connection pool is shut down");
        }

        if (!availableConnections_.empty()) {
            PGconn* conn = availableConnections_.front();
            availableConnections_.pop();

            if (isConnectionHealthy(conn)) {
                spdlog::debug("[DbConnectionPool] Acquired connection (available: {})", availableConnections_.size());
                return DbConnection(conn, this);
            }
            spdlog::warn("[DbConnectionPool] Pooled connection is unhealthy, closing and retrying");
            PQfinish(conn);
            totalConnections_--;
            continue;
        }

        if (totalConnections_ < maxSize_) {
            // Reserve the slot before unlocking so concurrent callers respect maxSize
            totalConnections_++;
            lock.unlock();
            PGconn* conn = createConnection();
            lock.lock();

            if (conn) {
                spdlog::info("[DbConnectionPool] Created new connection (total: {})", totalConnections_.load());
                return DbConnection(conn, this);
            }
            totalConnections_--;
            throw ConnectionException("failed to create database connection");
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            spdlog::warn("[DbConnectionPool] Timeout waiting for connection ({}s)", acquireTimeout_.count());
            throw TimeoutException("acquiring database connection");
        }
    }
}

std::unique_ptr<IDbConnection> DbConnectionPool::acquireGeneric() {
    DbConnection conn = acquire();
    return std::make_unique<DbConnection>(std::move(conn));
}

void DbConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }

    spdlog::info("[DbConnectionPool] Shutting down");
    shutdown_ = true;

    while (!availableConnections_.empty()) {
        PGconn* conn = availableConnections_.front();
        availableConnections_.pop();
        PQfinish(conn);
        totalConnections_--;
    }

    cv_.notify_all();
}

PGconn* DbConnectionPool::createConnection() {
    PGconn* conn = PQconnectdb(connString_.c_str());

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn);
        spdlog::error("[DbConnectionPool] Failed to create PostgreSQL connection: {}", error);
        PQfinish(conn);
        return nullptr;
    }

    return conn;
}

bool DbConnectionPool::isConnectionHealthy(PGconn* conn) {
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn, "SELECT 1");
    if (!res || PQresultStatus(res) != PGRES_TUPLES_OK) {
        if (res) {
            PQclear(res);
        }
        return false;
    }

    PQclear(res);
    return true;
}

void DbConnectionPool::releaseConnection(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        PQfinish(conn);
        totalConnections_--;
        return;
    }

    // A connection must never go back to the pool inside an open transaction
    if (PQtransactionStatus(conn) != PQTRANS_IDLE) {
        spdlog::warn("[DbConnectionPool] Released connection has an open transaction, rolling back");
        PGresult* res = PQexec(conn, "ROLLBACK");
        if (res) {
            PQclear(res);
        }
    }

    if (isConnectionHealthy(conn)) {
        availableConnections_.push(conn);
    } else {
        spdlog::warn("[DbConnectionPool] Released connection is unhealthy, closing");
        PQfinish(conn);
        totalConnections_--;
    }

    cv_.notify_one();
}

} // namespace certsync::common

/**
 * @file db_transaction.h
 * @brief RAII transaction on a single database connection
 */

#pragma once

#include "db_connection_interface.h"
#include <certsync/railway/execution_context.h>

namespace certsync::common {

/**
 * @brief BEGIN on construction, COMMIT or ROLLBACK on request
 *
 * Rolls back in the destructor when neither commit() nor rollback() ran.
 * The connection must outlive the transaction.
 */
class DbTransaction : public railway::ITransaction {
public:
    /// @throws DatabaseException if BEGIN fails
    explicit DbTransaction(IDbConnection& connection);

    ~DbTransaction() override;

    DbTransaction(const DbTransaction&) = delete;
    DbTransaction& operator=(const DbTransaction&) = delete;

    /// @throws std::logic_error when already finished, DatabaseException on failure
    void commit() override;

    /// @throws std::logic_error when already finished, DatabaseException on failure
    void rollback() override;

    bool isActive() const { return active_; }

private:
    IDbConnection& connection_;
    bool active_;
};

} // namespace certsync::common

/**
 * @file db_transaction.cpp
 */

#include "db_transaction.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace certsync::common {

DbTransaction::DbTransaction(IDbConnection& connection)
    : connection_(connection), active_(false)
{
    connection_.execute("BEGIN");
    active_ = true;
}

DbTransaction::~DbTransaction() {
    if (!active_) {
        return;
    }
    try {
        connection_.execute("ROLLBACK");
    } catch (const std::exception& e) {
        spdlog::error("[DbTransaction] Rollback on scope exit failed: {}", e.what());
    }
}

void DbTransaction::commit() {
    if (!active_) {
        throw std::logic_error("DbTransaction: commit on a finished transaction");
    }
    connection_.execute("COMMIT");
    active_ = false;
}

void DbTransaction::rollback() {
    if (!active_) {
        throw std::logic_error("DbTransaction: rollback on a finished transaction");
    }
    active_ = false;
    connection_.execute("ROLLBACK");
}

} // namespace certsync::common

#pragma once

#include "../domain/ports.h"
#include "db_connection_interface.h"

#include <memory>
#include <string>

namespace certsync::repositories {

/**
 * @brief PostgreSQL store for the Master List records
 *
 * store() replaces the full contents of the four certificate tables in one
 * transaction. All statements are parameterized; DER fields are bound as
 * binary parameters so the bytea columns hold the exact bytes.
 *
 * Thread-safe: every call acquires its own connection from the pool.
 */
class CertificateRepository : public domain::ICertificateRepository {
public:
    /**
     * @param dbPool Shared database connection pool
     * @param schema Schema holding the tables
     * @throws std::invalid_argument if dbPool is nullptr or schema is not a plain identifier
     */
    explicit CertificateRepository(std::shared_ptr<common::IDbConnectionPool> dbPool,
                                   std::string schema = "certs");

    ~CertificateRepository() override = default;

    // Disable copy and move
    CertificateRepository(const CertificateRepository&) = delete;
    CertificateRepository& operator=(const CertificateRepository&) = delete;
    CertificateRepository(CertificateRepository&&) = delete;
    CertificateRepository& operator=(CertificateRepository&&) = delete;

    /**
     * @brief Delete every stored row, insert the payload, commit
     * @return payload.totalItems(), or DATABASE_ERROR "Failed to persist certificates to database"
     *         with the previous rows left untouched
     */
    railway::Result<int> store(const domain::MasterListPayload& payload) override;

    const std::string& schema() const { return schema_; }

private:
    railway::Result<int> storeWithConnection(common::IDbConnection& conn,
                                             const domain::MasterListPayload& payload);

    int replaceAll(common::IDbConnection& conn, const domain::MasterListPayload& payload,
                   const std::string& updatedAt);

    void insertCertificates(common::IDbConnection& conn, const std::string& table,
                            const std::vector<domain::CertificateRecord>& certs,
                            const std::string& updatedAt);

    std::string table(const char* name) const { return schema_ + "." + name; }

    std::shared_ptr<common::IDbConnectionPool> dbPool_;
    std::string schema_;
};

} // namespace certsync::repositories

#include "certificate_repository.h"
#include "db_transaction.h"
#include "exceptions.h"

#include <certsync/railway/execution_context.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <chrono>
#include <stdexcept>

namespace certsync::repositories {

using common::IDbConnection;
using common::SqlParam;
using domain::CertificateRecord;
using domain::MasterListPayload;
using railway::ErrorCode;
using railway::FailureDescription;
using railway::Result;

namespace {

const char* kPersistFailed = "Failed to persist certificates to database";

bool isPlainIdentifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

CertificateRepository::CertificateRepository(std::shared_ptr<common::IDbConnectionPool> dbPool,
                                             std::string schema)
    : dbPool_(std::move(dbPool))
    , schema_(std::move(schema))
{
    if (!dbPool_) {
        throw std::invalid_argument("CertificateRepository: dbPool cannot be nullptr");
    }
    if (!isPlainIdentifier(schema_)) {
        throw std::invalid_argument("CertificateRepository: invalid schema name '" + schema_ + "'");
    }
    spdlog::debug("[CertificateRepository] Initialized (schema={})", schema_);
}

Result<int> CertificateRepository::store(const MasterListPayload& payload) {
    spdlog::info("[CertificateRepository] Replacing stored records: root_ca={}, dsc={}, crls={}, revoked={}",
                 payload.rootCas.size(), payload.dscs.size(),
                 payload.crls.size(), payload.revokedCertificates.size());

    std::unique_ptr<IDbConnection> conn;
    try {
        conn = dbPool_->acquireGeneric();
    } catch (const std::exception& e) {
        spdlog::error("[CertificateRepository] {}: cannot acquire connection: {}", kPersistFailed, e.what());
        return Result<int>::failure(ErrorCode::DATABASE_ERROR, kPersistFailed, std::current_exception());
    }

    Result<int> result = storeWithConnection(*conn, payload);
    conn->release();

    if (result.isSuccess()) {
        spdlog::info("[CertificateRepository] Stored {} rows", result.unwrapSuccess());
    }
    return result;
}

Result<int> CertificateRepository::storeWithConnection(IDbConnection& conn, const MasterListPayload& payload) {
    std::unique_ptr<common::DbTransaction> tx;
    try {
        tx = std::make_unique<common::DbTransaction>(conn);
    } catch (const std::exception& e) {
        spdlog::error("[CertificateRepository] {}: BEGIN failed: {}", kPersistFailed, e.what());
        return Result<int>::failure(ErrorCode::DATABASE_ERROR, kPersistFailed, std::current_exception());
    }

    std::string updatedAt = domain::formatUtc(std::chrono::system_clock::now());

    railway::TransactionalExecutionContext<int> context(*tx);
    Result<int> result = context.execute([&]() {
        return Result<int>::success(replaceAll(conn, payload, updatedAt));
    });

    // Keep the original database fault as the cause, not the context's wrapper text
    return result.mapFailure([](const FailureDescription& failure) {
        spdlog::error("[CertificateRepository] {}: {}", kPersistFailed, failure.message());
        return FailureDescription(ErrorCode::DATABASE_ERROR, kPersistFailed, failure.cause());
    });
}

int CertificateRepository::replaceAll(IDbConnection& conn, const MasterListPayload& payload,
                                      const std::string& updatedAt) {
    // Child tables first: revoked_certificate_list.crl references crls.id
    conn.execute("DELETE FROM " + table("revoked_certificate_list"));
    conn.execute("DELETE FROM " + table("crls"));
    conn.execute("DELETE FROM " + table("dsc"));
    conn.execute("DELETE FROM " + table("root_ca"));

    insertCertificates(conn, table("root_ca"), payload.rootCas, updatedAt);
    insertCertificates(conn, table("dsc"), payload.dscs, updatedAt);

    const std::string crlSql =
        "INSERT INTO " + table("crls") +
        " (id, crl, source, issuer, country, updated_at)"
        " VALUES ($1, $2, $3, $4, $5, $6)";
    for (const auto& crl : payload.crls) {
        conn.executeParams(crlSql, {
            SqlParam::text(crl.getId()),
            SqlParam::bytes(crl.getCrl()),
            SqlParam::text(crl.getSource()),
            SqlParam::text(crl.getIssuer()),
            SqlParam::optionalText(crl.getCountry()),
            SqlParam::text(updatedAt),
        });
    }

    const std::string revokedSql =
        "INSERT INTO " + table("revoked_certificate_list") +
        " (id, source, country, isn, crl, revocation_reason, revocation_date, updated_at)"
        " VALUES ($1, $2, $3, $4, $5, $6, $7, $8)";
    for (const auto& revoked : payload.revokedCertificates) {
        conn.executeParams(revokedSql, {
            SqlParam::text(revoked.getId()),
            SqlParam::text(revoked.getSource()),
            SqlParam::optionalText(revoked.getCountry()),
            SqlParam::text(revoked.getIsn()),
            SqlParam::text(revoked.getCrlId()),
            SqlParam::optionalText(revoked.getRevocationReason()),
            SqlParam::text(domain::formatUtc(revoked.getRevocationDate())),
            SqlParam::text(updatedAt),
        });
    }

    return static_cast<int>(payload.totalItems());
}

void CertificateRepository::insertCertificates(IDbConnection& conn, const std::string& tableName,
                                               const std::vector<CertificateRecord>& certs,
                                               const std::string& updatedAt) {
    const std::string sql =
        "INSERT INTO " + tableName +
        " (id, certificate, subject_key_identifier, authority_key_identifier,"
        " issuer, x_500_issuer, source, isn, updated_at)"
        " VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)";

    for (const auto& cert : certs) {
        conn.executeParams(sql, {
            SqlParam::text(cert.getId()),
            SqlParam::bytes(cert.getCertificate()),
            SqlParam::optionalText(cert.getSubjectKeyIdentifier()),
            SqlParam::optionalText(cert.getAuthorityKeyIdentifier()),
            SqlParam::text(cert.getIssuer()),
            SqlParam::bytes(cert.getX500Issuer()),
            SqlParam::text(cert.getSource()),
            SqlParam::text(cert.getIsn()),
            SqlParam::text(updatedAt),
        });
    }
}

} // namespace certsync::repositories

/**
 * @file models.h
 * @brief Immutable records extracted from a Master List bundle
 *
 * Records are built through validating factories that return a Result;
 * an invalid field yields VALIDATION_ERROR instead of an exception.
 * Binary fields (certificate and CRL DER) are kept byte-exact.
 */

#pragma once

#include <certsync/railway/result.h>

#include <json/json.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace certsync::domain {

using Bytes = std::vector<unsigned char>;
using TimePoint = std::chrono::system_clock::time_point;

/// Source tag written to every record extracted from a Master List
inline constexpr const char* kMasterListSource = "icao-masterlist";

/**
 * @brief Root CA (CSCA) or document signer certificate
 *
 * Maps to the root_ca and dsc tables (identical columns).
 */
class CertificateRecord {
public:
    struct Fields {
        Bytes certificate;
        std::string id;                                  // generated UUID when empty
        std::optional<std::string> subjectKeyIdentifier;
        std::optional<std::string> authorityKeyIdentifier;
        std::string issuer;                              // RFC 4514 string
        Bytes x500Issuer;                                // DER issuer Name
        std::string source;
        std::string isn;                                 // serial, "0x" hex
        std::optional<TimePoint> updatedAt;
    };

    /**
     * @brief Build a record
     * @return VALIDATION_ERROR when the certificate bytes are empty
     */
    static railway::Result<CertificateRecord> create(Fields fields);

    const Bytes& getCertificate() const { return f_.certificate; }
    const std::string& getId() const { return f_.id; }
    const std::optional<std::string>& getSubjectKeyIdentifier() const { return f_.subjectKeyIdentifier; }
    const std::optional<std::string>& getAuthorityKeyIdentifier() const { return f_.authorityKeyIdentifier; }
    const std::string& getIssuer() const { return f_.issuer; }
    const Bytes& getX500Issuer() const { return f_.x500Issuer; }
    const std::string& getSource() const { return f_.source; }
    const std::string& getIsn() const { return f_.isn; }
    const std::optional<TimePoint>& getUpdatedAt() const { return f_.updatedAt; }

    /**
     * @brief Convert to JSON representation (without binary data)
     */
    Json::Value toJson() const;

private:
    explicit CertificateRecord(Fields fields) : f_(std::move(fields)) {}

    Fields f_;
};

/**
 * @brief Certificate Revocation List, maps to the crls table
 */
class CrlRecord {
public:
    struct Fields {
        Bytes crl;
        std::string id;
        std::string source;
        std::string issuer;
        std::optional<std::string> country;              // ISO 3166 alpha-2
        std::optional<TimePoint> updatedAt;
    };

    /**
     * @return VALIDATION_ERROR on empty CRL bytes or a country that is not two letters
     */
    static railway::Result<CrlRecord> create(Fields fields);

    const Bytes& getCrl() const { return f_.crl; }
    const std::string& getId() const { return f_.id; }
    const std::string& getSource() const { return f_.source; }
    const std::string& getIssuer() const { return f_.issuer; }
    const std::optional<std::string>& getCountry() const { return f_.country; }
    const std::optional<TimePoint>& getUpdatedAt() const { return f_.updatedAt; }

    Json::Value toJson() const;

private:
    explicit CrlRecord(Fields fields) : f_(std::move(fields)) {}

    Fields f_;
};

/**
 * @brief One revoked entry of a CRL, maps to revoked_certificate_list
 *
 * crlId references the CrlRecord produced in the same extraction pass.
 */
class RevokedCertificateRecord {
public:
    struct Fields {
        std::string id;
        std::string source;
        std::optional<std::string> country;
        std::string isn;
        std::string crlId;
        std::optional<std::string> revocationReason;     // RFC 5280 reason name
        TimePoint revocationDate;
        std::optional<TimePoint> updatedAt;
    };

    /**
     * @return VALIDATION_ERROR on empty serial, missing CRL reference or bad country
     */
    static railway::Result<RevokedCertificateRecord> create(Fields fields);

    const std::string& getId() const { return f_.id; }
    const std::string& getSource() const { return f_.source; }
    const std::optional<std::string>& getCountry() const { return f_.country; }
    const std::string& getIsn() const { return f_.isn; }
    const std::string& getCrlId() const { return f_.crlId; }
    const std::optional<std::string>& getRevocationReason() const { return f_.revocationReason; }
    TimePoint getRevocationDate() const { return f_.revocationDate; }
    const std::optional<TimePoint>& getUpdatedAt() const { return f_.updatedAt; }

    Json::Value toJson() const;

private:
    explicit RevokedCertificateRecord(Fields fields) : f_(std::move(fields)) {}

    Fields f_;
};

/**
 * @brief Dual-token credentials for the download call
 *
 *   Authorization: Bearer {accessToken}
 *   x-sfc-authorization: Bearer {sfcToken}
 */
class AuthCredentials {
public:
    AuthCredentials(std::string accessToken, std::string sfcToken)
        : accessToken_(std::move(accessToken)), sfcToken_(std::move(sfcToken)) {}

    const std::string& getAccessToken() const { return accessToken_; }
    const std::string& getSfcToken() const { return sfcToken_; }

private:

    std::string accessToken_;
    std::string sfcToken_;
};

/**
 * @brief Everything extracted from one Master List bundle
 */
struct MasterListPayload {
    std::vector<CertificateRecord> rootCas;
    std::vector<CertificateRecord> dscs;
    std::vector<CrlRecord> crls;
    std::vector<RevokedCertificateRecord> revokedCertificates;

    size_t totalCertificates() const { return rootCas.size() + dscs.size(); }

    size_t totalItems() const {
        return totalCertificates() + crls.size() + revokedCertificates.size();
    }

    /// Counts only
    Json::Value summaryJson() const;
};

/// @brief ISO-8601 UTC string, e.g. "2026-01-31T12:00:00Z"
std::string formatUtc(TimePoint tp);

} // namespace certsync::domain

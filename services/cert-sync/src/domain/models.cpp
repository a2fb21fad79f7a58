/**
 * @file models.cpp
 * @brief Record factories and JSON views
 */

#include "models.h"
#include "../common/uuid_util.h"

#include <certsync/railway/result_failures.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace certsync::domain {

using railway::Result;
using railway::ResultFailures;

namespace {

bool isCountryCode(const std::string& value) {
    return value.size() == 2 &&
           std::isalpha(static_cast<unsigned char>(value[0])) &&
           std::isalpha(static_cast<unsigned char>(value[1]));
}

void putOptional(Json::Value& json, const char* key, const std::optional<std::string>& value) {
    json[key] = value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

void putOptional(Json::Value& json, const char* key, const std::optional<TimePoint>& value) {
    json[key] = value ? Json::Value(formatUtc(*value)) : Json::Value(Json::nullValue);
}

} // anonymous namespace

std::string formatUtc(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tmTime;
    if (!gmtime_r(&t, &tmTime)) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec << 'Z';
    return oss.str();
}

// =============================================================================
// CertificateRecord
// =============================================================================

Result<CertificateRecord> CertificateRecord::create(Fields fields) {
    if (fields.certificate.empty()) {
        return ResultFailures::validationError("CertificateRecord: certificate bytes are empty");
    }
    if (fields.id.empty()) {
        fields.id = common::generateUuid();
    }
    return Result<CertificateRecord>::success(CertificateRecord(std::move(fields)));
}

Json::Value CertificateRecord::toJson() const {
    Json::Value json;
    json["id"] = f_.id;
    putOptional(json, "subject_key_identifier", f_.subjectKeyIdentifier);
    putOptional(json, "authority_key_identifier", f_.authorityKeyIdentifier);
    json["issuer"] = f_.issuer;
    json["source"] = f_.source;
    json["isn"] = f_.isn;
    json["certificate_size"] = static_cast<Json::UInt64>(f_.certificate.size());
    putOptional(json, "updated_at", f_.updatedAt);
    return json;
}

// =============================================================================
// CrlRecord
// =============================================================================

Result<CrlRecord> CrlRecord::create(Fields fields) {
    if (fields.crl.empty()) {
        return ResultFailures::validationError("CrlRecord: CRL bytes are empty");
    }
    if (fields.country && !isCountryCode(*fields.country)) {
        return ResultFailures::validationError("CrlRecord: invalid country code '" + *fields.country + "'");
    }
    if (fields.id.empty()) {
        fields.id = common::generateUuid();
    }
    return Result<CrlRecord>::success(CrlRecord(std::move(fields)));
}

Json::Value CrlRecord::toJson() const {
    Json::Value json;
    json["id"] = f_.id;
    json["source"] = f_.source;
    json["issuer"] = f_.issuer;
    putOptional(json, "country", f_.country);
    json["crl_size"] = static_cast<Json::UInt64>(f_.crl.size());
    putOptional(json, "updated_at", f_.updatedAt);
    return json;
}

// =============================================================================
// RevokedCertificateRecord
// =============================================================================

Result<RevokedCertificateRecord> RevokedCertificateRecord::create(Fields fields) {
    if (fields.isn.empty()) {
        return ResultFailures::validationError("RevokedCertificateRecord: serial number is empty");
    }
    if (fields.crlId.empty()) {
        return ResultFailures::validationError("RevokedCertificateRecord: CRL reference is empty");
    }
    if (fields.country && !isCountryCode(*fields.country)) {
        return ResultFailures::validationError(
            "RevokedCertificateRecord: invalid country code '" + *fields.country + "'");
    }
    if (fields.id.empty()) {
        fields.id = common::generateUuid();
    }
    return Result<RevokedCertificateRecord>::success(RevokedCertificateRecord(std::move(fields)));
}

Json::Value RevokedCertificateRecord::toJson() const {
    Json::Value json;
    json["id"] = f_.id;
    json["source"] = f_.source;
    putOptional(json, "country", f_.country);
    json["isn"] = f_.isn;
    json["crl"] = f_.crlId;
    putOptional(json, "revocation_reason", f_.revocationReason);
    json["revocation_date"] = formatUtc(f_.revocationDate);
    putOptional(json, "updated_at", f_.updatedAt);
    return json;
}

// =============================================================================
// MasterListPayload
// =============================================================================

Json::Value MasterListPayload::summaryJson() const {
    Json::Value json;
    json["root_cas"] = static_cast<Json::UInt64>(rootCas.size());
    json["dscs"] = static_cast<Json::UInt64>(dscs.size());
    json["crls"] = static_cast<Json::UInt64>(crls.size());
    json["revoked_certificates"] = static_cast<Json::UInt64>(revokedCertificates.size());
    json["total_items"] = static_cast<Json::UInt64>(totalItems());
    return json;
}

} // namespace certsync::domain

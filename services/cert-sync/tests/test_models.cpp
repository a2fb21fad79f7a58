/**
 * @file test_models.cpp
 * @brief Unit tests for the extracted record types
 */

#include <gtest/gtest.h>
#include "domain/models.h"

using namespace certsync::domain;
using certsync::railway::ErrorCode;

namespace {

TimePoint at(std::time_t t) {
    return std::chrono::system_clock::from_time_t(t);
}

CertificateRecord::Fields certFields() {
    CertificateRecord::Fields f;
    f.certificate = {0x30, 0x03, 0x02, 0x01, 0x01};
    f.issuer = "CN=Test,C=KR";
    f.x500Issuer = {0x30, 0x00};
    f.source = kMasterListSource;
    f.isn = "0x1";
    return f;
}

} // anonymous namespace

// ============================================================================
// formatUtc
// ============================================================================

TEST(FormatUtcTest, Epoch) {
    EXPECT_EQ(formatUtc(at(0)), "1970-01-01T00:00:00Z");
}

TEST(FormatUtcTest, KnownInstant) {
    EXPECT_EQ(formatUtc(at(1700000000)), "2023-11-14T22:13:20Z");
}

TEST(FormatUtcTest, SubSecondTruncated) {
    EXPECT_EQ(formatUtc(at(1700000000) + std::chrono::milliseconds(999)), "2023-11-14T22:13:20Z");
}

// ============================================================================
// CertificateRecord
// ============================================================================

TEST(CertificateRecordTest, CreateGeneratesId) {
    auto result = CertificateRecord::create(certFields());
    ASSERT_TRUE(result.isSuccess());
    const auto& record = result.unwrapSuccess();
    EXPECT_EQ(record.getId().size(), 36u);
    EXPECT_EQ(record.getSource(), "icao-masterlist");
    EXPECT_FALSE(record.getSubjectKeyIdentifier().has_value());
}

TEST(CertificateRecordTest, CreateKeepsGivenId) {
    auto fields = certFields();
    fields.id = "11111111-2222-3333-4444-555555555555";
    auto result = CertificateRecord::create(fields);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.unwrapSuccess().getId(), fields.id);
}

TEST(CertificateRecordTest, GeneratedIdsAreUnique) {
    auto a = CertificateRecord::create(certFields());
    auto b = CertificateRecord::create(certFields());
    ASSERT_TRUE(a.isSuccess() && b.isSuccess());
    EXPECT_NE(a.unwrapSuccess().getId(), b.unwrapSuccess().getId());
}

TEST(CertificateRecordTest, EmptyCertificateRejected) {
    auto fields = certFields();
    fields.certificate.clear();
    auto result = CertificateRecord::create(fields);
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.unwrapFailure().code(), ErrorCode::VALIDATION_ERROR);
}

TEST(CertificateRecordTest, ToJsonOmitsBinary) {
    auto fields = certFields();
    fields.subjectKeyIdentifier = "abcd";
    fields.updatedAt = at(0);
    auto record = CertificateRecord::create(fields).unwrapSuccess();

    Json::Value json = record.toJson();
    EXPECT_EQ(json["subject_key_identifier"].asString(), "abcd");
    EXPECT_TRUE(json["authority_key_identifier"].isNull());
    EXPECT_EQ(json["certificate_size"].asUInt64(), 5u);
    EXPECT_EQ(json["updated_at"].asString(), "1970-01-01T00:00:00Z");
    EXPECT_FALSE(json.isMember("certificate"));
}

// ============================================================================
// CrlRecord
// ============================================================================

TEST(CrlRecordTest, CreateWithCountry) {
    CrlRecord::Fields f;
    f.crl = {0x30, 0x00};
    f.issuer = "CN=CRL Issuer,C=DE";
    f.source = kMasterListSource;
    f.country = "DE";
    auto result = CrlRecord::create(f);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.unwrapSuccess().getCountry().value_or(""), "DE");
}

TEST(CrlRecordTest, EmptyCrlRejected) {
    CrlRecord::Fields f;
    f.issuer = "CN=x";
    auto result = CrlRecord::create(f);
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.unwrapFailure().code(), ErrorCode::VALIDATION_ERROR);
}

TEST(CrlRecordTest, BadCountryRejected) {
    CrlRecord::Fields f;
    f.crl = {0x30, 0x00};
    f.country = "DEU";
    EXPECT_TRUE(CrlRecord::create(f).isFailure());
    f.country = "1A";
    EXPECT_TRUE(CrlRecord::create(f).isFailure());
}

TEST(CrlRecordTest, CountryOptional) {
    CrlRecord::Fields f;
    f.crl = {0x30, 0x00};
    auto result = CrlRecord::create(f);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(result.unwrapSuccess().toJson()["country"].isNull());
}

// ============================================================================
// RevokedCertificateRecord
// ============================================================================

TEST(RevokedCertificateRecordTest, Create) {
    RevokedCertificateRecord::Fields f;
    f.source = kMasterListSource;
    f.country = "KR";
    f.isn = "0x2a";
    f.crlId = "crl-1";
    f.revocationReason = "keyCompromise";
    f.revocationDate = at(1700000000);
    auto result = RevokedCertificateRecord::create(f);
    ASSERT_TRUE(result.isSuccess());

    Json::Value json = result.unwrapSuccess().toJson();
    EXPECT_EQ(json["crl"].asString(), "crl-1");
    EXPECT_EQ(json["revocation_reason"].asString(), "keyCompromise");
    EXPECT_EQ(json["revocation_date"].asString(), "2023-11-14T22:13:20Z");
}

TEST(RevokedCertificateRecordTest, MissingSerialRejected) {
    RevokedCertificateRecord::Fields f;
    f.crlId = "crl-1";
    EXPECT_TRUE(RevokedCertificateRecord::create(f).isFailure());
}

TEST(RevokedCertificateRecordTest, MissingCrlReferenceRejected) {
    RevokedCertificateRecord::Fields f;
    f.isn = "0x1";
    auto result = RevokedCertificateRecord::create(f);
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.unwrapFailure().code(), ErrorCode::VALIDATION_ERROR);
}

// ============================================================================
// AuthCredentials / MasterListPayload
// ============================================================================

TEST(AuthCredentialsTest, Accessors) {
    AuthCredentials creds("access", "sfc");
    EXPECT_EQ(creds.getAccessToken(), "access");
    EXPECT_EQ(creds.getSfcToken(), "sfc");
}

TEST(MasterListPayloadTest, Totals) {
    MasterListPayload payload;
    EXPECT_EQ(payload.totalItems(), 0u);

    payload.rootCas.push_back(CertificateRecord::create(certFields()).unwrapSuccess());
    payload.rootCas.push_back(CertificateRecord::create(certFields()).unwrapSuccess());
    payload.dscs.push_back(CertificateRecord::create(certFields()).unwrapSuccess());

    CrlRecord::Fields crl;
    crl.crl = {0x30, 0x00};
    payload.crls.push_back(CrlRecord::create(crl).unwrapSuccess());

    EXPECT_EQ(payload.totalCertificates(), 3u);
    EXPECT_EQ(payload.totalItems(), 4u);

    Json::Value summary = payload.summaryJson();
    EXPECT_EQ(summary["root_cas"].asUInt64(), 2u);
    EXPECT_EQ(summary["dscs"].asUInt64(), 1u);
    EXPECT_EQ(summary["total_items"].asUInt64(), 4u);
}

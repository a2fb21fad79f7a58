/**
 * @file cms_masterlist_parser.cpp
 * @brief ICAO Master List (CMS SignedData) parser
 */

#include "cms_masterlist_parser.h"
#include "exceptions.h"

#include <openssl/err.h>
#include <openssl/objects.h>

#include <spdlog/spdlog.h>

#include <cctype>

namespace certsync::adapters {

using common::ParsingException;
using domain::Bytes;
using domain::CertificateRecord;
using domain::CrlRecord;
using domain::MasterListPayload;
using domain::RevokedCertificateRecord;
using railway::ErrorCode;
using railway::Result;

namespace {

/// Success value of a record factory, ParsingException on the failure track
template <typename T>
T unwrapOrThrow(Result<T> result) {
    if (result.isFailure()) {
        throw ParsingException(result.unwrapFailure().message());
    }
    return std::move(result).unwrapSuccess();
}

/// Country code only when it is two letters
std::optional<std::string> normalizeCountry(std::optional<std::string> country, const std::string& issuer) {
    if (!country) {
        return std::nullopt;
    }
    if (country->size() != 2 ||
        !std::isalpha(static_cast<unsigned char>((*country)[0])) ||
        !std::isalpha(static_cast<unsigned char>((*country)[1]))) {
        spdlog::warn("[CmsMasterListParser] Ignoring malformed country '{}' in CRL issuer {}",
                     *country, issuer);
        return std::nullopt;
    }
    return country;
}

} // anonymous namespace

CmsMasterListParser::CmsMasterListParser(std::string source)
    : source_(std::move(source)) {}

Result<MasterListPayload> CmsMasterListParser::parse(const Bytes& raw) {
    auto result = Result<MasterListPayload>::fromComputation(
        [&]() { return doParse(raw); },
        ErrorCode::TECHNICAL_ERROR,
        "Failed to parse CMS Master List binary");

    if (result.isFailure()) {
        spdlog::error("[CmsMasterListParser] {} ({} bytes): {}",
                      result.unwrapFailure().message(), raw.size(),
                      result.unwrapFailure().causeMessage());
        ERR_clear_error();
    }
    return result;
}

MasterListPayload CmsMasterListParser::doParse(const Bytes& raw) const {
    if (raw.empty()) {
        throw ParsingException("empty input");
    }

    ERR_clear_error();

    // Step 1: ContentInfo envelope
    x509::BioPtr bio(BIO_new_mem_buf(raw.data(), static_cast<int>(raw.size())));
    if (!bio) {
        throw ParsingException("failed to create BIO: " + x509::lastOpenSslError());
    }

    x509::CmsPtr cms(d2i_CMS_bio(bio.get(), nullptr));
    if (!cms) {
        throw ParsingException("not a CMS ContentInfo: " + x509::lastOpenSslError());
    }

    const ASN1_OBJECT* contentType = CMS_get0_type(cms.get());
    if (!contentType || OBJ_obj2nid(contentType) != NID_pkcs7_signed) {
        throw ParsingException("CMS content type is not signedData");
    }

    MasterListPayload payload;

    // Step 2: certList from the encapsulated CscaMasterList
    std::vector<CertificateRecord> inner = extractInnerCertificates(cms.get());

    // Step 3: signer certificates carried in the envelope
    std::vector<CertificateRecord> outer = extractOuterCertificates(cms.get());

    size_t innerCount = inner.size();
    size_t outerCount = outer.size();
    payload.rootCas.reserve(innerCount + outerCount);
    for (auto& rec : inner) {
        payload.rootCas.push_back(std::move(rec));
    }
    for (auto& rec : outer) {
        payload.rootCas.push_back(std::move(rec));
    }

    // Step 4: CRLs and revoked entries
    extractCrls(cms.get(), payload);

    spdlog::info("[CmsMasterListParser] Parsed Master List: inner_certs={}, outer_certs={}, "
                 "root_cas={}, crls={}, revoked={}",
                 innerCount, outerCount, payload.rootCas.size(),
                 payload.crls.size(), payload.revokedCertificates.size());

    return payload;
}

std::vector<CertificateRecord> CmsMasterListParser::extractInnerCertificates(CMS_ContentInfo* cms) const {
    std::vector<CertificateRecord> records;

    ASN1_OCTET_STRING** contentPtr = CMS_get0_content(cms);
    if (!contentPtr || !*contentPtr) {
        spdlog::warn("[CmsMasterListParser] No encapsulated content (detached), no inner certificates");
        return records;
    }

    const unsigned char* contentData = ASN1_STRING_get0_data(*contentPtr);
    long remaining = ASN1_STRING_length(*contentPtr);
    if (!contentData || remaining <= 0) {
        throw ParsingException("empty encapsulated content");
    }

    // CscaMasterList ::= SEQUENCE { version INTEGER OPTIONAL, certList SET OF Certificate }
    const unsigned char* p = contentData;
    int tag = 0, xclass = 0;
    long seqLen = 0;
    int ret = ASN1_get_object(&p, &seqLen, &tag, &xclass, remaining);
    if ((ret & 0x80) || ret != V_ASN1_CONSTRUCTED ||
        xclass != V_ASN1_UNIVERSAL || tag != V_ASN1_SEQUENCE) {
        throw ParsingException("Master List content is not a definite-length SEQUENCE");
    }
    const unsigned char* seqEnd = p + seqLen;

    long elemLen = 0;
    ret = ASN1_get_object(&p, &elemLen, &tag, &xclass, seqEnd - p);
    if (ret & 0x80) {
        throw ParsingException("truncated Master List element");
    }

    if (xclass == V_ASN1_UNIVERSAL && tag == V_ASN1_INTEGER) {
        // Version present, skip it and read certList
        p += elemLen;
        if (p >= seqEnd) {
            throw ParsingException("Master List has no certList");
        }
        ret = ASN1_get_object(&p, &elemLen, &tag, &xclass, seqEnd - p);
        if (ret & 0x80) {
            throw ParsingException("truncated Master List certList");
        }
    }

    if (ret != V_ASN1_CONSTRUCTED || xclass != V_ASN1_UNIVERSAL || tag != V_ASN1_SET) {
        throw ParsingException("Master List certList is not a SET");
    }

    const unsigned char* certPtr = p;
    const unsigned char* certSetEnd = p + elemLen;

    while (certPtr < certSetEnd) {
        const unsigned char* certStart = certPtr;
        x509::X509Ptr cert(d2i_X509(nullptr, &certPtr, certSetEnd - certStart));
        if (!cert) {
            throw ParsingException("invalid certificate #" + std::to_string(records.size() + 1) +
                                   " in certList: " + x509::lastOpenSslError());
        }
        Bytes der(certStart, certPtr);
        records.push_back(toCertificateRecord(cert.get(), std::move(der)));
    }

    spdlog::debug("[CmsMasterListParser] certList holds {} certificates", records.size());
    return records;
}

std::vector<CertificateRecord> CmsMasterListParser::extractOuterCertificates(CMS_ContentInfo* cms) const {
    std::vector<CertificateRecord> records;

    x509::X509StackPtr certs(CMS_get1_certs(cms));
    if (!certs) {
        return records;
    }

    int count = sk_X509_num(certs.get());
    for (int i = 0; i < count; i++) {
        X509* cert = sk_X509_value(certs.get(), i);
        if (!cert) {
            continue;
        }
        records.push_back(toCertificateRecord(cert, x509::certificateToDer(cert)));
    }
    return records;
}

void CmsMasterListParser::extractCrls(CMS_ContentInfo* cms, MasterListPayload& payload) const {
    x509::CrlStackPtr crls(CMS_get1_crls(cms));
    if (!crls) {
        return;
    }

    int count = sk_X509_CRL_num(crls.get());
    for (int i = 0; i < count; i++) {
        X509_CRL* crl = sk_X509_CRL_value(crls.get(), i);
        if (!crl) {
            continue;
        }

        const X509_NAME* issuerName = X509_CRL_get_issuer(crl);
        std::string issuer = x509::nameToRfc4514(issuerName);
        std::optional<std::string> country = normalizeCountry(x509::countryOf(issuerName), issuer);

        CrlRecord::Fields crlFields;
        crlFields.crl = x509::crlToDer(crl);
        crlFields.source = source_;
        crlFields.issuer = issuer;
        crlFields.country = country;
        CrlRecord crlRecord = unwrapOrThrow(CrlRecord::create(std::move(crlFields)));

        STACK_OF(X509_REVOKED)* revokedList = X509_CRL_get_REVOKED(crl);
        int revokedCount = revokedList ? sk_X509_REVOKED_num(revokedList) : 0;
        for (int j = 0; j < revokedCount; j++) {
            const X509_REVOKED* revoked = sk_X509_REVOKED_value(revokedList, j);

            RevokedCertificateRecord::Fields revFields;
            revFields.source = source_;
            revFields.country = country;
            revFields.isn = x509::serialToHex(X509_REVOKED_get0_serialNumber(revoked));
            revFields.crlId = crlRecord.getId();
            revFields.revocationReason = x509::revocationReason(revoked);
            revFields.revocationDate = x509::asn1TimeToTimePoint(X509_REVOKED_get0_revocationDate(revoked));
            payload.revokedCertificates.push_back(
                unwrapOrThrow(RevokedCertificateRecord::create(std::move(revFields))));
        }

        spdlog::debug("[CmsMasterListParser] CRL {}: issuer={}, revoked={}", i + 1, issuer, revokedCount);
        payload.crls.push_back(std::move(crlRecord));
    }
}

CertificateRecord CmsMasterListParser::toCertificateRecord(X509* cert, Bytes der) const {
    const X509_NAME* issuerName = X509_get_issuer_name(cert);

    CertificateRecord::Fields fields;
    fields.certificate = std::move(der);
    fields.issuer = x509::nameToRfc4514(issuerName);
    fields.x500Issuer = x509::nameToDer(issuerName);
    fields.source = source_;
    fields.isn = x509::serialToHex(X509_get0_serialNumber(cert));
    fields.subjectKeyIdentifier = x509::subjectKeyIdentifier(cert);
    fields.authorityKeyIdentifier = x509::authorityKeyIdentifier(cert);

    if (!fields.subjectKeyIdentifier) {
        spdlog::warn("[CmsMasterListParser] Certificate without SubjectKeyIdentifier: issuer={}, serial={}",
                     fields.issuer, fields.isn);
    }

    return unwrapOrThrow(CertificateRecord::create(std::move(fields)));
}

} // namespace certsync::adapters

/**
 * @file x509_metadata.h
 * @brief X.509 certificate and CRL field extraction (OpenSSL)
 *
 * Helpers used by the Master List parser to turn OpenSSL structures into
 * the string and byte forms stored in the database.
 */

#pragma once

#include "../domain/models.h"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/cms.h>
#include <openssl/x509.h>

#include <memory>
#include <optional>
#include <string>

namespace certsync::adapters::x509 {

// --- RAII wrappers ---

struct BioDeleter { void operator()(BIO* p) const { BIO_free(p); } };
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

struct CmsDeleter { void operator()(CMS_ContentInfo* p) const { CMS_ContentInfo_free(p); } };
using CmsPtr = std::unique_ptr<CMS_ContentInfo, CmsDeleter>;

struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

struct X509StackDeleter {
    void operator()(STACK_OF(X509)* p) const { sk_X509_pop_free(p, X509_free); }
};
using X509StackPtr = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;

struct CrlStackDeleter {
    void operator()(STACK_OF(X509_CRL)* p) const { sk_X509_CRL_pop_free(p, X509_CRL_free); }
};
using CrlStackPtr = std::unique_ptr<STACK_OF(X509_CRL), CrlStackDeleter>;

// --- Field extraction ---

/**
 * @brief RFC 4514 string of a Name, most specific RDN first, UTF-8 kept as is
 * @throws ParsingException if OpenSSL cannot print the name
 */
std::string nameToRfc4514(const X509_NAME* name);

/**
 * @brief DER encoding of a Name
 * @throws ParsingException on encoding failure
 */
domain::Bytes nameToDer(const X509_NAME* name);

/// @brief C= attribute of a Name, nullopt when absent
std::optional<std::string> countryOf(const X509_NAME* name);

/**
 * @brief Serial as lowercase hex with "0x" prefix and no leading zeros
 *
 * 0x1a2b, 0x0 for zero, -0x5 for a negative serial.
 * @throws ParsingException if the integer cannot be converted
 */
std::string serialToHex(const ASN1_INTEGER* serial);

/// @brief Subject Key Identifier as lowercase hex, nullopt when absent
std::optional<std::string> subjectKeyIdentifier(X509* cert);

/// @brief keyIdentifier of the Authority Key Identifier, nullopt when absent
std::optional<std::string> authorityKeyIdentifier(X509* cert);

/**
 * @brief RFC 5280 reason name (e.g. "keyCompromise"), nullopt when the
 * reasonCode extension is absent, unreadable or holds an unassigned code
 */
std::optional<std::string> revocationReason(const X509_REVOKED* revoked);

/// @brief RFC 5280 CRLReason name for a code, nullptr for unassigned values
const char* reasonName(long code);

/**
 * @brief UTCTime/GeneralizedTime to a UTC time point
 * @throws ParsingException on an invalid time
 */
domain::TimePoint asn1TimeToTimePoint(const ASN1_TIME* time);

/**
 * @brief DER encoding of a certificate
 * @throws ParsingException on encoding failure
 */
domain::Bytes certificateToDer(X509* cert);

/**
 * @brief DER encoding of a CRL
 * @throws ParsingException on encoding failure
 */
domain::Bytes crlToDer(X509_CRL* crl);

/// @brief Oldest queued OpenSSL error as text, clears the queue
std::string lastOpenSslError();

} // namespace certsync::adapters::x509

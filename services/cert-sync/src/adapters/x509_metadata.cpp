/**
 * @file x509_metadata.cpp
 * @brief X.509 certificate and CRL field extraction
 */

#include "x509_metadata.h"
#include "exceptions.h"

#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace certsync::adapters::x509 {

using common::ParsingException;

namespace {

std::string toHex(const unsigned char* data, int len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < len; i++) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // anonymous namespace

std::string lastOpenSslError() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "no OpenSSL error queued";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
}

std::string nameToRfc4514(const X509_NAME* name) {
    if (!name) {
        throw ParsingException("missing X.509 name");
    }

    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw ParsingException("failed to allocate BIO");
    }

    // RFC2253 without escaping of bytes >= 0x80 so UTF-8 stays readable
    const unsigned long flags = XN_FLAG_RFC2253 & ~ASN1_STRFLGS_ESC_MSB;
    if (X509_NAME_print_ex(bio.get(), name, 0, flags) < 0) {
        throw ParsingException("failed to print X.509 name: " + lastOpenSslError());
    }

    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    if (len <= 0 || !data) {
        return "";
    }
    return std::string(data, static_cast<size_t>(len));
}

domain::Bytes nameToDer(const X509_NAME* name) {
    unsigned char* buf = nullptr;
    int len = i2d_X509_NAME(name, &buf);
    if (len < 0 || !buf) {
        throw ParsingException("failed to encode X.509 name: " + lastOpenSslError());
    }
    domain::Bytes der(buf, buf + len);
    OPENSSL_free(buf);
    return der;
}

std::optional<std::string> countryOf(const X509_NAME* name) {
    if (!name) {
        return std::nullopt;
    }
    int idx = X509_NAME_get_index_by_NID(name, NID_countryName, -1);
    if (idx < 0) {
        return std::nullopt;
    }
    X509_NAME_ENTRY* entry = X509_NAME_get_entry(name, idx);
    ASN1_STRING* value = entry ? X509_NAME_ENTRY_get_data(entry) : nullptr;
    if (!value) {
        return std::nullopt;
    }

    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, value);
    if (len < 0 || !utf8) {
        return std::nullopt;
    }
    std::string country(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return country;
}

std::string serialToHex(const ASN1_INTEGER* serial) {
    if (!serial) {
        throw ParsingException("missing serial number");
    }

    BIGNUM* bn = ASN1_INTEGER_to_BN(serial, nullptr);
    if (!bn) {
        throw ParsingException("failed to convert serial number: " + lastOpenSslError());
    }
    char* hex = BN_bn2hex(bn);
    BN_free(bn);
    if (!hex) {
        throw ParsingException("failed to format serial number");
    }
    std::string raw(hex);
    OPENSSL_free(hex);

    bool negative = !raw.empty() && raw[0] == '-';
    std::string digits = negative ? raw.substr(1) : raw;

    size_t firstNonZero = digits.find_first_not_of('0');
    digits = (firstNonZero == std::string::npos) ? "0" : digits.substr(firstNonZero);
    for (auto& c : digits) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    return (negative ? "-0x" : "0x") + digits;
}

std::optional<std::string> subjectKeyIdentifier(X509* cert) {
    auto* ski = static_cast<ASN1_OCTET_STRING*>(
        X509_get_ext_d2i(cert, NID_subject_key_identifier, nullptr, nullptr));
    if (!ski) {
        return std::nullopt;
    }
    std::string hex = toHex(ASN1_STRING_get0_data(ski), ASN1_STRING_length(ski));
    ASN1_OCTET_STRING_free(ski);
    return hex;
}

std::optional<std::string> authorityKeyIdentifier(X509* cert) {
    auto* aki = static_cast<AUTHORITY_KEYID*>(
        X509_get_ext_d2i(cert, NID_authority_key_identifier, nullptr, nullptr));
    if (!aki) {
        return std::nullopt;
    }
    std::optional<std::string> result;
    if (aki->keyid) {
        result = toHex(ASN1_STRING_get0_data(aki->keyid), ASN1_STRING_length(aki->keyid));
    }
    AUTHORITY_KEYID_free(aki);
    return result;
}

const char* reasonName(long code) {
    switch (code) {
        case CRL_REASON_UNSPECIFIED:            return "unspecified";
        case CRL_REASON_KEY_COMPROMISE:         return "keyCompromise";
        case CRL_REASON_CA_COMPROMISE:          return "cACompromise";
        case CRL_REASON_AFFILIATION_CHANGED:    return "affiliationChanged";
        case CRL_REASON_SUPERSEDED:             return "superseded";
        case CRL_REASON_CESSATION_OF_OPERATION: return "cessationOfOperation";
        case CRL_REASON_CERTIFICATE_HOLD:       return "certificateHold";
        case CRL_REASON_REMOVE_FROM_CRL:        return "removeFromCRL";
        case CRL_REASON_PRIVILEGE_WITHDRAWN:    return "privilegeWithdrawn";
        case CRL_REASON_AA_COMPROMISE:          return "aACompromise";
        default:                                return nullptr;
    }
}

std::optional<std::string> revocationReason(const X509_REVOKED* revoked) {
    int critical = 0;
    auto* reason = static_cast<ASN1_ENUMERATED*>(
        X509_REVOKED_get_ext_d2i(revoked, NID_crl_reason, &critical, nullptr));
    if (!reason) {
        return std::nullopt;
    }
    long code = ASN1_ENUMERATED_get(reason);
    ASN1_ENUMERATED_free(reason);
    const char* name = reasonName(code);
    if (!name) {
        return std::nullopt;
    }
    return std::string(name);
}

domain::TimePoint asn1TimeToTimePoint(const ASN1_TIME* time) {
    if (!time) {
        throw ParsingException("missing time value");
    }
    struct tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));
    if (ASN1_TIME_to_tm(time, &tmTime) != 1) {
        throw ParsingException("invalid ASN.1 time: " + lastOpenSslError());
    }
    return std::chrono::system_clock::from_time_t(timegm(&tmTime));
}

domain::Bytes certificateToDer(X509* cert) {
    unsigned char* buf = nullptr;
    int len = i2d_X509(cert, &buf);
    if (len < 0 || !buf) {
        throw ParsingException("failed to encode certificate: " + lastOpenSslError());
    }
    domain::Bytes der(buf, buf + len);
    OPENSSL_free(buf);
    return der;
}

domain::Bytes crlToDer(X509_CRL* crl) {
    unsigned char* buf = nullptr;
    int len = i2d_X509_CRL(crl, &buf);
    if (len < 0 || !buf) {
        throw ParsingException("failed to encode CRL: " + lastOpenSslError());
    }
    domain::Bytes der(buf, buf + len);
    OPENSSL_free(buf);
    return der;
}

} // namespace certsync::adapters::x509

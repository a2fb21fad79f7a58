/**
 * @file cms_masterlist_parser.h
 * @brief ICAO Master List (CMS SignedData) parser
 *
 * Pipeline:
 *   raw bytes
 *     -> ContentInfo (must be signedData)
 *     -> eContent: CscaMasterList ::= SEQUENCE { version INTEGER OPTIONAL, certList SET OF Certificate }
 *     -> SignedData.certificates (signer identities)
 *     -> SignedData.crls and their revoked entries
 *     -> MasterListPayload
 *
 * Root CAs are the certList entries followed by the envelope certificates.
 * The signature is not verified.
 */

#pragma once

#include "../domain/ports.h"
#include "x509_metadata.h"

#include <string>
#include <vector>

namespace certsync::adapters {

class CmsMasterListParser : public domain::IMasterListParser {
public:
    explicit CmsMasterListParser(std::string source = domain::kMasterListSource);

    /**
     * @brief Parse a CMS Master List bundle
     * @return Payload, or TECHNICAL_ERROR "Failed to parse CMS Master List binary"
     *         for any undecodable input
     */
    railway::Result<domain::MasterListPayload> parse(const domain::Bytes& raw) override;

private:
    /// @throws ParsingException (or OpenSSL-derived std::exception) on any decoding error
    domain::MasterListPayload doParse(const domain::Bytes& raw) const;

    std::vector<domain::CertificateRecord> extractInnerCertificates(CMS_ContentInfo* cms) const;
    std::vector<domain::CertificateRecord> extractOuterCertificates(CMS_ContentInfo* cms) const;
    void extractCrls(CMS_ContentInfo* cms, domain::MasterListPayload& payload) const;

    /// DER is stored exactly as given; metadata is read from the parsed certificate
    domain::CertificateRecord toCertificateRecord(X509* cert, domain::Bytes der) const;

    std::string source_;
};

} // namespace certsync::adapters

/**
 * @file ports.h
 * @brief Interfaces the sync pipeline depends on
 *
 * Dual-token flow:
 *   1. IAccessTokenProvider  -> OpenID Connect access token (password grant)
 *   2. ISfcTokenProvider     -> service token, requested with the access token
 *   3. IBinaryDownloader     -> Master List bundle, requested with both tokens
 *   4. IMasterListParser     -> records extracted from the bundle
 *   5. ICertificateRepository -> transactional replace of the stored records
 *
 * Every operation reports failures on the Result failure track; none throws.
 */

#pragma once

#include "models.h"

#include <certsync/railway/result.h>

#include <string>

namespace certsync::domain {

class IAccessTokenProvider {
public:
    virtual ~IAccessTokenProvider() = default;
    virtual railway::Result<std::string> acquireToken() = 0;

protected:
    IAccessTokenProvider() = default;
};

class ISfcTokenProvider {
public:
    virtual ~ISfcTokenProvider() = default;
    virtual railway::Result<std::string> acquireToken(const std::string& accessToken) = 0;

protected:
    ISfcTokenProvider() = default;
};

class IBinaryDownloader {
public:
    virtual ~IBinaryDownloader() = default;
    virtual railway::Result<Bytes> download(const AuthCredentials& credentials) = 0;

protected:
    IBinaryDownloader() = default;
};

class IMasterListParser {
public:
    virtual ~IMasterListParser() = default;

    /// Never throws, for any input
    virtual railway::Result<MasterListPayload> parse(const Bytes& raw) = 0;

protected:
    IMasterListParser() = default;
};

class ICertificateRepository {
public:
    virtual ~ICertificateRepository() = default;

    /**
     * @brief Atomically replace all stored records with the payload
     * @return Rows inserted (payload.totalItems()); on failure the previous rows remain
     */
    virtual railway::Result<int> store(const MasterListPayload& payload) = 0;

protected:
    ICertificateRepository() = default;
};

} // namespace certsync::domain

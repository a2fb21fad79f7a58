/**
 * @file certificate_downloader.h
 * @brief Master List bundle download with both tokens
 */
#pragma once

#include "../../domain/ports.h"
#include "http_client.h"
#include "retry_policy.h"

#include <string>

namespace certsync::adapters::http {

class CertificateDownloader : public domain::IBinaryDownloader {
public:
    /// @throws std::invalid_argument if transport is nullptr
    CertificateDownloader(IHttpTransport* transport, std::string url,
                          RetryPolicy retry = RetryPolicy{});

    /**
     * @brief GET the bundle
     *
     * Headers: "Authorization: Bearer <access>", "x-sfc-authorization: Bearer <sfc>".
     * @return Response body bytes, or EXTERNAL_SERVICE_ERROR "Binary download failed"
     */
    railway::Result<domain::Bytes> download(const domain::AuthCredentials& credentials) override;

private:
    domain::Bytes fetch(const domain::AuthCredentials& credentials);

    IHttpTransport* transport_;
    std::string url_;
    RetryPolicy retry_;
};

} // namespace certsync::adapters::http

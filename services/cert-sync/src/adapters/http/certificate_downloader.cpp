/**
 * @file certificate_downloader.cpp
 * @brief Master List bundle download
 */
#include "certificate_downloader.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace certsync::adapters::http {

using domain::AuthCredentials;
using domain::Bytes;
using railway::ErrorCode;
using railway::Result;

CertificateDownloader::CertificateDownloader(IHttpTransport* transport, std::string url, RetryPolicy retry)
    : transport_(transport)
    , url_(std::move(url))
    , retry_(std::move(retry))
{
    if (!transport_) {
        throw std::invalid_argument("CertificateDownloader: transport cannot be nullptr");
    }
}

Result<Bytes> CertificateDownloader::download(const AuthCredentials& credentials) {
    auto result = Result<Bytes>::fromComputation(
        [&]() { return withRetry(retry_, "Master List download", [&]() { return fetch(credentials); }); },
        ErrorCode::EXTERNAL_SERVICE_ERROR,
        "Binary download failed");

    if (result.isFailure()) {
        spdlog::error("[CertificateDownloader] {}: {}",
                      result.unwrapFailure().message(), result.unwrapFailure().causeMessage());
    } else {
        spdlog::info("[CertificateDownloader] Downloaded {} bytes", result.unwrapSuccess().size());
    }
    return result;
}

Bytes CertificateDownloader::fetch(const AuthCredentials& credentials) {
    HttpRequest request;
    request.method = Method::Get;
    request.url = url_;
    request.headers = {
        {"Authorization", "Bearer " + credentials.getAccessToken()},
        {"x-sfc-authorization", "Bearer " + credentials.getSfcToken()},
    };

    HttpResponse response = transport_->send(request);
    raiseForStatus(response.status, "certificate download endpoint");

    return Bytes(response.body.begin(), response.body.end());
}

} // namespace certsync::adapters::http

#include "sync_pipeline.h"

#include <spdlog/spdlog.h>

#include <string>

namespace certsync::services {

using domain::AuthCredentials;
using domain::Bytes;
using domain::MasterListPayload;
using railway::Result;

Result<int> runPipeline(domain::IAccessTokenProvider& accessTokenProvider,
                        domain::ISfcTokenProvider& sfcTokenProvider,
                        domain::IBinaryDownloader& downloader,
                        domain::IMasterListParser& parser,
                        domain::ICertificateRepository& repository) {
    spdlog::info("[SyncPipeline] Starting Master List synchronization");

    auto result = accessTokenProvider.acquireToken()
        .flatMap([&](const std::string& accessToken) {
            return sfcTokenProvider.acquireToken(accessToken)
                .map([&](const std::string& sfcToken) {
                    return AuthCredentials(accessToken, sfcToken);
                });
        })
        .flatMap([&](const AuthCredentials& credentials) { return downloader.download(credentials); })
        .flatMap([&](const Bytes& raw) { return parser.parse(raw); })
        .peek([](const MasterListPayload& payload) {
            spdlog::info("[SyncPipeline] Extracted {} items", payload.totalItems());
        })
        .flatMap([&](const MasterListPayload& payload) { return repository.store(payload); });

    result.peek([](int rows) {
        spdlog::info("[SyncPipeline] Completed: {} rows stored", rows);
    }).peekFailure([](const railway::FailureDescription& failure) {
        spdlog::error("[SyncPipeline] Failed: {}", failure.toString());
    });
    return result;
}

} // namespace certsync::services

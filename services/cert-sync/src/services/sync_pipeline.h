/**
 * @file sync_pipeline.h
 * @brief Master List synchronization pipeline
 *
 *   acquire access token
 *     -> acquire SFC token
 *       -> AuthCredentials
 *         -> download
 *           -> parse
 *             -> store
 *
 * Stages are connected with flatMap: the first Failure skips every later
 * stage and is returned with its classification unchanged.
 */
#pragma once

#include "../domain/ports.h"

#include <certsync/railway/result.h>

namespace certsync::services {

/**
 * @brief Run all stages once
 * @return Rows stored, or the first stage Failure
 */
railway::Result<int> runPipeline(domain::IAccessTokenProvider& accessTokenProvider,
                                 domain::ISfcTokenProvider& sfcTokenProvider,
                                 domain::IBinaryDownloader& downloader,
                                 domain::IMasterListParser& parser,
                                 domain::ICertificateRepository& repository);

/**
 * @brief The pipeline bound to its ports
 *
 * Ports are borrowed; they must outlive the pipeline.
 */
class SyncPipeline {
public:
    SyncPipeline(domain::IAccessTokenProvider& accessTokenProvider,
                 domain::ISfcTokenProvider& sfcTokenProvider,
                 domain::IBinaryDownloader& downloader,
                 domain::IMasterListParser& parser,
                 domain::ICertificateRepository& repository)
        : accessTokenProvider_(accessTokenProvider)
        , sfcTokenProvider_(sfcTokenProvider)
        , downloader_(downloader)
        , parser_(parser)
        , repository_(repository) {}

    railway::Result<int> run() {
        return runPipeline(accessTokenProvider_, sfcTokenProvider_, downloader_, parser_, repository_);
    }

private:
    domain::IAccessTokenProvider& accessTokenProvider_;
    domain::ISfcTokenProvider& sfcTokenProvider_;
    domain::IBinaryDownloader& downloader_;
    domain::IMasterListParser& parser_;
    domain::ICertificateRepository& repository_;
};

} // namespace certsync::services

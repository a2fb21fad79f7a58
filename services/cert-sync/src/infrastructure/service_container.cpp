/**
 * @file service_container.cpp
 * @brief ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"

#include <spdlog/spdlog.h>

// Infrastructure
#include "db_connection_pool.h"
#include "../adapters/http/http_client.h"
#include "../adapters/http/token_providers.h"
#include "../adapters/http/certificate_downloader.h"
#include "../adapters/cms_masterlist_parser.h"

// Repositories
#include "../repositories/certificate_repository.h"

// Services
#include "../services/sync_pipeline.h"

namespace certsync::infrastructure {

struct ServiceContainer::Impl {
    std::shared_ptr<common::IDbConnectionPool> dbPool;
    std::unique_ptr<repositories::CertificateRepository> certificateRepo;

    std::unique_ptr<adapters::http::DrogonHttpClient> httpClient;
    std::unique_ptr<adapters::http::AccessTokenProvider> accessTokenProvider;
    std::unique_ptr<adapters::http::SfcTokenProvider> sfcTokenProvider;
    std::unique_ptr<adapters::http::CertificateDownloader> downloader;
    std::unique_ptr<adapters::CmsMasterListParser> parser;

    std::unique_ptr<services::SyncPipeline> pipeline;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("Initializing cert-sync dependencies...");

    try {
        // Step 1: Database connection pool
        impl_->dbPool = std::make_shared<common::DbConnectionPool>(
            config.database.dsn,
            static_cast<size_t>(config.database.poolMin),
            static_cast<size_t>(config.database.poolMax));
        if (!impl_->dbPool->initialize()) {
            spdlog::critical("Failed to initialize database connection pool");
            return false;
        }
        spdlog::info("Database connection pool initialized (type={})", impl_->dbPool->getDatabaseType());

        // Step 2: Repository
        impl_->certificateRepo = std::make_unique<repositories::CertificateRepository>(
            impl_->dbPool, config.database.schema);

        // Step 3: HTTP adapters share one transport
        impl_->httpClient = std::make_unique<adapters::http::DrogonHttpClient>(config.httpTimeoutSeconds);
        impl_->accessTokenProvider = std::make_unique<adapters::http::AccessTokenProvider>(
            impl_->httpClient.get(), config.auth);
        impl_->sfcTokenProvider = std::make_unique<adapters::http::SfcTokenProvider>(
            impl_->httpClient.get(), config.login);
        impl_->downloader = std::make_unique<adapters::http::CertificateDownloader>(
            impl_->httpClient.get(), config.downloadUrl);

        // Step 4: Parser
        impl_->parser = std::make_unique<adapters::CmsMasterListParser>();

        // Step 5: Pipeline
        impl_->pipeline = std::make_unique<services::SyncPipeline>(
            *impl_->accessTokenProvider, *impl_->sfcTokenProvider,
            *impl_->downloader, *impl_->parser, *impl_->certificateRepo);

        spdlog::info("cert-sync dependencies initialized");
        return true;
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize dependencies: {}", e.what());
        shutdown();
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (!impl_) {
        return;
    }

    // Reverse order of construction
    impl_->pipeline.reset();
    impl_->parser.reset();
    impl_->downloader.reset();
    impl_->sfcTokenProvider.reset();
    impl_->accessTokenProvider.reset();
    impl_->httpClient.reset();
    impl_->certificateRepo.reset();
    if (impl_->dbPool) {
        impl_->dbPool->shutdown();
        impl_->dbPool.reset();
    }
}

common::IDbConnectionPool* ServiceContainer::dbPool() const {
    return impl_->dbPool.get();
}

services::SyncPipeline* ServiceContainer::pipeline() const {
    return impl_->pipeline.get();
}

} // namespace certsync::infrastructure

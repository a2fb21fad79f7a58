/**
 * @file main.cpp
 * @brief cert-sync entry point
 *
 * Loads configuration, wires the pipeline, starts the cron scheduler and
 * serves /health, /ready, /info and /trigger with Drogon.
 */

#include "infrastructure/app_config.h"
#include "infrastructure/cron_expression.h"
#include "infrastructure/service_container.h"
#include "infrastructure/service_state.h"
#include "infrastructure/sync_scheduler.h"
#include "handlers/health_handler.h"
#include "handlers/trigger_handler.h"
#include "services/sync_pipeline.h"
#include "logger.h"

#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

using namespace certsync;

namespace {

constexpr const char* kServiceName = "cert-sync";
constexpr const char* kVersion = "1.0.0";

} // anonymous namespace

int main() {
    infrastructure::AppConfig config;
    try {
        config = infrastructure::AppConfig::loadFromEnv();
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }

    common::Logger::initialize(kServiceName, config.logLevel, !config.logFile.empty(), config.logFile);

    spdlog::info("=================================================");
    spdlog::info("  cert-sync v{}", kVersion);
    spdlog::info("=================================================");
    spdlog::info("Configuration: {}", config.summary());

    infrastructure::ServiceState state;

    // Already validated by AppConfig::load()
    auto cron = infrastructure::CronExpression::parse(config.cron);

    infrastructure::ServiceContainer container;
    if (!container.initialize(config)) {
        spdlog::critical("Service initialization failed");
        common::Logger::flush();
        return 1;
    }
    services::SyncPipeline* pipeline = container.pipeline();

    infrastructure::SyncScheduler scheduler(
        cron, [pipeline]() { return pipeline->run(); }, state, config.runOnStartup);

    handlers::HealthHandler healthHandler(state, kVersion);
    handlers::TriggerHandler triggerHandler([pipeline]() { return pipeline->run(); });

    auto& app = drogon::app();
    healthHandler.registerRoutes(app);
    triggerHandler.registerRoutes(app);

    scheduler.start();

    spdlog::info("Starting HTTP server on port {}...", config.serverPort);
    app.addListener("0.0.0.0", static_cast<uint16_t>(config.serverPort))
        .setThreadNum(2)
        .run();

    spdlog::info("Shutting down...");
    scheduler.stop();
    triggerHandler.shutdown();
    container.shutdown();
    common::Logger::flush();

    return 0;
}

/**
 * @file health_handler.cpp
 * @brief Health check handler implementation
 */

#include "health_handler.h"
#include <spdlog/spdlog.h>

namespace certsync::handlers {

drogon::HttpResponsePtr toHttpResponse(const JsonReply& reply) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(reply.body);
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(reply.status));
    return resp;
}

HealthHandler::HealthHandler(const infrastructure::ServiceState& state, std::string version)
    : state_(state), version_(std::move(version)) {}

JsonReply HealthHandler::health() const {
    JsonReply reply;
    if (auto error = state_.errorMessage()) {
        spdlog::warn("[HealthHandler] Health check failed: {}", *error);
        reply.status = 503;
        reply.body["status"] = "unhealthy";
        reply.body["error"] = *error;
        return reply;
    }

    if (!state_.schedulerRunning()) {
        reply.status = 503;
        reply.body["status"] = "unhealthy";
        reply.body["reason"] = "scheduler thread not running";
        return reply;
    }

    reply.body["status"] = "healthy";
    reply.body["scheduler_running"] = true;
    return reply;
}

JsonReply HealthHandler::ready() const {
    JsonReply reply;
    if (!state_.schedulerReady() || !state_.schedulerStarted()) {
        reply.status = 202;
        reply.body["status"] = "starting";
        reply.body["scheduler_started"] = state_.schedulerStarted();
        return reply;
    }

    if (auto error = state_.errorMessage()) {
        reply.status = 503;
        reply.body["status"] = "error";
        reply.body["error"] = *error;
        return reply;
    }

    reply.body["status"] = "ready";
    reply.body["scheduler_running"] = state_.schedulerRunning();
    return reply;
}

JsonReply HealthHandler::info() const {
    JsonReply reply;
    reply.body["name"] = "cert-sync";
    reply.body["version"] = version_;
    reply.body["scheduler_running"] = state_.schedulerRunning();
    reply.body["scheduler_started"] = state_.schedulerStarted();
    reply.body["scheduler_ready"] = state_.schedulerReady();
    reply.body["has_error"] = state_.hasError();
    return reply;
}

void HealthHandler::registerRoutes(drogon::HttpAppFramework& app) {
    app.registerHandler("/health",
        [this](const drogon::HttpRequestPtr&, std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            callback(toHttpResponse(health()));
        }, {drogon::Get});

    app.registerHandler("/ready",
        [this](const drogon::HttpRequestPtr&, std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            callback(toHttpResponse(ready()));
        }, {drogon::Get});

    app.registerHandler("/info",
        [this](const drogon::HttpRequestPtr&, std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            callback(toHttpResponse(info()));
        }, {drogon::Get});
}

} // namespace certsync::handlers

#pragma once

/**
 * @file health_handler.h
 * @brief Liveness, readiness and info endpoints
 */

#include "../infrastructure/service_state.h"

#include <drogon/drogon.h>
#include <json/json.h>

#include <functional>
#include <string>

namespace certsync::handlers {

/// Status code and JSON body of a reply, independent of the HTTP framework
struct JsonReply {
    int status = 200;
    Json::Value body;
};

drogon::HttpResponsePtr toHttpResponse(const JsonReply& reply);

/**
 * @brief Handler for GET /health, GET /ready and GET /info
 */
class HealthHandler {
public:
    /**
     * @param state Process status (non-owning)
     * @param version Reported by /info
     */
    HealthHandler(const infrastructure::ServiceState& state, std::string version);

    /// 200 healthy, 503 when an error is recorded or the scheduler thread is not running
    JsonReply health() const;

    /// 202 while starting, 503 on error, 200 ready
    JsonReply ready() const;

    JsonReply info() const;

    /** @brief Register the three routes on the Drogon application */
    void registerRoutes(drogon::HttpAppFramework& app);

private:
    const infrastructure::ServiceState& state_;
    std::string version_;
};

} // namespace certsync::handlers

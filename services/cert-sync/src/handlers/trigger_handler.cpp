/**
 * @file trigger_handler.cpp
 * @brief Manual trigger handler implementation
 */

#include "trigger_handler.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace certsync::handlers {

using railway::ErrorCode;
using railway::Result;

TriggerHandler::TriggerHandler(RunFn runFn) : runFn_(std::move(runFn)) {}

TriggerHandler::~TriggerHandler() {
    shutdown();
}

JsonReply TriggerHandler::unavailableReply() {
    JsonReply reply;
    reply.status = 503;
    reply.body["status"] = "unavailable";
    reply.body["reason"] = "Pipeline not initialized";
    return reply;
}

JsonReply TriggerHandler::shuttingDownReply() {
    JsonReply reply;
    reply.status = 503;
    reply.body["status"] = "unavailable";
    reply.body["reason"] = "Service shutting down";
    return reply;
}

JsonReply TriggerHandler::replyFor(const Result<int>& result) {
    JsonReply reply;
    if (result.isSuccess()) {
        reply.body["status"] = "success";
        reply.body["rows_stored"] = result.unwrapSuccess();
        return reply;
    }

    const auto& failure = result.unwrapFailure();
    reply.status = 500;
    reply.body["status"] = "failed";
    reply.body["error_code"] = railway::toString(failure.code());
    reply.body["message"] = failure.message();
    return reply;
}

JsonReply TriggerHandler::runNow() const {
    if (!runFn_) {
        return unavailableReply();
    }

    spdlog::info("[TriggerHandler] Manual pipeline run requested");
    try {
        return replyFor(runFn_());
    } catch (const std::exception& e) {
        spdlog::error("[TriggerHandler] Pipeline raised: {}", e.what());
    } catch (...) {
        spdlog::error("[TriggerHandler] Pipeline raised a non-standard exception");
    }
    return replyFor(Result<int>::failure(ErrorCode::TECHNICAL_ERROR, "Pipeline execution failed"));
}

void TriggerHandler::runAsync(std::function<void(const JsonReply&)> onDone) {
    if (!runFn_) {
        onDone(unavailableReply());
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (shuttingDown_) {
        lock.unlock();
        onDone(shuttingDownReply());
        return;
    }
    reapFinishedLocked();

    // Keep the request thread free for /health and /ready
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread worker([this, done, onDone = std::move(onDone)]() {
        JsonReply reply = runNow();
        if (reply.status == 200) {
            spdlog::info("[TriggerHandler] Completed: rows_stored={}", reply.body["rows_stored"].asInt());
        } else {
            spdlog::error("[TriggerHandler] Failed: {}", reply.body["message"].asString());
        }
        onDone(reply);
        done->store(true);
    });
    workers_.push_back(Worker{std::move(worker), std::move(done)});
}

void TriggerHandler::reapFinishedLocked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void TriggerHandler::shutdown() {
    std::list<Worker> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shuttingDown_ = true;
        pending.swap(workers_);
    }

    if (!pending.empty()) {
        spdlog::info("[TriggerHandler] Waiting for {} manual run(s) to finish", pending.size());
    }
    for (auto& worker : pending) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

size_t TriggerHandler::workerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

void TriggerHandler::handle(const drogon::HttpRequestPtr&,
                            std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    runAsync([callback = std::move(callback)](const JsonReply& reply) {
        callback(toHttpResponse(reply));
    });
}

void TriggerHandler::registerRoutes(drogon::HttpAppFramework& app) {
    app.registerHandler("/trigger",
        [this](const drogon::HttpRequestPtr& req, std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handle(req, std::move(callback));
        }, {drogon::Post});
}

} // namespace certsync::handlers

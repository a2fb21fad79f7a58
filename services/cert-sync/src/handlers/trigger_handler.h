#pragma once

/**
 * @file trigger_handler.h
 * @brief POST /trigger - run the synchronization on demand
 */

#include "health_handler.h"

#include <certsync/railway/result.h>

#include <drogon/drogon.h>

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace certsync::handlers {

class TriggerHandler {
public:
    using RunFn = std::function<railway::Result<int>()>;

    /// @param runFn Pipeline entry; empty while the pipeline is not wired
    explicit TriggerHandler(RunFn runFn);
    ~TriggerHandler();

    TriggerHandler(const TriggerHandler&) = delete;
    TriggerHandler& operator=(const TriggerHandler&) = delete;

    /// 503 "Pipeline not initialized" when no pipeline is wired
    static JsonReply unavailableReply();

    /**
     * @brief 200 {"status":"success","rows_stored":N} or
     *        500 {"status":"failed","error_code":..,"message":..}
     *
     * Only the code and message of a failure are exposed, never its cause.
     */
    static JsonReply replyFor(const railway::Result<int>& result);

    /// 503 once shutdown() has been called
    static JsonReply shuttingDownReply();

    /// Runs the pipeline on the calling thread and builds the reply
    JsonReply runNow() const;

    /**
     * @brief Run the pipeline on a worker thread owned by this handler
     *
     * onDone is invoked from the worker once the run finishes, or
     * immediately when no pipeline is wired or shutdown() was called.
     */
    void runAsync(std::function<void(const JsonReply&)> onDone);

    /**
     * @brief Refuse new runs and join every in-flight worker
     *
     * Must be called before the pipeline is torn down. Idempotent.
     */
    void shutdown();

    /// Workers started and not yet joined
    size_t workerCount() const;

    /// Handle POST /trigger through runAsync()
    void handle(const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reapFinishedLocked();

    RunFn runFn_;
    mutable std::mutex mutex_;
    std::list<Worker> workers_;
    bool shuttingDown_ = false;
};

} // namespace certsync::handlers

#pragma once

/**
 * @file sync_scheduler.h
 * @brief Cron-driven scheduler for the Master List synchronization
 *
 * One background thread waits on a condition variable until the next cron
 * fire time, a manual trigger or stop(). Each job runs inside a
 * LoggingExecutionContext("MasterListSync").
 */

#include "cron_expression.h"
#include "service_state.h"

#include <certsync/railway/result.h>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace certsync::infrastructure {

class SyncScheduler {
public:
    using SyncFn = std::function<railway::Result<int>()>;

    /**
     * @param cron Fire times
     * @param syncFn Job body, normally SyncPipeline::run
     * @param state Flags updated as the thread starts and stops
     * @param runOnStartup Run once as soon as the thread starts
     * @throws std::invalid_argument if syncFn is empty
     */
    SyncScheduler(CronExpression cron, SyncFn syncFn, ServiceState& state, bool runOnStartup = true);

    /// Stops and joins the thread
    ~SyncScheduler();

    SyncScheduler(const SyncScheduler&) = delete;
    SyncScheduler& operator=(const SyncScheduler&) = delete;

    /** @brief Start the scheduler thread (no-op when already running) */
    void start();

    /** @brief Stop the scheduler and join the thread; a running job completes first */
    void stop();

    /** @brief Wake the scheduler to run a job now */
    void triggerNow();

    /// Jobs finished since start, successful or not
    int completedRuns() const { return completedRuns_.load(); }

    const CronExpression& cron() const { return cron_; }

private:
    void loop();
    void runJob(const char* reason);

    CronExpression cron_;
    SyncFn syncFn_;
    ServiceState& state_;
    bool runOnStartup_;

    std::atomic<bool> running_{false};
    std::atomic<int> completedRuns_{0};
    bool forceRun_ = false;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace certsync::infrastructure

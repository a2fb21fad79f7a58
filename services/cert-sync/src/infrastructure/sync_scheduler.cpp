/**
 * @file sync_scheduler.cpp
 * @brief SyncScheduler implementation
 */

#include "sync_scheduler.h"

#include <certsync/railway/execution_context.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

std::string formatLocalTime(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return ss.str();
}

} // anonymous namespace

namespace certsync::infrastructure {

SyncScheduler::SyncScheduler(CronExpression cron, SyncFn syncFn, ServiceState& state, bool runOnStartup)
    : cron_(std::move(cron))
    , syncFn_(std::move(syncFn))
    , state_(state)
    , runOnStartup_(runOnStartup)
{
    if (!syncFn_) {
        throw std::invalid_argument("SyncScheduler: syncFn cannot be empty");
    }
}

SyncScheduler::~SyncScheduler() {
    stop();
}

void SyncScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    state_.setSchedulerStarted(true);
    thread_ = std::thread([this]() { loop(); });
}

void SyncScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        spdlog::info("[SyncScheduler] Stopped after {} run(s)", completedRuns_.load());
    }
}

void SyncScheduler::triggerNow() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forceRun_ = true;
    }
    cv_.notify_all();
}

void SyncScheduler::loop() {
    state_.setSchedulerRunning(true);
    state_.setSchedulerReady(true);
    spdlog::info("[SyncScheduler] Started (cron='{}', run_on_startup={})", cron_.expression(), runOnStartup_);

    if (runOnStartup_ && running_) {
        runJob("startup");
    }

    try {
        while (running_) {
            auto next = cron_.nextAfter(std::chrono::system_clock::now());
            spdlog::info("[SyncScheduler] Next run at {}", formatLocalTime(next));

            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_until(lock, next, [this]() { return !running_ || forceRun_; });
            if (!running_) {
                break;
            }

            bool manual = forceRun_;
            forceRun_ = false;
            lock.unlock();

            if (!manual && std::chrono::system_clock::now() < next) {
                continue;   // woke early (clock adjustment)
            }
            runJob(manual ? "manual" : "scheduled");
        }
    } catch (const std::exception& e) {
        spdlog::error("[SyncScheduler] Scheduler error: {}", e.what());
        state_.setError(std::string("Scheduler error: ") + e.what());
    }

    state_.setSchedulerRunning(false);
}

void SyncScheduler::runJob(const char* reason) {
    spdlog::info("[SyncScheduler] Running Master List sync ({})", reason);

    railway::LoggingExecutionContext<int> context("MasterListSync");
    railway::Result<int> result = context.execute(syncFn_);

    if (result.isSuccess()) {
        spdlog::info("[SyncScheduler] Job completed: rows_stored={}", result.unwrapSuccess());
    } else {
        spdlog::error("[SyncScheduler] Job failed: {}", result.unwrapFailure().toString());
    }
    completedRuns_++;
}

} // namespace certsync::infrastructure

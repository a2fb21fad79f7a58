/**
 * @file service_state.h
 * @brief Process-level status shared by main, the scheduler and the HTTP handlers
 */
#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace certsync::infrastructure {

class ServiceState {
public:
    ServiceState() = default;

    ServiceState(const ServiceState&) = delete;
    ServiceState& operator=(const ServiceState&) = delete;

    /// start() was called on the scheduler
    bool schedulerStarted() const { return schedulerStarted_.load(); }
    void setSchedulerStarted(bool value) { schedulerStarted_.store(value); }

    /// The scheduler thread is up; set before the optional startup run
    bool schedulerReady() const { return schedulerReady_.load(); }
    void setSchedulerReady(bool value) { schedulerReady_.store(value); }

    /// The scheduler thread is alive
    bool schedulerRunning() const { return schedulerRunning_.load(); }
    void setSchedulerRunning(bool value) { schedulerRunning_.store(value); }

    std::optional<std::string> errorMessage() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return errorMessage_;
    }

    void setError(std::string message) {
        std::lock_guard<std::mutex> lock(mutex_);
        errorMessage_ = std::move(message);
    }

    void clearError() {
        std::lock_guard<std::mutex> lock(mutex_);
        errorMessage_.reset();
    }

    bool hasError() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return errorMessage_.has_value();
    }

private:
    std::atomic<bool> schedulerStarted_{false};
    std::atomic<bool> schedulerReady_{false};
    std::atomic<bool> schedulerRunning_{false};

    mutable std::mutex mutex_;
    std::optional<std::string> errorMessage_;
};

} // namespace certsync::infrastructure

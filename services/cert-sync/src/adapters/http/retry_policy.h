/**
 * @file retry_policy.h
 * @brief Bounded retry with exponential backoff for transient faults
 */
#pragma once

#include <certsync/railway/exception_mapping.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <utility>

namespace certsync::adapters::http {

/**
 * @brief Attempt count and backoff schedule
 *
 * Delay before attempt n+1 is initialDelay * multiplier^(n-1), capped at maxDelay.
 */
struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds initialDelay{100};
    double multiplier = 2.0;
    std::chrono::milliseconds maxDelay{30000};

    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    /// Defaults to std::this_thread::sleep_for; tests substitute a recorder
    Sleeper sleeper;

    std::chrono::milliseconds delayBefore(int nextAttempt) const {
        double delay = static_cast<double>(initialDelay.count());
        for (int i = 2; i < nextAttempt; i++) {
            delay *= multiplier;
        }
        auto ms = std::chrono::milliseconds(static_cast<long long>(delay));
        return std::min(ms, maxDelay);
    }

    void sleep(std::chrono::milliseconds delay) const {
        if (sleeper) {
            sleeper(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
};

/**
 * @brief Run an operation, retrying only timeout-like and connectivity-like exceptions
 *
 * Non-transient exceptions and the last transient one are rethrown unchanged.
 */
template <typename F>
auto withRetry(const RetryPolicy& policy, const std::string& operation, F&& fn) -> decltype(fn()) {
    for (int attempt = 1;; attempt++) {
        try {
            return fn();
        } catch (const std::exception& e) {
            auto category = railway::classifyException(std::current_exception());
            if (!railway::isTransient(category) || attempt >= policy.maxAttempts) {
                throw;
            }
            auto delay = policy.delayBefore(attempt + 1);
            spdlog::warn("[Retry] {} attempt {}/{} failed ({}): {}; retrying in {}ms",
                         operation, attempt, policy.maxAttempts,
                         railway::toString(category), e.what(), delay.count());
            policy.sleep(delay);
        }
    }
}

} // namespace certsync::adapters::http

/**
 * @file failure.h
 * @brief FailureDescription - the payload of the failure track
 */

#pragma once

#include <certsync/railway/error_code.h>

#include <chrono>
#include <exception>
#include <ostream>
#include <string>

namespace certsync::railway {

/**
 * @brief Immutable description of a failed step
 *
 * Carries the classification, a human-readable message, the optional
 * causing exception and the creation time. Two descriptions compare
 * equal when code and message match; cause and timestamp are ignored.
 */
class FailureDescription {
public:
    using Clock = std::chrono::system_clock;

    /**
     * @brief Create a failure description
     * @param code Classification
     * @param message Human-readable message (must not be empty)
     * @param cause Causing exception, may be null
     * @throws std::invalid_argument if message is empty
     */
    FailureDescription(ErrorCode code, std::string message,
                       std::exception_ptr cause = nullptr);

    static FailureDescription create(ErrorCode code, std::string message,
                                     std::exception_ptr cause = nullptr) {
        return FailureDescription(code, std::move(message), std::move(cause));
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::exception_ptr& cause() const { return cause_; }
    bool hasCause() const { return static_cast<bool>(cause_); }

    /// @brief what() of the cause, empty when there is none
    const std::string& causeMessage() const { return causeMessage_; }

    Clock::time_point timestamp() const { return timestamp_; }

    /// @brief "[CODE] message" plus " (cause: ...)" when a cause is attached
    std::string toString() const;

    /// @brief Rethrow the cause; no-op when there is none
    void rethrowCause() const;

    bool operator==(const FailureDescription& other) const {
        return code_ == other.code_ && message_ == other.message_;
    }
    bool operator!=(const FailureDescription& other) const { return !(*this == other); }

private:
    ErrorCode code_;
    std::string message_;
    std::exception_ptr cause_;
    std::string causeMessage_;
    Clock::time_point timestamp_;
};

/// @brief what() of an exception_ptr, "unknown exception" for non-std types
std::string describeException(const std::exception_ptr& ex);

std::ostream& operator<<(std::ostream& os, const FailureDescription& failure);

} // namespace certsync::railway

/**
 * @file failure.cpp
 * @brief FailureDescription implementation
 */

#include <certsync/railway/failure.h>

#include <stdexcept>

namespace certsync::railway {

std::string describeException(const std::exception_ptr& ex) {
    if (!ex) {
        return "";
    }
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

FailureDescription::FailureDescription(ErrorCode code, std::string message,
                                       std::exception_ptr cause)
    : code_(code)
    , message_(std::move(message))
    , cause_(std::move(cause))
    , timestamp_(Clock::now())
{
    if (message_.empty()) {
        throw std::invalid_argument("FailureDescription: message cannot be empty");
    }
    causeMessage_ = describeException(cause_);
}

std::string FailureDescription::toString() const {
    std::string out = "[" + railway::toString(code_) + "] " + message_;
    if (!causeMessage_.empty()) {
        out += " (cause: " + causeMessage_ + ")";
    }
    return out;
}

void FailureDescription::rethrowCause() const {
    if (cause_) {
        std::rethrow_exception(cause_);
    }
}

std::ostream& operator<<(std::ostream& os, const FailureDescription& failure) {
    return os << failure.toString();
}

} // namespace certsync::railway

/**
 * @file result_failures.h
 * @brief Shorthand factories for common failures
 *
 * Each factory returns a FailureDescription, which converts implicitly to
 * any Result<T>:
 *
 * @code
 *   Result<int> store(...) {
 *       if (!pool) return ResultFailures::configurationError("pool not set");
 *       ...
 *   }
 * @endcode
 */

#pragma once

#include <certsync/railway/exception_mapping.h>
#include <certsync/railway/failure.h>

#include <string>

namespace certsync::railway {

struct ResultFailures {
    static FailureDescription validationError(const std::string& message) {
        return FailureDescription(ErrorCode::VALIDATION_ERROR, message);
    }

    static FailureDescription businessRuleError(const std::string& message) {
        return FailureDescription(ErrorCode::BUSINESS_RULE_ERROR, message);
    }

    static FailureDescription notFound(const std::string& resourceType, const std::string& identifier) {
        return FailureDescription(ErrorCode::NOT_FOUND, resourceType + " not found: " + identifier);
    }

    static FailureDescription authenticationError(const std::string& message) {
        return FailureDescription(ErrorCode::AUTHENTICATION_ERROR, message);
    }

    static FailureDescription authorizationError(const std::string& message) {
        return FailureDescription(ErrorCode::AUTHORIZATION_ERROR, message);
    }

    static FailureDescription databaseError(const std::string& message,
                                            std::exception_ptr cause = nullptr) {
        return FailureDescription(ErrorCode::DATABASE_ERROR, message, std::move(cause));
    }

    static FailureDescription technicalError(const std::string& message,
                                             std::exception_ptr cause = nullptr) {
        return FailureDescription(ErrorCode::TECHNICAL_ERROR, message, std::move(cause));
    }

    static FailureDescription externalServiceError(const std::string& message,
                                                   std::exception_ptr cause = nullptr) {
        return FailureDescription(ErrorCode::EXTERNAL_SERVICE_ERROR, message, std::move(cause));
    }

    static FailureDescription timeoutError(const std::string& message) {
        return FailureDescription(ErrorCode::TIMEOUT_ERROR, message);
    }

    static FailureDescription configurationError(const std::string& message) {
        return FailureDescription(ErrorCode::CONFIGURATION_ERROR, message);
    }

    /// @brief Classify the exception with classifyException() and keep the given message
    static FailureDescription fromException(const std::string& message, std::exception_ptr ex) {
        ErrorCode code = errorCodeFor(classifyException(ex));
        return FailureDescription(code, message, std::move(ex));
    }

    /// @brief Classify the exception and use its own what() as message
    static FailureDescription fromExceptionAuto(std::exception_ptr ex) {
        ErrorCode code = errorCodeFor(classifyException(ex));
        std::string message = describeException(ex);
        if (message.empty()) {
            message = "unknown exception";
        }
        return FailureDescription(code, message, std::move(ex));
    }
};

} // namespace certsync::railway

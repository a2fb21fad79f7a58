/**
 * @file error_code.h
 * @brief Closed failure classification shared by every Result
 *
 * Client-class codes describe a problem with the request or the caller's
 * credentials, server-class codes a problem on our side or upstream.
 */

#pragma once

#include <string>

namespace certsync::railway {

/// @brief Failure classification
enum class ErrorCode {
    // Client errors
    VALIDATION_ERROR,
    AUTHENTICATION_ERROR,
    AUTHORIZATION_ERROR,
    NOT_FOUND,
    BUSINESS_RULE_ERROR,
    RATE_LIMIT_ERROR,
    // Server errors
    TECHNICAL_ERROR,
    DATABASE_ERROR,
    CONFIGURATION_ERROR,
    EXTERNAL_SERVICE_ERROR,
    SERVICE_UNAVAILABLE_ERROR,
    TIMEOUT_ERROR,
    UNKNOWN_ERROR
};

/// @brief Enum name, e.g. "DATABASE_ERROR"
std::string toString(ErrorCode code);

/// @brief True for the client-class codes
bool isClientError(ErrorCode code);

/**
 * @brief HTTP status reported for a failure of this classification
 *
 * 4xx for client-class codes, 5xx for server-class codes
 * (502 external service, 503 unavailable, 504 timeout, 500 otherwise).
 */
int httpStatusFor(ErrorCode code);

} // namespace certsync::railway

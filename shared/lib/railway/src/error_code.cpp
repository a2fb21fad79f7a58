/**
 * @file error_code.cpp
 * @brief ErrorCode names and HTTP status mapping
 */

#include <certsync/railway/error_code.h>

namespace certsync::railway {

std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION_ERROR:          return "VALIDATION_ERROR";
        case ErrorCode::AUTHENTICATION_ERROR:      return "AUTHENTICATION_ERROR";
        case ErrorCode::AUTHORIZATION_ERROR:       return "AUTHORIZATION_ERROR";
        case ErrorCode::NOT_FOUND:                 return "NOT_FOUND";
        case ErrorCode::BUSINESS_RULE_ERROR:       return "BUSINESS_RULE_ERROR";
        case ErrorCode::RATE_LIMIT_ERROR:          return "RATE_LIMIT_ERROR";
        case ErrorCode::TECHNICAL_ERROR:           return "TECHNICAL_ERROR";
        case ErrorCode::DATABASE_ERROR:            return "DATABASE_ERROR";
        case ErrorCode::CONFIGURATION_ERROR:       return "CONFIGURATION_ERROR";
        case ErrorCode::EXTERNAL_SERVICE_ERROR:    return "EXTERNAL_SERVICE_ERROR";
        case ErrorCode::SERVICE_UNAVAILABLE_ERROR: return "SERVICE_UNAVAILABLE_ERROR";
        case ErrorCode::TIMEOUT_ERROR:             return "TIMEOUT_ERROR";
        case ErrorCode::UNKNOWN_ERROR:             return "UNKNOWN_ERROR";
    }
    return "UNKNOWN_ERROR";
}

bool isClientError(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION_ERROR:
        case ErrorCode::AUTHENTICATION_ERROR:
        case ErrorCode::AUTHORIZATION_ERROR:
        case ErrorCode::NOT_FOUND:
        case ErrorCode::BUSINESS_RULE_ERROR:
        case ErrorCode::RATE_LIMIT_ERROR:
            return true;
        default:
            return false;
    }
}

int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION_ERROR:          return 400;
        case ErrorCode::AUTHENTICATION_ERROR:      return 401;
        case ErrorCode::AUTHORIZATION_ERROR:       return 403;
        case ErrorCode::NOT_FOUND:                 return 404;
        case ErrorCode::BUSINESS_RULE_ERROR:       return 409;
        case ErrorCode::RATE_LIMIT_ERROR:          return 429;
        case ErrorCode::EXTERNAL_SERVICE_ERROR:    return 502;
        case ErrorCode::SERVICE_UNAVAILABLE_ERROR: return 503;
        case ErrorCode::TIMEOUT_ERROR:             return 504;
        default:                                   return 500;
    }
}

} // namespace certsync::railway

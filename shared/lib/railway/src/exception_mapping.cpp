/**
 * @file exception_mapping.cpp
 * @brief Ordered exception classification
 */

#include <certsync/railway/exception_mapping.h>
#include "exceptions.h"

#include <initializer_list>
#include <stdexcept>
#include <system_error>

namespace certsync::railway {

namespace {

bool matchesAny(const std::error_code& ec, std::initializer_list<std::errc> conditions) {
    for (std::errc c : conditions) {
        if (ec == std::make_error_condition(c)) {
            return true;
        }
    }
    return false;
}

bool isValidationLike(const std::exception& e) {
    return dynamic_cast<const common::ValidationException*>(&e) ||
           dynamic_cast<const std::invalid_argument*>(&e) ||
           dynamic_cast<const std::domain_error*>(&e) ||
           dynamic_cast<const std::length_error*>(&e);
}

bool isNotFoundLike(const std::exception& e) {
    return dynamic_cast<const common::NotFoundException*>(&e) ||
           dynamic_cast<const std::out_of_range*>(&e);
}

bool isPermissionLike(const std::exception& e) {
    if (dynamic_cast<const common::PermissionException*>(&e)) {
        return true;
    }
    if (auto* se = dynamic_cast<const std::system_error*>(&e)) {
        return matchesAny(se->code(), {std::errc::permission_denied,
                                       std::errc::operation_not_permitted});
    }
    return false;
}

bool isTimeoutLike(const std::exception& e) {
    if (dynamic_cast<const common::TimeoutException*>(&e)) {
        return true;
    }
    if (auto* se = dynamic_cast<const std::system_error*>(&e)) {
        return matchesAny(se->code(), {std::errc::timed_out});
    }
    return false;
}

bool isConnectivityLike(const std::exception& e) {
    if (dynamic_cast<const common::ConnectionException*>(&e)) {
        return true;
    }
    if (auto* se = dynamic_cast<const std::system_error*>(&e)) {
        return matchesAny(se->code(), {std::errc::connection_refused,
                                       std::errc::connection_reset,
                                       std::errc::connection_aborted,
                                       std::errc::network_unreachable,
                                       std::errc::host_unreachable,
                                       std::errc::network_down});
    }
    return false;
}

} // anonymous namespace

FaultCategory classifyException(const std::exception_ptr& ex) {
    if (!ex) {
        return FaultCategory::Unknown;
    }
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        if (isValidationLike(e))   return FaultCategory::Validation;
        if (isNotFoundLike(e))     return FaultCategory::NotFound;
        if (isPermissionLike(e))   return FaultCategory::Permission;
        if (isTimeoutLike(e))      return FaultCategory::Timeout;
        if (isConnectivityLike(e)) return FaultCategory::Connectivity;
        return FaultCategory::Unknown;
    } catch (...) {
        return FaultCategory::Unknown;
    }
}

ErrorCode errorCodeFor(FaultCategory category) {
    switch (category) {
        case FaultCategory::Validation:   return ErrorCode::VALIDATION_ERROR;
        case FaultCategory::NotFound:     return ErrorCode::NOT_FOUND;
        case FaultCategory::Permission:   return ErrorCode::AUTHORIZATION_ERROR;
        case FaultCategory::Timeout:      return ErrorCode::TIMEOUT_ERROR;
        case FaultCategory::Connectivity: return ErrorCode::EXTERNAL_SERVICE_ERROR;
        case FaultCategory::Unknown:      return ErrorCode::UNKNOWN_ERROR;
    }
    return ErrorCode::UNKNOWN_ERROR;
}

bool isTransient(FaultCategory category) {
    return category == FaultCategory::Timeout || category == FaultCategory::Connectivity;
}

const char* toString(FaultCategory category) {
    switch (category) {
        case FaultCategory::Validation:   return "validation";
        case FaultCategory::NotFound:     return "not_found";
        case FaultCategory::Permission:   return "permission";
        case FaultCategory::Timeout:      return "timeout";
        case FaultCategory::Connectivity: return "connectivity";
        case FaultCategory::Unknown:      return "unknown";
    }
    return "unknown";
}

} // namespace certsync::railway

/**
 * @file exception_mapping.h
 * @brief Exception classification for adapter boundaries
 *
 * Exceptions are sorted into a closed list of fault categories, checked
 * in a fixed priority order:
 *
 *   validation -> not found -> permission -> timeout -> connectivity -> unknown
 *
 * The first matching category wins.
 */

#pragma once

#include <certsync/railway/error_code.h>

#include <exception>

namespace certsync::railway {

/// @brief Fault category, in priority order
enum class FaultCategory {
    Validation,
    NotFound,
    Permission,
    Timeout,
    Connectivity,
    Unknown
};

/**
 * @brief Classify an exception
 *
 * - Validation: ValidationException, std::invalid_argument, std::domain_error, std::length_error
 * - NotFound: NotFoundException, std::out_of_range
 * - Permission: PermissionException, std::system_error (permission_denied, operation_not_permitted)
 * - Timeout: TimeoutException, std::system_error (timed_out)
 * - Connectivity: ConnectionException, std::system_error (connection_refused,
 *   connection_reset, connection_aborted, network_unreachable, host_unreachable, network_down)
 * - Unknown: anything else, including a null pointer
 */
FaultCategory classifyException(const std::exception_ptr& ex);

/// @brief VALIDATION_ERROR, NOT_FOUND, AUTHORIZATION_ERROR, TIMEOUT_ERROR, EXTERNAL_SERVICE_ERROR, UNKNOWN_ERROR
ErrorCode errorCodeFor(FaultCategory category);

/// @brief Timeout-like and connectivity-like faults are worth retrying
bool isTransient(FaultCategory category);

const char* toString(FaultCategory category);

} // namespace certsync::railway

/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exception types thrown inside adapters. They never cross an adapter
 * boundary: Result::fromComputation() and classifyException() turn them
 * into classified failures.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace certsync::common {

/**
 * @brief Base exception for all certsync exceptions
 */
class CertSyncException : public std::runtime_error {
public:
    explicit CertSyncException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Input rejected (bad argument, malformed response, HTTP 4xx)
 */
class ValidationException : public CertSyncException {
public:
    explicit ValidationException(const std::string& message)
        : CertSyncException("Validation error: " + message) {}
};

/**
 * @brief Requested resource does not exist
 */
class NotFoundException : public CertSyncException {
public:
    explicit NotFoundException(const std::string& message)
        : CertSyncException("Not found: " + message) {}
};

/**
 * @brief Access refused by the remote side (HTTP 403)
 */
class PermissionException : public CertSyncException {
public:
    explicit PermissionException(const std::string& message)
        : CertSyncException("Permission denied: " + message) {}
};

/**
 * @brief Operation did not complete in time
 */
class TimeoutException : public CertSyncException {
public:
    explicit TimeoutException(const std::string& message)
        : CertSyncException("Timeout: " + message) {}
};

/**
 * @brief Network or connectivity fault (refused, reset, 5xx)
 */
class ConnectionException : public CertSyncException {
public:
    explicit ConnectionException(const std::string& message)
        : CertSyncException("Connection error: " + message) {}
};

/**
 * @brief Credentials rejected (HTTP 401)
 */
class AuthenticationException : public CertSyncException {
public:
    explicit AuthenticationException(const std::string& message)
        : CertSyncException("Authentication error: " + message) {}
};

/**
 * @brief Database operation failed
 */
class DatabaseException : public CertSyncException {
public:
    explicit DatabaseException(const std::string& message)
        : CertSyncException("Database error: " + message) {}
};

/**
 * @brief Binary structure could not be decoded (CMS, X.509, CRL)
 */
class ParsingException : public CertSyncException {
public:
    explicit ParsingException(const std::string& message)
        : CertSyncException("Parsing error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public CertSyncException {
public:
    explicit ConfigException(const std::string& message)
        : CertSyncException("Configuration error: " + message) {}
};

} // namespace certsync::common

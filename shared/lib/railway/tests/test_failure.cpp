/**
 * @file test_failure.cpp
 * @brief Unit tests for ErrorCode, FailureDescription, ResultFailures and exception classification
 */

#include <gtest/gtest.h>
#include <certsync/railway/error_code.h>
#include <certsync/railway/exception_mapping.h>
#include <certsync/railway/failure.h>
#include <certsync/railway/result.h>
#include <certsync/railway/result_failures.h>
#include "exceptions.h"

#include <stdexcept>
#include <system_error>

using namespace certsync::railway;
namespace common = certsync::common;

namespace {

template <typename E>
std::exception_ptr make(const E& e) {
    return std::make_exception_ptr(e);
}

} // anonymous namespace

// ============================================================================
// ErrorCode
// ============================================================================

TEST(ErrorCodeTest, Names) {
    EXPECT_EQ(toString(ErrorCode::TECHNICAL_ERROR), "TECHNICAL_ERROR");
    EXPECT_EQ(toString(ErrorCode::EXTERNAL_SERVICE_ERROR), "EXTERNAL_SERVICE_ERROR");
    EXPECT_EQ(toString(ErrorCode::NOT_FOUND), "NOT_FOUND");
}

TEST(ErrorCodeTest, ClientAndServerClasses) {
    EXPECT_TRUE(isClientError(ErrorCode::VALIDATION_ERROR));
    EXPECT_TRUE(isClientError(ErrorCode::RATE_LIMIT_ERROR));
    EXPECT_FALSE(isClientError(ErrorCode::DATABASE_ERROR));
    EXPECT_FALSE(isClientError(ErrorCode::TIMEOUT_ERROR));
}

TEST(ErrorCodeTest, HttpStatus) {
    EXPECT_EQ(httpStatusFor(ErrorCode::VALIDATION_ERROR), 400);
    EXPECT_EQ(httpStatusFor(ErrorCode::AUTHENTICATION_ERROR), 401);
    EXPECT_EQ(httpStatusFor(ErrorCode::AUTHORIZATION_ERROR), 403);
    EXPECT_EQ(httpStatusFor(ErrorCode::NOT_FOUND), 404);
    EXPECT_EQ(httpStatusFor(ErrorCode::BUSINESS_RULE_ERROR), 409);
    EXPECT_EQ(httpStatusFor(ErrorCode::RATE_LIMIT_ERROR), 429);
    EXPECT_EQ(httpStatusFor(ErrorCode::DATABASE_ERROR), 500);
    EXPECT_EQ(httpStatusFor(ErrorCode::EXTERNAL_SERVICE_ERROR), 502);
    EXPECT_EQ(httpStatusFor(ErrorCode::SERVICE_UNAVAILABLE_ERROR), 503);
    EXPECT_EQ(httpStatusFor(ErrorCode::TIMEOUT_ERROR), 504);
    EXPECT_EQ(httpStatusFor(ErrorCode::UNKNOWN_ERROR), 500);
}

// ============================================================================
// FailureDescription
// ============================================================================

TEST(FailureDescriptionTest, EqualityIgnoresCauseAndTimestamp) {
    FailureDescription a(ErrorCode::DATABASE_ERROR, "down");
    FailureDescription b(ErrorCode::DATABASE_ERROR, "down", make(std::runtime_error("x")));
    EXPECT_EQ(a, b);
    EXPECT_NE(a, FailureDescription(ErrorCode::DATABASE_ERROR, "other"));
    EXPECT_NE(a, FailureDescription(ErrorCode::TECHNICAL_ERROR, "down"));
}

TEST(FailureDescriptionTest, ToStringIncludesCause) {
    FailureDescription f(ErrorCode::TECHNICAL_ERROR, "parse failed", make(std::runtime_error("truncated")));
    EXPECT_EQ(f.toString(), "[TECHNICAL_ERROR] parse failed (cause: truncated)");

    FailureDescription plain(ErrorCode::NOT_FOUND, "gone");
    EXPECT_EQ(plain.toString(), "[NOT_FOUND] gone");
    EXPECT_FALSE(plain.hasCause());
}

TEST(FailureDescriptionTest, EmptyMessageRejected) {
    EXPECT_THROW(FailureDescription(ErrorCode::UNKNOWN_ERROR, ""), std::invalid_argument);
}

TEST(FailureDescriptionTest, TimestampIsSet) {
    auto before = FailureDescription::Clock::now();
    FailureDescription f = FailureDescription::create(ErrorCode::TIMEOUT_ERROR, "slow");
    EXPECT_GE(f.timestamp(), before);
    EXPECT_LE(f.timestamp(), FailureDescription::Clock::now());
}

// ============================================================================
// Exception classification
// ============================================================================

TEST(ExceptionMappingTest, ValidationLike) {
    EXPECT_EQ(classifyException(make(std::invalid_argument("x"))), FaultCategory::Validation);
    EXPECT_EQ(classifyException(make(std::domain_error("x"))), FaultCategory::Validation);
    EXPECT_EQ(classifyException(make(common::ValidationException("x"))), FaultCategory::Validation);
}

TEST(ExceptionMappingTest, NotFoundLike) {
    EXPECT_EQ(classifyException(make(std::out_of_range("x"))), FaultCategory::NotFound);
    EXPECT_EQ(classifyException(make(common::NotFoundException("x"))), FaultCategory::NotFound);
}

TEST(ExceptionMappingTest, PermissionLike) {
    EXPECT_EQ(classifyException(make(common::PermissionException("x"))), FaultCategory::Permission);
    EXPECT_EQ(classifyException(make(std::system_error(
                  std::make_error_code(std::errc::permission_denied)))),
              FaultCategory::Permission);
}

TEST(ExceptionMappingTest, TimeoutLike) {
    EXPECT_EQ(classifyException(make(common::TimeoutException("x"))), FaultCategory::Timeout);
    EXPECT_EQ(classifyException(make(std::system_error(
                  std::make_error_code(std::errc::timed_out)))),
              FaultCategory::Timeout);
}

TEST(ExceptionMappingTest, ConnectivityLike) {
    EXPECT_EQ(classifyException(make(common::ConnectionException("x"))), FaultCategory::Connectivity);
    EXPECT_EQ(classifyException(make(std::system_error(
                  std::make_error_code(std::errc::connection_refused)))),
              FaultCategory::Connectivity);
}

TEST(ExceptionMappingTest, EverythingElseUnknown) {
    EXPECT_EQ(classifyException(make(std::runtime_error("x"))), FaultCategory::Unknown);
    EXPECT_EQ(classifyException(make(common::DatabaseException("x"))), FaultCategory::Unknown);
    EXPECT_EQ(classifyException(std::make_exception_ptr(42)), FaultCategory::Unknown);
    EXPECT_EQ(classifyException(nullptr), FaultCategory::Unknown);
}

TEST(ExceptionMappingTest, CategoryToCode) {
    EXPECT_EQ(errorCodeFor(FaultCategory::Validation), ErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(errorCodeFor(FaultCategory::NotFound), ErrorCode::NOT_FOUND);
    EXPECT_EQ(errorCodeFor(FaultCategory::Permission), ErrorCode::AUTHORIZATION_ERROR);
    EXPECT_EQ(errorCodeFor(FaultCategory::Timeout), ErrorCode::TIMEOUT_ERROR);
    EXPECT_EQ(errorCodeFor(FaultCategory::Connectivity), ErrorCode::EXTERNAL_SERVICE_ERROR);
    EXPECT_EQ(errorCodeFor(FaultCategory::Unknown), ErrorCode::UNKNOWN_ERROR);
}

TEST(ExceptionMappingTest, OnlyTimeoutAndConnectivityAreTransient) {
    EXPECT_TRUE(isTransient(FaultCategory::Timeout));
    EXPECT_TRUE(isTransient(FaultCategory::Connectivity));
    EXPECT_FALSE(isTransient(FaultCategory::Validation));
    EXPECT_FALSE(isTransient(FaultCategory::Permission));
    EXPECT_FALSE(isTransient(FaultCategory::Unknown));
}

// ============================================================================
// ResultFailures
// ============================================================================

TEST(ResultFailuresTest, Factories) {
    Result<int> r = ResultFailures::notFound("Certificate", "abc");
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(r.unwrapFailure().message(), "Certificate not found: abc");

    EXPECT_EQ(ResultFailures::authenticationError("x").code(), ErrorCode::AUTHENTICATION_ERROR);
    EXPECT_EQ(ResultFailures::configurationError("x").code(), ErrorCode::CONFIGURATION_ERROR);
    EXPECT_EQ(ResultFailures::externalServiceError("x").code(), ErrorCode::EXTERNAL_SERVICE_ERROR);
}

TEST(ResultFailuresTest, FromExceptionClassifies) {
    auto f = ResultFailures::fromException("download failed",
                                           make(common::TimeoutException("read timed out")));
    EXPECT_EQ(f.code(), ErrorCode::TIMEOUT_ERROR);
    EXPECT_EQ(f.message(), "download failed");
}

TEST(ResultFailuresTest, FromExceptionAutoUsesWhat) {
    auto f = ResultFailures::fromExceptionAuto(make(std::invalid_argument("bad cron")));
    EXPECT_EQ(f.code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(f.message(), "bad cron");
}

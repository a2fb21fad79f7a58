/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T> and its combinators
 */

#include <gtest/gtest.h>
#include <certsync/railway/result.h>
#include <certsync/railway/result_failures.h>

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace certsync::railway;

namespace {

Result<int> parsePositive(const std::string& s) {
    return Result<int>::fromComputation([&] { return std::stoi(s); },
                                        ErrorCode::VALIDATION_ERROR, "not a number")
        .ensure([](int v) { return v > 0; }, ErrorCode::VALIDATION_ERROR, "must be positive");
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TEST(ResultTest, Success_HoldsValue) {
    auto r = Result<int>::success(42);
    EXPECT_TRUE(r.isSuccess());
    EXPECT_FALSE(r.isFailure());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.unwrapSuccess(), 42);
}

TEST(ResultTest, Failure_HoldsDescription) {
    auto r = Result<int>::failure(ErrorCode::NOT_FOUND, "missing");
    EXPECT_TRUE(r.isFailure());
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(r.unwrapFailure().message(), "missing");
}

TEST(ResultTest, Success_NullPointerRejected) {
    EXPECT_THROW(Result<int*>::success(nullptr), std::invalid_argument);
    EXPECT_THROW(Result<std::shared_ptr<int>>::success(nullptr), std::invalid_argument);
    EXPECT_THROW(Result<std::optional<int>>::success(std::nullopt), std::invalid_argument);
}

TEST(ResultTest, Success_NonNullPointerAccepted) {
    auto value = std::make_shared<int>(7);
    auto r = Result<std::shared_ptr<int>>::success(value);
    EXPECT_EQ(*r.unwrapSuccess(), 7);
}

TEST(ResultTest, Failure_EmptyMessageRejected) {
    EXPECT_THROW(Result<int>::failure(ErrorCode::TECHNICAL_ERROR, ""), std::invalid_argument);
}

TEST(ResultTest, ImplicitFromFailureDescription) {
    Result<std::string> r = ResultFailures::databaseError("down");
    EXPECT_TRUE(r.isFailure());
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::DATABASE_ERROR);
}

// ============================================================================
// Wrong-track access
// ============================================================================

TEST(ResultTest, UnwrapSuccessOnFailure_Throws) {
    auto r = Result<int>::failure(ErrorCode::VALIDATION_ERROR, "bad");
    EXPECT_THROW(r.unwrapSuccess(), BadResultAccess);
}

TEST(ResultTest, UnwrapFailureOnSuccess_Throws) {
    auto r = Result<int>::success(1);
    EXPECT_THROW(r.unwrapFailure(), BadResultAccess);
}

TEST(ResultTest, BadResultAccess_IsLogicError) {
    auto r = Result<int>::success(1);
    EXPECT_THROW(r.unwrapFailure(), std::logic_error);
}

// ============================================================================
// map / flatMap
// ============================================================================

TEST(ResultTest, Map_TransformsSuccess) {
    auto r = Result<int>::success(20).map([](int v) { return v + 1; });
    EXPECT_EQ(r.unwrapSuccess(), 21);
}

TEST(ResultTest, Map_ChangesType) {
    auto r = Result<int>::success(5).map([](int v) { return std::to_string(v); });
    EXPECT_EQ(r.unwrapSuccess(), "5");
}

TEST(ResultTest, Map_PassesFailureThrough) {
    int calls = 0;
    auto r = Result<int>::failure(ErrorCode::DATABASE_ERROR, "db")
        .map([&](int v) { ++calls; return v; });
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::DATABASE_ERROR);
    EXPECT_EQ(r.unwrapFailure().message(), "db");
}

TEST(ResultTest, Map_MoveOnlyValue) {
    auto r = Result<std::unique_ptr<int>>::success(std::make_unique<int>(3))
        .map([](std::unique_ptr<int>&& p) { return *p * 2; });
    EXPECT_EQ(r.unwrapSuccess(), 6);
}

TEST(ResultTest, FlatMap_Chains) {
    auto r = Result<std::string>::success("12").flatMap(parsePositive);
    EXPECT_EQ(r.unwrapSuccess(), 12);
}

TEST(ResultTest, FlatMap_ShortCircuitsOnFailure) {
    int calls = 0;
    auto r = Result<std::string>::failure(ErrorCode::AUTHENTICATION_ERROR, "no token")
        .flatMap([&](const std::string& s) { ++calls; return parsePositive(s); });
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::AUTHENTICATION_ERROR);
}

TEST(ResultTest, FlatMap_PropagatesInnerFailure) {
    auto r = Result<std::string>::success("-3").flatMap(parsePositive);
    EXPECT_EQ(r.unwrapFailure().message(), "must be positive");
}

TEST(ResultTest, FlatMap_FirstFailureWinsAcrossChain) {
    int thirdCalls = 0;
    auto r = Result<int>::success(1)
        .flatMap([](int) { return Result<int>::failure(ErrorCode::TIMEOUT_ERROR, "slow"); })
        .flatMap([](int) { return Result<int>::failure(ErrorCode::DATABASE_ERROR, "later"); })
        .map([&](int v) { ++thirdCalls; return v; });
    EXPECT_EQ(thirdCalls, 0);
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::TIMEOUT_ERROR);
}

// ============================================================================
// ensure / mapFailure / recover
// ============================================================================

TEST(ResultTest, Ensure_PredicateHolds) {
    auto r = Result<int>::success(5).ensure([](int v) { return v < 10; },
                                           ErrorCode::VALIDATION_ERROR, "too big");
    EXPECT_EQ(r.unwrapSuccess(), 5);
}

TEST(ResultTest, Ensure_PredicateFails) {
    auto r = Result<int>::success(50).ensure([](int v) { return v < 10; },
                                            ErrorCode::BUSINESS_RULE_ERROR, "too big");
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::BUSINESS_RULE_ERROR);
    EXPECT_EQ(r.unwrapFailure().message(), "too big");
}

TEST(ResultTest, Ensure_NoOpOnFailure) {
    int calls = 0;
    auto r = Result<int>::failure(ErrorCode::NOT_FOUND, "gone")
        .ensure([&](int) { ++calls; return false; }, ErrorCode::VALIDATION_ERROR, "x");
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::NOT_FOUND);
}

TEST(ResultTest, MapFailure_RewritesFailure) {
    auto r = Result<int>::failure(ErrorCode::UNKNOWN_ERROR, "boom")
        .mapFailure([](const FailureDescription& f) {
            return FailureDescription(ErrorCode::TECHNICAL_ERROR, "wrapped: " + f.message());
        });
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::TECHNICAL_ERROR);
    EXPECT_EQ(r.unwrapFailure().message(), "wrapped: boom");
}

TEST(ResultTest, MapFailure_LeavesSuccess) {
    auto r = Result<int>::success(1).mapFailure([](const FailureDescription& f) { return f; });
    EXPECT_EQ(r.unwrapSuccess(), 1);
}

TEST(ResultTest, Recover_AlwaysYieldsSuccess) {
    auto r = Result<int>::failure(ErrorCode::TIMEOUT_ERROR, "slow")
        .recover([](const FailureDescription&) { return 0; });
    EXPECT_TRUE(r.isSuccess());
    EXPECT_EQ(r.unwrapSuccess(), 0);
}

// ============================================================================
// peek / either / getOrElse
// ============================================================================

TEST(ResultTest, Peek_RunsOnSuccessOnly) {
    int seen = 0;
    Result<int>::success(9).peek([&](int v) { seen = v; });
    Result<int>::failure(ErrorCode::NOT_FOUND, "x").peek([&](int) { seen = -1; });
    EXPECT_EQ(seen, 9);
}

TEST(ResultTest, PeekFailure_RunsOnFailureOnly) {
    std::string seen;
    Result<int>::success(1).peekFailure([&](const FailureDescription&) { seen = "wrong"; });
    Result<int>::failure(ErrorCode::NOT_FOUND, "gone")
        .peekFailure([&](const FailureDescription& f) { seen = f.message(); });
    EXPECT_EQ(seen, "gone");
}

TEST(ResultTest, Peek_DoesNotAlterValue) {
    auto r = Result<int>::success(4);
    const auto& same = r.peek([](int) {});
    EXPECT_EQ(same.unwrapSuccess(), 4);
}

TEST(ResultTest, Either_FoldsBothTracks) {
    auto onOk = [](int v) { return "rows=" + std::to_string(v); };
    auto onErr = [](const FailureDescription& f) { return toString(f.code()); };
    EXPECT_EQ(Result<int>::success(11).either(onOk, onErr), "rows=11");
    EXPECT_EQ(Result<int>::failure(ErrorCode::DATABASE_ERROR, "x").either(onOk, onErr),
              "DATABASE_ERROR");
}

TEST(ResultTest, GetOrElse) {
    EXPECT_EQ(Result<int>::success(3).getOrElse(-1), 3);
    EXPECT_EQ(Result<int>::failure(ErrorCode::NOT_FOUND, "x").getOrElse(-1), -1);
    EXPECT_EQ(Result<int>::failure(ErrorCode::NOT_FOUND, "abc")
                  .getOrElseGet([](const FailureDescription& f) {
                      return static_cast<int>(f.message().size());
                  }),
              3);
}

// ============================================================================
// fromComputation / fromOptional
// ============================================================================

TEST(ResultTest, FromComputation_Success) {
    auto r = Result<int>::fromComputation([] { return 8; }, ErrorCode::TECHNICAL_ERROR, "failed");
    EXPECT_EQ(r.unwrapSuccess(), 8);
}

TEST(ResultTest, FromComputation_CapturesException) {
    auto r = Result<int>::fromComputation(
        []() -> int { throw std::runtime_error("disk on fire"); },
        ErrorCode::DATABASE_ERROR, "Failed to persist");
    ASSERT_TRUE(r.isFailure());
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::DATABASE_ERROR);
    EXPECT_EQ(r.unwrapFailure().message(), "Failed to persist");
    EXPECT_TRUE(r.unwrapFailure().hasCause());
    EXPECT_EQ(r.unwrapFailure().causeMessage(), "disk on fire");
    EXPECT_THROW(r.unwrapFailure().rethrowCause(), std::runtime_error);
}

TEST(ResultTest, FromComputation_CapturesNonStdException) {
    auto r = Result<int>::fromComputation(
        []() -> int { throw 42; }, ErrorCode::TECHNICAL_ERROR, "odd throw");
    ASSERT_TRUE(r.isFailure());
    EXPECT_EQ(r.unwrapFailure().causeMessage(), "unknown exception");
}

TEST(ResultTest, FromOptional) {
    auto present = Result<int>::fromOptional(5, "missing");
    auto absent = Result<int>::fromOptional(std::nullopt, "missing", ErrorCode::CONFIGURATION_ERROR);
    EXPECT_EQ(present.unwrapSuccess(), 5);
    EXPECT_EQ(absent.unwrapFailure().code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST(ResultTest, FromOptional_DefaultsToValidation) {
    auto absent = Result<std::string>::fromOptional(std::nullopt, "required");
    EXPECT_EQ(absent.unwrapFailure().code(), ErrorCode::VALIDATION_ERROR);
}

// ============================================================================
// combine / combine3 / allOf
// ============================================================================

TEST(ResultTest, Combine_BothSucceed) {
    auto r = combine(Result<int>::success(2), Result<std::string>::success("x"),
                     [](int n, const std::string& s) { return std::string(n, s[0]); });
    EXPECT_EQ(r.unwrapSuccess(), "xx");
}

TEST(ResultTest, Combine_FirstFailureWins) {
    auto r = combine(Result<int>::failure(ErrorCode::NOT_FOUND, "first"),
                     Result<int>::failure(ErrorCode::TIMEOUT_ERROR, "second"),
                     [](int a, int b) { return a + b; });
    EXPECT_EQ(r.unwrapFailure().message(), "first");
}

TEST(ResultTest, Combine_SecondFailure) {
    auto r = combine(Result<int>::success(1),
                     Result<int>::failure(ErrorCode::TIMEOUT_ERROR, "second"),
                     [](int a, int b) { return a + b; });
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::TIMEOUT_ERROR);
}

TEST(ResultTest, Combine3) {
    auto ok = combine3(Result<int>::success(1), Result<int>::success(2), Result<int>::success(3),
                       [](int a, int b, int c) { return a + b + c; });
    EXPECT_EQ(ok.unwrapSuccess(), 6);

    auto bad = combine3(Result<int>::success(1),
                        Result<int>::failure(ErrorCode::VALIDATION_ERROR, "b"),
                        Result<int>::failure(ErrorCode::DATABASE_ERROR, "c"),
                        [](int a, int b, int c) { return a + b + c; });
    EXPECT_EQ(bad.unwrapFailure().message(), "b");
}

TEST(ResultTest, AllOf_PreservesOrder) {
    std::vector<Result<int>> results{Result<int>::success(3), Result<int>::success(1),
                                     Result<int>::success(2)};
    auto r = allOf(results);
    EXPECT_EQ(r.unwrapSuccess(), (std::vector<int>{3, 1, 2}));
}

TEST(ResultTest, AllOf_FirstFailureInSequenceOrder) {
    std::vector<Result<int>> results{Result<int>::success(1),
                                     Result<int>::failure(ErrorCode::NOT_FOUND, "second"),
                                     Result<int>::failure(ErrorCode::DATABASE_ERROR, "third")};
    auto r = allOf(results);
    EXPECT_EQ(r.unwrapFailure().message(), "second");
}

TEST(ResultTest, AllOf_EmptyIsSuccess) {
    auto r = allOf(std::vector<Result<int>>{});
    EXPECT_TRUE(r.isSuccess());
    EXPECT_TRUE(r.unwrapSuccess().empty());
}

// ============================================================================
// Async
// ============================================================================

TEST(ResultTest, MapAsync_Success) {
    auto fut = Result<int>::success(4).mapAsync([](int v) {
        return std::async(std::launch::async, [v] { return v * 10; });
    });
    EXPECT_EQ(fut.get().unwrapSuccess(), 40);
}

TEST(ResultTest, MapAsync_ExceptionBecomesExternalServiceError) {
    auto fut = Result<int>::success(4).mapAsync([](int) {
        return std::async(std::launch::async, []() -> int {
            throw std::runtime_error("socket closed");
        });
    });
    auto r = fut.get();
    ASSERT_TRUE(r.isFailure());
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::EXTERNAL_SERVICE_ERROR);
    EXPECT_EQ(r.unwrapFailure().message(), "Async operation failed");
    EXPECT_EQ(r.unwrapFailure().causeMessage(), "socket closed");
}

TEST(ResultTest, MapAsync_ShortCircuitsOnFailure) {
    std::atomic<int> calls{0};
    auto fut = Result<int>::failure(ErrorCode::AUTHENTICATION_ERROR, "denied").mapAsync([&](int v) {
        ++calls;
        return std::async(std::launch::async, [v] { return v; });
    });
    auto r = fut.get();
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::AUTHENTICATION_ERROR);
}

TEST(ResultTest, FlatMapAsync_Chains) {
    auto fut = Result<int>::success(2).flatMapAsync([](int v) {
        return std::async(std::launch::async, [v] {
            return Result<std::string>::success(std::to_string(v));
        });
    });
    EXPECT_EQ(fut.get().unwrapSuccess(), "2");
}

TEST(ResultTest, FlatMapAsync_ExceptionBecomesExternalServiceError) {
    auto fut = Result<int>::success(2).flatMapAsync([](int) -> std::future<Result<int>> {
        throw std::runtime_error("dns");
    });
    auto r = fut.get();
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::EXTERNAL_SERVICE_ERROR);
}

// ============================================================================
// Equality
// ============================================================================

TEST(ResultTest, Equality) {
    EXPECT_EQ(Result<int>::success(1), Result<int>::success(1));
    EXPECT_NE(Result<int>::success(1), Result<int>::success(2));
    EXPECT_EQ(Result<int>::failure(ErrorCode::NOT_FOUND, "x"),
              Result<int>::failure(ErrorCode::NOT_FOUND, "x"));
    EXPECT_NE(Result<int>::failure(ErrorCode::NOT_FOUND, "x"), Result<int>::success(1));
}

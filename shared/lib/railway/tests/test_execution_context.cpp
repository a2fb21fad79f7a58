/**
 * @file test_execution_context.cpp
 * @brief Unit tests for pass-through, logging, transactional and composable contexts
 */

#include <gtest/gtest.h>
#include <certsync/railway/execution_context.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace certsync::railway;

// ============================================================================
// Test doubles
// ============================================================================

class RecordingTransaction : public ITransaction {
public:
    int commits = 0;
    int rollbacks = 0;
    bool failCommit = false;

    void commit() override {
        if (failCommit) {
            throw std::runtime_error("commit refused");
        }
        ++commits;
    }

    void rollback() override { ++rollbacks; }
};

/// Appends its name before and after the inner computation
class TracingContext : public ExecutionContext<int> {
public:
    TracingContext(std::string name, std::vector<std::string>& trace)
        : name_(std::move(name)), trace_(trace) {}

    Result<int> execute(Computation computation) override {
        trace_.push_back(name_ + ":enter");
        auto result = computation();
        trace_.push_back(name_ + ":exit");
        return result;
    }

private:
    std::string name_;
    std::vector<std::string>& trace_;
};

// ============================================================================
// PassThrough
// ============================================================================

TEST(PassThroughContextTest, ReturnsComputationResult) {
    PassThroughExecutionContext<int> ctx;
    EXPECT_EQ(ctx.execute([] { return Result<int>::success(3); }).unwrapSuccess(), 3);

    auto failed = ctx.execute([] { return Result<int>::failure(ErrorCode::NOT_FOUND, "x"); });
    EXPECT_EQ(failed.unwrapFailure().code(), ErrorCode::NOT_FOUND);
}

TEST(PassThroughContextTest, Within) {
    PassThroughExecutionContext<int> ctx;
    auto r = Result<int>::success(5).within(ctx);
    EXPECT_EQ(r.unwrapSuccess(), 5);
}

// ============================================================================
// Logging
// ============================================================================

TEST(LoggingContextTest, PassesSuccessThrough) {
    LoggingExecutionContext<int> ctx("Op");
    auto r = ctx.execute([] { return Result<int>::success(11); });
    EXPECT_EQ(r.unwrapSuccess(), 11);
}

TEST(LoggingContextTest, PassesFailureThroughUnchanged) {
    LoggingExecutionContext<int> ctx("Op");
    auto r = ctx.execute([] { return Result<int>::failure(ErrorCode::DATABASE_ERROR, "db down"); });
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::DATABASE_ERROR);
    EXPECT_EQ(r.unwrapFailure().message(), "db down");
}

TEST(LoggingContextTest, ExceptionBecomesTechnicalError) {
    LoggingExecutionContext<int> ctx("Op");
    auto r = ctx.execute([]() -> Result<int> { throw std::runtime_error("kaboom"); });
    ASSERT_TRUE(r.isFailure());
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::TECHNICAL_ERROR);
    EXPECT_EQ(r.unwrapFailure().message(), "Execution failed: kaboom");
    EXPECT_TRUE(r.unwrapFailure().hasCause());
}

TEST(LoggingContextTest, NonStdExceptionBecomesTechnicalError) {
    LoggingExecutionContext<int> ctx("Op");
    auto r = ctx.execute([]() -> Result<int> { throw 7; });
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::TECHNICAL_ERROR);
}

TEST(LoggingContextTest, DelegatesToInner) {
    std::vector<std::string> trace;
    auto inner = std::make_shared<TracingContext>("inner", trace);
    LoggingExecutionContext<int> ctx("Op", inner);

    auto r = ctx.execute([&] { trace.push_back("body"); return Result<int>::success(1); });

    EXPECT_TRUE(r.isSuccess());
    EXPECT_EQ(trace, (std::vector<std::string>{"inner:enter", "body", "inner:exit"}));
}

// ============================================================================
// Transactional
// ============================================================================

TEST(TransactionalContextTest, CommitsOnSuccess) {
    RecordingTransaction tx;
    TransactionalExecutionContext<int> ctx(tx);

    auto r = ctx.execute([] { return Result<int>::success(4); });

    EXPECT_EQ(r.unwrapSuccess(), 4);
    EXPECT_EQ(tx.commits, 1);
    EXPECT_EQ(tx.rollbacks, 0);
}

TEST(TransactionalContextTest, RollsBackOnFailure) {
    RecordingTransaction tx;
    TransactionalExecutionContext<int> ctx(tx);

    auto r = ctx.execute([] { return Result<int>::failure(ErrorCode::VALIDATION_ERROR, "bad row"); });

    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(tx.commits, 0);
    EXPECT_EQ(tx.rollbacks, 1);
}

TEST(TransactionalContextTest, RollsBackOnException) {
    RecordingTransaction tx;
    TransactionalExecutionContext<int> ctx(tx);

    auto r = ctx.execute([]() -> Result<int> { throw std::runtime_error("constraint violated"); });

    ASSERT_TRUE(r.isFailure());
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::DATABASE_ERROR);
    EXPECT_EQ(r.unwrapFailure().message(), "Transaction failed: constraint violated");
    EXPECT_EQ(tx.commits, 0);
    EXPECT_EQ(tx.rollbacks, 1);
}

TEST(TransactionalContextTest, CommitFailureRollsBack) {
    RecordingTransaction tx;
    tx.failCommit = true;
    TransactionalExecutionContext<int> ctx(tx);

    auto r = ctx.execute([] { return Result<int>::success(1); });

    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::DATABASE_ERROR);
    EXPECT_EQ(tx.rollbacks, 1);
}

// ============================================================================
// Composable
// ============================================================================

TEST(ComposableContextTest, EmptyListThrows) {
    EXPECT_THROW(ComposableExecutionContext<int>({}), std::invalid_argument);
}

TEST(ComposableContextTest, NullEntryThrows) {
    std::vector<std::shared_ptr<ExecutionContext<int>>> contexts{nullptr};
    EXPECT_THROW(ComposableExecutionContext<int>{contexts}, std::invalid_argument);
}

TEST(ComposableContextTest, FirstListedIsOutermost) {
    std::vector<std::string> trace;
    ComposableExecutionContext<int> ctx({
        std::make_shared<TracingContext>("outer", trace),
        std::make_shared<TracingContext>("middle", trace),
        std::make_shared<TracingContext>("inner", trace),
    });

    auto r = ctx.execute([&] { trace.push_back("body"); return Result<int>::success(9); });

    EXPECT_EQ(r.unwrapSuccess(), 9);
    EXPECT_EQ(trace, (std::vector<std::string>{
        "outer:enter", "middle:enter", "inner:enter", "body",
        "inner:exit", "middle:exit", "outer:exit"}));
}

TEST(ComposableContextTest, LoggingAroundTransaction) {
    RecordingTransaction tx;
    ComposableExecutionContext<int> ctx({
        std::make_shared<LoggingExecutionContext<int>>("Replace"),
        std::make_shared<TransactionalExecutionContext<int>>(tx),
    });

    auto r = ctx.execute([]() -> Result<int> { throw std::runtime_error("lost connection"); });

    // The transactional context is innermost and converts the exception first
    EXPECT_EQ(r.unwrapFailure().code(), ErrorCode::DATABASE_ERROR);
    EXPECT_EQ(tx.rollbacks, 1);
    EXPECT_EQ(ctx.size(), 2u);
}

/**
 * @file execution_context.h
 * @brief Execution contexts - side effects around a Result computation
 *
 * A context runs a Result-producing computation and adds behaviour around
 * it (logging, transaction commit/rollback) without the computation
 * knowing about it. Contexts never let an exception escape.
 *
 * @code
 *   ComposableExecutionContext<int> ctx({
 *       std::make_shared<LoggingExecutionContext<int>>("MasterListSync"),
 *       std::make_shared<TransactionalExecutionContext<int>>(tx),
 *   });
 *   auto rows = ctx.execute([&] { return replaceAll(payload); });
 * @endcode
 */

#pragma once

#include <certsync/railway/result.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace certsync::railway {

/**
 * @brief Transaction seen by TransactionalExecutionContext
 */
class ITransaction {
public:
    virtual ~ITransaction() = default;

    /// @throws on commit failure
    virtual void commit() = 0;

    /// @throws on rollback failure
    virtual void rollback() = 0;

protected:
    ITransaction() = default;
};

/**
 * @brief Runs a Result computation with added behaviour
 */
template <typename T>
class ExecutionContext {
public:
    using Computation = std::function<Result<T>()>;

    virtual ~ExecutionContext() = default;

    virtual Result<T> execute(Computation computation) = 0;

protected:
    ExecutionContext() = default;
};

/**
 * @brief Identity context: runs the computation as is
 */
template <typename T>
class PassThroughExecutionContext : public ExecutionContext<T> {
public:
    Result<T> execute(typename ExecutionContext<T>::Computation computation) override {
        return computation();
    }
};

/**
 * @brief Logs start, duration and outcome around an (optional) inner context
 *
 * An exception escaping the computation becomes
 * TECHNICAL_ERROR "Execution failed: <what>".
 */
template <typename T>
class LoggingExecutionContext : public ExecutionContext<T> {
public:
    explicit LoggingExecutionContext(std::string operation,
                                     std::shared_ptr<ExecutionContext<T>> inner = nullptr,
                                     spdlog::level::level_enum level = spdlog::level::info)
        : operation_(std::move(operation))
        , inner_(inner ? std::move(inner) : std::make_shared<PassThroughExecutionContext<T>>())
        , level_(level) {}

    Result<T> execute(typename ExecutionContext<T>::Computation computation) override {
        spdlog::log(level_, "[{}] Starting execution", operation_);
        auto start = std::chrono::steady_clock::now();

        try {
            Result<T> result = inner_->execute(std::move(computation));
            spdlog::log(level_, "[{}] Completed in {:.3f}s - {}",
                        operation_, elapsedSeconds(start),
                        result.isSuccess() ? "SUCCESS" : "FAILURE");
            return result;
        } catch (const std::exception& e) {
            spdlog::error("[{}] Execution failed after {:.3f}s: {}",
                          operation_, elapsedSeconds(start), e.what());
            return Result<T>::failure(ErrorCode::TECHNICAL_ERROR,
                                      std::string("Execution failed: ") + e.what(),
                                      std::current_exception());
        } catch (...) {
            spdlog::error("[{}] Execution failed after {:.3f}s: unknown exception",
                          operation_, elapsedSeconds(start));
            return Result<T>::failure(ErrorCode::TECHNICAL_ERROR,
                                      "Execution failed: unknown exception",
                                      std::current_exception());
        }
    }

    const std::string& operation() const { return operation_; }

private:
    static double elapsedSeconds(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }

    std::string operation_;
    std::shared_ptr<ExecutionContext<T>> inner_;
    spdlog::level::level_enum level_;
};

/**
 * @brief Commits on Success, rolls back on Failure
 *
 * An exception escaping the computation (or the commit) triggers a
 * rollback and becomes DATABASE_ERROR "Transaction failed: <what>".
 */
template <typename T>
class TransactionalExecutionContext : public ExecutionContext<T> {
public:
    explicit TransactionalExecutionContext(ITransaction& transaction)
        : transaction_(transaction) {}

    Result<T> execute(typename ExecutionContext<T>::Computation computation) override {
        try {
            Result<T> result = computation();
            if (result.isSuccess()) {
                transaction_.commit();
            } else {
                transaction_.rollback();
            }
            return result;
        } catch (const std::exception& e) {
            spdlog::error("[TransactionalExecutionContext] Rolling back: {}", e.what());
            auto cause = std::current_exception();
            rollbackQuietly();
            return Result<T>::failure(ErrorCode::DATABASE_ERROR,
                                      std::string("Transaction failed: ") + e.what(),
                                      cause);
        } catch (...) {
            auto cause = std::current_exception();
            rollbackQuietly();
            return Result<T>::failure(ErrorCode::DATABASE_ERROR,
                                      "Transaction failed: unknown exception", cause);
        }
    }

private:
    void rollbackQuietly() {
        try {
            transaction_.rollback();
        } catch (const std::exception& e) {
            spdlog::error("[TransactionalExecutionContext] Rollback failed: {}", e.what());
        }
    }

    ITransaction& transaction_;
};

/**
 * @brief Nests several contexts: first listed is outermost
 *
 * Given (A, B, C) the call order is A(B(C(computation))).
 */
template <typename T>
class ComposableExecutionContext : public ExecutionContext<T> {
public:
    /// @throws std::invalid_argument when no context is given
    explicit ComposableExecutionContext(std::vector<std::shared_ptr<ExecutionContext<T>>> contexts)
        : contexts_(std::move(contexts))
    {
        if (contexts_.empty()) {
            throw std::invalid_argument("ComposableExecutionContext: at least one context is required");
        }
        for (const auto& ctx : contexts_) {
            if (!ctx) {
                throw std::invalid_argument("ComposableExecutionContext: context cannot be nullptr");
            }
        }
    }

    Result<T> execute(typename ExecutionContext<T>::Computation computation) override {
        auto wrapped = std::move(computation);
        for (auto it = contexts_.rbegin(); it != contexts_.rend(); ++it) {
            std::shared_ptr<ExecutionContext<T>> ctx = *it;
            wrapped = [ctx, inner = std::move(wrapped)]() { return ctx->execute(inner); };
        }
        return wrapped();
    }

    size_t size() const { return contexts_.size(); }

private:
    std::vector<std::shared_ptr<ExecutionContext<T>>> contexts_;
};

} // namespace certsync::railway

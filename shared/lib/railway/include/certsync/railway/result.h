/**
 * @file result.h
 * @brief Result<T> - two-track value for fallible steps
 *
 * A Result is either Success(value) or Failure(FailureDescription).
 * Pipelines are built with flatMap(): once a step fails, every later step
 * is skipped and the first failure travels to the end unchanged.
 *
 * @code
 *   auto rows = accessToken()
 *       .flatMap([&](const std::string& t) { return sfcToken(t); })
 *       .map([](const std::string& s) { return s.size(); });
 * @endcode
 */

#pragma once

#include <certsync/railway/failure.h>

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace certsync::railway {

/**
 * @brief Thrown when the wrong track of a Result is unwrapped
 *
 * This is a programming error, not a business failure.
 */
class BadResultAccess : public std::logic_error {
public:
    explicit BadResultAccess(const std::string& message)
        : std::logic_error(message) {}
};

template <typename T> class Result;
template <typename T> class ExecutionContext;

namespace detail {

template <typename U> struct IsNullable : std::false_type {};
template <typename U> struct IsNullable<U*> : std::true_type {};
template <typename U> struct IsNullable<std::shared_ptr<U>> : std::true_type {};
template <typename U, typename D> struct IsNullable<std::unique_ptr<U, D>> : std::true_type {};
template <typename U> struct IsNullable<std::optional<U>> : std::true_type {};
template <typename S> struct IsNullable<std::function<S>> : std::true_type {};

template <typename U> struct IsResult : std::false_type {};
template <typename U> struct IsResult<Result<U>> : std::true_type {};

template <typename F, typename... Args>
using ResultOf = std::decay_t<std::invoke_result_t<F, Args...>>;

template <typename Future>
using FutureValue = std::decay_t<decltype(std::declval<Future&>().get())>;

} // namespace detail

template <typename T>
class Result {
    static_assert(!std::is_reference_v<T>, "Result<T> cannot hold a reference");
    static_assert(!std::is_same_v<T, FailureDescription>,
                  "Result<FailureDescription> is ambiguous");

public:
    using value_type = T;

    /**
     * @brief Failure track from an existing description
     *
     * Implicit so that a function returning Result<T> can
     * `return ResultFailures::databaseError(...)`.
     */
    Result(FailureDescription error)  // NOLINT(google-explicit-constructor)
        : state_(std::in_place_index<1>, std::move(error)) {}

    // --- Factories ---

    /**
     * @brief Success track
     * @throws std::invalid_argument for a null pointer-like value
     */
    static Result success(T value) {
        if constexpr (detail::IsNullable<T>::value) {
            if (!value) {
                throw std::invalid_argument("Result::success: value cannot be null");
            }
        }
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result failure(FailureDescription error) {
        return Result(std::move(error));
    }

    static Result failure(ErrorCode code, std::string message,
                          std::exception_ptr cause = nullptr) {
        return Result(FailureDescription(code, std::move(message), std::move(cause)));
    }

    /**
     * @brief Run a throwing computation and capture any exception as a Failure
     *
     * The boundary between exception-throwing code and the Result world.
     * Every exception, std or not, becomes Failure(code, message, cause).
     */
    template <typename F>
    static Result fromComputation(F&& computation, ErrorCode code, const std::string& message) {
        try {
            return success(std::invoke(std::forward<F>(computation)));
        } catch (...) {
            return failure(code, message, std::current_exception());
        }
    }

    /// @brief Success when the optional holds a value, Failure(code, message) otherwise
    static Result fromOptional(std::optional<T> value, std::string message,
                               ErrorCode code = ErrorCode::VALIDATION_ERROR) {
        if (value) {
            return success(std::move(*value));
        }
        return failure(code, std::move(message));
    }

    // --- State ---

    bool isSuccess() const noexcept { return state_.index() == 0; }
    bool isFailure() const noexcept { return state_.index() == 1; }
    explicit operator bool() const noexcept { return isSuccess(); }

    /// @throws BadResultAccess when called on a Failure
    const T& unwrapSuccess() const& {
        if (isFailure()) {
            throw BadResultAccess("unwrapSuccess() called on Failure: " +
                                  std::get<1>(state_).toString());
        }
        return std::get<0>(state_);
    }

    T unwrapSuccess() && {
        if (isFailure()) {
            throw BadResultAccess("unwrapSuccess() called on Failure: " +
                                  std::get<1>(state_).toString());
        }
        return std::move(std::get<0>(state_));
    }

    /// @throws BadResultAccess when called on a Success
    const FailureDescription& unwrapFailure() const {
        if (isSuccess()) {
            throw BadResultAccess("unwrapFailure() called on Success");
        }
        return std::get<1>(state_);
    }

    // --- Combinators ---

    /// @brief Transform the success value; failures pass through untouched
    template <typename F>
    auto map(F&& mapper) const& -> Result<detail::ResultOf<F, const T&>> {
        using U = detail::ResultOf<F, const T&>;
        if (isFailure()) {
            return Result<U>::failure(std::get<1>(state_));
        }
        return Result<U>::success(std::invoke(std::forward<F>(mapper), std::get<0>(state_)));
    }

    template <typename F>
    auto map(F&& mapper) && -> Result<detail::ResultOf<F, T&&>> {
        using U = detail::ResultOf<F, T&&>;
        if (isFailure()) {
            return Result<U>::failure(std::move(std::get<1>(state_)));
        }
        return Result<U>::success(std::invoke(std::forward<F>(mapper), std::move(std::get<0>(state_))));
    }

    /**
     * @brief Chain a Result-returning step
     *
     * The mapper is never invoked on a Failure.
     */
    template <typename F>
    auto flatMap(F&& mapper) const& -> detail::ResultOf<F, const T&> {
        using R = detail::ResultOf<F, const T&>;
        static_assert(detail::IsResult<R>::value, "flatMap mapper must return a Result");
        if (isFailure()) {
            return R::failure(std::get<1>(state_));
        }
        return std::invoke(std::forward<F>(mapper), std::get<0>(state_));
    }

    template <typename F>
    auto flatMap(F&& mapper) && -> detail::ResultOf<F, T&&> {
        using R = detail::ResultOf<F, T&&>;
        static_assert(detail::IsResult<R>::value, "flatMap mapper must return a Result");
        if (isFailure()) {
            return R::failure(std::move(std::get<1>(state_)));
        }
        return std::invoke(std::forward<F>(mapper), std::move(std::get<0>(state_)));
    }

    /// @brief Turn a Success into Failure(code, message) when the predicate is false
    template <typename P>
    Result ensure(P&& predicate, ErrorCode code, std::string message) const {
        if (isFailure()) {
            return *this;
        }
        if (!std::invoke(std::forward<P>(predicate), std::get<0>(state_))) {
            return failure(code, std::move(message));
        }
        return *this;
    }

    /// @brief Rewrite the failure description; successes pass through
    template <typename F>
    Result mapFailure(F&& mapper) const {
        if (isSuccess()) {
            return *this;
        }
        return failure(std::invoke(std::forward<F>(mapper), std::get<1>(state_)));
    }

    /// @brief Replace a failure with a fallback value; always yields a Success
    template <typename F>
    Result recover(F&& recovery) const {
        if (isSuccess()) {
            return *this;
        }
        return success(std::invoke(std::forward<F>(recovery), std::get<1>(state_)));
    }

    /// @brief Side effect on the success value (logging taps)
    template <typename F>
    const Result& peek(F&& action) const {
        if (isSuccess()) {
            std::invoke(std::forward<F>(action), std::get<0>(state_));
        }
        return *this;
    }

    /// @brief Side effect on the failure description (logging taps)
    template <typename F>
    const Result& peekFailure(F&& action) const {
        if (isFailure()) {
            std::invoke(std::forward<F>(action), std::get<1>(state_));
        }
        return *this;
    }

    /// @brief Fold both tracks into a single value
    template <typename OnSuccess, typename OnFailure>
    auto either(OnSuccess&& onSuccess, OnFailure&& onFailure) const
        -> std::common_type_t<detail::ResultOf<OnSuccess, const T&>,
                              detail::ResultOf<OnFailure, const FailureDescription&>> {
        if (isSuccess()) {
            return std::invoke(std::forward<OnSuccess>(onSuccess), std::get<0>(state_));
        }
        return std::invoke(std::forward<OnFailure>(onFailure), std::get<1>(state_));
    }

    T getOrElse(T fallback) const {
        return isSuccess() ? std::get<0>(state_) : std::move(fallback);
    }

    template <typename F>
    T getOrElseGet(F&& fallback) const {
        if (isSuccess()) {
            return std::get<0>(state_);
        }
        return std::invoke(std::forward<F>(fallback), std::get<1>(state_));
    }

    /// @brief Hand this Result to an execution context (logging, transaction)
    Result within(ExecutionContext<T>& context) const {
        Result self = *this;
        return context.execute([self]() { return self; });
    }

    // --- Asynchronous analogues ---

    /**
     * @brief Asynchronous map
     *
     * The mapper returns std::future<U>. An exception raised by the
     * asynchronous step becomes EXTERNAL_SERVICE_ERROR "Async operation failed".
     */
    template <typename F>
    auto mapAsync(F mapper) const
        -> std::future<Result<detail::FutureValue<detail::ResultOf<F, const T&>>>> {
        using U = detail::FutureValue<detail::ResultOf<F, const T&>>;
        if (isFailure()) {
            std::promise<Result<U>> ready;
            ready.set_value(Result<U>::failure(std::get<1>(state_)));
            return ready.get_future();
        }
        return std::async(std::launch::async,
            [mapper = std::move(mapper), value = std::get<0>(state_)]() mutable {
                try {
                    return Result<U>::success(std::invoke(mapper, std::as_const(value)).get());
                } catch (...) {
                    return Result<U>::failure(ErrorCode::EXTERNAL_SERVICE_ERROR,
                                              "Async operation failed",
                                              std::current_exception());
                }
            });
    }

    /**
     * @brief Asynchronous flatMap
     *
     * The mapper returns std::future<Result<U>>; never invoked on a Failure.
     */
    template <typename F>
    auto flatMapAsync(F mapper) const
        -> std::future<detail::FutureValue<detail::ResultOf<F, const T&>>> {
        using R = detail::FutureValue<detail::ResultOf<F, const T&>>;
        static_assert(detail::IsResult<R>::value, "flatMapAsync mapper must yield a Result");
        if (isFailure()) {
            std::promise<R> ready;
            ready.set_value(R::failure(std::get<1>(state_)));
            return ready.get_future();
        }
        return std::async(std::launch::async,
            [mapper = std::move(mapper), value = std::get<0>(state_)]() mutable {
                try {
                    return std::invoke(mapper, std::as_const(value)).get();
                } catch (...) {
                    return R::failure(ErrorCode::EXTERNAL_SERVICE_ERROR,
                                      "Async operation failed",
                                      std::current_exception());
                }
            });
    }

    bool operator==(const Result& other) const {
        if (isSuccess() != other.isSuccess()) {
            return false;
        }
        if (isSuccess()) {
            return std::get<0>(state_) == std::get<0>(other.state_);
        }
        return std::get<1>(state_) == std::get<1>(other.state_);
    }
    bool operator!=(const Result& other) const { return !(*this == other); }

private:
    template <typename... Args>
    explicit Result(std::in_place_index_t<0> tag, Args&&... args)
        : state_(tag, std::forward<Args>(args)...) {}

    std::variant<T, FailureDescription> state_;
};

// --- Free combinators ---

/**
 * @brief Combine two Results; both must succeed, the first failure wins
 */
template <typename A, typename B, typename F>
auto combine(const Result<A>& ra, const Result<B>& rb, F&& combiner)
    -> Result<detail::ResultOf<F, const A&, const B&>> {
    using R = detail::ResultOf<F, const A&, const B&>;
    if (ra.isFailure()) return Result<R>::failure(ra.unwrapFailure());
    if (rb.isFailure()) return Result<R>::failure(rb.unwrapFailure());
    return Result<R>::success(
        std::invoke(std::forward<F>(combiner), ra.unwrapSuccess(), rb.unwrapSuccess()));
}

template <typename A, typename B, typename C, typename F>
auto combine3(const Result<A>& ra, const Result<B>& rb, const Result<C>& rc, F&& combiner)
    -> Result<detail::ResultOf<F, const A&, const B&, const C&>> {
    using R = detail::ResultOf<F, const A&, const B&, const C&>;
    if (ra.isFailure()) return Result<R>::failure(ra.unwrapFailure());
    if (rb.isFailure()) return Result<R>::failure(rb.unwrapFailure());
    if (rc.isFailure()) return Result<R>::failure(rc.unwrapFailure());
    return Result<R>::success(
        std::invoke(std::forward<F>(combiner),
                    ra.unwrapSuccess(), rb.unwrapSuccess(), rc.unwrapSuccess()));
}

/**
 * @brief Sequence of Results to Result of sequence
 *
 * Returns the first failure in sequence order, else all values in order.
 */
template <typename T>
Result<std::vector<T>> allOf(const std::vector<Result<T>>& results) {
    std::vector<T> values;
    values.reserve(results.size());
    for (const auto& r : results) {
        if (r.isFailure()) {
            return Result<std::vector<T>>::failure(r.unwrapFailure());
        }
        values.push_back(r.unwrapSuccess());
    }
    return Result<std::vector<T>>::success(std::move(values));
}

} // namespace certsync::railway

#pragma once

#include "kern/config/KernConfig.hpp"
#include "kern/log/Check.hpp"
#include "kern/status/Expected.hpp"
#include "kern/status/Status.hpp"
#include "kern/status/StatusOr.hpp"

#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#if defined(__GLIBCXX__)
#include <cxxabi.h>
#endif

namespace kern {

namespace detail {

/**
 * @brief Result type of an adapted call, given the wrapped function's return type R.
 *
 * - void                -> Status (OK on normal return)
 * - Status              -> Status
 * - AStatusOrElse<T>    -> AStatusOrElse<T>
 * - StatusOr<T>         -> StatusOr<T>
 * - any other T         -> AStatusOrElse<T>
 */
template <typename R>
struct AdaptedResult {
    using type = AStatusOrElse<R>;
};

template <>
struct AdaptedResult<void> {
    using type = Status;
};

template <>
struct AdaptedResult<Status> {
    using type = Status;
};

template <typename T>
struct AdaptedResult<tl::expected<T, Status>> {
    using type = tl::expected<T, Status>;
};

template <typename T>
struct AdaptedResult<StatusOr<T>> {
    using type = StatusOr<T>;
};

template <typename R>
using AdaptedResultT = typename AdaptedResult<std::remove_cv_t<std::remove_reference_t<R>>>::type;

template <typename Result>
Result failureResult(Status status) {
    if constexpr (std::is_same_v<Result, Status>) {
        return status;
    } else {
        return Result(Failure(std::move(status)));
    }
}

template <typename T>
void checkContract(const AStatusOrElse<T>& result) {
    if (!result.has_value() && result.error().ok()) {
        checkFailed("!result.error().ok()",
                    "a function returning AStatusOrElse<T> reported failure with an OK status",
                    KERN_HERE);
    }
}

template <typename T>
void checkContract(const StatusOr<T>&) {
    // StatusOr enforces the invariant in its constructors.
}

inline void checkContract(const Status&) {}

} // namespace detail

/**
 * @brief Call @p f once and turn any exception it throws into a Status.
 *
 * Normal returns pass through unchanged (plain values are lifted into the
 * success arm of AStatusOrElse<T>; `void` becomes an OK Status). A
 * std::exception is translated with Status::fromException(); any other thrown
 * object becomes StatusCode::Unknown. Thread cancellation (glibc's forced
 * unwind) is rethrown untouched.
 *
 * Failed checks inside @p f still abort the process: they never reach this
 * boundary as exceptions.
 */
template <typename F, typename... Args>
detail::AdaptedResultT<std::invoke_result_t<F, Args...>>
invokeWithStatus(F&& f, Args&&... args) {
    using Raw = std::invoke_result_t<F, Args...>;
    using Result = detail::AdaptedResultT<Raw>;

    try {
        if constexpr (std::is_void_v<Raw>) {
            std::invoke(std::forward<F>(f), std::forward<Args>(args)...);
            return Status();
        } else if constexpr (std::is_same_v<std::remove_cv_t<std::remove_reference_t<Raw>>, Result>) {
            Result result = std::invoke(std::forward<F>(f), std::forward<Args>(args)...);
            detail::checkContract(result);
            return result;
        } else {
            return Result(std::invoke(std::forward<F>(f), std::forward<Args>(args)...));
        }
    } catch (const std::exception& ex) {
        return detail::failureResult<Result>(Status::fromException(ex));
#if defined(__GLIBCXX__)
    } catch (abi::__forced_unwind&) {
        // Thread cancellation must keep unwinding.
        throw;
#endif
    } catch (...) {
        return detail::failureResult<Result>(
            Status(StatusCode::Unknown, std::string(config::KERN_UNKNOWN_EXCEPTION_MESSAGE)));
    }
}

/**
 * @brief Wrap @p f so every call goes through invokeWithStatus().
 *
 * Usage:
 * @code
 *   auto safeStoi = kern::useStatus([](const std::string& s) { return std::stoi(s); });
 *   kern::StatusOr<int> n = safeStoi("42");   // ok, 42
 *   kern::StatusOr<int> bad = safeStoi("x");  // INVALID_ARGUMENT: stoi
 * @endcode
 */
template <typename F>
auto useStatus(F&& f) {
    return [fn = std::forward<F>(f)](auto&&... args) mutable {
        return invokeWithStatus(fn, std::forward<decltype(args)>(args)...);
    };
}

} // namespace kern

#pragma once

#include "kern/log/Check.hpp"
#include "kern/status/Expected.hpp"
#include "kern/status/Status.hpp"

#include <type_traits>
#include <utility>

namespace kern {

/**
 * @brief Holds either a value of type T or the non-OK Status explaining its absence.
 *
 * Invariants:
 * - never a value and a failure at the same time;
 * - the failure arm never carries an OK status. Constructing one is a
 *   programming error and fails the process through KERN_CHECK.
 *
 * Accessing `val()` without checking `ok()` first is also a fatal check
 * failure; handle the error instead of assuming success.
 *
 * Usage:
 * @code
 *   kern::StatusOr<float> quotient = divide(6, 3);
 *   if (!quotient.ok()) {
 *       return quotient.status();
 *   }
 *   use(quotient.val());
 * @endcode
 *
 * Functions that produce nothing on success return kern::Status directly.
 */
template <typename T>
class StatusOr {
    static_assert(!std::is_same_v<std::remove_cv_t<T>, Status>,
                  "StatusOr<Status> is meaningless; return kern::Status");
    static_assert(!std::is_reference_v<T>, "StatusOr cannot hold references");
    static_assert(!std::is_void_v<T>, "void operations return kern::Status");

    template <typename U>
    using EnableIfValue = std::enable_if_t<
        std::is_constructible_v<T, U&&> &&
        !std::is_same_v<std::decay_t<U>, StatusOr> &&
        !std::is_same_v<std::decay_t<U>, Status> &&
        !std::is_same_v<std::decay_t<U>, AStatusOrElse<T>> &&
        !std::is_same_v<std::decay_t<U>, Failure>, int>;

public:
    using value_type = T;

    /// Success arm.
    template <typename U = T, EnableIfValue<U> = 0>
    StatusOr(U&& value)
    : storage(tl::in_place, std::forward<U>(value)) {}

    /// Failure arm. @p status must not be OK.
    StatusOr(const Status& status)
    : storage(Failure(status)) {
        checkFailureArm();
    }

    StatusOr(Status&& status)
    : storage(Failure(std::move(status))) {
        checkFailureArm();
    }

    StatusOr(Failure failure)
    : storage(std::move(failure)) {
        checkFailureArm();
    }

    /// Adopt the raw result of a function honouring the AStatusOrElse<T> contract.
    StatusOr(AStatusOrElse<T> result)
    : storage(std::move(result)) {
        if (!storage.has_value()) {
            checkFailureArm();
        }
    }

    bool ok() const { return storage.has_value(); }

    const T& val() const& {
        checkHasValue();
        return *storage;
    }

    T& val() & {
        checkHasValue();
        return *storage;
    }

    T&& val() && {
        checkHasValue();
        return std::move(*storage);
    }

    /// The held failure, or OK when a value is present.
    Status status() const {
        return ok() ? Status() : storage.error();
    }

    template <typename U>
    T valueOr(U&& fallback) const& {
        return ok() ? *storage : static_cast<T>(std::forward<U>(fallback));
    }

    template <typename U>
    T valueOr(U&& fallback) && {
        return ok() ? std::move(*storage) : static_cast<T>(std::forward<U>(fallback));
    }

    const AStatusOrElse<T>& asExpected() const& { return storage; }
    AStatusOrElse<T> asExpected() && { return std::move(storage); }

    friend bool operator==(const StatusOr& lhs, const StatusOr& rhs) {
        if (lhs.ok() != rhs.ok()) {
            return false;
        }
        return lhs.ok() ? *lhs.storage == *rhs.storage : lhs.storage.error() == rhs.storage.error();
    }

    friend bool operator!=(const StatusOr& lhs, const StatusOr& rhs) { return !(lhs == rhs); }

private:
    void checkFailureArm() const {
        if (storage.error().ok()) {
            checkFailed("!status.ok()",
                        "an OK status is not a valid constructor argument to StatusOr<T>",
                        KERN_HERE);
        }
    }

    void checkHasValue() const {
        if (!storage.has_value()) {
            checkFailed("ok()",
                        "attempting to fetch the value instead of handling the error: " +
                            storage.error().toString(),
                        KERN_HERE);
        }
    }

    AStatusOrElse<T> storage;
};

} // namespace kern

#pragma once

// CHECK macros terminate the process when an invariant does not hold.
//
// Unlike assert(), KERN_CHECK is compiled in every build mode. Use it where
// continuing would be worse than stopping: a failed check emits one Fatal
// record through kern::log and calls std::abort(). It is never turned into a
// Status and cannot be caught.
//
// KERN_DCHECK and friends behave the same in debug builds and compile to
// nothing under NDEBUG; their arguments are then not evaluated.

#include "kern/log/SourceLocation.hpp"
#include "kern/status/Status.hpp"

#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace kern {

/**
 * @brief Emit the Fatal record for a failed check and abort.
 * @param expression Stringified condition that evaluated to false.
 * @param message    Caller-supplied explanation (may be empty).
 * @param location   Call site.
 */
[[noreturn]] void checkFailed(std::string_view expression,
                              std::string_view message,
                              const log::SourceLocation& location) noexcept;

namespace detail {

template<typename T, typename = void>
struct IsStreamable : std::false_type {};

template<typename T>
struct IsStreamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template<typename T>
void streamOperand(std::ostream& os, const T& value) {
    if constexpr (IsStreamable<T>::value) {
        os << value;
    } else {
        os << "<unprintable>";
    }
}

template<typename A, typename B>
std::string describeOperands(const A& lhs, const B& rhs) {
    std::ostringstream oss;
    oss << "(";
    streamOperand(oss, lhs);
    oss << " vs. ";
    streamOperand(oss, rhs);
    oss << ")";
    return oss.str();
}

} // namespace detail
} // namespace kern

#define KERN_CHECK(condition, message)                                      \
    do {                                                                    \
        if (!(condition)) {                                                 \
            ::kern::checkFailed(#condition, (message), KERN_HERE);          \
        }                                                                   \
    } while (false)

#define KERN_CHECK_EQ(a, b)                                                 \
    do {                                                                    \
        const auto& kernCheckLhs = (a);                                     \
        const auto& kernCheckRhs = (b);                                     \
        if (!(kernCheckLhs == kernCheckRhs)) {                              \
            ::kern::checkFailed(#a " == " #b,                               \
                ::kern::detail::describeOperands(kernCheckLhs, kernCheckRhs), \
                KERN_HERE);                                                 \
        }                                                                   \
    } while (false)

#define KERN_CHECK_NE(a, b)                                                 \
    do {                                                                    \
        const auto& kernCheckLhs = (a);                                     \
        const auto& kernCheckRhs = (b);                                     \
        if (!(kernCheckLhs != kernCheckRhs)) {                              \
            ::kern::checkFailed(#a " != " #b,                               \
                ::kern::detail::describeOperands(kernCheckLhs, kernCheckRhs), \
                KERN_HERE);                                                 \
        }                                                                   \
    } while (false)

#define KERN_CHECK_OK(status)                                               \
    do {                                                                    \
        const ::kern::Status& kernCheckStatus = (status);                   \
        if (!kernCheckStatus.ok()) {                                        \
            ::kern::checkFailed(#status ".ok()", kernCheckStatus.toString(), KERN_HERE); \
        }                                                                   \
    } while (false)

#ifdef NDEBUG
#define KERN_DCHECK(condition, message) \
    do { if (false) { KERN_CHECK(condition, message); } } while (false)
#define KERN_DCHECK_EQ(a, b) \
    do { if (false) { KERN_CHECK_EQ(a, b); } } while (false)
#define KERN_DCHECK_NE(a, b) \
    do { if (false) { KERN_CHECK_NE(a, b); } } while (false)
#define KERN_DCHECK_OK(status) \
    do { if (false) { KERN_CHECK_OK(status); } } while (false)
#else
#define KERN_DCHECK(condition, message) KERN_CHECK(condition, message)
#define KERN_DCHECK_EQ(a, b) KERN_CHECK_EQ(a, b)
#define KERN_DCHECK_NE(a, b) KERN_CHECK_NE(a, b)
#define KERN_DCHECK_OK(status) KERN_CHECK_OK(status)
#endif

#pragma once

#include <ostream>
#include <string_view>
#include <system_error>

namespace kern {

/**
 * @brief Closed catalogue of failure categories carried by a Status.
 *
 * Layout:
 * - 0..16 are the canonical codes understood across the codebase.
 * - Negative values are kern-specific codes with no canonical counterpart.
 * - 100+ name the standard C++ exception families so a translated exception
 *   keeps its origin visible even when no canonical code fits.
 *
 * `Ok` is the only success value.
 */
enum class StatusCode : int {
    // Canonical ---------------------------------------------------------------
    Ok = 0,
    Cancelled = 1,
    Unknown = 2,
    InvalidArgument = 3,
    DeadlineExceeded = 4,
    NotFound = 5,
    AlreadyExists = 6,
    PermissionDenied = 7,
    ResourceExhausted = 8,
    FailedPrecondition = 9,
    Aborted = 10,
    OutOfRange = 11,
    Unimplemented = 12,
    Internal = 13,
    Unavailable = 14,
    DataLoss = 15,
    Unauthenticated = 16,

    // Custom ------------------------------------------------------------------
    ZeroDivision = -1,

    // Standard exception families ---------------------------------------------
    LogicError = 100,
    DomainError = 101,
    LengthError = 102,
    RuntimeError = 103,
    RangeError = 104,
    OverflowError = 105,
    UnderflowError = 106,
    SystemError = 107,
    IoFailure = 108,
    BadCast = 109,
    BadTypeid = 110,
    BadOptionalAccess = 111,
    BadVariantAccess = 112,
    BadFunctionCall = 113,
    BadWeakPtr = 114,
    FutureError = 115,
    RegexError = 116,
    FilesystemError = 117
};

/// Upper-snake name of @p code ("OK", "INVALID_ARGUMENT", ...), or "UNRECOGNIZED".
std::string_view toString(StatusCode code);

std::ostream& operator<<(std::ostream& os, StatusCode code);

/// True when @p value is one of the enumerators above.
bool isValidStatusCode(int value);

/**
 * @brief Map a generic/system error code to the closest canonical StatusCode.
 *
 * An empty error code is `Ok`; conditions without an obvious counterpart map
 * to `Unknown`.
 */
StatusCode statusCodeFromErrorCode(const std::error_code& ec);

} // namespace kern

#pragma once

#include "kern/status/StatusCode.hpp"

#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace kern {

/**
 * @brief Immutable description of how an operation ended.
 *
 * A Status is either OK (success) or carries a failure code, a human-readable
 * message and an optional opaque payload. Success is decided by the code
 * alone; an OK code with a message is still OK.
 *
 * Statuses are plain values: copy or move them along the call chain, never
 * mutate them. `withPayload()` returns a new Status instead of editing this one.
 */
class Status {
public:
    /// Success.
    Status() = default;

    Status(StatusCode code, std::string message);

    /// Canonical success value.
    static Status okStatus() { return Status(); }

    static Status fromStatusCode(StatusCode code, std::string message = {});

    /**
     * @brief Build a Status from a std::error_code.
     * @param ec       Error reported by a system or standard library call.
     * @param context  Optional prefix, e.g. the path being operated on.
     *
     * The code is chosen by statusCodeFromErrorCode(); the message is
     * "<context>: <ec.message()>" or just the error message.
     */
    static Status fromErrorCode(const std::error_code& ec, std::string_view context = {});

    /**
     * @brief Translate a caught exception.
     *
     * The code comes from the process-wide ExceptionTranslator, the message is
     * `what()` and the payload records the exception's dynamic type.
     */
    static Status fromException(const std::exception& ex);

    bool ok() const { return code_ == StatusCode::Ok; }
    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::optional<std::string>& payload() const { return payload_; }

    Status withPayload(std::string payload) const;

    /// "OK", "<CODE>: <message>" or "<CODE>" when the message is empty.
    std::string toString() const;

    friend bool operator==(const Status& lhs, const Status& rhs) {
        return lhs.code_ == rhs.code_ && lhs.message_ == rhs.message_ &&
               lhs.payload_ == rhs.payload_;
    }

    friend bool operator!=(const Status& lhs, const Status& rhs) { return !(lhs == rhs); }

private:
    StatusCode code_ = StatusCode::Ok;
    std::string message_;
    std::optional<std::string> payload_;
};

std::ostream& operator<<(std::ostream& os, const Status& status);

// Error factories ---------------------------------------------------------------
Status cancelledError(std::string message = {});
Status unknownError(std::string message = {});
Status invalidArgumentError(std::string message = {});
Status deadlineExceededError(std::string message = {});
Status notFoundError(std::string message = {});
Status alreadyExistsError(std::string message = {});
Status permissionDeniedError(std::string message = {});
Status resourceExhaustedError(std::string message = {});
Status failedPreconditionError(std::string message = {});
Status abortedError(std::string message = {});
Status outOfRangeError(std::string message = {});
Status unimplementedError(std::string message = {});
Status internalError(std::string message = {});
Status unavailableError(std::string message = {});
Status dataLossError(std::string message = {});
Status unauthenticatedError(std::string message = {});
Status zeroDivisionError(std::string message = {});

} // namespace kern

#include "kern/status/Status.hpp"

#include "kern/status/ExceptionTranslator.hpp"

#include <cstdlib>
#include <memory>
#include <typeinfo>
#include <utility>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace kern {

namespace {

std::string readableTypeName(const std::type_info& type) {
#if defined(__GNUG__)
    int rc = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &rc), std::free);
    if (rc == 0 && demangled) {
        return demangled.get();
    }
#endif
    return type.name();
}

} // namespace

Status::Status(StatusCode code, std::string message)
: code_(code)
, message_(std::move(message)) {}

Status Status::fromStatusCode(StatusCode code, std::string message) {
    return Status(code, std::move(message));
}

Status Status::fromErrorCode(const std::error_code& ec, std::string_view context) {
    if (!ec) {
        return Status();
    }
    std::string message;
    if (!context.empty()) {
        message.append(context).append(": ");
    }
    message.append(ec.message());
    return Status(statusCodeFromErrorCode(ec), std::move(message));
}

Status Status::fromException(const std::exception& ex) {
    Status status(ExceptionTranslator::instance().translate(ex), ex.what());
    status.payload_ = readableTypeName(typeid(ex));
    return status;
}

Status Status::withPayload(std::string payload) const {
    Status copy(*this);
    copy.payload_ = std::move(payload);
    return copy;
}

std::string Status::toString() const {
    if (ok()) {
        return "OK";
    }
    std::string text(kern::toString(code_));
    if (!message_.empty()) {
        text.append(": ").append(message_);
    }
    return text;
}

std::ostream& operator<<(std::ostream& os, const Status& status) {
    return os << status.toString();
}

Status cancelledError(std::string message) {
    return Status(StatusCode::Cancelled, std::move(message));
}

Status unknownError(std::string message) {
    return Status(StatusCode::Unknown, std::move(message));
}

Status invalidArgumentError(std::string message) {
    return Status(StatusCode::InvalidArgument, std::move(message));
}

Status deadlineExceededError(std::string message) {
    return Status(StatusCode::DeadlineExceeded, std::move(message));
}

Status notFoundError(std::string message) {
    return Status(StatusCode::NotFound, std::move(message));
}

Status alreadyExistsError(std::string message) {
    return Status(StatusCode::AlreadyExists, std::move(message));
}

Status permissionDeniedError(std::string message) {
    return Status(StatusCode::PermissionDenied, std::move(message));
}

Status resourceExhaustedError(std::string message) {
    return Status(StatusCode::ResourceExhausted, std::move(message));
}

Status failedPreconditionError(std::string message) {
    return Status(StatusCode::FailedPrecondition, std::move(message));
}

Status abortedError(std::string message) {
    return Status(StatusCode::Aborted, std::move(message));
}

Status outOfRangeError(std::string message) {
    return Status(StatusCode::OutOfRange, std::move(message));
}

Status unimplementedError(std::string message) {
    return Status(StatusCode::Unimplemented, std::move(message));
}

Status internalError(std::string message) {
    return Status(StatusCode::Internal, std::move(message));
}

Status unavailableError(std::string message) {
    return Status(StatusCode::Unavailable, std::move(message));
}

Status dataLossError(std::string message) {
    return Status(StatusCode::DataLoss, std::move(message));
}

Status unauthenticatedError(std::string message) {
    return Status(StatusCode::Unauthenticated, std::move(message));
}

Status zeroDivisionError(std::string message) {
    return Status(StatusCode::ZeroDivision, std::move(message));
}

} // namespace kern

#include "kern/status/StatusCode.hpp"

namespace kern {

std::string_view toString(StatusCode code) {
    switch (code) {
        case StatusCode::Ok:                 return "OK";
        case StatusCode::Cancelled:          return "CANCELLED";
        case StatusCode::Unknown:            return "UNKNOWN";
        case StatusCode::InvalidArgument:    return "INVALID_ARGUMENT";
        case StatusCode::DeadlineExceeded:   return "DEADLINE_EXCEEDED";
        case StatusCode::NotFound:           return "NOT_FOUND";
        case StatusCode::AlreadyExists:      return "ALREADY_EXISTS";
        case StatusCode::PermissionDenied:   return "PERMISSION_DENIED";
        case StatusCode::ResourceExhausted:  return "RESOURCE_EXHAUSTED";
        case StatusCode::FailedPrecondition: return "FAILED_PRECONDITION";
        case StatusCode::Aborted:            return "ABORTED";
        case StatusCode::OutOfRange:         return "OUT_OF_RANGE";
        case StatusCode::Unimplemented:      return "UNIMPLEMENTED";
        case StatusCode::Internal:           return "INTERNAL";
        case StatusCode::Unavailable:        return "UNAVAILABLE";
        case StatusCode::DataLoss:           return "DATA_LOSS";
        case StatusCode::Unauthenticated:    return "UNAUTHENTICATED";
        case StatusCode::ZeroDivision:       return "ZERO_DIVISION";
        case StatusCode::LogicError:         return "LOGIC_ERROR";
        case StatusCode::DomainError:        return "DOMAIN_ERROR";
        case StatusCode::LengthError:        return "LENGTH_ERROR";
        case StatusCode::RuntimeError:       return "RUNTIME_ERROR";
        case StatusCode::RangeError:         return "RANGE_ERROR";
        case StatusCode::OverflowError:      return "OVERFLOW_ERROR";
        case StatusCode::UnderflowError:     return "UNDERFLOW_ERROR";
        case StatusCode::SystemError:        return "SYSTEM_ERROR";
        case StatusCode::IoFailure:          return "IO_FAILURE";
        case StatusCode::BadCast:            return "BAD_CAST";
        case StatusCode::BadTypeid:          return "BAD_TYPEID";
        case StatusCode::BadOptionalAccess:  return "BAD_OPTIONAL_ACCESS";
        case StatusCode::BadVariantAccess:   return "BAD_VARIANT_ACCESS";
        case StatusCode::BadFunctionCall:    return "BAD_FUNCTION_CALL";
        case StatusCode::BadWeakPtr:         return "BAD_WEAK_PTR";
        case StatusCode::FutureError:        return "FUTURE_ERROR";
        case StatusCode::RegexError:         return "REGEX_ERROR";
        case StatusCode::FilesystemError:    return "FILESYSTEM_ERROR";
    }
    return "UNRECOGNIZED";
}

std::ostream& operator<<(std::ostream& os, StatusCode code) {
    return os << toString(code);
}

bool isValidStatusCode(int value) {
    if (value == static_cast<int>(StatusCode::ZeroDivision)) {
        return true;
    }
    if (value >= static_cast<int>(StatusCode::Ok) &&
        value <= static_cast<int>(StatusCode::Unauthenticated)) {
        return true;
    }
    return value >= static_cast<int>(StatusCode::LogicError) &&
           value <= static_cast<int>(StatusCode::FilesystemError);
}

StatusCode statusCodeFromErrorCode(const std::error_code& ec) {
    if (!ec) {
        return StatusCode::Ok;
    }

    // Compare against portable conditions so both generic_category and
    // system_category errors are recognised.
    const auto is = [&ec](std::errc cond) { return ec == std::make_error_condition(cond); };

    if (is(std::errc::no_such_file_or_directory) || is(std::errc::no_such_device) ||
        is(std::errc::no_such_device_or_address) || is(std::errc::no_such_process)) {
        return StatusCode::NotFound;
    }
    if (is(std::errc::file_exists)) {
        return StatusCode::AlreadyExists;
    }
    if (is(std::errc::permission_denied) || is(std::errc::operation_not_permitted) ||
        is(std::errc::read_only_file_system)) {
        return StatusCode::PermissionDenied;
    }
    if (is(std::errc::timed_out)) {
        return StatusCode::DeadlineExceeded;
    }
    if (is(std::errc::operation_canceled)) {
        return StatusCode::Cancelled;
    }
    if (is(std::errc::invalid_argument) || is(std::errc::is_a_directory) ||
        is(std::errc::not_a_directory) || is(std::errc::filename_too_long) ||
        is(std::errc::bad_file_descriptor)) {
        return StatusCode::InvalidArgument;
    }
    if (is(std::errc::not_enough_memory) || is(std::errc::no_space_on_device) ||
        is(std::errc::too_many_files_open) || is(std::errc::too_many_files_open_in_system)) {
        return StatusCode::ResourceExhausted;
    }
    if (is(std::errc::not_supported) || is(std::errc::operation_not_supported) ||
        is(std::errc::function_not_supported)) {
        return StatusCode::Unimplemented;
    }
    if (is(std::errc::io_error)) {
        return StatusCode::DataLoss;
    }
    if (is(std::errc::resource_unavailable_try_again) || is(std::errc::device_or_resource_busy) ||
        is(std::errc::connection_refused) || is(std::errc::connection_reset) ||
        is(std::errc::not_connected) || is(std::errc::network_unreachable)) {
        return StatusCode::Unavailable;
    }
    if (is(std::errc::result_out_of_range) || is(std::errc::argument_out_of_domain)) {
        return StatusCode::OutOfRange;
    }
    if (is(std::errc::directory_not_empty) || is(std::errc::operation_in_progress) ||
        is(std::errc::connection_already_in_progress)) {
        return StatusCode::FailedPrecondition;
    }
    return StatusCode::Unknown;
}

} // namespace kern

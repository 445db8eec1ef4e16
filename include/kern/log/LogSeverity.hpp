#pragma once

#include <ostream>
#include <string_view>

namespace kern::log {

/**
 * @brief Severity attached to every log record.
 *
 * `Fatal` records come from logFatal() and the check macros, both of which
 * terminate the process after the record is delivered. emit() accepts Fatal
 * as well but leaves termination to its caller.
 */
enum class LogSeverity : int {
    Info = 0,
    Warning = 1,
    Error = 2,
    Fatal = 3
};

/// "INFO", "WARNING", "ERROR" or "FATAL".
std::string_view toString(LogSeverity severity);

std::ostream& operator<<(std::ostream& os, LogSeverity severity);

/// First letter of the severity name, as used in the glog-style prefix.
char severityLetter(LogSeverity severity);

} // namespace kern::log

#pragma once

#include <string_view>

namespace kern::config {

/**
 * @brief Constants shared by the status, check and logging modules.
 *
 * Keeping the values here stops defaults drifting between translation units.
 */

// Logging ---------------------------------------------------------------------
// glog-like prefix: severity letter, date, time with microseconds, call site.
constexpr std::string_view KERN_DEFAULT_LOG_FORMAT = "%severity%%Y%m%d %H:%M:%S.%f [%F:%L] ";
constexpr std::string_view KERN_LOG_FILE_EXTENSION = ".log";

// ANSI colours used by the console sink.
constexpr std::string_view KERN_COLOR_INFO = "\033[0m";
constexpr std::string_view KERN_COLOR_WARNING = "\033[33m";
constexpr std::string_view KERN_COLOR_ERROR = "\033[31m";
constexpr std::string_view KERN_COLOR_FATAL = "\033[35m";
constexpr std::string_view KERN_COLOR_RESET = "\033[0m";

// Status adapter ----------------------------------------------------------------
constexpr std::string_view KERN_UNKNOWN_EXCEPTION_MESSAGE = "unknown exception";

} // namespace kern::config

#pragma once

#include "kern/log/LogSeverity.hpp"
#include "kern/log/SourceLocation.hpp"

#include <chrono>
#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace kern::log {

/**
 * @brief One message on its way to a sink.
 *
 * `message` only lives for the duration of the sink call; sinks that keep
 * records around must copy it.
 */
struct LogRecord {
    LogSeverity severity = LogSeverity::Info;
    std::string_view message;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
};

using LogSink = std::function<void(const LogRecord&)>;

/**
 * @brief Replace the process-wide sink. An empty sink restores the default.
 *
 * The default sink formats with LogFormatter and writes Info/Warning to
 * stdout and Error/Fatal to stderr.
 *
 * Sinks may be called from several threads at once and must serialise their
 * own output.
 */
void setLogSink(LogSink sink);
void resetLogSink();

/**
 * @brief Deliver one record to the current sink.
 *
 * Drops records below LogConfig::minSeverity() except Fatal ones. This is the
 * only entry point the check mechanism relies on.
 */
void emit(LogSeverity severity, std::string_view message, const SourceLocation& location = {});

void logInfo(std::string_view message, const SourceLocation& location = {});
void logWarning(std::string_view message, const SourceLocation& location = {});
void logError(std::string_view message, const SourceLocation& location = {});

/**
 * @brief Emit a Fatal record and terminate the process with std::abort().
 *
 * This is the only way application code should produce a Fatal record; the
 * check macros use it as well.
 */
[[noreturn]] void logFatal(std::string_view message, const SourceLocation& location = {}) noexcept;

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

} // namespace detail

template<typename... Args>
void logInfof(Args&&... args) {
    logInfo(detail::buildLogMessage(std::forward<Args>(args)...));
}

template<typename... Args>
void logWarningf(Args&&... args) {
    logWarning(detail::buildLogMessage(std::forward<Args>(args)...));
}

template<typename... Args>
void logErrorf(Args&&... args) {
    logError(detail::buildLogMessage(std::forward<Args>(args)...));
}

template<typename... Args>
[[noreturn]] void logFatalf(Args&&... args) {
    logFatal(detail::buildLogMessage(std::forward<Args>(args)...));
}

} // namespace kern::log

#define KERN_LOG(severity, ...) \
    ::kern::log::emit((severity), ::kern::log::detail::buildLogMessage(__VA_ARGS__), KERN_HERE)
#define KERN_LOG_INFO(...) KERN_LOG(::kern::log::LogSeverity::Info, __VA_ARGS__)
#define KERN_LOG_WARNING(...) KERN_LOG(::kern::log::LogSeverity::Warning, __VA_ARGS__)
#define KERN_LOG_ERROR(...) KERN_LOG(::kern::log::LogSeverity::Error, __VA_ARGS__)
#define KERN_LOG_FATAL(...) \
    ::kern::log::logFatal(::kern::log::detail::buildLogMessage(__VA_ARGS__), KERN_HERE)

// Debug-only logging. Under NDEBUG the arguments are not evaluated.
#ifdef NDEBUG
#define KERN_DLOG(severity, ...) \
    do { if (false) { KERN_LOG(severity, __VA_ARGS__); } } while (false)
#define KERN_DLOG_FATAL(...) \
    do { if (false) { KERN_LOG_FATAL(__VA_ARGS__); } } while (false)
#else
#define KERN_DLOG(severity, ...) KERN_LOG(severity, __VA_ARGS__)
#define KERN_DLOG_FATAL(...) KERN_LOG_FATAL(__VA_ARGS__)
#endif
#define KERN_DLOG_INFO(...) KERN_DLOG(::kern::log::LogSeverity::Info, __VA_ARGS__)
#define KERN_DLOG_WARNING(...) KERN_DLOG(::kern::log::LogSeverity::Warning, __VA_ARGS__)
#define KERN_DLOG_ERROR(...) KERN_DLOG(::kern::log::LogSeverity::Error, __VA_ARGS__)

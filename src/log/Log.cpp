#include "kern/log/Log.hpp"

#include "kern/log/LogConfig.hpp"
#include "kern/log/LogSinks.hpp"

#include <cstdlib>
#include <mutex>

namespace kern::log {

namespace {

struct SinkState {
    std::mutex mutex;
    LogSink sink = makeConsoleSink();
};

// Constructed on first use so records emitted from other static initializers
// still find a sink.
SinkState& sinkState() {
    static SinkState state;
    return state;
}

} // namespace

std::string_view toString(LogSeverity severity) {
    switch (severity) {
        case LogSeverity::Info:    return "INFO";
        case LogSeverity::Warning: return "WARNING";
        case LogSeverity::Error:   return "ERROR";
        case LogSeverity::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, LogSeverity severity) {
    return os << toString(severity);
}

char severityLetter(LogSeverity severity) {
    return toString(severity).front();
}

void setLogSink(LogSink sink) {
    auto& state = sinkState();
    std::lock_guard lock(state.mutex);
    state.sink = sink ? std::move(sink) : makeConsoleSink();
}

void resetLogSink() {
    auto& state = sinkState();
    std::lock_guard lock(state.mutex);
    state.sink = makeConsoleSink();
}

void emit(LogSeverity severity, std::string_view message, const SourceLocation& location) {
    if (severity != LogSeverity::Fatal &&
        static_cast<int>(severity) < static_cast<int>(LogConfig::minSeverity())) {
        return;
    }

    LogSink sink;
    {
        auto& state = sinkState();
        std::lock_guard lock(state.mutex);
        sink = state.sink;
    }
    if (sink) {
        sink(LogRecord{severity, message, location, std::chrono::system_clock::now()});
    }
}

void logInfo(std::string_view message, const SourceLocation& location) {
    emit(LogSeverity::Info, message, location);
}

void logWarning(std::string_view message, const SourceLocation& location) {
    emit(LogSeverity::Warning, message, location);
}

void logError(std::string_view message, const SourceLocation& location) {
    emit(LogSeverity::Error, message, location);
}

void logFatal(std::string_view message, const SourceLocation& location) noexcept {
    emit(LogSeverity::Fatal, message, location);
    std::abort();
}

} // namespace kern::log

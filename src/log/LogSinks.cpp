#include "kern/log/LogSinks.hpp"

#include "kern/config/KernConfig.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <system_error>

namespace kern::log {

namespace {

std::string_view colorFor(LogSeverity severity) {
    switch (severity) {
        case LogSeverity::Info:    return config::KERN_COLOR_INFO;
        case LogSeverity::Warning: return config::KERN_COLOR_WARNING;
        case LogSeverity::Error:   return config::KERN_COLOR_ERROR;
        case LogSeverity::Fatal:   return config::KERN_COLOR_FATAL;
    }
    return config::KERN_COLOR_RESET;
}

std::mutex initMutex;
bool loggingInitialized = false;

} // namespace

LogSink makeConsoleSink(bool colored, LogFormatter formatter) {
    auto consoleMutex = std::make_shared<std::mutex>();
    return [consoleMutex, colored, formatter = std::move(formatter)](const LogRecord& record) {
        const std::string line = formatter.format(record);
        const bool toError = record.severity == LogSeverity::Error ||
                             record.severity == LogSeverity::Fatal;
        std::ostream& out = toError ? std::cerr : std::cout;

        std::lock_guard lock(*consoleMutex);
        if (colored) {
            out << colorFor(record.severity) << line << config::KERN_COLOR_RESET << '\n';
        } else {
            out << line << '\n';
        }
        out.flush();
    };
}

StatusOr<LogSink> makeFileSink(const std::string& path) {
    errno = 0;
    auto file = std::make_shared<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!file->is_open()) {
        const int err = errno;
        if (err != 0) {
            return Status::fromErrorCode(std::error_code(err, std::generic_category()),
                                         "cannot open log file " + path);
        }
        return unavailableError("cannot open log file " + path);
    }

    auto fileMutex = std::make_shared<std::mutex>();
    LogSink sink = [file, fileMutex](const LogRecord& record) {
        std::lock_guard lock(*fileMutex);
        *file << '[' << toString(record.severity) << "] " << record.message << '\n';
        file->flush();
    };
    return sink;
}

LogSink teeSinks(LogSink first, LogSink second) {
    return [first = std::move(first), second = std::move(second)](const LogRecord& record) {
        if (first) {
            first(record);
        }
        if (second) {
            second(record);
        }
    };
}

Status initLogging(std::string_view programName, const std::optional<std::string>& logDir) {
    std::lock_guard lock(initMutex);
    if (loggingInitialized) {
        return Status();
    }

    if (programName.empty()) {
        return invalidArgumentError("program name must not be empty");
    }

    LogSink sink = makeConsoleSink();

    if (logDir) {
        std::error_code ec;
        std::filesystem::create_directories(*logDir, ec);
        if (ec) {
            return Status::fromErrorCode(ec, "cannot create log directory " + *logDir);
        }

        std::filesystem::path logPath(*logDir);
        logPath /= std::string(programName) + std::string(config::KERN_LOG_FILE_EXTENSION);

        auto fileSink = makeFileSink(logPath.string());
        if (!fileSink.ok()) {
            return fileSink.status();
        }
        sink = teeSinks(std::move(sink), std::move(fileSink).val());
    }

    setLogSink(std::move(sink));
    loggingInitialized = true;
    return Status();
}

void shutdownLogging() {
    std::lock_guard lock(initMutex);
    resetLogSink();
    loggingInitialized = false;
}

} // namespace kern::log

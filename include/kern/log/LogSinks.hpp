#pragma once

#include "kern/log/Log.hpp"
#include "kern/log/LogFormatter.hpp"
#include "kern/status/Status.hpp"
#include "kern/status/StatusOr.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace kern::log {

/**
 * @brief Console sink: Info/Warning to stdout, Error/Fatal to stderr.
 * @param colored   Wrap each line in an ANSI colour chosen by severity.
 * @param formatter Prefix formatter (glog-style by default).
 */
LogSink makeConsoleSink(bool colored = false, LogFormatter formatter = LogFormatter());

/**
 * @brief Sink appending "[SEVERITY] message" lines to @p path.
 *
 * Fails when the file cannot be opened for appending.
 */
StatusOr<LogSink> makeFileSink(const std::string& path);

/// Forward every record to @p first and then @p second.
LogSink teeSinks(LogSink first, LogSink second);

/**
 * @brief Install the standard sinks once per process.
 * @param programName Base name of the log file.
 * @param logDir      When set, the directory is created and records are also
 *                    appended to "<logDir>/<programName>.log".
 *
 * Calling it again after a successful initialisation is a no-op returning OK.
 */
Status initLogging(std::string_view programName, const std::optional<std::string>& logDir = std::nullopt);

/// Undo initLogging(): restore the default sink and allow re-initialisation.
void shutdownLogging();

} // namespace kern::log

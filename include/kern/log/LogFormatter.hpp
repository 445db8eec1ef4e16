#pragma once

#include "kern/log/Log.hpp"

#include <string>
#include <string_view>

namespace kern::log {

/**
 * @brief Renders a LogRecord as "<prefix><message>".
 *
 * The prefix pattern understands these tokens:
 * - `%severity%` first letter of the severity (I, W, E, F)
 * - `%Y` `%m` `%d` date, `%H` `%M` `%S` time, `%f` microseconds
 * - `%F` base name of the source file, `%L` line number
 *
 * Anything else is copied verbatim. Records without a call site (line < 0)
 * skip any `[...]` group holding `%F` or `%L`, together with one space after it. The default pattern mimics glog:
 * `I20250101 12:00:00.000123 [main.cpp:42] message`.
 */
class LogFormatter {
public:
    LogFormatter();
    explicit LogFormatter(std::string pattern);

    std::string format(const LogRecord& record) const;

    const std::string& pattern() const { return formatPattern; }

private:
    std::string formatPattern;
};

} // namespace kern::log

#include "kern/log/LogFormatter.hpp"

#include "kern/config/KernConfig.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace kern::log {

namespace {

std::tm toLocalTime(std::time_t seconds) {
    std::tm parts{};
#if defined(_WIN32)
    localtime_s(&parts, &seconds);
#else
    localtime_r(&seconds, &parts);
#endif
    return parts;
}

std::string_view baseName(const char* path) {
    if (!path) {
        return "unknown";
    }
    std::string_view view(path);
    const auto slash = view.find_last_of("/\\");
    return slash == std::string_view::npos ? view : view.substr(slash + 1);
}

constexpr std::string_view kSeverityToken = "%severity%";

// Length of a "[...]" group starting at @p pos that holds a location token,
// including one trailing space, or 0 when there is none.
std::size_t locationGroupLength(std::string_view pattern, std::size_t pos) {
    const auto close = pattern.find(']', pos);
    if (close == std::string_view::npos) {
        return 0;
    }
    const auto group = pattern.substr(pos, close - pos + 1);
    if (group.find("%F") == std::string_view::npos && group.find("%L") == std::string_view::npos) {
        return 0;
    }
    const std::size_t end = close + 1;
    return (end < pattern.size() && pattern[end] == ' ') ? end - pos + 1 : end - pos;
}

} // namespace

LogFormatter::LogFormatter()
: formatPattern(config::KERN_DEFAULT_LOG_FORMAT) {}

LogFormatter::LogFormatter(std::string pattern)
: formatPattern(std::move(pattern)) {}

std::string LogFormatter::format(const LogRecord& record) const {
    using namespace std::chrono;

    const auto seconds = system_clock::to_time_t(record.timestamp);
    const auto micros = duration_cast<microseconds>(record.timestamp.time_since_epoch()).count() % 1000000;
    const std::tm parts = toLocalTime(seconds);

    std::ostringstream os;
    os << std::setfill('0');

    const std::string_view pattern(formatPattern);
    const bool hasLocation = record.location.line >= 0;
    std::size_t i = 0;
    while (i < pattern.size()) {
        if (!hasLocation && pattern[i] == '[') {
            const std::size_t skip = locationGroupLength(pattern, i);
            if (skip > 0) {
                i += skip;
                continue;
            }
        }
        if (pattern[i] != '%' || i + 1 >= pattern.size()) {
            os << pattern[i++];
            continue;
        }
        if (pattern.compare(i, kSeverityToken.size(), kSeverityToken) == 0) {
            os << severityLetter(record.severity);
            i += kSeverityToken.size();
            continue;
        }

        switch (pattern[i + 1]) {
            case 'Y': os << std::setw(4) << parts.tm_year + 1900; break;
            case 'm': os << std::setw(2) << parts.tm_mon + 1; break;
            case 'd': os << std::setw(2) << parts.tm_mday; break;
            case 'H': os << std::setw(2) << parts.tm_hour; break;
            case 'M': os << std::setw(2) << parts.tm_min; break;
            case 'S': os << std::setw(2) << parts.tm_sec; break;
            case 'f': os << std::setw(6) << (micros < 0 ? micros + 1000000 : micros); break;
            case 'F': os << baseName(record.location.file); break;
            case 'L': os << record.location.line; break;
            default:
                // Not a token; keep both characters.
                os << pattern[i] << pattern[i + 1];
                break;
        }
        i += 2;
    }

    os << record.message;
    return os.str();
}

} // namespace kern::log

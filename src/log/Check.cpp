#include "kern/log/Check.hpp"

#include "kern/log/Log.hpp"

#include <string>

namespace kern {

void checkFailed(std::string_view expression,
                 std::string_view message,
                 const log::SourceLocation& location) noexcept {
    std::string text;
    text.reserve(expression.size() + message.size() + 16);
    text.append("Check failed: ").append(expression);
    if (!message.empty()) {
        text.append(" ").append(message);
    }

    // The sink serialises its own writes, so concurrent failures still
    // produce whole records. Whichever thread gets here first ends the process.
    log::logFatal(text, location);
}

} // namespace kern

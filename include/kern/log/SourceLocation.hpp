#pragma once

namespace kern::log {

/**
 * @brief Call site of a log or check statement.
 *
 * Filled in by `KERN_HERE`; the pointers refer to string literals so the
 * struct can be copied freely.
 */
struct SourceLocation {
    const char* file = "unknown";
    int line = -1;
    const char* function = "";
};

} // namespace kern::log

#define KERN_HERE (::kern::log::SourceLocation{__FILE__, __LINE__, __func__})

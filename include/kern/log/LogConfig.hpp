#pragma once

#include "kern/log/LogSeverity.hpp"

#include <atomic>

namespace kern::log {

/**
 * @brief Stores the process-wide logging threshold.
 *
 * Records below the minimum severity are dropped by emit(). Fatal records are
 * never dropped.
 */
class LogConfig {
public:
    static void setMinSeverity(LogSeverity severity) {
        storage().store(severity, std::memory_order_relaxed);
    }

    static LogSeverity minSeverity() {
        return storage().load(std::memory_order_relaxed);
    }

    /** RAII helper that temporarily overrides the minimum severity. */
    class ScopedOverride {
    public:
        explicit ScopedOverride(LogSeverity severity)
        : previous_(minSeverity()) {
            setMinSeverity(severity);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            setMinSeverity(previous_);
        }

    private:
        LogSeverity previous_;
    };

private:
    static std::atomic<LogSeverity>& storage() {
        static std::atomic<LogSeverity> severity{LogSeverity::Info};
        return severity;
    }
};

} // namespace kern::log

#pragma once

#include "kern/log/Check.hpp"
#include "kern/status/StatusCode.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace kern {

/**
 * @brief Thrown by exception-based arithmetic code for a zero divisor.
 *
 * C++ has no built-in division-by-zero exception; legacy code wrapped by
 * useStatus() throws this one so the adapter can report StatusCode::ZeroDivision.
 */
class ZeroDivisionError : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

/**
 * @brief Process-wide lookup table from exception type to StatusCode.
 *
 * Lookup for a caught exception `ex`:
 * 1. an entry registered for exactly `typeid(ex)`;
 * 2. otherwise the first entry, in precedence order, whose type is a base of
 *    `ex`'s dynamic type;
 * 3. otherwise StatusCode::Unknown.
 *
 * A mapper that throws, or answers StatusCode::Ok, also yields Unknown.
 *
 * The built-in table lists every standard exception class, most derived
 * first. Registrations are inserted ahead of everything already present, so
 * application mappings override the defaults.
 *
 * Thread-safety: lookups work on an immutable snapshot of the table;
 * registration swaps in a new snapshot under a mutex.
 */
class ExceptionTranslator {
public:
    using Mapper = std::function<StatusCode(const std::exception&)>;

    static ExceptionTranslator& instance();

    StatusCode translate(const std::exception& ex) const;

    /// Map exceptions of type @p E (and types derived from it) to @p code.
    template <typename E>
    void registerMapping(StatusCode code) {
        static_assert(std::is_base_of_v<std::exception, E>,
                      "only std::exception types can be translated");
        KERN_CHECK(code != StatusCode::Ok, "an exception cannot map to StatusCode::Ok");
        prepend(makeEntry<E>(code));
    }

    /// Map exceptions of type @p E using @p mapper, e.g. to inspect an error code.
    template <typename E>
    void registerMapping(std::function<StatusCode(const E&)> mapper) {
        static_assert(std::is_base_of_v<std::exception, E>,
                      "only std::exception types can be translated");
        KERN_CHECK(static_cast<bool>(mapper), "exception mapper must not be empty");
        prepend(makeEntry<E>(std::move(mapper)));
    }

    /// Drop all registrations and reinstall the built-in table.
    void resetToDefaults();

    std::size_t size() const;

private:
    struct Entry {
        std::type_index type;
        std::function<bool(const std::exception&)> matches;
        Mapper map;
    };

    using Table = std::vector<Entry>;

    ExceptionTranslator();

    template <typename E>
    static Entry makeEntry(std::function<StatusCode(const E&)> mapper) {
        return Entry{
            std::type_index(typeid(E)),
            [](const std::exception& ex) { return dynamic_cast<const E*>(&ex) != nullptr; },
            [mapper = std::move(mapper)](const std::exception& ex) {
                return mapper(dynamic_cast<const E&>(ex));
            }};
    }

    template <typename E>
    static Entry makeEntry(StatusCode code) {
        return makeEntry<E>(std::function<StatusCode(const E&)>([code](const E&) { return code; }));
    }

    static std::shared_ptr<const Table> defaultTable();

    void prepend(Entry entry);
    std::shared_ptr<const Table> snapshot() const;

    mutable std::mutex tableMutex;
    std::shared_ptr<const Table> table;
};

} // namespace kern

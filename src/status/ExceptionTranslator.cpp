#include "kern/status/ExceptionTranslator.hpp"

#include <filesystem>
#include <future>
#include <ios>
#include <memory>
#include <new>
#include <optional>
#include <regex>
#include <system_error>
#include <typeinfo>
#include <variant>

#if defined(__GLIBCXX__)
#include <cxxabi.h>
#endif

namespace kern {

namespace {

// error_code-carrying exceptions keep their canonical meaning when the code
// is recognised; otherwise they fall back to their family code.
StatusCode fromCarriedErrorCode(const std::error_code& ec, StatusCode fallback) {
    const StatusCode code = statusCodeFromErrorCode(ec);
    if (code == StatusCode::Ok || code == StatusCode::Unknown) {
        return fallback;
    }
    return code;
}

} // namespace

ExceptionTranslator& ExceptionTranslator::instance() {
    static ExceptionTranslator translator;
    return translator;
}

ExceptionTranslator::ExceptionTranslator()
: table(defaultTable()) {}

std::shared_ptr<const ExceptionTranslator::Table> ExceptionTranslator::defaultTable() {
    auto entries = std::make_shared<Table>();
    Table& t = *entries;

    // Most derived first: the second lookup pass takes the first base match.
    t.push_back(makeEntry<ZeroDivisionError>(StatusCode::ZeroDivision));
    t.push_back(makeEntry<std::filesystem::filesystem_error>(
        std::function<StatusCode(const std::filesystem::filesystem_error&)>(
            [](const std::filesystem::filesystem_error& e) {
                return fromCarriedErrorCode(e.code(), StatusCode::FilesystemError);
            })));
    t.push_back(makeEntry<std::ios_base::failure>(StatusCode::IoFailure));
    t.push_back(makeEntry<std::future_error>(StatusCode::FutureError));
    t.push_back(makeEntry<std::regex_error>(StatusCode::RegexError));
    t.push_back(makeEntry<std::system_error>(
        std::function<StatusCode(const std::system_error&)>(
            [](const std::system_error& e) {
                return fromCarriedErrorCode(e.code(), StatusCode::SystemError);
            })));

    t.push_back(makeEntry<std::invalid_argument>(StatusCode::InvalidArgument));
    t.push_back(makeEntry<std::domain_error>(StatusCode::DomainError));
    t.push_back(makeEntry<std::length_error>(StatusCode::LengthError));
    t.push_back(makeEntry<std::out_of_range>(StatusCode::OutOfRange));
    t.push_back(makeEntry<std::logic_error>(StatusCode::LogicError));

    t.push_back(makeEntry<std::range_error>(StatusCode::RangeError));
    t.push_back(makeEntry<std::overflow_error>(StatusCode::OverflowError));
    t.push_back(makeEntry<std::underflow_error>(StatusCode::UnderflowError));
    t.push_back(makeEntry<std::runtime_error>(StatusCode::RuntimeError));

    t.push_back(makeEntry<std::bad_alloc>(StatusCode::ResourceExhausted));
    t.push_back(makeEntry<std::bad_optional_access>(StatusCode::BadOptionalAccess));
    t.push_back(makeEntry<std::bad_variant_access>(StatusCode::BadVariantAccess));
    t.push_back(makeEntry<std::bad_cast>(StatusCode::BadCast));
    t.push_back(makeEntry<std::bad_typeid>(StatusCode::BadTypeid));
    t.push_back(makeEntry<std::bad_function_call>(StatusCode::BadFunctionCall));
    t.push_back(makeEntry<std::bad_weak_ptr>(StatusCode::BadWeakPtr));

    return entries;
}

StatusCode ExceptionTranslator::translate(const std::exception& ex) const {
    const auto entries = snapshot();
    const std::type_index dynamicType(typeid(ex));

    const Entry* match = nullptr;
    for (const auto& entry : *entries) {
        if (entry.type == dynamicType) {
            match = &entry;
            break;
        }
    }
    if (!match) {
        for (const auto& entry : *entries) {
            if (entry.matches(ex)) {
                match = &entry;
                break;
            }
        }
    }
    if (!match) {
        return StatusCode::Unknown;
    }

    // A mapper runs inside the adapter's catch handler; nothing may escape it.
    StatusCode code = StatusCode::Unknown;
    try {
        code = match->map(ex);
#if defined(__GLIBCXX__)
    } catch (abi::__forced_unwind&) {
        throw;
#endif
    } catch (...) {
        return StatusCode::Unknown;
    }
    return code == StatusCode::Ok ? StatusCode::Unknown : code;
}

void ExceptionTranslator::resetToDefaults() {
    auto fresh = defaultTable();
    std::lock_guard lock(tableMutex);
    table = std::move(fresh);
}

std::size_t ExceptionTranslator::size() const {
    return snapshot()->size();
}

void ExceptionTranslator::prepend(Entry entry) {
    std::lock_guard lock(tableMutex);
    auto next = std::make_shared<Table>();
    next->reserve(table->size() + 1);
    next->push_back(std::move(entry));
    next->insert(next->end(), table->begin(), table->end());
    table = std::move(next);
}

std::shared_ptr<const ExceptionTranslator::Table> ExceptionTranslator::snapshot() const {
    std::lock_guard lock(tableMutex);
    return table;
}

} // namespace kern

#pragma once

#ifndef CORE_ERROR_ERROR_SOURCE_H
#define CORE_ERROR_ERROR_SOURCE_H

#include <concepts>
#include <exception>
#include <utility>

namespace flat::core::error {

/**
 * @brief Interface for exceptions that own their causal predecessor
 *
 * Implement this when the cause is held by value or by unique_ptr rather
 * than through std::throw_with_nested. The returned pointer is valid for
 * as long as the implementing object lives.
 */
class ErrorSource {
public:
    virtual ~ErrorSource() = default;

    /**
     * @brief The exception that caused this one, or nullptr
     */
    [[nodiscard]] virtual const std::exception* source() const noexcept = 0;

protected:
    ErrorSource() = default;
    ErrorSource(const ErrorSource&) = default;
    ErrorSource(ErrorSource&&) = default;
    ErrorSource& operator=(const ErrorSource&) = default;
    ErrorSource& operator=(ErrorSource&&) = default;
};

/**
 * @brief What with_source() found below an exception
 */
enum class SourceKind {
    None,       // no causal predecessor
    Exception,  // a std::exception, handed to the visitor
    Foreign     // a nested payload that is not a std::exception
};

/**
 * @brief Visit the causal predecessor of an exception
 *
 * A non-null ErrorSource::source() takes priority over std::nested_exception;
 * an ErrorSource without a cause still reports whatever throw_with_nested
 * attached to it. A nested payload is only alive inside the handler that
 * catches it, so the predecessor is handed to visit() instead of being
 * returned; do not keep references to it past the call.
 */
template<typename F>
    requires std::invocable<F, const std::exception&>
SourceKind with_source(const std::exception& error, F&& visit) {
    if (const auto* sourced = dynamic_cast<const ErrorSource*>(&error)) {
        if (const std::exception* source = sourced->source()) {
            std::forward<F>(visit)(*source);
            return SourceKind::Exception;
        }
    }

    const auto* nested = dynamic_cast<const std::nested_exception*>(&error);
    if (!nested || !nested->nested_ptr()) {
        return SourceKind::None;
    }

    try {
        std::rethrow_exception(nested->nested_ptr());
    } catch (const std::exception& source) {
        std::forward<F>(visit)(source);
        return SourceKind::Exception;
    } catch (...) {
        return SourceKind::Foreign;
    }
}

/**
 * @brief Check whether an exception has any causal predecessor
 */
inline bool has_source(const std::exception& error) {
    return with_source(error, [](const std::exception&) {}) != SourceKind::None;
}

} // namespace flat::core::error

#endif // CORE_ERROR_ERROR_SOURCE_H

#pragma once

#ifndef CORE_ERROR_FLAT_ERROR_H
#define CORE_ERROR_FLAT_ERROR_H

#include <exception>
#include <format>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "conversions.h"
#include "error_source.h"
#include "extended_error.h"
#include "../config/config.h"

namespace flat::core::error {

/**
 * @brief Comparable, copyable snapshot of an arbitrary exception
 *
 * Captures what() of the original, the name of its dynamic type and,
 * recursively, its causal predecessor. The result owns everything it
 * refers to, never changes after construction, and satisfies ExtendedError
 * so it can sit in a std::variant of error payloads where the original
 * (std::system_error, std::filesystem::filesystem_error, ...) could not.
 * Behavior specific to the original type is not preserved.
 *
 * Rendering:
 * - "{}" and operator<<: the captured message
 * - "{:#}": "message (source: <source message>, original type: `name`)",
 *   disclosing one source level in compact form
 * - describe(): structured form of the whole chain
 */
class FlatError : public std::exception, public ErrorSource {
public:
    /**
     * @brief Flatten an exception and its causal chain
     *
     * Flattening a FlatError yields an equal FlatError, plus any cause
     * attached to it by std::throw_with_nested.
     */
    [[nodiscard]] static FlatError from_any(const std::exception& error);

    /**
     * @brief Flatten a stored exception
     *
     * Payloads that are not std::exception, and a null pointer, become a
     * leaf labelled "unknown".
     */
    [[nodiscard]] static FlatError from_exception_ptr(std::exception_ptr eptr);

    /**
     * @brief Flatten the exception currently being handled
     */
    [[nodiscard]] static FlatError from_current_exception() {
        return from_exception_ptr(std::current_exception());
    }

    /**
     * @brief Implicit conversion from registered failure types
     */
    template<FlatConvertible E>
    FlatError(const E& error)  // NOLINT(google-explicit-constructor)
        : FlatError(from_any(error)) {}

    // Deep copy of the source chain
    FlatError(const FlatError& other);
    FlatError(FlatError&&) noexcept = default;
    FlatError& operator=(const FlatError& other);
    FlatError& operator=(FlatError&&) noexcept = default;
    ~FlatError() override = default;

    const char* what() const noexcept override { return message_.c_str(); }

    const std::exception* source() const noexcept override { return source_.get(); }

    /**
     * @brief The flattened source, or nullptr
     */
    [[nodiscard]] const FlatError* flat_source() const noexcept { return source_.get(); }

    /**
     * @brief Name of the original exception type
     *
     * Best-effort and for diagnostics only; the text depends on the compiler.
     * The view is valid for the lifetime of the process.
     */
    [[nodiscard]] std::string_view original_type_name() const noexcept {
        return original_type_name_;
    }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /**
     * @brief Structured developer rendering of the whole chain
     */
    [[nodiscard]] std::string describe() const;

    friend bool operator==(const FlatError& lhs, const FlatError& rhs) noexcept;

private:
    FlatError(std::string_view original_type_name,
              std::string message,
              std::unique_ptr<FlatError> source);

    static std::unique_ptr<FlatError> capture_source(const std::exception& error);

    std::string_view original_type_name_;
    std::string message_;
    std::unique_ptr<FlatError> source_;
};

// Compact form; see FlatError::describe() for the structured rendering
inline std::ostream& operator<<(std::ostream& os, const FlatError& error) {
    return os << error.message();
}

inline std::string to_string(const FlatError& error) {
    return error.message();
}

static_assert(ExtendedError<FlatError>);

/**
 * @brief Use e as is when it already qualifies, flatten it otherwise
 */
template<Failure E>
auto flatten_if_needed(const E& error) {
    if constexpr (ExtendedError<E>) {
        return E(error);
    } else {
        return FlatError::from_any(error);
    }
}

} // namespace flat::core::error

/**
 * @brief "{}" renders the message, "{:#}" the verbose form
 */
template<>
struct std::formatter<flat::core::error::FlatError, char> {
    bool alternate = false;

    constexpr auto parse(std::format_parse_context& ctx) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it == '#') {
            alternate = true;
            ++it;
        }
        if (it != ctx.end() && *it != '}') {
            throw std::format_error("FlatError only supports the '#' format option");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const flat::core::error::FlatError& error, FormatContext& ctx) const {
        if (!alternate) {
            return std::format_to(ctx.out(), "{}", error.message());
        }

        auto out = std::format_to(ctx.out(), "{} (", error.message());
        if (const auto* source = error.flat_source()) {
            out = std::format_to(out, "source: {}, ", source->message());
        }
        return std::format_to(out, "original type: `{}`)", error.original_type_name());
    }
};

#endif // CORE_ERROR_FLAT_ERROR_H

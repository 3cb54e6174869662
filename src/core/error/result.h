#pragma once

#ifndef CORE_ERROR_RESULT_H
#define CORE_ERROR_RESULT_H

#include <concepts>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "extended_error.h"

namespace flat::core::error {

// Error payloads: enums, failures (message in what()), or classes with message()
template<typename E>
concept ErrorType = std::is_enum_v<E> ||
    Failure<E> ||
    requires(const E& e) {
        { e.message() } -> std::convertible_to<std::string_view>;
    };

namespace detail {

template<typename E>
std::string error_message(const E& e) {
    if constexpr (std::is_enum_v<E>) {
        return "Error code: " + std::to_string(static_cast<std::underlying_type_t<E>>(e));
    } else if constexpr (Failure<E>) {
        return e.what();
    } else {
        return std::string(std::string_view(e.message()));
    }
}

} // namespace detail

/**
 * @brief Error wrapper for Result types
 *
 * Provides explicit error construction to avoid ambiguity
 */
template<typename E>
class Error {
public:
    explicit Error(E error) : error_(std::move(error)) {}

    const E& get() const noexcept { return error_; }
    E& get() noexcept { return error_; }

private:
    E error_;
};

/**
 * @brief Result type for error handling without exceptions
 *
 * Holds either a value or an error. With an ExtendedError payload (for
 * instance a FlatError captured at an exception boundary) the whole Result
 * is comparable and copyable.
 *
 * @tparam T Value type
 * @tparam E Error type (must satisfy ErrorType concept)
 */
template<typename T, typename E>
    requires ErrorType<E>
class Result {
public:
    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> data_;

public:
    // Constructors
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error<E> error) : data_(std::in_place_index<1>, std::move(error.get())) {}

    // State queries
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_error() const noexcept {
        return data_.index() == 1;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    // Value access
    [[nodiscard]] const T& value() const& {
        if (!is_ok()) {
            throw std::runtime_error(std::format("Result contains error: {}",
                                                 detail::error_message(error())));
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T& value() & {
        if (!is_ok()) {
            throw std::runtime_error(std::format("Result contains error: {}",
                                                 detail::error_message(error())));
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T&& value() && {
        if (!is_ok()) {
            throw std::runtime_error(std::format("Result contains error: {}",
                                                 detail::error_message(error())));
        }
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    // Error access
    [[nodiscard]] const E& error() const& {
        if (!is_error()) {
            throw std::logic_error("Result is not an error");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] E& error() & {
        if (!is_error()) {
            throw std::logic_error("Result is not an error");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] E&& error() && {
        if (!is_error()) {
            throw std::logic_error("Result is not an error");
        }
        return std::get<1>(std::move(data_));
    }

    // Monadic operations
    template<typename F>
        requires std::invocable<F, const T&>
    auto map(F&& f) const -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>(std::forward<F>(f)(std::get<0>(data_)));
        }
        return Result<U, E>(Error<E>(std::get<1>(data_)));
    }

    template<typename F>
        requires std::invocable<F, const T&>
    auto and_then(F&& f) const -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        static_assert(std::same_as<typename R::error_type, E>,
                      "and_then function must return Result with same error type");

        if (is_ok()) {
            return std::forward<F>(f)(std::get<0>(data_));
        }
        return R(Error<E>(std::get<1>(data_)));
    }

    template<typename F>
        requires std::invocable<F, const E&>
    auto or_else(F&& f) const -> std::invoke_result_t<F, const E&> {
        using R = std::invoke_result_t<F, const E&>;
        static_assert(std::same_as<typename R::value_type, T>,
                      "or_else function must return Result with same value type");

        if (is_error()) {
            return std::forward<F>(f)(std::get<1>(data_));
        }
        return R(std::get<0>(data_));
    }

    template<typename F>
        requires std::invocable<F, const E&>
    auto map_error(F&& f) const -> Result<T, std::invoke_result_t<F, const E&>> {
        using G = std::invoke_result_t<F, const E&>;
        if (is_error()) {
            return Result<T, G>(Error<G>(std::forward<F>(f)(std::get<1>(data_))));
        }
        return Result<T, G>(std::get<0>(data_));
    }

    friend bool operator==(const Result& lhs, const Result& rhs)
        requires std::equality_comparable<T> && std::equality_comparable<E>
    {
        return lhs.data_ == rhs.data_;
    }
};

// Specialization for void result type
template<typename E>
    requires ErrorType<E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

private:
    std::optional<E> error_;

public:
    Result() : error_(std::nullopt) {}
    Result(Error<E> error) : error_(std::move(error.get())) {}

    [[nodiscard]] bool is_ok() const noexcept {
        return !error_.has_value();
    }

    [[nodiscard]] bool is_error() const noexcept {
        return error_.has_value();
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] const E& error() const& {
        if (!is_error()) {
            throw std::logic_error("Result is not an error");
        }
        return *error_;
    }

    [[nodiscard]] E& error() & {
        if (!is_error()) {
            throw std::logic_error("Result is not an error");
        }
        return *error_;
    }

    [[nodiscard]] E&& error() && {
        if (!is_error()) {
            throw std::logic_error("Result is not an error");
        }
        return std::move(*error_);
    }

    // Void value() - just checks for errors
    void value() const {
        if (is_error()) {
            throw std::runtime_error(std::format("Result contains error: {}",
                                                 detail::error_message(*error_)));
        }
    }

    template<typename F>
    auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using R = std::invoke_result_t<F>;
        if (is_error()) {
            return R(Error<E>(*error_));
        }
        return std::forward<F>(f)();
    }

    template<typename F>
        requires std::invocable<F, const E&>
    auto map_error(F&& f) const -> Result<void, std::invoke_result_t<F, const E&>> {
        using G = std::invoke_result_t<F, const E&>;
        if (is_error()) {
            return Result<void, G>(Error<G>(std::forward<F>(f)(*error_)));
        }
        return Result<void, G>();
    }

    friend bool operator==(const Result& lhs, const Result& rhs)
        requires std::equality_comparable<E>
    {
        return lhs.error_ == rhs.error_;
    }
};

// Early return on error (similar to Rust's ? operator)
#define FLAT_TRY(expr) \
    do { \
        auto flat_try_result_ = (expr); \
        if (!flat_try_result_) { \
            return flat::core::error::Error{std::move(flat_try_result_).error()}; \
        } \
    } while(0)

/**
 * @brief Construct a successful Result
 */
template<typename E, typename T>
[[nodiscard]] auto Ok(T&& value) {
    return Result<std::decay_t<T>, E>(std::forward<T>(value));
}

/**
 * @brief Construct an error; converts to any Result<T, E>
 */
template<typename E>
[[nodiscard]] auto Err(E&& error) {
    return Error<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace flat::core::error

#endif // CORE_ERROR_RESULT_H

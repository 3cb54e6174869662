#pragma once

#ifndef CORE_ERROR_TRY_CATCH_H
#define CORE_ERROR_TRY_CATCH_H

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

#include "flat_error.h"
#include "result.h"

namespace flat::core::error {

/**
 * @brief Convert exception-throwing code to Result
 *
 * Runs f and flattens whatever it throws, including payloads that are not
 * std::exception, into the error side of the Result.
 */
template<typename F, typename... Args>
    requires std::invocable<F, Args...>
auto try_flatten(F&& f, Args&&... args) -> Result<std::invoke_result_t<F, Args...>, FlatError> {
    using ReturnType = std::invoke_result_t<F, Args...>;

    try {
        if constexpr (std::is_void_v<ReturnType>) {
            std::invoke(std::forward<F>(f), std::forward<Args>(args)...);
            return Result<void, FlatError>();
        } else {
            return Result<ReturnType, FlatError>(
                std::invoke(std::forward<F>(f), std::forward<Args>(args)...));
        }
    } catch (...) {
        return Result<ReturnType, FlatError>(
            Error<FlatError>(FlatError::from_current_exception()));
    }
}

/**
 * @brief Convert Result to exception
 *
 * Failure error types are thrown as themselves, anything else as a
 * std::runtime_error carrying the error message.
 */
template<typename T, typename E>
T unwrap_or_throw(Result<T, E>&& result) {
    if (result.is_error()) {
        if constexpr (Failure<E>) {
            throw std::move(result).error();
        } else {
            throw std::runtime_error(detail::error_message(result.error()));
        }
    }
    if constexpr (!std::is_void_v<T>) {
        return std::move(result).value();
    }
}

} // namespace flat::core::error

#endif // CORE_ERROR_TRY_CATCH_H

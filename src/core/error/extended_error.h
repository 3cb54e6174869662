#pragma once

#ifndef CORE_ERROR_EXTENDED_ERROR_H
#define CORE_ERROR_EXTENDED_ERROR_H

#include <concepts>
#include <exception>
#include <ostream>
#include <type_traits>

namespace flat::core::error {

/**
 * @brief A failure value: anything thrown or stored as a std::exception
 *
 * The human-facing message is what(). An optional causal predecessor is
 * exposed through ErrorSource or std::nested_exception (see error_source.h).
 */
template<typename E>
concept Failure = std::derived_from<E, std::exception>;

/**
 * @brief Types with a developer-facing rendering through operator<<
 *
 * Any stream rendering qualifies; nothing is required of its content.
 * FlatError streams its message and keeps the structured form in describe().
 */
template<typename E>
concept Debuggable = requires(std::ostream& os, const E& e) {
    { os << e } -> std::same_as<std::ostream&>;
};

/**
 * @brief Failure types that can be used directly as an error payload
 *
 * Any type that is a Failure and is also equality comparable, copyable and
 * Debuggable qualifies, with no opt-in. Failures that fall short (most
 * standard library exceptions lack operator==) must be flattened into a
 * FlatError first.
 *
 * @code
 * template<ExtendedError E>
 * E clone_error(const E& error) {
 *     std::clog << "cloning " << error << '\n';
 *     return error;
 * }
 * @endcode
 */
template<typename E>
concept ExtendedError = Failure<E> &&
                        std::equality_comparable<E> &&
                        std::copy_constructible<E> &&
                        Debuggable<E>;

} // namespace flat::core::error

#endif // CORE_ERROR_EXTENDED_ERROR_H

#pragma once

#ifndef CORE_ERROR_CONVERSIONS_H
#define CORE_ERROR_CONVERSIONS_H

#include <any>
#include <format>
#include <functional>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <type_traits>
#include <typeinfo>
#include <variant>

#include "extended_error.h"
#include "../config/config.h"

#if FLAT_ENABLE_HOSTED_CONVERSIONS
#include <filesystem>
#include <future>
#include <ios>
#include <regex>
#endif

namespace flat::core::error {

/**
 * @brief Registers E for implicit conversion into FlatError
 *
 * Matching is on the exact type. Specialize for your own failure types:
 *
 * @code
 * template<>
 * struct flat::core::error::enable_flat_conversion<db::ConnectionError>
 *     : std::true_type {};
 * @endcode
 *
 * Any failure can still be flattened explicitly with FlatError::from_any.
 */
template<typename E>
struct enable_flat_conversion : std::false_type {};

/**
 * @brief Failure types with a registered implicit conversion
 */
template<typename E>
concept FlatConvertible = Failure<std::remove_cvref_t<E>> &&
                          enable_flat_conversion<std::remove_cvref_t<E>>::value;

#define FLAT_REGISTER_CONVERSION(type) \
    template<> \
    struct enable_flat_conversion<type> : std::true_type {}

// ==============================================================================
// Language support and general purpose library
// ==============================================================================

FLAT_REGISTER_CONVERSION(std::logic_error);
FLAT_REGISTER_CONVERSION(std::invalid_argument);
FLAT_REGISTER_CONVERSION(std::domain_error);
FLAT_REGISTER_CONVERSION(std::length_error);
FLAT_REGISTER_CONVERSION(std::out_of_range);
FLAT_REGISTER_CONVERSION(std::runtime_error);
FLAT_REGISTER_CONVERSION(std::range_error);
FLAT_REGISTER_CONVERSION(std::overflow_error);
FLAT_REGISTER_CONVERSION(std::underflow_error);
FLAT_REGISTER_CONVERSION(std::bad_alloc);
FLAT_REGISTER_CONVERSION(std::bad_array_new_length);
FLAT_REGISTER_CONVERSION(std::bad_cast);
FLAT_REGISTER_CONVERSION(std::bad_typeid);
FLAT_REGISTER_CONVERSION(std::bad_optional_access);
FLAT_REGISTER_CONVERSION(std::bad_variant_access);
FLAT_REGISTER_CONVERSION(std::bad_any_cast);
FLAT_REGISTER_CONVERSION(std::bad_function_call);
FLAT_REGISTER_CONVERSION(std::bad_weak_ptr);
FLAT_REGISTER_CONVERSION(std::format_error);

// Mutex lock and try-lock failures are reported as std::system_error
FLAT_REGISTER_CONVERSION(std::system_error);

// ==============================================================================
// Hosted runtime only
// ==============================================================================

#if FLAT_ENABLE_HOSTED_CONVERSIONS
FLAT_REGISTER_CONVERSION(std::ios_base::failure);
FLAT_REGISTER_CONVERSION(std::filesystem::filesystem_error);
FLAT_REGISTER_CONVERSION(std::future_error);
FLAT_REGISTER_CONVERSION(std::regex_error);
#endif

} // namespace flat::core::error

#endif // CORE_ERROR_CONVERSIONS_H

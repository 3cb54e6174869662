#pragma once

#ifndef CORE_ERROR_TYPE_NAME_H
#define CORE_ERROR_TYPE_NAME_H

#include <string_view>
#include <typeinfo>
#include <type_traits>

#include "../config/config.h"

namespace flat::core::error {

/**
 * @brief Human-readable name of a type, for diagnostics only
 *
 * Names are demangled once and interned in a process-wide table, so the
 * returned view stays valid until the process exits. The exact text is
 * compiler dependent and must not be parsed or compared across builds.
 */
std::string_view type_name(const std::type_info& info);

/**
 * @brief Static type name of T
 */
template<typename T>
std::string_view type_name() {
    return type_name(typeid(T));
}

/**
 * @brief Name of the dynamic type of value (static type if T is not polymorphic)
 */
template<typename T>
std::string_view type_name_of(const T& value) {
    if constexpr (std::is_polymorphic_v<T>) {
        return type_name(typeid(value));
    } else {
        return type_name(typeid(T));
    }
}

} // namespace flat::core::error

#endif // CORE_ERROR_TYPE_NAME_H

#pragma once

#ifndef CORE_CONFIG_CONFIG_H
#define CORE_CONFIG_CONFIG_H

#include <cstddef>

// ==============================================================================
// Core Library Configuration
// ==============================================================================
// This file contains compile-time configuration and feature toggles used
// throughout the flat_error library. Every toggle can be overridden from the
// build system with -D<NAME>=0/1.
// ==============================================================================

namespace flat {
namespace config {

// ==============================================================================
// Version Information
// ==============================================================================

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "0.3.0";

using size_type = std::size_t;

// ==============================================================================
// Platform Detection
// ==============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define FLAT_PLATFORM_WINDOWS 1
    #define FLAT_PLATFORM_NAME "Windows"
#elif defined(__APPLE__)
    #include <TargetConditionals.h>
    #if TARGET_OS_MAC
        #define FLAT_PLATFORM_MACOS 1
        #define FLAT_PLATFORM_NAME "macOS"
    #endif
#elif defined(__linux__)
    #define FLAT_PLATFORM_LINUX 1
    #define FLAT_PLATFORM_NAME "Linux"
#elif defined(__unix__)
    #define FLAT_PLATFORM_UNIX 1
    #define FLAT_PLATFORM_NAME "Unix"
#else
    #define FLAT_PLATFORM_UNKNOWN 1
    #define FLAT_PLATFORM_NAME "Unknown"
#endif

// ==============================================================================
// Compiler Detection
// ==============================================================================

#if defined(__clang__)
    #define FLAT_COMPILER_CLANG 1
    #define FLAT_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
    #define FLAT_COMPILER_GCC 1
    #define FLAT_COMPILER_NAME "GCC"
#elif defined(_MSC_VER)
    #define FLAT_COMPILER_MSVC 1
    #define FLAT_COMPILER_NAME "MSVC"
#else
    #define FLAT_COMPILER_UNKNOWN 1
    #define FLAT_COMPILER_NAME "Unknown"
#endif

// ==============================================================================
// Build Configuration
// ==============================================================================

#if defined(DEBUG) || defined(_DEBUG) || !defined(NDEBUG)
    #define FLAT_DEBUG_BUILD 1
    #define FLAT_BUILD_TYPE "Debug"
#else
    #define FLAT_RELEASE_BUILD 1
    #define FLAT_BUILD_TYPE "Release"
#endif

// ==============================================================================
// Feature Toggles
// ==============================================================================

// Library log statements (see core/logging/logger.h)
#ifndef FLAT_ENABLE_LOGGING
    #define FLAT_ENABLE_LOGGING 1
#endif

// Conversions from exception types that only exist on a hosted runtime
// (iostreams, filesystem, futures, regex). Disable for freestanding-style
// builds that only want the language-support exceptions.
#ifndef FLAT_ENABLE_HOSTED_CONVERSIONS
    #define FLAT_ENABLE_HOSTED_CONVERSIONS 1
#endif

// Readable type labels through the Itanium C++ ABI demangler
#ifndef FLAT_ENABLE_DEMANGLING
    #if defined(__has_include)
        #if __has_include(<cxxabi.h>)
            #define FLAT_ENABLE_DEMANGLING 1
        #else
            #define FLAT_ENABLE_DEMANGLING 0
        #endif
    #else
        #define FLAT_ENABLE_DEMANGLING 0
    #endif
#endif

// ==============================================================================
// String Configuration
// ==============================================================================

// Label recorded for exception payloads that do not derive from std::exception
constexpr const char* UNKNOWN_TYPE_LABEL = "unknown";
constexpr const char* UNKNOWN_EXCEPTION_MESSAGE = "Unknown exception";
constexpr const char* UNKNOWN_NESTED_MESSAGE = "Unknown nested exception";

// ==============================================================================
// Attribute Macros
// ==============================================================================

// Unused parameter
#define FLAT_UNUSED(x) ((void)(x))

// Likely/Unlikely branch hints
#if defined(FLAT_COMPILER_GCC) || defined(FLAT_COMPILER_CLANG)
    #define FLAT_LIKELY(x) __builtin_expect(!!(x), 1)
    #define FLAT_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define FLAT_LIKELY(x) (x)
    #define FLAT_UNLIKELY(x) (x)
#endif

// ==============================================================================
// Utility Macros
// ==============================================================================

#define FLAT_STRINGIFY(x) #x
#define FLAT_STRINGIFY_MACRO(x) FLAT_STRINGIFY(x)

} // namespace config
} // namespace flat

#endif // CORE_CONFIG_CONFIG_H

#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test gate for stackless
 *
 * Include this header early in a translation unit (the CLI main.cpp does)
 * to get clear error messages if the toolchain is insufficient.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "stackless requires C++23 or later (__cplusplus >= 202302L)."
#endif

// =============================================================================
// std::print / std::println (__cpp_lib_print)
// =============================================================================
// Required for: CLI diagnostics on stderr

#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "stackless requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Result / VoidResult

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "stackless requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::views::enumerate (__cpp_lib_ranges_enumerate)
// =============================================================================
// Required for: offset-indexed iteration over code

#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "stackless requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================
// Required for: rendering

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "stackless requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define STACKLESS_CPP23_FEATURES_VERIFIED 1

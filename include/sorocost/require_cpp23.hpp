#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for sorocost
 *
 * Include early in a translation unit (main.cpp does) to get a clear
 * error when the toolchain is insufficient.
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
    #error "sorocost requires C++23 or later (__cplusplus >= 202302L)."
#endif

// =============================================================================
// std::print / std::println (__cpp_lib_print)
// =============================================================================
// Required for: CLI and report output

#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "sorocost requires std::print/std::println (__cpp_lib_print >= 202207L)."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================
// Required for: hint, report and error message text, UTC timestamps

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "sorocost requires std::format (__cpp_lib_format >= 202110L)."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Result / VoidResult error handling

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "sorocost requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// =============================================================================
// std::views::enumerate (__cpp_lib_ranges_enumerate)
// =============================================================================
// Required for: indexed footprint parsing

#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "sorocost requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L)."
#endif

// =============================================================================
// std::to_underlying (__cpp_lib_to_underlying)
// =============================================================================
// Required for: LedgerDimension indexing

#if !defined(__cpp_lib_to_underlying) || __cpp_lib_to_underlying < 202'102L
    #error "sorocost requires std::to_underlying (__cpp_lib_to_underlying >= 202102L)."
#endif

#define SOROCOST_CPP23_FEATURES_VERIFIED 1

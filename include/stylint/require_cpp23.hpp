#pragma once

/**
 * @file require_cpp23.hpp
 * @brief Compile-time checks for the C++23 library features stylint relies on
 *
 * Included by the analyzer so a toolchain without these features fails with a
 * readable message instead of a wall of template errors.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "stylint requires C++23 or later (__cplusplus >= 202302L)."
#endif

// std::println is used for trace output.
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "stylint requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Result<T> is std::expected.
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "stylint requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Parsers and the canonical writer iterate with std::views::enumerate.
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "stylint requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// SHA-256 rounds use std::rotr.
#if !defined(__cpp_lib_bitops) || __cpp_lib_bitops < 201'907L
    #error "stylint requires <bit> bit operations (__cpp_lib_bitops >= 201907L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Enum ranks in the rule catalog and scorer.
#if !defined(__cpp_lib_to_underlying) || __cpp_lib_to_underlying < 202'102L
    #error "stylint requires std::to_underlying (__cpp_lib_to_underlying >= 202102L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "stylint requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "stylint requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define STYLINT_CPP23_FEATURES_VERIFIED 1

namespace stylint::compat {

/// Always true once this header compiles; usable in static_assert.
[[nodiscard]] constexpr bool verify_cpp23_features() noexcept
{
    return true;
}

}  // namespace stylint::compat

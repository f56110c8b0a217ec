#pragma once

/**
 * @file common.hpp
 * @brief Common utilities and macros for the Orrery scene module
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <type_traits>
#include <cpptrace/cpptrace.hpp>

#include "profiler.hpp"
#include "logger.hpp"

// ============================================================================
// Assertion Macros (Debug-only)
// ============================================================================

#ifdef DEBUG
#define ORRERY_ASSERT(condition, message)                                        \
  do {                                                                           \
    if (!(condition)) {                                                          \
        std::string trace = cpptrace::generate_trace().to_string();              \
        orrery::core::Logger::critical("ASSERTION FAILED: {}\nStack Trace:\n{}", \
            message, trace);                                                     \
      throw cpptrace::runtime_error(                                             \
          "ASSERTION FAILED: " + std::string(message) +                          \
          "\nFile: " __FILE__ "\nLine: " + std::to_string(__LINE__));            \
    }                                                                            \
  } while (0)
#else
#define ORRERY_ASSERT(condition, message) (void)(0)
#endif

// ============================================================================
// Cast Helper Functions (to reduce static_cast noise)
// ============================================================================

namespace orrery::util {

/**
 * @brief Helper function to convert any type to uint32_t cleanly
 */
template <typename T>
constexpr uint32_t u32(T value) noexcept {
  return static_cast<uint32_t>(value);
}

/**
 * @brief Helper function to convert any type to float cleanly
 * Useful for integer-to-float conversions in math-heavy code
 */
template <typename T>
constexpr float toFloat(T value) noexcept {
  return static_cast<float>(value);
}

/**
 * @brief Helper function to get underlying value of enum cleanly
 */
template <typename Enum>
constexpr auto underlying(Enum e) noexcept -> std::underlying_type_t<Enum> {
  return static_cast<std::underlying_type_t<Enum>>(e);
}

} // namespace orrery::util

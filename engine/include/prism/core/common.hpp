#pragma once

/**
 * @file common.hpp
 * @brief Common utilities and macros for the Prism importer
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <cpptrace/cpptrace.hpp>

#include "profiler.hpp"
#include "logger.hpp"

// ============================================================================
// Assertion Macros (Debug-only)
// ============================================================================

#ifdef DEBUG
#define PRISM_ASSERT(condition, message)                                       \
  do {                                                                         \
    if (!(condition)) {                                                        \
        std::string trace = cpptrace::generate_trace().to_string();            \
        prism::core::Logger::critical("ASSERTION FAILED: {}\nStack Trace:\n{}",\
            message, trace);                                                   \
      throw cpptrace::runtime_error(                                           \
          "ASSERTION FAILED: " + std::string(message) +                        \
          "\nFile: " __FILE__ "\nLine: " + std::to_string(__LINE__));          \
    }                                                                          \
  } while (0)
#else
#define PRISM_ASSERT(condition, message) (void)(0)
#endif

// ============================================================================
// Cast Helper Functions (to reduce static_cast noise)
// ============================================================================

namespace prism::core {

/**
 * @brief Helper function to convert any type to uint32_t cleanly
 */
template <typename T>
constexpr uint32_t u32(T value) noexcept {
  return static_cast<uint32_t>(value);
}

/**
 * @brief Helper function to convert any type to size_t cleanly
 */
template <typename T>
constexpr size_t sz(T value) noexcept {
  return static_cast<size_t>(value);
}

} // namespace prism::core

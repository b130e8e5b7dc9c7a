#pragma once

#include <facemetrics/core/core.hpp>

#include <format>
#include <source_location>
#include <string>
#include <string_view>

namespace facemetrics {

/**
 * @brief Prints a fatal error banner with an optional stack trace and aborts.
 * @param message Description of the failure.
 */
[[noreturn]] void AbortWithStacktrace(std::string_view message) noexcept;

namespace details {

#ifdef FACEMETRICS_ENABLE_ASSERTS
inline constexpr bool kEnableAssert = true;
#else
inline constexpr bool kEnableAssert = false;
#endif

/**
 * @brief Captures the current call stack as text.
 * @return Stack trace, or an empty string when built without FACEMETRICS_ENABLE_STACKTRACE.
 */
[[nodiscard]] std::string CaptureStackTrace() noexcept;

/**
 * @brief Reports a failed assertion through the logger and aborts.
 * @param condition The failed condition as a string.
 * @param loc Source location of the assertion.
 * @param message Additional message describing the failure.
 */
[[noreturn]] void AssertionFailed(std::string_view condition, const std::source_location& loc,
                                  std::string_view message = {}) noexcept;

template <typename... Args>
  requires(sizeof...(Args) > 0)
[[noreturn]] void AssertionFailed(std::string_view condition, const std::source_location& loc,
                                  std::format_string<Args...> fmt, Args&&... args) noexcept {
  std::string message;
  try {
    message = std::format(fmt, std::forward<Args>(args)...);
  } catch (...) {
    message = "Formatting error in assertion message";
  }
  AssertionFailed(condition, loc, message);
}

}  // namespace details

}  // namespace facemetrics

/**
 * @brief Checks an internal invariant in builds with FACEMETRICS_ENABLE_ASSERTS.
 * @details Usable as an expression. The condition is not evaluated when assertions are disabled.
 */
#ifdef FACEMETRICS_ENABLE_ASSERTS
#define FACEMETRICS_ASSERT(condition, ...)                                           \
  (FACEMETRICS_EXPECT_TRUE(static_cast<bool>(condition))                             \
       ? static_cast<void>(0)                                                        \
       : ::facemetrics::details::AssertionFailed(#condition, std::source_location::current() \
                                                     __VA_OPT__(, ) __VA_ARGS__))
#else
#define FACEMETRICS_ASSERT(condition, ...) static_cast<void>(sizeof(static_cast<bool>(condition)))
#endif

#define FACEMETRICS_INVARIANT(condition, ...) FACEMETRICS_ASSERT(condition __VA_OPT__(, ) __VA_ARGS__)

/**
 * @brief Like FACEMETRICS_ASSERT, but always evaluated.
 */
#define FACEMETRICS_VERIFY(condition, ...)                                           \
  (FACEMETRICS_EXPECT_TRUE(static_cast<bool>(condition))                             \
       ? static_cast<void>(0)                                                        \
       : ::facemetrics::details::AssertionFailed(#condition, std::source_location::current() \
                                                     __VA_OPT__(, ) __VA_ARGS__))

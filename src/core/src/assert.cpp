#include <facemetrics/core/assert.hpp>

#include <facemetrics/core/core.hpp>
#include <facemetrics/core/logger.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#ifdef FACEMETRICS_ENABLE_STACKTRACE
// FACEMETRICS_USE_STD_STACKTRACE is defined by CMake when std::stacktrace links.
// __cpp_lib_stacktrace alone is not enough: libstdc++ may advertise it without the library.
#ifdef FACEMETRICS_USE_STD_STACKTRACE
#include <stacktrace>
#else
#include <boost/stacktrace.hpp>
#endif
#endif

namespace facemetrics {

namespace details {

std::string CaptureStackTrace() noexcept {
#ifdef FACEMETRICS_ENABLE_STACKTRACE
  constexpr size_t kMaxStackTraceFrames = 10;

  try {
    std::string result;
    result.reserve(512);
    result.append("\nStack trace:");

#ifdef FACEMETRICS_USE_STD_STACKTRACE
    const auto stack_trace = std::stacktrace::current();
    const auto stack_size = static_cast<size_t>(stack_trace.size());
#else
    const boost::stacktrace::stacktrace stack_trace;
    const size_t stack_size = stack_trace.size();
#endif
    if (stack_size <= 1) {
      result.append(" <empty>");
      return result;
    }

    // Frame 0 is this function
    const size_t frame_count = std::min(stack_size, 1 + kMaxStackTraceFrames);
    for (size_t i = 1; i < frame_count; ++i) {
      result.append("\n  ");
      result.append(std::to_string(i));
      result.append(": ");
#ifdef FACEMETRICS_USE_STD_STACKTRACE
      result.append(std::to_string(stack_trace[static_cast<std::stacktrace::size_type>(i)]));
#else
      result.append(boost::stacktrace::to_string(stack_trace[i]));
#endif
    }

    return result;
  } catch (...) {
    return "\nStack trace: <error during capture>";
  }
#else
  return "";
#endif
}

void AssertionFailed(std::string_view condition, const std::source_location& loc, std::string_view message) noexcept {
  Logger::GetInstance().LogAssertionFailure(condition, loc, message);
  Logger::GetInstance().FlushAll();

  std::string summary;
  try {
    summary = std::format("Assertion failed: {} | {} [{}:{}]", condition, message, loc.file_name(), loc.line());
  } catch (...) {
    summary = "Assertion failed";
  }
  AbortWithStacktrace(summary);
}

}  // namespace details

void AbortWithStacktrace(std::string_view message) noexcept {
  std::fprintf(stderr, "\n=== FATAL ERROR ===\n");
  std::fprintf(stderr, "Message: %.*s\n", static_cast<int>(message.size()), message.data());

#ifdef FACEMETRICS_ENABLE_STACKTRACE
  std::fprintf(stderr, "%s\n", details::CaptureStackTrace().c_str());
#else
  std::fprintf(stderr, "\nStack trace: <not available - build with FACEMETRICS_ENABLE_STACKTRACE>\n");
#endif

  std::fprintf(stderr, "===================\n\n");
  std::fflush(stderr);

  FACEMETRICS_DEBUG_BREAK();
  std::abort();
}

}  // namespace facemetrics

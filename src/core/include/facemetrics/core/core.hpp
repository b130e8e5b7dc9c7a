#pragma once

#include <utility>

// Debug break, only meaningful when assertions are compiled in
#ifdef FACEMETRICS_ENABLE_ASSERTS

#if defined(_MSC_VER)
#define FACEMETRICS_DEBUG_BREAK() __debugbreak()

#elif (defined(__x86_64__) || defined(__i386__)) && (defined(__GNUC__) || defined(__clang__))
#define FACEMETRICS_DEBUG_BREAK() __asm__("int3")

#elif (defined(__aarch64__) || defined(__arm64__)) && (defined(__GNUC__) || defined(__clang__))
#define FACEMETRICS_DEBUG_BREAK() __asm__("brk 0")

#elif defined(__has_builtin) && __has_builtin(__builtin_trap)
#define FACEMETRICS_DEBUG_BREAK() __builtin_trap()

#else
#include <csignal>
#define FACEMETRICS_DEBUG_BREAK() ::std::raise(SIGTRAP)
#endif

#else
#define FACEMETRICS_DEBUG_BREAK()
#endif

#define FACEMETRICS_UNREACHABLE() std::unreachable()

#define FACEMETRICS_STRINGIFY_IMPL(x) #x
#define FACEMETRICS_STRINGIFY(x) FACEMETRICS_STRINGIFY_IMPL(x)

#define FACEMETRICS_CONCAT_IMPL(a, b) a##b
#define FACEMETRICS_CONCAT(a, b) FACEMETRICS_CONCAT_IMPL(a, b)

// Anonymous variable generation
#define FACEMETRICS_ANONYMOUS_VAR(prefix) FACEMETRICS_CONCAT(prefix, __LINE__)

#if defined(__GNUC__) || defined(__clang__)
#define FACEMETRICS_EXPECT_TRUE(x) __builtin_expect(!!(x), 1)
#define FACEMETRICS_EXPECT_FALSE(x) __builtin_expect(!!(x), 0)
#else
#define FACEMETRICS_EXPECT_TRUE(x) (x)
#define FACEMETRICS_EXPECT_FALSE(x) (x)
#endif

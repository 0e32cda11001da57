/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal
 *        errors, and debug messaging.
 *
 * The helpers use `fmt` for compile-time format string checks and
 * `std::source_location` for automatic source code location reporting.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "mqttop_utils_export.h"
#include "utils/format_tools.hpp"

// ---------------- source location formatting --------------
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", mqttop::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace mqttop::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * Uses `backtrace` and `backtrace_symbols`, demangling C++ symbols through
 * `dladdr` where possible. Errors during capture are reported to `stderr`.
 */
MQTTOP_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable programming errors (misuse of a lifecycle-managed
 * service, broken invariants). Formats and prints the message with the source
 * location, prints a stack trace, and calls `std::abort()`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC\n"
                   "[PANIC]  Exception: '{}'\n",
                   SRCLOC_TO_STR(loc), e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: '{}'\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace mqttop::debug

#ifndef MQTTOP_LOC_HERE_STR
#define MQTTOP_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Calls `mqttop::debug::panic` with automatic source location.
 * @param fmt The `fmt`-style format string literal.
 */
#ifndef MQTTOP_PANIC
#define MQTTOP_PANIC(fmt, ...)                                                                     \
    ::mqttop::debug::panic(std::source_location::current(),                                       \
                           FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Prints a debug message; compiled out unless MQTTOP_ENABLE_DEBUG_MESSAGES.
 *
 * Used where the Logger cannot be (inside the Logger and the lifecycle manager).
 */
#ifndef MQTTOP_DEBUG
#if defined(MQTTOP_ENABLE_DEBUG_MESSAGES)
#define MQTTOP_DEBUG(fmt, ...) ::mqttop::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define MQTTOP_DEBUG(fmt, ...)                                                                     \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif

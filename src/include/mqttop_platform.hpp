#pragma once
/**
 * @file mqttop_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (MQTTOP_PLATFORM_LINUX, MQTTOP_IS_POSIX, etc.) should include
 * this. It is self-contained and can be included at any point.
 *
 * mqttop reads Linux kernel interfaces (/proc, /sys) for its metrics and device
 * identity, so only POSIX targets are supported.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_APPLE)

#define MQTTOP_PLATFORM_APPLE 1

#elif defined(PLATFORM_FREEBSD)

#define MQTTOP_PLATFORM_FREEBSD 1

#elif defined(PLATFORM_LINUX)

#define MQTTOP_PLATFORM_LINUX 1

#else
// Fallback detection
#if defined(__APPLE__) && defined(__MACH__)
#define MQTTOP_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define MQTTOP_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define MQTTOP_PLATFORM_LINUX 1
#else
#define MQTTOP_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(MQTTOP_PLATFORM_APPLE) || defined(MQTTOP_PLATFORM_FREEBSD) ||                        \
    defined(MQTTOP_PLATFORM_LINUX)
#define MQTTOP_IS_POSIX 1
#else
#error "mqttop requires a POSIX platform."
#endif

// --- Require C++20 or later --------------------------------------------------
// The codebase uses std::jthread, std::stop_token, std::source_location and
// designated initializers. Fail early with a clear message when an older
// language standard is used.
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif

#include "mqttop_utils_export.h"

namespace mqttop::platform
{

/// Process id of the calling process.
MQTTOP_UTILS_EXPORT uint64_t get_pid();

/// Kernel thread id of the calling thread (what `top -H` shows).
MQTTOP_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Name of the running executable.
 * @param include_path When true, the absolute path is returned instead of the file name.
 * @return The name, or "unknown" when it cannot be determined.
 */
MQTTOP_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/// Host name as reported by gethostname(); empty on failure.
MQTTOP_UTILS_EXPORT std::string get_hostname() noexcept;

MQTTOP_UTILS_EXPORT int get_version_major() noexcept;
MQTTOP_UTILS_EXPORT int get_version_minor() noexcept;
MQTTOP_UTILS_EXPORT int get_version_rolling() noexcept;
MQTTOP_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Monotonic clock reading in nanoseconds.
 * @note The absolute value is meaningless; use for deltas only.
 */
MQTTOP_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/// Nanoseconds elapsed since @p start_ns, or 0 if @p start_ns lies in the future.
MQTTOP_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace mqttop::platform

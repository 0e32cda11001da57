/**
 * @file platform.cpp
 * @brief Provides POSIX implementations for core OS-specific utilities.
 *
 * This file contains the platform-specific logic for functions declared in the
 * `mqttop::platform` namespace, such as retrieving process and thread IDs,
 * getting the current executable's path, and package version information.
 */
#include "mqttop_base.hpp"
#include "mqttop_version.h"

#include <array>
#include <chrono>
#include <climits>
#include <thread>

#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#ifdef MQTTOP_PLATFORM_FREEBSD
#include <sys/sysctl.h>
#endif

#if defined(MQTTOP_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

#include <fmt/format.h>

namespace mqttop::platform
{

uint64_t get_pid()
{
    return static_cast<uint64_t>(getpid());
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most efficient OS-specific API available (`pthread_threadid_np`,
 *          `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(__APPLE__)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(__linux__)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    // Fallback for other POSIX systems.
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

/**
 * @brief Discovers the name and optionally the full path of the current executable.
 * @details Uses `readlink` on `/proc/self/exe` (Linux), `_NSGetExecutablePath` (macOS)
 *          and `sysctl` (FreeBSD).
 */
std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(MQTTOP_PLATFORM_LINUX)
        std::array<char, PATH_MAX> buf{};
        const ssize_t len = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
        if (len <= 0)
        {
            return "unknown";
        }
        full_path.assign(buf.data(), static_cast<size_t>(len));
#elif defined(MQTTOP_PLATFORM_APPLE)
        uint32_t size = PATH_MAX;
        std::string buf(size, '\0');
        if (_NSGetExecutablePath(buf.data(), &size) != 0)
        {
            buf.resize(size);
            if (_NSGetExecutablePath(buf.data(), &size) != 0)
            {
                return "unknown";
            }
        }
        full_path = buf.c_str();
#elif defined(MQTTOP_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        std::array<char, PATH_MAX> buf{};
        size_t size = buf.size();
        if (sysctl(mib, 4, buf.data(), &size, nullptr, 0) != 0)
        {
            return "unknown";
        }
        full_path = buf.data();
#endif
        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        // std::filesystem operations can throw on invalid paths.
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

std::string get_hostname() noexcept
{
    std::array<char, 256> buf{};
    if (::gethostname(buf.data(), buf.size() - 1) != 0)
    {
        return {};
    }
    return std::string(buf.data());
}

// --- Version information (from mqttop_version.h, generated at configure time) ---

int get_version_major() noexcept
{
    return MQTTOP_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return MQTTOP_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return MQTTOP_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return MQTTOP_VERSION_STRING;
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

} // namespace mqttop::platform

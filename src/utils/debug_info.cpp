/**
 * @file debug_info.cpp
 * @brief Stack trace printing for panic reports.
 */
#include "mqttop_base.hpp"

#include <cstdlib>
#include <string>

#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols

namespace mqttop::debug
{

namespace
{
template <typename... Args>
inline void safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (const std::exception &)
    {
        // Nothing more can be reported while already reporting a failure.
        std::fputs("[stack trace formatting failed]\n", stderr);
    }
}

std::string demangle(const char *symbol)
{
    int status = 0;
    char *dem = abi::__cxa_demangle(symbol, nullptr, nullptr, &status);
    if (status == 0 && dem != nullptr)
    {
        std::string out(dem);
        std::free(dem); // NOLINT(cppcoreguidelines-no-malloc)
        return out;
    }
    return symbol;
}
} // namespace

void print_stack_trace() noexcept
{
    constexpr int kMaxFrames = 128;
    void *callstack[kMaxFrames];
    const int nframes = backtrace(callstack, kMaxFrames);
    if (nframes <= 0)
    {
        safe_format_to_stderr("  [No stack frames available]\n");
        return;
    }

    char **symbols = backtrace_symbols(callstack, nframes);
    safe_format_to_stderr("Stack trace ({} frames):\n", nframes);

    // Frame 0 is this function.
    for (int i = 1; i < nframes; ++i)
    {
        const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
        Dl_info dlinfo;
        if (dladdr(callstack[i], &dlinfo) != 0 && dlinfo.dli_sname != nullptr)
        {
            const auto offset = addr - reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
            safe_format_to_stderr("  #{:<3} {} + {:#x} ({})\n", i, demangle(dlinfo.dli_sname),
                                  offset,
                                  dlinfo.dli_fname != nullptr
                                      ? format_tools::filename_only(dlinfo.dli_fname)
                                      : std::string_view("?"));
        }
        else if (symbols != nullptr)
        {
            safe_format_to_stderr("  #{:<3} {}\n", i, symbols[i]);
        }
        else
        {
            safe_format_to_stderr("  #{:<3} {:#x}\n", i, addr);
        }
    }
    std::free(symbols); // NOLINT(cppcoreguidelines-no-malloc)
    std::fflush(stderr);
}

} // namespace mqttop::debug

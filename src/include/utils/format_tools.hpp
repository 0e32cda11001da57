// Tools for formatting and parsing strings
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "mqttop_utils_export.h"

namespace mqttop::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
MQTTOP_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Extracts a value from a dictionary-like string.
 *
 * This function parses a string containing key-value pairs (e.g.,
 * "key1=val1; key2=val2", or the lines of /etc/os-release with a '\n'
 * separator) and returns the value for a specified key. It handles whitespace
 * around separators and assignment symbols.
 *
 * @param keyword The key to search for.
 * @param input The string_view to parse.
 * @param separator The character separating key-value pairs.
 * @param assignment_symbol The character separating a key from its value.
 * @return The value if found, otherwise std::nullopt.
 */
MQTTOP_UTILS_EXPORT std::optional<std::string>
extract_value_from_string(std::string_view keyword, std::string_view input, char separator = ';',
                          char assignment_symbol = '=');

/// Strips leading and trailing whitespace.
MQTTOP_UTILS_EXPORT std::string_view trim_whitespace(std::string_view str) noexcept;

/// Upper-cases the first letter of every word ("my-host box" -> "My-Host Box").
MQTTOP_UTILS_EXPORT std::string title_case(std::string_view str);

/**
 * @brief Parses a duration string such as "2s", "500ms", "1m30s" or "1h".
 *
 * Accepted units are ns, us, ms, s, m and h; a bare "0" is zero. Fractions are
 * accepted ("1.5s").
 *
 * @return The duration in milliseconds (rounded down), or std::nullopt if the
 *         string is not a valid duration.
 */
MQTTOP_UTILS_EXPORT std::optional<std::chrono::milliseconds> parse_duration(std::string_view str);

/// Inverse of parse_duration for display ("1m30s", "500ms", "0s").
MQTTOP_UTILS_EXPORT std::string format_duration(std::chrono::milliseconds d);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128); // small reserve to avoid many reallocs
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Creates a `fmt::memory_buffer` from a runtime format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer_rt(fmt::string_view fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 * @param file_path A string_view of the full path.
 * @return A string_view of just the filename portion of the path.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    if (last_slash == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_slash + 1);
}

} // namespace mqttop::format_tools

// format_tools.cpp
#include "mqttop_base.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace mqttop::format_tools
{

// Formatted local time with microsecond resolution. The fractional part is
// computed manually so the output does not depend on the fmt chrono version.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}",
                                fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string_view trim_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";

    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        // all whitespace
        return str.substr(0, 0);
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

std::optional<std::string> extract_value_from_string(std::string_view keyword,
                                                     std::string_view input, char separator,
                                                     char assignment_symbol)
{
    std::string_view::size_type start = 0;
    while (start < input.size())
    {
        std::string_view::size_type end = input.find(separator, start);
        if (end == std::string_view::npos)
        {
            end = input.size();
        }

        std::string_view segment = input.substr(start, end - start);
        start = end + 1;

        std::string_view::size_type assignment_pos = segment.find(assignment_symbol);
        if (assignment_pos == std::string_view::npos)
        {
            continue; // No assignment symbol, so it's not a valid pair
        }

        std::string_view key_sv = trim_whitespace(segment.substr(0, assignment_pos));
        if (key_sv == keyword)
        {
            return std::string(trim_whitespace(segment.substr(assignment_pos + 1)));
        }
    }
    return std::nullopt;
}

std::string title_case(std::string_view str)
{
    std::string out(str);
    bool word_start = true;
    for (auto &c : out)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc))
        {
            if (word_start)
            {
                c = static_cast<char>(std::toupper(uc));
            }
            word_start = false;
        }
        else
        {
            word_start = true;
        }
    }
    return out;
}

std::optional<std::chrono::milliseconds> parse_duration(std::string_view str)
{
    str = trim_whitespace(str);
    if (str.empty())
    {
        return std::nullopt;
    }
    if (str == "0")
    {
        return std::chrono::milliseconds{0};
    }

    long double total_ns = 0;
    size_t pos = 0;
    while (pos < str.size())
    {
        // Number: digits with an optional fraction.
        const size_t num_start = pos;
        while (pos < str.size() &&
               (std::isdigit(static_cast<unsigned char>(str[pos])) != 0 || str[pos] == '.'))
        {
            ++pos;
        }
        if (pos == num_start)
        {
            return std::nullopt;
        }
        const std::string number(str.substr(num_start, pos - num_start));
        if (number == "." || std::count(number.begin(), number.end(), '.') > 1)
        {
            return std::nullopt;
        }

        const size_t unit_start = pos;
        while (pos < str.size() && std::isalpha(static_cast<unsigned char>(str[pos])) != 0)
        {
            ++pos;
        }
        const std::string_view unit = str.substr(unit_start, pos - unit_start);

        long double scale = 0;
        if (unit == "ns")
            scale = 1;
        else if (unit == "us")
            scale = 1e3L;
        else if (unit == "ms")
            scale = 1e6L;
        else if (unit == "s")
            scale = 1e9L;
        else if (unit == "m")
            scale = 60e9L;
        else if (unit == "h")
            scale = 3600e9L;
        else
            return std::nullopt;

        total_ns += std::stold(number) * scale;
    }
    return std::chrono::milliseconds{static_cast<int64_t>(std::floor(total_ns / 1e6L))};
}

std::string format_duration(std::chrono::milliseconds d)
{
    using namespace std::chrono;
    if (d.count() == 0)
    {
        return "0s";
    }
    if (d < seconds{1})
    {
        return fmt::format("{}ms", d.count());
    }

    const auto h = duration_cast<hours>(d);
    const auto m = duration_cast<minutes>(d - h);
    const auto s = duration_cast<seconds>(d - h - m);
    const auto ms = (d - h - m - s).count();

    std::string sec_part = fmt::format("{}", s.count());
    if (ms != 0)
    {
        std::string frac = fmt::format("{:03d}", ms);
        while (!frac.empty() && frac.back() == '0')
        {
            frac.pop_back();
        }
        sec_part += "." + frac;
    }

    if (h.count() > 0)
    {
        return fmt::format("{}h{}m{}s", h.count(), m.count(), sec_part);
    }
    if (m.count() > 0)
    {
        return fmt::format("{}m{}s", m.count(), sec_part);
    }
    return sec_part + "s";
}

} // namespace mqttop::format_tools

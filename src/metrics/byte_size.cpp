#include "metrics/byte_size.hpp"

#include <bit>
#include <limits>

#include <fmt/format.h>

namespace mqttop::metrics
{

ByteSize size_of(uint64_t bytes) noexcept
{
    if (bytes == 0)
    {
        return ByteSize::Bytes;
    }
    const int width = static_cast<int>(std::bit_width(bytes - 1));
    int pow = ((width - 1) / 10) * 10;
    if (pow < 0)
    {
        pow = 0;
    }
    if (pow > static_cast<int>(ByteSize::PiB))
    {
        pow = static_cast<int>(ByteSize::PiB);
    }
    return static_cast<ByteSize>(pow);
}

std::optional<ByteSize> parse_size(std::string_view name) noexcept
{
    if (name == "b" || name == "B" || name == "bytes" || name == "Bytes")
        return ByteSize::Bytes;
    if (name == "KiB")
        return ByteSize::KiB;
    if (name == "MiB")
        return ByteSize::MiB;
    if (name == "GiB")
        return ByteSize::GiB;
    if (name == "TiB")
        return ByteSize::TiB;
    if (name == "PiB")
        return ByteSize::PiB;
    return std::nullopt;
}

std::string_view to_string(ByteSize size) noexcept
{
    switch (size)
    {
    case ByteSize::Bytes:
        return "B";
    case ByteSize::KiB:
        return "KiB";
    case ByteSize::MiB:
        return "MiB";
    case ByteSize::GiB:
        return "GiB";
    case ByteSize::TiB:
        return "TiB";
    case ByteSize::PiB:
        return "PiB";
    }
    return "Unknown";
}

void append_size(std::string &out, uint64_t bytes, ByteSize size)
{
    const int shift = static_cast<int>(size);
    if (shift == 0)
    {
        fmt::format_to(std::back_inserter(out), "{}", bytes);
        return;
    }
    // Scale by 1000 for three fixed decimals, shifting first when that would overflow.
    constexpr uint64_t overflow = std::numeric_limits<uint64_t>::max() / 1000;
    const uint64_t milli = bytes > overflow ? 1000 * (bytes >> shift) : (1000 * bytes) >> shift;
    if (milli % 1000 == 0)
    {
        fmt::format_to(std::back_inserter(out), "{}", milli / 1000);
        return;
    }
    fmt::format_to(std::back_inserter(out), "{}.{:03}", milli / 1000, milli % 1000);
}

} // namespace mqttop::metrics

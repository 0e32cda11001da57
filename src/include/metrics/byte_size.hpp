#pragma once
/**
 * @file byte_size.hpp
 * @brief Binary size units (B, KiB ... PiB) used to render byte counts.
 */
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mqttop::metrics
{

/// The value is the power of two of the unit.
enum class ByteSize : int
{
    Bytes = 0,
    KiB = 10,
    MiB = 20,
    GiB = 30,
    TiB = 40,
    PiB = 50,
};

/// Largest unit in which @p bytes is at least 1 (capped at PiB).
ByteSize size_of(uint64_t bytes) noexcept;

/// Accepts "b", "B", "bytes", "Bytes", "KiB", ..., "PiB".
std::optional<ByteSize> parse_size(std::string_view name) noexcept;

std::string_view to_string(ByteSize size) noexcept;

/**
 * @brief Appends @p bytes scaled to @p size with up to three decimals.
 *
 * Whole numbers are written without a fraction ("2" rather than "2.000").
 */
void append_size(std::string &out, uint64_t bytes, ByteSize size);

} // namespace mqttop::metrics

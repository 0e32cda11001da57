#pragma once
/**
 * @file errors.hpp
 * @brief std::error_code category for bridge configuration errors.
 */
#include <system_error>

namespace mqttop::bridge
{

enum class Errc
{
    no_metrics = 1,
    stopped,
};

const std::error_category &bridge_category() noexcept;

inline std::error_code make_error_code(Errc e) noexcept
{
    return {static_cast<int>(e), bridge_category()};
}

} // namespace mqttop::bridge

template <> struct std::is_error_code_enum<mqttop::bridge::Errc> : std::true_type
{
};

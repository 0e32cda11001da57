#pragma once
/**
 * @file errors.hpp
 * @brief std::error_code category for broker client failures.
 */
#include <system_error>

namespace mqttop::mqtt
{

enum class Errc
{
    not_connected = 1,
    connect_failed,
    publish_failed,
    subscribe_failed,
    unsubscribe_failed,
    timeout,
    invalid_argument,
};

const std::error_category &mqtt_category() noexcept;

inline std::error_code make_error_code(Errc e) noexcept
{
    return {static_cast<int>(e), mqtt_category()};
}

} // namespace mqttop::mqtt

template <> struct std::is_error_code_enum<mqttop::mqtt::Errc> : std::true_type
{
};

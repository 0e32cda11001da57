#pragma once
/**
 * @file errors.hpp
 * @brief std::error_code category for discovery document failures.
 */
#include <system_error>

namespace mqttop::discovery
{

enum class Errc
{
    no_object_id = 1,
    invalid_document,
    no_machine_id,
};

const std::error_category &discovery_category() noexcept;

inline std::error_code make_error_code(Errc e) noexcept
{
    return {static_cast<int>(e), discovery_category()};
}

} // namespace mqttop::discovery

template <> struct std::is_error_code_enum<mqttop::discovery::Errc> : std::true_type
{
};

#pragma once
/**
 * @file errors.hpp
 * @brief std::error_code category for metric outcomes.
 *
 * `no_change` and `rescanned` are not failures: a metric sends them on its
 * update channel to tell the bridge that nothing needs publishing, or that
 * its set of sub-entities changed and discovery must be refreshed.
 */
#include <system_error>

namespace mqttop::metrics
{

enum class Errc
{
    already_running = 1,
    disabled,
    no_change,
    not_found,
    not_supported,
    rescanned,
};

const std::error_category &metric_category() noexcept;

inline std::error_code make_error_code(Errc e) noexcept
{
    return {static_cast<int>(e), metric_category()};
}

} // namespace mqttop::metrics

template <> struct std::is_error_code_enum<mqttop::metrics::Errc> : std::true_type
{
};

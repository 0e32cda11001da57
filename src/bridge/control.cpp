#include "bridge/control.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <nlohmann/json.hpp>

namespace mqttop::bridge
{

std::error_code apply_update_payload(metrics::Metric &metric, std::string_view payload)
{
    if (format_tools::trim_whitespace(payload).empty())
    {
        return {};
    }

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(payload);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        LOGGER_WARN("Ignoring update payload for {}: {}", metric.type(), e.what());
        return std::make_error_code(std::errc::invalid_argument);
    }
    if (!j.is_object())
    {
        LOGGER_WARN("Ignoring update payload for {}: not an object", metric.type());
        return std::make_error_code(std::errc::invalid_argument);
    }

    auto *reconf = metric.as_reconfigurable();

    if (auto it = j.find("interval"); it != j.end() && it->is_string())
    {
        auto d = format_tools::parse_duration(it->get<std::string>());
        if (!d)
        {
            LOGGER_WARN("Invalid interval '{}' for {}", it->get<std::string>(), metric.type());
        }
        else if (reconf)
        {
            reconf->set_interval(*d);
        }
    }

    if (auto it = j.find("selection_mode"); it != j.end() && it->is_string() && reconf)
    {
        if (auto ec = reconf->set_selection_mode(it->get<std::string>()))
        {
            LOGGER_DEBUG("{} selection mode not applied: {}", metric.type(), ec.message());
        }
    }
    return {};
}

} // namespace mqttop::bridge

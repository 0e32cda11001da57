#pragma once
/**
 * @file control.hpp
 * @brief Parsing of the payload sent to a metric's `/update` control topic.
 */
#include "metrics/metric.hpp"

#include <string_view>
#include <system_error>

namespace mqttop::bridge
{

/**
 * @brief Reconfigures @p metric from an `/update` payload.
 *
 * The payload is empty or a JSON object of strings:
 * `{"interval": "<duration>", "selection_mode": "<mode>"}`. Unknown keys and
 * values the metric cannot apply are ignored.
 *
 * @return std::errc::invalid_argument when the payload is not such an object.
 */
std::error_code apply_update_payload(metrics::Metric &metric, std::string_view payload);

} // namespace mqttop::bridge

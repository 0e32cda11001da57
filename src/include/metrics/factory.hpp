#pragma once
/**
 * @file factory.hpp
 * @brief Builds the metrics enabled in a configuration.
 */
#include "metrics/metric.hpp"

#include <vector>

namespace mqttop::config
{
struct Config;
}

namespace mqttop::metrics
{

/**
 * @brief One metric per enabled section of @p cfg.
 *
 * A metric that fails to initialize is logged and left out.
 */
std::vector<MetricPtr> from_config(const config::Config &cfg);

} // namespace mqttop::metrics

#include "metrics/factory.hpp"
#include "config/config.hpp"
#include "metrics/memory_metric.hpp"
#include "utils/logger.hpp"

namespace mqttop::metrics
{

std::vector<MetricPtr> from_config(const config::Config &cfg)
{
    std::vector<MetricPtr> out;
    if (cfg.memory.enabled)
    {
        MemoryOptions opts;
        opts.topic = cfg.memory.topic;
        opts.interval = cfg.memory_interval();
        opts.size_unit = parse_size(cfg.memory.size_unit);
        opts.include_swap = cfg.memory.include_swap;
        auto mem = MemoryMetric::create(std::move(opts));
        if (mem.is_ok())
        {
            out.push_back(std::move(mem).content());
        }
        else
        {
            LOGGER_ERROR("Couldn't initialize memory: {}", mem.error().message());
        }
    }
    return out;
}

} // namespace mqttop::metrics

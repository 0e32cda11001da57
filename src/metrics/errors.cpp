#include "metrics/errors.hpp"

#include <string>

namespace mqttop::metrics
{

namespace
{
class MetricCategory final : public std::error_category
{
  public:
    const char *name() const noexcept override { return "metric"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Errc>(ev))
        {
        case Errc::already_running:
            return "already running";
        case Errc::disabled:
            return "metric disabled";
        case Errc::no_change:
            return "no change";
        case Errc::not_found:
            return "not found";
        case Errc::not_supported:
            return "not supported";
        case Errc::rescanned:
            return "rescanned";
        }
        return "unknown metric error";
    }
};
} // namespace

const std::error_category &metric_category() noexcept
{
    static const MetricCategory category;
    return category;
}

} // namespace mqttop::metrics

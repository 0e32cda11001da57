#include "bridge/errors.hpp"

#include <string>

namespace mqttop::bridge
{

namespace
{
class BridgeCategory final : public std::error_category
{
  public:
    const char *name() const noexcept override { return "bridge"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Errc>(ev))
        {
        case Errc::no_metrics:
            return "no metrics";
        case Errc::stopped:
            return "bridge stopped";
        }
        return "unknown bridge error";
    }
};
} // namespace

const std::error_category &bridge_category() noexcept
{
    static const BridgeCategory category;
    return category;
}

} // namespace mqttop::bridge

#include "discovery/errors.hpp"

#include <string>

namespace mqttop::discovery
{

namespace
{
class DiscoveryCategory final : public std::error_category
{
  public:
    const char *name() const noexcept override { return "discovery"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Errc>(ev))
        {
        case Errc::no_object_id:
            return "no object id";
        case Errc::invalid_document:
            return "invalid discovery document";
        case Errc::no_machine_id:
            return "machine id unavailable";
        }
        return "unknown discovery error";
    }
};
} // namespace

const std::error_category &discovery_category() noexcept
{
    static const DiscoveryCategory category;
    return category;
}

} // namespace mqttop::discovery

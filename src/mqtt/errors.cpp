#include "mqtt/errors.hpp"

#include <string>

namespace mqttop::mqtt
{

namespace
{
class MqttCategory final : public std::error_category
{
  public:
    const char *name() const noexcept override { return "mqtt"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Errc>(ev))
        {
        case Errc::not_connected:
            return "not connected";
        case Errc::connect_failed:
            return "connect failed";
        case Errc::publish_failed:
            return "publish failed";
        case Errc::subscribe_failed:
            return "subscribe failed";
        case Errc::unsubscribe_failed:
            return "unsubscribe failed";
        case Errc::timeout:
            return "operation timed out";
        case Errc::invalid_argument:
            return "invalid argument";
        }
        return "unknown mqtt error";
    }
};
} // namespace

const std::error_category &mqtt_category() noexcept
{
    static const MqttCategory category;
    return category;
}

} // namespace mqttop::mqtt

#include "mqtt/client.hpp"

#include <fmt/format.h>

namespace mqttop::mqtt
{

bool topic_matches(std::string_view filter, std::string_view topic)
{
    if (!topic.empty() && topic.front() == '$' && !filter.empty() &&
        (filter.front() == '+' || filter.front() == '#'))
    {
        return false;
    }

    size_t fpos = 0;
    size_t tpos = 0;
    while (true)
    {
        const size_t fend = filter.find('/', fpos);
        const std::string_view flevel =
            filter.substr(fpos, fend == std::string_view::npos ? std::string_view::npos : fend - fpos);

        if (flevel == "#")
        {
            return true;
        }
        if (tpos > topic.size())
        {
            return false;
        }

        const size_t tend = topic.find('/', tpos);
        const std::string_view tlevel =
            topic.substr(tpos, tend == std::string_view::npos ? std::string_view::npos : tend - tpos);

        if (flevel != "+" && flevel != tlevel)
        {
            return false;
        }

        const bool filter_last = fend == std::string_view::npos;
        const bool topic_last = tend == std::string_view::npos;
        if (filter_last || topic_last)
        {
            if (filter_last && topic_last)
            {
                return true;
            }
            // "a/#" also matches "a".
            return topic_last && filter.substr(fend + 1) == "#";
        }
        fpos = fend + 1;
        tpos = tend + 1;
    }
}

std::string normalize_broker_url(std::string_view broker)
{
    std::string scheme = "tcp";
    std::string_view rest = broker;
    if (const auto pos = broker.find("://"); pos != std::string_view::npos)
    {
        scheme = std::string(broker.substr(0, pos));
        rest = broker.substr(pos + 3);
    }
    if (rest.empty())
    {
        return {};
    }

    // A colon after the last ']' (IPv6 literals) is a port separator.
    const auto bracket = rest.rfind(']');
    const auto colon = rest.rfind(':');
    const bool has_port =
        colon != std::string_view::npos && (bracket == std::string_view::npos || colon > bracket);
    if (has_port)
    {
        return fmt::format("{}://{}", scheme, rest);
    }
    const bool secure = scheme == "ssl" || scheme == "mqtts" || scheme == "wss";
    int port = secure ? 8883 : 1883;
    if (scheme == "ws")
        port = 80;
    else if (scheme == "wss")
        port = 443;
    return fmt::format("{}://{}:{}", scheme, rest, port);
}

} // namespace mqttop::mqtt

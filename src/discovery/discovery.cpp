#include "discovery/discovery.hpp"
#include "discovery/errors.hpp"
#include "mqtt/token.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <fstream>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace mqttop::discovery
{

namespace
{
using nlohmann::json;

constexpr const char *kMigratePayload = "{\"migrate_discovery\": true}";

bool is_placeholder(const Component &cmp)
{
    return cmp.is_object() && cmp.size() <= 1;
}

std::string platform_of(const Component &cmp)
{
    if (auto it = cmp.find(opt::Platform); it != cmp.end() && it->is_string())
    {
        return it->get<std::string>();
    }
    return {};
}

std::string derive_object_id(const Device &dev)
{
    if (!dev.identifiers.empty())
    {
        return fmt::format("{}", fmt::join(dev.identifiers, "_"));
    }
    std::string id;
    for (size_t i = 0; i < dev.connections.size(); ++i)
    {
        if (i > 0)
        {
            id += '_';
        }
        id += dev.connections[i][1];
    }
    return id;
}
} // namespace

std::optional<Method> parse_method(std::string_view name)
{
    if (name.empty() || name == "device")
        return Method::Device;
    if (name == "components")
        return Method::Components;
    if (name == "nodes" || name == "metrics")
        return Method::Nodes;
    return std::nullopt;
}

std::string_view to_string(Method method)
{
    switch (method)
    {
    case Method::Device:
        return "device";
    case Method::Components:
        return "components";
    case Method::Nodes:
        return "nodes";
    }
    return "device";
}

bool should_migrate(Method method, Method old)
{
    switch (old)
    {
    case Method::Device:
        return method == Method::Components;
    case Method::Components:
        return method == Method::Device;
    case Method::Nodes:
        break;
    }
    return false;
}

std::string availability_template(std::string_view topic)
{
    return fmt::format("{{{{ iif(value_json[{}]|default, 'online', 'offline') if value_json is "
                       "defined else value }}}}",
                       json(std::string(topic)).dump());
}

utils::Result<Discovery, std::error_code> Discovery::create(Options options, Device device,
                                                             Origin origin)
{
    using R = utils::Result<Discovery, std::error_code>;

    if (!options.device_name.empty() && options.device_name != "hostname")
    {
        device.name = options.device_name;
    }
    if (device.name.empty())
    {
        device.name = "Mqttop";
    }
    if (options.node_id.empty())
    {
        options.node_id = "mqttop";
    }

    Discovery d;
    d.m_object_id = derive_object_id(device);
    if (d.m_object_id.empty())
    {
        return R::error(make_error_code(Errc::no_object_id));
    }
    d.m_options = std::move(options);
    d.m_device = std::move(device);
    d.m_origin = std::move(origin);
    return R::ok(std::move(d));
}

utils::Result<Discovery, std::error_code> Discovery::load(const std::filesystem::path &path)
{
    using R = utils::Result<Discovery, std::error_code>;

    std::ifstream in(path);
    if (!in)
    {
        return R::error(std::make_error_code(std::errc::no_such_file_or_directory));
    }

    Discovery d;
    try
    {
        const json j = json::parse(in);
        if (!j.is_object() || !j.contains("cmps") || !j.at("cmps").is_object())
        {
            return R::error(make_error_code(Errc::invalid_document));
        }
        if (j.contains("o"))
        {
            j.at("o").get_to(d.m_origin);
        }
        if (j.contains("dev"))
        {
            j.at("dev").get_to(d.m_device);
        }
        for (const auto &[id, cmp] : j.at("cmps").items())
        {
            if (!cmp.is_object())
            {
                return R::error(make_error_code(Errc::invalid_document));
            }
            d.m_components[id] = cmp;
        }
        if (auto it = j.find("_nodes"); it != j.end() && it->is_object())
        {
            it->get_to(d.m_nodes);
        }
        if (auto it = j.find("_method"); it != j.end() && it->is_string())
        {
            auto method = parse_method(it->get<std::string>());
            if (!method)
            {
                return R::error(make_error_code(Errc::invalid_document));
            }
            d.m_options.method = *method;
        }
    }
    catch (const json::exception &e)
    {
        LOGGER_WARN("Discovery document '{}' is not valid JSON: {}", path.string(), e.what());
        return R::error(make_error_code(Errc::invalid_document));
    }
    d.m_object_id = derive_object_id(d.m_device);
    return R::ok(std::move(d));
}

std::error_code Discovery::write(const std::filesystem::path &path) const
{
    std::ofstream out(path, std::ios::trunc);
    if (!out)
    {
        return {errno, std::generic_category()};
    }
    out << to_json().dump(2) << '\n';
    out.flush();
    if (!out)
    {
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

void Discovery::add_component(const std::string &node, const std::string &unique_id,
                              Component cmp)
{
    m_components[unique_id] = std::move(cmp);
    auto &ids = m_nodes[node];
    if (std::find(ids.begin(), ids.end(), unique_id) == ids.end())
    {
        ids.push_back(unique_id);
    }
}

std::vector<std::string> Discovery::reset_node(const std::string &node)
{
    auto it = m_nodes.find(node);
    if (it == m_nodes.end())
    {
        return {};
    }
    std::vector<std::string> previous = std::move(it->second);
    it->second.clear();
    for (const auto &id : previous)
    {
        auto cmp = m_components.find(id);
        if (cmp == m_components.end())
        {
            continue;
        }
        cmp->second = Component{{opt::Platform, platform_of(cmp->second)}};
    }
    return previous;
}

void Discovery::restore_node(const std::string &node, std::vector<std::string> previous)
{
    auto &ids = m_nodes[node];
    ids.insert(ids.end(), std::make_move_iterator(previous.begin()),
               std::make_move_iterator(previous.end()));
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    ids.erase(std::remove_if(ids.begin(), ids.end(),
                             [this](const std::string &id) { return !m_components.contains(id); }),
              ids.end());
}

std::string Discovery::topic(std::string_view component, std::string_view node_id,
                             std::string_view object_id) const
{
    if (object_id.empty())
    {
        object_id = m_object_id;
    }
    if (node_id.empty())
    {
        return fmt::format("{}/{}/{}/config", m_options.prefix, component, object_id);
    }
    return fmt::format("{}/{}/{}/{}/config", m_options.prefix, component, node_id, object_id);
}

json Discovery::payload() const
{
    json j;
    j[opt::Origin] = m_origin;
    j[opt::Device] = m_device;
    j["cmps"] = json::object();
    for (const auto &[id, cmp] : m_components)
    {
        j["cmps"][id] = cmp;
    }
    return j;
}

json Discovery::to_json() const
{
    json j = payload();
    if (!m_nodes.empty())
    {
        j["_nodes"] = m_nodes;
    }
    j["_method"] = std::string(to_string(m_options.method));
    return j;
}

bool Discovery::diff(const Discovery &old)
{
    for (const auto &[id, cmp] : old.m_components)
    {
        if (m_components.contains(id) || is_placeholder(cmp))
        {
            continue;
        }
        m_components[id] = Component{{opt::Platform, platform_of(cmp)}};
        for (const auto &[node, ids] : old.m_nodes)
        {
            if (std::find(ids.begin(), ids.end(), id) != ids.end())
            {
                add_component(node, id, m_components[id]);
            }
        }
    }
    return should_migrate(m_options.method, old.m_options.method);
}

std::string Discovery::component_payload(const Component &cmp) const
{
    if (is_placeholder(cmp))
    {
        return {};
    }
    Component out = cmp;
    out.erase(opt::Platform);
    out[opt::Origin] = m_origin;
    out[opt::Device] = m_device;
    return out.dump();
}

std::error_code Discovery::publish_to(std::stop_token st, mqtt::Client &client,
                                      const std::string &topic, std::string payload) const
{
    LOGGER_TRACE("Discovery publish to '{}' ({} bytes)", topic, payload.size());
    auto token = client.publish(topic, m_options.qos, m_options.retained, std::move(payload));
    return mqtt::wait_token(st, token);
}

std::error_code Discovery::wait(std::stop_token st, mqtt::Client &client) const
{
    if (m_options.wait_topic.empty())
    {
        return {};
    }

    auto gate = std::make_shared<mqtt::Token>();
    const std::string topic = m_options.wait_topic;
    const std::string expected = m_options.wait_payload;
    mqtt::Client *c = &client;
    auto sub = client.subscribe(topic, 0, [gate, topic, expected, c](const mqtt::Message &msg) {
        if (gate->is_done() || (!expected.empty() && msg.payload != expected))
        {
            return;
        }
        c->unsubscribe({topic})->on_complete([gate](const std::error_code &ec) {
            gate->complete(ec);
        });
    });
    if (auto ec = mqtt::wait_token(st, sub))
    {
        return ec;
    }
    LOGGER_INFO("Waiting for '{}' on '{}' before discovery", expected, topic);
    if (!gate->wait(st))
    {
        return {};
    }
    return gate->error();
}

std::error_code Discovery::publish(std::stop_token st, mqtt::Client &client, bool migrate)
{
    if (auto ec = wait(st, client))
    {
        LOGGER_ERROR("Unsuccessful discovery: {}", ec.message());
        return ec;
    }
    if (st.stop_requested())
    {
        return {};
    }

    LOGGER_DEBUG("Publishing discovery, method {}", to_string(m_options.method));
    std::error_code ec;
    switch (m_options.method)
    {
    case Method::Device:
        ec = publish_device(st, client, migrate);
        break;
    case Method::Components:
        ec = publish_components(st, client, migrate, {});
        break;
    case Method::Nodes:
        ec = publish_nodes(st, client, {});
        break;
    }
    if (ec)
    {
        LOGGER_ERROR("Unsuccessful discovery: {}", ec.message());
    }
    return ec;
}

std::error_code Discovery::publish_node(std::stop_token st, mqtt::Client &client,
                                        const std::string &node)
{
    std::error_code ec;
    switch (m_options.method)
    {
    case Method::Device:
        ec = publish_device(st, client, false);
        break;
    case Method::Components: {
        auto it = m_nodes.find(node);
        if (it == m_nodes.end() || it->second.empty())
        {
            return {};
        }
        ec = publish_components(st, client, false, it->second);
        break;
    }
    case Method::Nodes:
        ec = publish_nodes(st, client, {node});
        break;
    }
    if (ec)
    {
        LOGGER_ERROR("Unsuccessful discovery of {}: {}", node, ec.message());
    }
    return ec;
}

std::error_code Discovery::publish_device(std::stop_token st, mqtt::Client &client,
                                          bool migrate) const
{
    if (migrate)
    {
        if (auto ec = this->migrate(st, client))
        {
            return ec;
        }
    }
    if (auto ec = publish_to(st, client, topic("device", m_options.node_id), payload().dump()))
    {
        return ec;
    }
    if (migrate)
    {
        return remove_components(st, client);
    }
    return {};
}

std::error_code Discovery::publish_components(std::stop_token st, mqtt::Client &client,
                                              bool migrate,
                                              const std::vector<std::string> &subset) const
{
    if (migrate)
    {
        if (auto ec = rollback(st, client))
        {
            return ec;
        }
    }
    for (const auto &[id, cmp] : m_components)
    {
        if (!subset.empty() && std::find(subset.begin(), subset.end(), id) == subset.end())
        {
            continue;
        }
        if (st.stop_requested())
        {
            return {};
        }
        if (auto ec = publish_to(st, client, topic(platform_of(cmp), m_options.node_id, id),
                                 component_payload(cmp)))
        {
            return ec;
        }
    }
    if (migrate)
    {
        return remove_device(st, client);
    }
    return {};
}

std::error_code Discovery::publish_nodes(std::stop_token st, mqtt::Client &client,
                                         const std::vector<std::string> &subset) const
{
    std::vector<std::string> names = subset;
    if (names.empty())
    {
        for (const auto &[node, ids] : m_nodes)
        {
            names.push_back(node);
        }
    }
    for (const auto &node : names)
    {
        auto it = m_nodes.find(node);
        if (it == m_nodes.end() || it->second.empty())
        {
            continue;
        }
        json j;
        j[opt::Origin] = m_origin;
        j[opt::Device] = m_device;
        j["cmps"] = json::object();
        for (const auto &id : it->second)
        {
            if (auto cmp = m_components.find(id); cmp != m_components.end())
            {
                j["cmps"][id] = cmp->second;
            }
        }
        if (j["cmps"].empty())
        {
            continue;
        }
        if (st.stop_requested())
        {
            return {};
        }
        const auto node_id = fmt::format("{}_{}", m_options.node_id, node);
        if (auto ec = publish_to(st, client, topic("device", node_id), j.dump()))
        {
            return ec;
        }
    }
    return {};
}

std::error_code Discovery::migrate(std::stop_token st, mqtt::Client &client) const
{
    for (const auto &[id, cmp] : m_components)
    {
        if (st.stop_requested())
        {
            return {};
        }
        if (auto ec = publish_to(st, client, topic(platform_of(cmp), m_options.node_id, id),
                                 kMigratePayload))
        {
            return ec;
        }
    }
    return {};
}

std::error_code Discovery::rollback(std::stop_token st, mqtt::Client &client) const
{
    return publish_to(st, client, topic("device", m_options.node_id), kMigratePayload);
}

std::error_code Discovery::remove_components(std::stop_token st, mqtt::Client &client) const
{
    for (const auto &[id, cmp] : m_components)
    {
        if (st.stop_requested())
        {
            return {};
        }
        if (auto ec = publish_to(st, client, topic(platform_of(cmp), m_options.node_id, id), {}))
        {
            return ec;
        }
    }
    return {};
}

std::error_code Discovery::remove_device(std::stop_token st, mqtt::Client &client) const
{
    return publish_to(st, client, topic("device", m_options.node_id), {});
}

std::error_code Discovery::subscribe_status(std::stop_token st, mqtt::Client &client,
                                            std::function<void()> on_online) const
{
    const auto status = fmt::format("{}/status", m_options.prefix);
    auto token = client.subscribe(status, 0, [fn = std::move(on_online)](const mqtt::Message &msg) {
        if (msg.payload == "online")
        {
            fn();
        }
    });
    return mqtt::wait_token(st, token);
}

} // namespace mqttop::discovery

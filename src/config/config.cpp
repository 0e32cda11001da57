#include "config/config.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <fmt/format.h>

namespace mqttop::config
{

namespace fs = std::filesystem;
using nlohmann::json;

namespace
{

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
void json_merge(json &base, const json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        throw std::runtime_error(fmt::format("cannot open config file '{}'", path.string()));
    }
    try
    {
        json j;
        f >> j;
        return j;
    }
    catch (const json::exception &e)
    {
        throw std::runtime_error(
            fmt::format("config file '{}' is not valid JSON: {}", path.string(), e.what()));
    }
}

std::string getenv_or_empty(const std::string &name)
{
    const char *v = std::getenv(name.c_str());
    return v ? std::string(v) : std::string{};
}

bool is_env_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// ${NAME} and $NAME substitution; unknown variables expand to nothing.
std::string expand_env(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '$' || i + 1 >= s.size())
        {
            out += s[i];
            continue;
        }
        if (s[i + 1] == '{')
        {
            const auto close = s.find('}', i + 2);
            if (close == std::string_view::npos)
            {
                out += s.substr(i);
                break;
            }
            out += getenv_or_empty(std::string(s.substr(i + 2, close - i - 2)));
            i = close;
            continue;
        }
        size_t end = i + 1;
        while (end < s.size() && is_env_char(s[end]))
            ++end;
        if (end == i + 1)
        {
            out += s[i];
            continue;
        }
        out += getenv_or_empty(std::string(s.substr(i + 1, end - i - 1)));
        i = end - 1;
    }
    return out;
}

std::string read_secret(std::string_view name)
{
    std::string dir = getenv_or_empty("MQTTOP_SECRETS_DIR");
    if (dir.empty())
        dir = "/run/secrets";
    std::ifstream f(fs::path(dir) / std::string(name));
    if (!f.is_open())
    {
        LOGGER_WARN("Secret '{}' not found in {}", name, dir);
        return {};
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return std::string(format_tools::trim_whitespace(content));
}

template <typename T>
void read_key(const json &obj, const char *key, T &out, std::string_view section)
{
    if (!obj.contains(key) || obj.at(key).is_null())
        return;
    try
    {
        obj.at(key).get_to(out);
    }
    catch (const json::exception &e)
    {
        throw std::runtime_error(fmt::format("invalid value for '{}{}{}': {}", section,
                                             section.empty() ? "" : ".", key, e.what()));
    }
}

void read_duration(const json &obj, const char *key, std::chrono::milliseconds &out,
                   std::string_view section)
{
    if (!obj.contains(key) || obj.at(key).is_null())
        return;
    const auto &v = obj.at(key);
    std::optional<std::chrono::milliseconds> d;
    if (v.is_string())
        d = format_tools::parse_duration(v.get<std::string>());
    else if (v.is_number_unsigned() || v.is_number_integer())
        d = std::chrono::seconds(v.get<int64_t>());
    if (!d || d->count() < 0)
    {
        throw std::runtime_error(fmt::format("invalid duration for '{}{}{}': {}", section,
                                             section.empty() ? "" : ".", key, v.dump()));
    }
    out = *d;
}

const json &section_of(const json &j, const char *name)
{
    static const json empty = json::object();
    if (!j.contains(name))
        return empty;
    const auto &s = j.at(name);
    if (!s.is_object())
        throw std::runtime_error(fmt::format("config section '{}' must be an object", name));
    return s;
}

} // namespace

std::string expand_value(std::string_view value)
{
    if (value.starts_with("!secret "))
    {
        return read_secret(format_tools::trim_whitespace(value.substr(8)));
    }
    if (value.starts_with("env:"))
    {
        return getenv_or_empty(std::string(value.substr(4)));
    }
    return expand_env(value);
}

std::string expand_topic(std::string_view topic, std::string_view base)
{
    std::string out(topic);
    if (out.empty() || base.empty())
        return out;
    if (out.front() == '~')
        out = std::string(base) + out.substr(1);
    if (!out.empty() && out.back() == '~')
        out = out.substr(0, out.size() - 1) + std::string(base);
    return out;
}

void Config::apply_json(const json &j)
{
    if (!j.is_object())
        throw std::runtime_error("configuration root must be an object");

    read_duration(j, "interval", interval, "");
    read_key(j, "base_topic", base_topic, "");

    const auto &m = section_of(j, "mqtt");
    read_key(m, "broker", mqtt.broker, "mqtt");
    read_key(m, "client_id", mqtt.client_id, "mqtt");
    read_key(m, "username", mqtt.username, "mqtt");
    read_key(m, "password", mqtt.password, "mqtt");
    read_duration(m, "keep_alive", mqtt.keep_alive, "mqtt");
    read_duration(m, "connect_timeout", mqtt.connect_timeout, "mqtt");
    read_duration(m, "reconnect_interval", mqtt.reconnect_interval, "mqtt");
    read_key(m, "cert_file", mqtt.cert_file, "mqtt");
    read_key(m, "key_file", mqtt.key_file, "mqtt");
    read_key(m, "ca_file", mqtt.ca_file, "mqtt");
    read_key(m, "birth_lwt_enabled", mqtt.birth_lwt_enabled, "mqtt");
    read_key(m, "birth_lwt_topic", mqtt.birth_lwt_topic, "mqtt");
    read_key(m, "log_level", mqtt.log_level, "mqtt");

    const auto &d = section_of(j, "discovery");
    read_key(d, "enabled", discovery.enabled, "discovery");
    read_key(d, "prefix", discovery.prefix, "discovery");
    read_key(d, "method", discovery.method, "discovery");
    read_key(d, "device_name", discovery.device_name, "discovery");
    read_key(d, "node_id", discovery.node_id, "discovery");
    read_key(d, "availability_topic", discovery.availability_topic, "discovery");
    read_key(d, "retained", discovery.retained, "discovery");
    read_key(d, "qos", discovery.qos, "discovery");
    read_key(d, "wait_topic", discovery.wait_topic, "discovery");
    read_key(d, "wait_payload", discovery.wait_payload, "discovery");
    read_key(d, "data_path", discovery.data_path, "discovery");

    const auto &l = section_of(j, "log");
    read_key(l, "level", log.level, "log");
    read_key(l, "output", log.output, "log");
    read_key(l, "format", log.format, "log");
    read_key(l, "queue_size", log.queue_size, "log");

    const auto &b = section_of(j, "bridge");
    read_key(b, "offline_after_errors", bridge.offline_after_errors, "bridge");

    const auto &mem = section_of(j, "memory");
    read_key(mem, "enabled", memory.enabled, "memory");
    read_duration(mem, "interval", memory.interval, "memory");
    read_key(mem, "topic", memory.topic, "memory");
    read_key(mem, "size_unit", memory.size_unit, "memory");
    read_key(mem, "include_swap", memory.include_swap, "memory");
}

Config Config::load(const std::vector<fs::path> &paths)
{
    Config cfg;
    const auto files = paths.empty() ? search_path() : paths;
    if (files.empty())
    {
        LOGGER_DEBUG("No config file found, using defaults");
        return cfg;
    }
    json merged = json::object();
    for (const auto &path : files)
    {
        LOGGER_DEBUG("Loading config from '{}'", path.string());
        json_merge(merged, read_json_file(path));
    }
    cfg.apply_json(merged);
    return cfg;
}

std::vector<fs::path> Config::search_path()
{
    std::vector<fs::path> candidates;
    const std::string env = getenv_or_empty("MQTTOP_CONFIG_PATH");
    size_t start = 0;
    while (start < env.size())
    {
        auto comma = env.find(',', start);
        if (comma == std::string::npos)
            comma = env.size();
        auto item = format_tools::trim_whitespace(std::string_view(env).substr(start, comma - start));
        if (!item.empty())
            candidates.emplace_back(std::string(item));
        start = comma + 1;
    }
    if (auto xdg = getenv_or_empty("XDG_CONFIG_HOME"); !xdg.empty())
        candidates.push_back(fs::path(xdg) / "mqttop.json");
    if (auto home = getenv_or_empty("HOME"); !home.empty())
        candidates.push_back(fs::path(home) / ".config" / "mqttop.json");

    std::vector<fs::path> found;
    for (auto &c : candidates)
    {
        std::error_code ec;
        if (fs::is_regular_file(c, ec))
        {
            found.push_back(std::move(c));
            // The first existing file wins.
            break;
        }
    }
    return found;
}

void Config::finalize()
{
    for (std::string *s :
         {&base_topic, &mqtt.broker, &mqtt.client_id, &mqtt.username, &mqtt.password,
          &mqtt.cert_file, &mqtt.key_file, &mqtt.ca_file, &mqtt.birth_lwt_topic,
          &discovery.prefix, &discovery.device_name, &discovery.node_id,
          &discovery.availability_topic, &discovery.wait_topic, &discovery.wait_payload,
          &discovery.data_path, &log.output, &memory.topic})
    {
        *s = expand_value(*s);
    }

    mqtt.birth_lwt_topic = expand_topic(mqtt.birth_lwt_topic, base_topic);
    discovery.availability_topic = expand_topic(discovery.availability_topic, base_topic);
    discovery.wait_topic = expand_topic(discovery.wait_topic, base_topic);
    memory.topic = expand_topic(memory.topic, base_topic);

    if (!mqtt.broker.empty())
        mqtt.broker = mqtt::normalize_broker_url(mqtt.broker);
    if (discovery.availability_topic.empty())
        discovery.availability_topic = will_topic();
    if (discovery.device_name == "username")
        discovery.device_name = mqtt.username;

    if (!discovery::parse_method(discovery.method))
        throw std::runtime_error(
            fmt::format("invalid value for 'discovery.method': '{}'", discovery.method));
    if (discovery.qos < 0 || discovery.qos > 2)
        throw std::runtime_error(fmt::format("invalid value for 'discovery.qos': {}", discovery.qos));
    if (!memory.size_unit.empty() && !metrics::parse_size(memory.size_unit))
        throw std::runtime_error(
            fmt::format("invalid value for 'memory.size_unit': '{}'", memory.size_unit));
    if (!utils::Logger::parse_level(log.level))
        throw std::runtime_error(fmt::format("invalid value for 'log.level': '{}'", log.level));
    if (log.format != "text" && log.format != "json")
        throw std::runtime_error(fmt::format("invalid value for 'log.format': '{}'", log.format));
    if (log.queue_size <= 0)
        throw std::runtime_error(
            fmt::format("invalid value for 'log.queue_size': {}", log.queue_size));
    if (bridge.offline_after_errors < 0)
        throw std::runtime_error("invalid value for 'bridge.offline_after_errors'");
}

std::chrono::milliseconds Config::memory_interval() const
{
    return memory.interval.count() > 0 ? memory.interval : interval;
}

std::string Config::will_topic() const
{
    return mqtt.birth_lwt_enabled ? mqtt.birth_lwt_topic : std::string{};
}

mqtt::ClientOptions MqttConfig::client_options() const
{
    mqtt::ClientOptions o;
    o.broker = broker;
    o.client_id = client_id;
    o.username = username;
    o.password = password;
    o.keep_alive = std::chrono::duration_cast<std::chrono::seconds>(keep_alive);
    o.connect_timeout = connect_timeout;
    o.reconnect_interval = reconnect_interval;
    o.auto_reconnect = true;
    o.tls.cert_file = cert_file;
    o.tls.key_file = key_file;
    o.tls.ca_file = ca_file;
    o.will.enabled = birth_lwt_enabled && !birth_lwt_topic.empty();
    o.will.topic = birth_lwt_topic;
    o.log_level = log_level;
    return o;
}

discovery::Options DiscoveryConfig::options() const
{
    discovery::Options o;
    o.prefix = prefix;
    o.method = discovery::parse_method(method).value_or(discovery::Method::Device);
    o.device_name = device_name;
    o.node_id = node_id;
    o.availability_topic = availability_topic;
    o.retained = retained;
    o.qos = qos;
    o.wait_topic = wait_topic;
    o.wait_payload = wait_payload;
    return o;
}

} // namespace mqttop::config

#include "discovery/device.hpp"
#include "discovery/errors.hpp"
#include "mqttop_platform.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <optional>

namespace mqttop::discovery
{

namespace
{
using nlohmann::json;

constexpr std::array<std::string_view, 2> kDefaultHostnames = {"localhost", "debian"};

std::optional<std::string> read_file(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::optional<std::string> read_trimmed(const std::filesystem::path &path)
{
    auto content = read_file(path);
    if (!content)
    {
        return std::nullopt;
    }
    auto trimmed = std::string(format_tools::trim_whitespace(*content));
    if (trimmed.empty())
    {
        return std::nullopt;
    }
    return trimmed;
}

// First readable DMI attribute among product, chassis and board.
std::optional<std::string> read_dmi(const std::filesystem::path &dir, std::string_view attr)
{
    for (std::string_view prefix : {"product_", "chassis_", "board_"})
    {
        if (auto value = read_trimmed(dir / fmt::format("{}{}", prefix, attr)))
        {
            return value;
        }
    }
    return std::nullopt;
}

template <typename T>
void set_if(json &j, const char *key, const T &value)
{
    if (!value.empty())
    {
        j[key] = value;
    }
}

template <typename T>
void get_if(const json &j, const char *key, T &value)
{
    if (auto it = j.find(key); it != j.end() && !it->is_null())
    {
        it->get_to(value);
    }
}
} // namespace

utils::Result<Device, std::error_code> Device::detect(const Sources &sources)
{
    Device dev;

    auto machine_id = read_trimmed(sources.machine_id);
    if (!machine_id)
    {
        LOGGER_ERROR("Cannot read machine id from '{}'", sources.machine_id.string());
        return utils::Result<Device, std::error_code>::error(
            make_error_code(Errc::no_machine_id));
    }
    dev.identifiers.push_back(crypto::sha256_base64url(*machine_id));

    auto hostname = read_trimmed(sources.hostname);
    if (!hostname)
    {
        auto name = platform::get_hostname();
        if (!name.empty())
        {
            hostname = std::move(name);
        }
    }
    if (hostname && std::find(kDefaultHostnames.begin(), kDefaultHostnames.end(), *hostname) ==
                        kDefaultHostnames.end())
    {
        dev.name = format_tools::title_case(*hostname);
    }

    if (auto release = read_file(sources.os_release))
    {
        if (auto pretty = format_tools::extract_value_from_string("PRETTY_NAME", *release, '\n'))
        {
            std::string_view v = *pretty;
            if (v.size() >= 2 && v.front() == '"' && v.back() == '"')
            {
                v = v.substr(1, v.size() - 2);
            }
            dev.sw_version = std::string(v);
        }
    }

    if (auto model = read_dmi(sources.dmi_dir, "name"))
    {
        dev.model = std::move(*model);
    }
    if (auto vendor = read_dmi(sources.dmi_dir, "vendor"))
    {
        dev.manufacturer = std::move(*vendor);
    }

    return utils::Result<Device, std::error_code>::ok(std::move(dev));
}

void to_json(json &j, const Device &dev)
{
    j = json::object();
    set_if(j, "cu", dev.configuration_url);
    set_if(j, "cns", dev.connections);
    set_if(j, "hw", dev.hw_version);
    set_if(j, "ids", dev.identifiers);
    set_if(j, "mf", dev.manufacturer);
    set_if(j, "mdl", dev.model);
    set_if(j, "mdl_id", dev.model_id);
    set_if(j, "name", dev.name);
    set_if(j, "sn", dev.serial_number);
    set_if(j, "sa", dev.suggested_area);
    set_if(j, "sw", dev.sw_version);
}

void from_json(const json &j, Device &dev)
{
    get_if(j, "cu", dev.configuration_url);
    get_if(j, "cns", dev.connections);
    get_if(j, "hw", dev.hw_version);
    get_if(j, "ids", dev.identifiers);
    get_if(j, "mf", dev.manufacturer);
    get_if(j, "mdl", dev.model);
    get_if(j, "mdl_id", dev.model_id);
    get_if(j, "name", dev.name);
    get_if(j, "sn", dev.serial_number);
    get_if(j, "sa", dev.suggested_area);
    get_if(j, "sw", dev.sw_version);
}

Origin Origin::current()
{
    return Origin{"mqttop", platform::get_version_string(), "https://github.com/lone-faerie/mqttop"};
}

void to_json(json &j, const Origin &origin)
{
    j = json{{"name", origin.name}};
    set_if(j, "sw", origin.sw_version);
    set_if(j, "url", origin.support_url);
}

void from_json(const json &j, Origin &origin)
{
    get_if(j, "name", origin.name);
    get_if(j, "sw", origin.sw_version);
    get_if(j, "url", origin.support_url);
}

} // namespace mqttop::discovery

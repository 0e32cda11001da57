#pragma once
/**
 * @file device.hpp
 * @brief Device and origin mappings of the discovery payload.
 */
#include "utils/result.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace mqttop::discovery
{

/// A `[type, identifier]` pair, e.g. `{"mac", "02:5b:26:a8:dc:12"}`.
using Connection = std::array<std::string, 2>;

/// Where `Device::detect` reads the host identity from. Defined outside
/// `Device` so it is complete where `detect`'s default argument needs it.
struct DeviceSources
{
    std::filesystem::path machine_id = "/etc/machine-id";
    std::filesystem::path hostname = "/etc/hostname";
    std::filesystem::path os_release = "/etc/os-release";
    std::filesystem::path dmi_dir = "/sys/class/dmi/id";
};

/// Ties the announced components together in the automation platform's device registry.
struct Device
{
    std::string configuration_url;
    std::vector<Connection> connections;
    std::string hw_version;
    std::vector<std::string> identifiers;
    std::string manufacturer;
    std::string model;
    std::string model_id;
    std::string name;
    std::string serial_number;
    std::string suggested_area;
    std::string sw_version;

    /// Where `detect` reads the host identity from.
    using Sources = DeviceSources;

    /**
     * @brief Describes the local host.
     *
     * The identifier is the unpadded base64url SHA-256 of the machine id; its
     * absence is the only error. The name is the title-cased hostname unless
     * the hostname is a distribution default. The software version is the
     * os-release PRETTY_NAME and model/manufacturer come from DMI when present.
     */
    static utils::Result<Device, std::error_code> detect(const Sources &sources = {});

    bool operator==(const Device &) const = default;
};

void to_json(nlohmann::json &j, const Device &dev);
void from_json(const nlohmann::json &j, Device &dev);

struct Origin
{
    std::string name = "mqttop";
    std::string sw_version;
    std::string support_url;

    /// This program: name "mqttop", the build version and the project URL.
    static Origin current();

    bool operator==(const Origin &) const = default;
};

void to_json(nlohmann::json &j, const Origin &origin);
void from_json(const nlohmann::json &j, Origin &origin);

} // namespace mqttop::discovery

#pragma once
/**
 * @file config.hpp
 * @brief mqttop configuration: JSON files merged over built-in defaults.
 *
 * Loading strategy (priority low to high):
 *  1. Built-in defaults (the member initializers below)
 *  2. Each configuration file, in the order given; objects merge key by key
 *  3. Command-line overrides, applied by the caller before `finalize()`
 *
 * String values are expanded while parsing: `env:NAME` takes the whole value
 * from the environment, `${NAME}` and `$NAME` substitute inline, and
 * `!secret name` reads `$MQTTOP_SECRETS_DIR/name` (default `/run/secrets`).
 * Topics beginning or ending with `~` are anchored at `base_topic` by
 * `finalize()`.
 */
#include "discovery/discovery.hpp"
#include "metrics/byte_size.hpp"
#include "mqtt/client.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mqttop::config
{

using namespace std::chrono_literals;

struct MqttConfig
{
    std::string broker = "${MQTTOP_BROKER_ADDRESS}";
    std::string client_id = "mqttop";
    std::string username = "${MQTTOP_BROKER_USERNAME}";
    std::string password = "${MQTTOP_BROKER_PASSWORD}";
    std::chrono::milliseconds keep_alive = 30s;
    std::chrono::milliseconds connect_timeout = 10s;
    std::chrono::milliseconds reconnect_interval = 1min;
    std::string cert_file;
    std::string key_file;
    std::string ca_file;
    bool birth_lwt_enabled = true;
    std::string birth_lwt_topic = "~/bridge/status";
    std::string log_level = "disabled";

    mqtt::ClientOptions client_options() const;
};

struct DiscoveryConfig
{
    bool enabled = true;
    std::string prefix = "homeassistant";
    std::string method = "device";
    std::string device_name;
    std::string node_id = "mqttop";
    std::string availability_topic;
    bool retained = true;
    int qos = 0;
    std::string wait_topic;
    std::string wait_payload;
    std::string data_path;

    discovery::Options options() const;
};

struct LogConfig
{
    std::string level = "info";
    /// "stderr", "stdout", "syslog" or a file path.
    std::string output = "stderr";
    /// "text" or "json".
    std::string format = "text";
    /// Soft cap on queued log messages; the rest are dropped and counted.
    int queue_size = 10000;
};

struct BridgeConfig
{
    int offline_after_errors = 0;
};

struct MemoryConfig
{
    bool enabled = true;
    /// Zero means the global interval.
    std::chrono::milliseconds interval = 0ms;
    std::string topic = "~/metric/memory";
    std::string size_unit;
    bool include_swap = false;
};

struct Config
{
    std::chrono::milliseconds interval = 2s;
    std::string base_topic = "mqttop";
    MqttConfig mqtt;
    DiscoveryConfig discovery;
    LogConfig log;
    BridgeConfig bridge;
    MemoryConfig memory;

    /**
     * @brief Loads and merges @p paths, or the search path when empty.
     * @throws std::runtime_error when a file cannot be read or a key is invalid.
     */
    static Config load(const std::vector<std::filesystem::path> &paths);

    /// Applies one JSON object over the current values.
    /// @throws std::runtime_error naming the offending key.
    void apply_json(const nlohmann::json &j);

    /**
     * @brief Resolves derived values once every override is in.
     *
     * Anchors `~` topics, completes the broker URL, defaults the availability
     * topic to the last-will topic and resolves `device_name: "username"`.
     * @throws std::runtime_error on invalid values (e.g. an unknown discovery method).
     */
    void finalize();

    /// Memory interval with the global fallback applied.
    std::chrono::milliseconds memory_interval() const;

    /// The last-will topic, empty when birth/LWT is disabled.
    std::string will_topic() const;

    /**
     * @brief Candidate files when none is given on the command line.
     *
     * `$MQTTOP_CONFIG_PATH` (comma separated), then `$XDG_CONFIG_HOME/mqttop.json`
     * and `$HOME/.config/mqttop.json`. Only existing files are returned.
     */
    static std::vector<std::filesystem::path> search_path();
};

/// Expands environment references and secrets in one configuration string.
std::string expand_value(std::string_view value);

/// Replaces a leading or trailing `~` in @p topic with @p base.
std::string expand_topic(std::string_view topic, std::string_view base);

} // namespace mqttop::config

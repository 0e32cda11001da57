#pragma once
/**
 * @file discovery.hpp
 * @brief Home Assistant MQTT discovery document.
 *
 * A Discovery holds every announced component keyed by unique id, plus a
 * `nodes` index from producer type (the owning metric's `type()`) to the ids
 * that producer contributed. The index is what lets one producer's subset be
 * rebuilt and republished without touching the rest of the document.
 *
 * Three publishing methods are supported:
 * - **device**: one retained device payload `{o, dev, cmps}` at
 *   `<prefix>/device/<node_id>/<object_id>/config`;
 * - **components**: one payload per component at
 *   `<prefix>/<platform>/<node_id>/<unique_id>/config`;
 * - **nodes**: one device payload per producer type at
 *   `<prefix>/device/<node_id>_<type>/<object_id>/config`.
 *
 * A component reduced to its platform (`{"p": "sensor"}`) is a removal
 * placeholder: it is published as an empty payload in the components method.
 *
 * Not thread-safe. The bridge mutates the document from one thread at a time.
 */
#include "discovery/device.hpp"
#include "mqtt/client.hpp"
#include "utils/result.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace mqttop::discovery
{

/// Abbreviated option keys understood by Home Assistant.
namespace opt
{
inline constexpr const char *Platform = "p";
inline constexpr const char *Name = "name";
inline constexpr const char *Icon = "ic";
inline constexpr const char *EntityCategory = "ent_cat";
inline constexpr const char *DeviceClass = "dev_cla";
inline constexpr const char *StateClass = "stat_cla";
inline constexpr const char *AvailabilityTopic = "avty_t";
inline constexpr const char *AvailabilityTemplate = "avty_tpl";
inline constexpr const char *CommandTopic = "cmd_t";
inline constexpr const char *StateTopic = "stat_t";
inline constexpr const char *ValueTemplate = "val_tpl";
inline constexpr const char *UnitOfMeasurement = "unit_of_meas";
inline constexpr const char *SuggestedDisplayPrecision = "sug_dsp_prc";
inline constexpr const char *JsonAttributesTopic = "json_attr_t";
inline constexpr const char *JsonAttributesTemplate = "json_attr_tpl";
inline constexpr const char *UniqueId = "uniq_id";
inline constexpr const char *EnabledByDefault = "en";
inline constexpr const char *Origin = "o";
inline constexpr const char *Device = "dev";
} // namespace opt

namespace platform
{
inline constexpr const char *BinarySensor = "binary_sensor";
inline constexpr const char *Button = "button";
inline constexpr const char *Sensor = "sensor";
inline constexpr const char *Switch = "switch";
} // namespace platform

inline constexpr const char *kDiagnostic = "diagnostic";

using Component = nlohmann::json;

enum class Method
{
    Device,
    Components,
    Nodes,
};

/// "" and "device", "components", "nodes" and "metrics".
std::optional<Method> parse_method(std::string_view name);
std::string_view to_string(Method method);

/// True when switching from @p old to @p method needs a migration handshake.
bool should_migrate(Method method, Method old);

struct Options
{
    std::string prefix = "homeassistant";
    Method method = Method::Device;
    /// Overrides the detected device name. "" and "hostname" keep it.
    std::string device_name;
    std::string node_id = "mqttop";
    std::string availability_topic;
    bool retained = true;
    int qos = 0;
    /// When set, the first publish waits for @p wait_payload (or any payload) here.
    std::string wait_topic;
    std::string wait_payload;
};

/**
 * @brief Availability template reading one topic's flag from the bridge state map.
 *
 * Falls back to the raw payload ("offline") when the state topic does not
 * carry JSON.
 */
std::string availability_template(std::string_view topic);

class Discovery
{
  public:
    using Nodes = std::map<std::string, std::vector<std::string>>;

    /**
     * @brief Builds an empty document for @p device.
     * @return Errc::no_object_id when the device has neither identifiers nor connections.
     */
    static utils::Result<Discovery, std::error_code> create(Options options, Device device,
                                                            Origin origin = Origin::current());

    /// Reads a document written by write(). Publishing options are left at their defaults.
    static utils::Result<Discovery, std::error_code> load(const std::filesystem::path &path);

    /// Writes the document, including the node index and method, as indented JSON.
    std::error_code write(const std::filesystem::path &path) const;

    const Options &options() const { return m_options; }
    Method method() const { return m_options.method; }
    const Origin &origin() const { return m_origin; }
    const Device &device() const { return m_device; }
    const std::string &object_id() const { return m_object_id; }
    const std::string &availability_topic() const { return m_options.availability_topic; }

    const std::map<std::string, Component> &components() const { return m_components; }
    const Nodes &nodes() const { return m_nodes; }

    /// Stores @p cmp under @p unique_id and records it as owned by @p node.
    void add_component(const std::string &node, const std::string &unique_id, Component cmp);

    /**
     * @brief Starts rebuilding one producer's subset.
     *
     * Every component of @p node is reduced to its platform placeholder and
     * the node's id list is cleared. Returns the ids it held.
     */
    std::vector<std::string> reset_node(const std::string &node);

    /**
     * @brief Finishes rebuilding one producer's subset.
     *
     * Ids from @p previous that the producer did not add again stay in the
     * node as placeholders. The id list ends up sorted and deduplicated.
     */
    void restore_node(const std::string &node, std::vector<std::string> previous);

    /// `<prefix>/<component>/[<node_id>/]<object_id>/config`. An empty object id means ours.
    std::string topic(std::string_view component, std::string_view node_id,
                      std::string_view object_id = {}) const;

    /// Device payload: `{o, dev, cmps}`.
    nlohmann::json payload() const;

    /// Persisted form: the payload plus `_nodes` and `_method`.
    nlohmann::json to_json() const;

    /**
     * @brief Adds placeholders for components of @p old that vanished.
     * @return true when the method changed in a way that needs migration.
     */
    bool diff(const Discovery &old);

    /**
     * @brief Blocks until the configured wait payload arrives.
     *
     * Returns immediately without a wait topic. Cancellation returns no error.
     */
    std::error_code wait(std::stop_token st, mqtt::Client &client) const;

    /**
     * @brief Publishes the whole document with the configured method.
     * @param migrate Run the migration handshake from the other method first.
     */
    std::error_code publish(std::stop_token st, mqtt::Client &client, bool migrate = false);

    /**
     * @brief Publishes only what belongs to @p node.
     *
     * In the device method the single device payload is republished, since
     * it cannot be split.
     */
    std::error_code publish_node(std::stop_token st, mqtt::Client &client, const std::string &node);

    /// Publishes the migrate marker to every component topic.
    std::error_code migrate(std::stop_token st, mqtt::Client &client) const;

    /// Publishes the migrate marker to the device topic.
    std::error_code rollback(std::stop_token st, mqtt::Client &client) const;

    /**
     * @brief Calls @p on_online whenever the platform announces itself online.
     *
     * Subscribes to `<prefix>/status`. The callback runs on the client's
     * delivery thread and must not block.
     */
    std::error_code subscribe_status(std::stop_token st, mqtt::Client &client,
                                     std::function<void()> on_online) const;

  private:
    Discovery() = default;

    std::error_code publish_to(std::stop_token st, mqtt::Client &client, const std::string &topic,
                               std::string payload) const;
    std::error_code publish_device(std::stop_token st, mqtt::Client &client, bool migrate) const;
    std::error_code publish_components(std::stop_token st, mqtt::Client &client, bool migrate,
                                       const std::vector<std::string> &subset) const;
    std::error_code publish_nodes(std::stop_token st, mqtt::Client &client,
                                  const std::vector<std::string> &subset) const;
    std::error_code remove_components(std::stop_token st, mqtt::Client &client) const;
    std::error_code remove_device(std::stop_token st, mqtt::Client &client) const;
    std::string component_payload(const Component &cmp) const;

    Options m_options;
    Origin m_origin;
    Device m_device;
    std::string m_object_id;
    std::map<std::string, Component> m_components;
    Nodes m_nodes;
};

} // namespace mqttop::discovery

#pragma once
/**
 * @file client.hpp
 * @brief The broker client capability consumed by the bridge.
 *
 * Every operation is asynchronous and returns a Token. Message handlers run on
 * the client's delivery thread and must not block on other broker operations.
 */
#include "mqtt/token.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mqttop::mqtt
{

/// Last-will parameters. The bridge also publishes `payload` itself on shutdown.
struct WillOptions
{
    bool enabled = false;
    std::string topic;
    std::string payload = "offline";
    int qos = 1;
    bool retained = true;
};

struct TlsOptions
{
    std::string cert_file;
    std::string key_file;
    std::string ca_file;

    bool enabled() const { return !cert_file.empty() && !key_file.empty(); }
};

struct ClientOptions
{
    std::string broker;
    std::string client_id = "mqttop";
    std::string username;
    std::string password;
    std::chrono::seconds keep_alive{30};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds reconnect_interval{60000};
    bool auto_reconnect = true;
    WillOptions will;
    TlsOptions tls;
    /// Library trace level: "disabled", "error", "warn", "info", "debug" or "trace".
    std::string log_level = "disabled";
};

struct Message
{
    std::string topic;
    std::string payload;
    int qos = 0;
    bool retained = false;
};

using MessageHandler = std::function<void(const Message &)>;

class Client
{
  public:
    virtual ~Client() = default;

    virtual TokenPtr connect() = 0;

    /// Disconnects, giving in-flight work up to @p grace to finish.
    virtual void disconnect(std::chrono::milliseconds grace) = 0;

    virtual bool is_connected() const = 0;

    virtual TokenPtr publish(const std::string &topic, int qos, bool retained,
                             std::string payload) = 0;

    virtual TokenPtr subscribe(const std::string &filter, int qos, MessageHandler handler) = 0;

    /// Subscribes to every filter (mapped to its qos) with one shared handler.
    virtual TokenPtr subscribe_multiple(const std::map<std::string, int> &filters,
                                        MessageHandler handler) = 0;

    virtual TokenPtr unsubscribe(const std::vector<std::string> &topics) = 0;

    /// Immutable snapshot of the options the client was created with.
    virtual const ClientOptions &options() const = 0;
};

/// MQTT topic filter matching with `+` and `#`. `$`-topics never match a leading wildcard.
bool topic_matches(std::string_view filter, std::string_view topic);

/**
 * @brief Completes a broker address into a URL.
 *
 * "host" becomes "tcp://host:1883"; an explicit scheme or port is kept
 * ("ssl://host" becomes "ssl://host:8883").
 */
std::string normalize_broker_url(std::string_view broker);

} // namespace mqttop::mqtt

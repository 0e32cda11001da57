#pragma once
/**
 * @file paho_client.hpp
 * @brief Broker client over the Eclipse Paho MQTT C asynchronous API.
 */
#include "mqtt/client.hpp"

#include <mutex>
#include <vector>

namespace mqttop::mqtt
{

class PahoClient : public Client
{
  public:
    /// @throws std::runtime_error if the Paho handle cannot be created.
    explicit PahoClient(ClientOptions options);
    ~PahoClient() override;

    PahoClient(const PahoClient &) = delete;
    PahoClient &operator=(const PahoClient &) = delete;

    TokenPtr connect() override;
    void disconnect(std::chrono::milliseconds grace) override;
    bool is_connected() const override;
    TokenPtr publish(const std::string &topic, int qos, bool retained,
                     std::string payload) override;
    TokenPtr subscribe(const std::string &filter, int qos, MessageHandler handler) override;
    TokenPtr subscribe_multiple(const std::map<std::string, int> &filters,
                                MessageHandler handler) override;
    TokenPtr unsubscribe(const std::vector<std::string> &topics) override;
    const ClientOptions &options() const override { return m_options; }

    /// Routes the library's trace output to the Logger at @p level ("disabled" turns it off).
    static void set_trace_level(const std::string &level);

  private:
    struct Route
    {
        std::string filter;
        int qos;
        MessageHandler handler;
    };

    // Paho C callbacks; defined in paho_client.cpp where the Paho types are visible.
    friend struct PahoCallbacks;

    void dispatch(const Message &msg) const;
    void resubscribe();

    const ClientOptions m_options;
    const std::string m_url;
    void *m_handle = nullptr;
    mutable std::mutex m_routes_mutex;
    std::vector<Route> m_routes;
};

} // namespace mqttop::mqtt

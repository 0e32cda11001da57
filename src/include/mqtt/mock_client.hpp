#pragma once
/**
 * @file mock_client.hpp
 * @brief Deterministic in-memory broker client for tests.
 *
 * MockClient keeps a log of every publish, a retained-message store and a
 * subscription table. Tokens complete and messages are delivered on a
 * dispatcher thread, so callers see the same asynchrony as with a real
 * broker. Test hooks inject inbound messages and script failures.
 */
#include "mqtt/client.hpp"
#include "utils/callback_dispatcher.hpp"

#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace mqttop::mqtt
{

class MockClient : public Client
{
  public:
    explicit MockClient(ClientOptions options = {});
    ~MockClient() override;

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

    // --- Test hooks ---

    /// Delivers a message to matching subscriptions as if the broker sent it.
    void inject(const std::string &topic, std::string payload, bool retained = false);

    /// Makes the next connect attempts fail with @p ec (empty to clear).
    void set_connect_error(std::error_code ec);

    /// Leaves connect tokens pending until release_connect().
    void set_hold_connect(bool hold);
    void release_connect();

    /// Subscribes to any of these exact filters fail with @p ec.
    void set_subscribe_error(const std::string &filter, std::error_code ec);

    /// Publishes to topics matching @p filter complete with @p ec.
    void set_publish_error(const std::string &filter, std::error_code ec);

    /// Simulates an unclean connection loss: the broker publishes the will.
    void drop_connection();

    // --- Queries ---

    std::vector<Message> published() const;
    std::vector<std::string> published_to(const std::string &topic) const;
    std::optional<Message> last_published_to(const std::string &topic) const;
    std::optional<std::string> retained(const std::string &topic) const;
    std::vector<std::string> subscriptions() const;
    size_t connect_count() const;
    size_t disconnect_count() const;
    void clear_published();

    /**
     * @brief Waits until a publish to @p topic satisfies @p pred.
     *
     * Publishes made before the call count too.
     */
    bool wait_for_publish(const std::string &topic,
                          const std::function<bool(const std::string &)> &pred,
                          std::chrono::milliseconds timeout);

    /// Waits until @p payload has been published to @p topic.
    bool wait_for_payload(const std::string &topic, const std::string &payload,
                          std::chrono::milliseconds timeout);

    /// Waits until every token completion and delivery queued so far has run.
    void drain();

  private:
    struct Subscription
    {
        std::string filter;
        int qos;
        MessageHandler handler;
    };

    void deliver_locked(const Message &msg);
    void complete_async(const TokenPtr &token, std::error_code ec);

    const ClientOptions m_options;
    mutable std::mutex m_mutex;
    std::condition_variable m_publish_cv;
    bool m_connected = false;
    bool m_hold_connect = false;
    std::error_code m_connect_error;
    std::vector<TokenPtr> m_held_connects;
    std::map<std::string, std::error_code> m_subscribe_errors;
    std::map<std::string, std::error_code> m_publish_errors;
    std::vector<Subscription> m_subscriptions;
    std::map<std::string, std::string> m_retained;
    std::vector<Message> m_published;
    size_t m_connect_count = 0;
    size_t m_disconnect_count = 0;
    utils::CallbackDispatcher m_dispatcher{"MockClient"};
};

} // namespace mqttop::mqtt

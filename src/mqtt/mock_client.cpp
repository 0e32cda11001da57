#include "mqtt/mock_client.hpp"
#include "mqtt/errors.hpp"

#include <algorithm>

namespace mqttop::mqtt
{

MockClient::MockClient(ClientOptions options) : m_options(std::move(options)) {}

MockClient::~MockClient()
{
    m_dispatcher.shutdown();
}

void MockClient::complete_async(const TokenPtr &token, std::error_code ec)
{
    m_dispatcher.post([token, ec] { token->complete(ec); });
}

TokenPtr MockClient::connect()
{
    auto token = std::make_shared<Token>();
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_connect_count;
    if (m_connect_error)
    {
        complete_async(token, m_connect_error);
        return token;
    }
    if (m_hold_connect)
    {
        m_held_connects.push_back(token);
        return token;
    }
    m_connected = true;
    complete_async(token, {});
    return token;
}

void MockClient::release_connect()
{
    std::vector<TokenPtr> held;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_hold_connect = false;
        held.swap(m_held_connects);
        if (!held.empty())
        {
            m_connected = true;
        }
    }
    for (auto &token : held)
    {
        complete_async(token, {});
    }
}

void MockClient::disconnect(std::chrono::milliseconds /*grace*/)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_connected)
        {
            return;
        }
        m_connected = false;
        m_subscriptions.clear();
        ++m_disconnect_count;
    }
    if (!m_dispatcher.on_worker_thread())
    {
        m_dispatcher.drain();
    }
}

bool MockClient::is_connected() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connected;
}

TokenPtr MockClient::publish(const std::string &topic, int qos, bool retained,
                             std::string payload)
{
    auto token = std::make_shared<Token>();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connected)
    {
        complete_async(token, Errc::not_connected);
        return token;
    }
    for (const auto &[filter, ec] : m_publish_errors)
    {
        if (topic_matches(filter, topic))
        {
            complete_async(token, ec);
            return token;
        }
    }

    Message msg{topic, std::move(payload), qos, retained};
    if (retained)
    {
        if (msg.payload.empty())
            m_retained.erase(topic);
        else
            m_retained[topic] = msg.payload;
    }
    m_published.push_back(msg);
    m_publish_cv.notify_all();
    deliver_locked(msg);
    complete_async(token, {});
    return token;
}

TokenPtr MockClient::subscribe(const std::string &filter, int qos, MessageHandler handler)
{
    return subscribe_multiple({{filter, qos}}, std::move(handler));
}

TokenPtr MockClient::subscribe_multiple(const std::map<std::string, int> &filters,
                                        MessageHandler handler)
{
    auto token = std::make_shared<Token>();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connected)
    {
        complete_async(token, Errc::not_connected);
        return token;
    }
    for (const auto &[filter, qos] : filters)
    {
        if (auto it = m_subscribe_errors.find(filter); it != m_subscribe_errors.end())
        {
            complete_async(token, it->second);
            return token;
        }
    }
    for (const auto &[filter, qos] : filters)
    {
        std::erase_if(m_subscriptions, [&](const Subscription &s) { return s.filter == filter; });
        m_subscriptions.push_back(Subscription{filter, qos, handler});
    }
    complete_async(token, {});
    // Retained messages reach a new subscription right after its SUBACK.
    for (const auto &[topic, payload] : m_retained)
    {
        for (const auto &[filter, qos] : filters)
        {
            if (topic_matches(filter, topic))
            {
                Message msg{topic, payload, qos, true};
                m_dispatcher.post([handler, msg] { handler(msg); });
                break;
            }
        }
    }
    return token;
}

TokenPtr MockClient::unsubscribe(const std::vector<std::string> &topics)
{
    auto token = std::make_shared<Token>();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connected)
    {
        complete_async(token, Errc::not_connected);
        return token;
    }
    std::erase_if(m_subscriptions,
                  [&](const Subscription &s)
                  { return std::find(topics.begin(), topics.end(), s.filter) != topics.end(); });
    complete_async(token, {});
    return token;
}

void MockClient::deliver_locked(const Message &msg)
{
    for (const auto &sub : m_subscriptions)
    {
        if (topic_matches(sub.filter, msg.topic))
        {
            auto handler = sub.handler;
            Message copy = msg;
            copy.qos = std::min(msg.qos, sub.qos);
            m_dispatcher.post([handler, copy] { handler(copy); });
        }
    }
}

void MockClient::inject(const std::string &topic, std::string payload, bool retained)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Message msg{topic, std::move(payload), 0, retained};
    if (retained)
    {
        m_retained[topic] = msg.payload;
    }
    deliver_locked(msg);
}

void MockClient::set_connect_error(std::error_code ec)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connect_error = ec;
}

void MockClient::set_hold_connect(bool hold)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hold_connect = hold;
}

void MockClient::set_subscribe_error(const std::string &filter, std::error_code ec)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (ec)
        m_subscribe_errors[filter] = ec;
    else
        m_subscribe_errors.erase(filter);
}

void MockClient::set_publish_error(const std::string &filter, std::error_code ec)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (ec)
        m_publish_errors[filter] = ec;
    else
        m_publish_errors.erase(filter);
}

void MockClient::drop_connection()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connected)
        return;
    m_connected = false;
    m_subscriptions.clear();
    const auto &will = m_options.will;
    if (will.enabled && !will.topic.empty())
    {
        Message msg{will.topic, will.payload, will.qos, will.retained};
        if (will.retained)
            m_retained[will.topic] = will.payload;
        m_published.push_back(msg);
        m_publish_cv.notify_all();
    }
}

std::vector<Message> MockClient::published() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_published;
}

std::vector<std::string> MockClient::published_to(const std::string &topic) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> payloads;
    for (const auto &msg : m_published)
    {
        if (msg.topic == topic)
            payloads.push_back(msg.payload);
    }
    return payloads;
}

std::optional<Message> MockClient::last_published_to(const std::string &topic) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_published.rbegin(); it != m_published.rend(); ++it)
    {
        if (it->topic == topic)
            return *it;
    }
    return std::nullopt;
}

std::optional<std::string> MockClient::retained(const std::string &topic) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto it = m_retained.find(topic); it != m_retained.end())
        return it->second;
    return std::nullopt;
}

std::vector<std::string> MockClient::subscriptions() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> filters;
    filters.reserve(m_subscriptions.size());
    for (const auto &sub : m_subscriptions)
        filters.push_back(sub.filter);
    std::sort(filters.begin(), filters.end());
    return filters;
}

size_t MockClient::connect_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connect_count;
}

size_t MockClient::disconnect_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_disconnect_count;
}

void MockClient::clear_published()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_published.clear();
}

bool MockClient::wait_for_publish(const std::string &topic,
                                  const std::function<bool(const std::string &)> &pred,
                                  std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_publish_cv.wait_for(lock, timeout,
                                 [&]
                                 {
                                     return std::any_of(m_published.begin(), m_published.end(),
                                                        [&](const Message &m)
                                                        { return m.topic == topic && pred(m.payload); });
                                 });
}

bool MockClient::wait_for_payload(const std::string &topic, const std::string &payload,
                                  std::chrono::milliseconds timeout)
{
    return wait_for_publish(topic, [&](const std::string &p) { return p == payload; }, timeout);
}

void MockClient::drain()
{
    m_dispatcher.drain();
}

} // namespace mqttop::mqtt

#include "mqttop_service.hpp"
#include "mqtt/errors.hpp"
#include "mqtt/paho_client.hpp"

#include <MQTTAsync.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace mqttop::mqtt
{

namespace
{
// Heap context of one in-flight Paho call; freed by whichever callback fires.
struct PendingOp
{
    TokenPtr token;
    Errc failure;
    std::string what;
};

void on_op_success(void *context, MQTTAsync_successData * /*response*/)
{
    std::unique_ptr<PendingOp> op(static_cast<PendingOp *>(context));
    op->token->complete();
}

void on_op_failure(void *context, MQTTAsync_failureData *response)
{
    std::unique_ptr<PendingOp> op(static_cast<PendingOp *>(context));
    LOGGER_DEBUG("[mqtt] {} failed: code={} message={}", op->what,
                 response != nullptr ? response->code : -1,
                 response != nullptr && response->message != nullptr ? response->message : "none");
    op->token->complete(op->failure);
}

MQTTAsync_responseOptions make_response_options(PendingOp *op)
{
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.onSuccess = on_op_success;
    opts.onFailure = on_op_failure;
    opts.context = op;
    return opts;
}

// Starts a Paho call; a synchronous failure completes the token immediately.
TokenPtr start_op(Errc failure, std::string what,
                  const std::function<int(MQTTAsync_responseOptions *)> &call)
{
    auto token = std::make_shared<Token>();
    auto op = std::make_unique<PendingOp>(PendingOp{token, failure, std::move(what)});
    auto opts = make_response_options(op.get());
    const int rc = call(&opts);
    if (rc != MQTTASYNC_SUCCESS)
    {
        LOGGER_DEBUG("[mqtt] {} rejected: {}", op->what, MQTTAsync_strerror(rc));
        token->complete(rc == MQTTASYNC_DISCONNECTED ? make_error_code(Errc::not_connected)
                                                     : make_error_code(failure));
        return token;
    }
    (void)op.release(); // owned by the Paho callback now
    return token;
}

void on_trace(enum MQTTASYNC_TRACE_LEVELS level, char *message)
{
    using Level = utils::Logger::Level;
    Level lvl = Level::L_TRACE;
    switch (level)
    {
    case MQTTASYNC_TRACE_MAXIMUM:
    case MQTTASYNC_TRACE_MEDIUM:
        lvl = Level::L_TRACE;
        break;
    case MQTTASYNC_TRACE_MINIMUM:
    case MQTTASYNC_TRACE_PROTOCOL:
        lvl = Level::L_DEBUG;
        break;
    case MQTTASYNC_TRACE_ERROR:
        lvl = Level::L_WARNING;
        break;
    case MQTTASYNC_TRACE_SEVERE:
    case MQTTASYNC_TRACE_FATAL:
        lvl = Level::L_ERROR;
        break;
    }
    utils::Logger::instance().log_message(lvl,
                                          fmt::format("[paho] {}", message ? message : ""));
}

} // namespace

struct PahoCallbacks
{
    static int message_arrived(void *context, char *topic_name, int topic_len,
                               MQTTAsync_message *message)
    {
        auto *self = static_cast<PahoClient *>(context);
        if (self != nullptr && topic_name != nullptr && message != nullptr)
        {
            Message msg;
            msg.topic = std::string(topic_name, topic_len > 0 ? static_cast<size_t>(topic_len)
                                                              : std::strlen(topic_name));
            msg.payload = std::string(static_cast<const char *>(message->payload),
                                      static_cast<size_t>(message->payloadlen));
            msg.qos = message->qos;
            msg.retained = message->retained != 0;
            self->dispatch(msg);
        }
        if (message != nullptr)
        {
            MQTTAsync_freeMessage(&message);
        }
        MQTTAsync_free(topic_name);
        return 1;
    }

    static void connection_lost(void * /*context*/, char *cause)
    {
        LOGGER_WARN("[mqtt] connection lost: {}", cause != nullptr ? cause : "unknown");
    }

    static void connected(void *context, char * /*cause*/)
    {
        auto *self = static_cast<PahoClient *>(context);
        LOGGER_INFO("[mqtt] connected to {}", self->m_url);
        // Clean sessions drop subscriptions on every reconnect.
        self->resubscribe();
    }
};

PahoClient::PahoClient(ClientOptions options)
    : m_options(std::move(options)), m_url(normalize_broker_url(m_options.broker))
{
    if (m_url.empty())
    {
        throw std::runtime_error("mqtt: no broker address configured");
    }
    MQTTAsync handle = nullptr;
    int rc = MQTTAsync_create(&handle, m_url.c_str(), m_options.client_id.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS)
    {
        throw std::runtime_error(
            fmt::format("mqtt: failed to create client for {}: {}", m_url, MQTTAsync_strerror(rc)));
    }
    m_handle = handle;
    rc = MQTTAsync_setCallbacks(handle, this, &PahoCallbacks::connection_lost,
                                &PahoCallbacks::message_arrived, nullptr);
    if (rc == MQTTASYNC_SUCCESS)
    {
        rc = MQTTAsync_setConnected(handle, this, &PahoCallbacks::connected);
    }
    if (rc != MQTTASYNC_SUCCESS)
    {
        MQTTAsync_destroy(&handle);
        m_handle = nullptr;
        throw std::runtime_error(
            fmt::format("mqtt: failed to set callbacks: {}", MQTTAsync_strerror(rc)));
    }
}

PahoClient::~PahoClient()
{
    if (m_handle != nullptr)
    {
        MQTTAsync handle = m_handle;
        MQTTAsync_setCallbacks(handle, nullptr, nullptr, nullptr, nullptr);
        if (MQTTAsync_isConnected(handle))
        {
            MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
            opts.timeout = 0;
            MQTTAsync_disconnect(handle, &opts);
        }
        MQTTAsync_destroy(&handle);
    }
}

TokenPtr PahoClient::connect()
{
    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    conn_opts.keepAliveInterval = static_cast<int>(m_options.keep_alive.count());
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(m_options.connect_timeout).count());
    if (!m_options.username.empty())
    {
        conn_opts.username = m_options.username.c_str();
    }
    if (!m_options.password.empty())
    {
        conn_opts.password = m_options.password.c_str();
    }
    if (m_options.auto_reconnect)
    {
        conn_opts.automaticReconnect = 1;
        conn_opts.minRetryInterval = 1;
        conn_opts.maxRetryInterval = std::max(
            1, static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(
                                    m_options.reconnect_interval)
                                    .count()));
    }

    MQTTAsync_willOptions will_opts = MQTTAsync_willOptions_initializer;
    if (m_options.will.enabled && !m_options.will.topic.empty())
    {
        will_opts.topicName = m_options.will.topic.c_str();
        will_opts.message = m_options.will.payload.c_str();
        will_opts.qos = m_options.will.qos;
        will_opts.retained = m_options.will.retained ? 1 : 0;
        conn_opts.will = &will_opts;
    }

    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;
    if (m_options.tls.enabled())
    {
        ssl_opts.keyStore = m_options.tls.cert_file.c_str();
        ssl_opts.privateKey = m_options.tls.key_file.c_str();
        ssl_opts.trustStore =
            m_options.tls.ca_file.empty() ? nullptr : m_options.tls.ca_file.c_str();
        ssl_opts.enableServerCertAuth = m_options.tls.ca_file.empty() ? 0 : 1;
        conn_opts.ssl = &ssl_opts;
    }

    auto token = std::make_shared<Token>();
    auto op = std::make_unique<PendingOp>(PendingOp{token, Errc::connect_failed, "connect"});
    conn_opts.onSuccess = on_op_success;
    conn_opts.onFailure = on_op_failure;
    conn_opts.context = op.get();

    LOGGER_INFO("[mqtt] connecting to {} as '{}'", m_url, m_options.client_id);
    const int rc = MQTTAsync_connect(static_cast<MQTTAsync>(m_handle), &conn_opts);
    if (rc != MQTTASYNC_SUCCESS)
    {
        LOGGER_ERROR("[mqtt] connect to {} rejected: {}", m_url, MQTTAsync_strerror(rc));
        token->complete(Errc::connect_failed);
        return token;
    }
    (void)op.release();
    return token;
}

void PahoClient::disconnect(std::chrono::milliseconds grace)
{
    if (!is_connected())
    {
        return;
    }
    auto token = std::make_shared<Token>();
    auto op = std::make_unique<PendingOp>(PendingOp{token, Errc::not_connected, "disconnect"});
    MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
    opts.timeout = static_cast<int>(grace.count());
    opts.onSuccess = on_op_success;
    opts.onFailure = on_op_failure;
    opts.context = op.get();
    const int rc = MQTTAsync_disconnect(static_cast<MQTTAsync>(m_handle), &opts);
    if (rc != MQTTASYNC_SUCCESS)
    {
        LOGGER_WARN("[mqtt] disconnect failed: {}", MQTTAsync_strerror(rc));
        return;
    }
    (void)op.release();
    if (!token->wait_for(grace + std::chrono::milliseconds(500)))
    {
        LOGGER_WARN("[mqtt] disconnect did not complete within {}ms", grace.count());
    }
}

bool PahoClient::is_connected() const
{
    return MQTTAsync_isConnected(static_cast<MQTTAsync>(m_handle)) != 0;
}

TokenPtr PahoClient::publish(const std::string &topic, int qos, bool retained,
                             std::string payload)
{
    return start_op(Errc::publish_failed, "publish to " + topic,
                    [&](MQTTAsync_responseOptions *opts)
                    {
                        MQTTAsync_message msg = MQTTAsync_message_initializer;
                        msg.payload = payload.data();
                        msg.payloadlen = static_cast<int>(payload.size());
                        msg.qos = qos;
                        msg.retained = retained ? 1 : 0;
                        return MQTTAsync_sendMessage(static_cast<MQTTAsync>(m_handle),
                                                     topic.c_str(), &msg, opts);
                    });
}

TokenPtr PahoClient::subscribe(const std::string &filter, int qos, MessageHandler handler)
{
    return subscribe_multiple({{filter, qos}}, std::move(handler));
}

TokenPtr PahoClient::subscribe_multiple(const std::map<std::string, int> &filters,
                                        MessageHandler handler)
{
    if (filters.empty())
    {
        return make_completed_token(Errc::invalid_argument);
    }
    {
        std::lock_guard<std::mutex> lock(m_routes_mutex);
        for (const auto &[filter, qos] : filters)
        {
            std::erase_if(m_routes, [&](const Route &r) { return r.filter == filter; });
            m_routes.push_back(Route{filter, qos, handler});
        }
    }

    std::vector<char *> topics;
    std::vector<int> qos_levels;
    for (const auto &[filter, qos] : filters)
    {
        topics.push_back(const_cast<char *>(filter.c_str()));
        qos_levels.push_back(qos);
    }
    return start_op(Errc::subscribe_failed, fmt::format("subscribe to {}", fmt::join(topics, ",")),
                    [&](MQTTAsync_responseOptions *opts)
                    {
                        return MQTTAsync_subscribeMany(static_cast<MQTTAsync>(m_handle),
                                                       static_cast<int>(topics.size()),
                                                       topics.data(), qos_levels.data(), opts);
                    });
}

TokenPtr PahoClient::unsubscribe(const std::vector<std::string> &topics)
{
    if (topics.empty())
    {
        return make_completed_token();
    }
    {
        std::lock_guard<std::mutex> lock(m_routes_mutex);
        std::erase_if(m_routes,
                      [&](const Route &r)
                      { return std::find(topics.begin(), topics.end(), r.filter) != topics.end(); });
    }
    std::vector<char *> raw;
    for (const auto &topic : topics)
    {
        raw.push_back(const_cast<char *>(topic.c_str()));
    }
    return start_op(Errc::unsubscribe_failed, fmt::format("unsubscribe {}", fmt::join(topics, ",")),
                    [&](MQTTAsync_responseOptions *opts)
                    {
                        return MQTTAsync_unsubscribeMany(static_cast<MQTTAsync>(m_handle),
                                                         static_cast<int>(raw.size()), raw.data(),
                                                         opts);
                    });
}

void PahoClient::dispatch(const Message &msg) const
{
    std::vector<MessageHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(m_routes_mutex);
        for (const auto &route : m_routes)
        {
            if (topic_matches(route.filter, msg.topic))
            {
                handlers.push_back(route.handler);
            }
        }
    }
    for (const auto &handler : handlers)
    {
        try
        {
            handler(msg);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("[mqtt] handler for {} threw: {}", msg.topic, e.what());
        }
    }
}

void PahoClient::resubscribe()
{
    std::map<std::string, int> filters;
    {
        std::lock_guard<std::mutex> lock(m_routes_mutex);
        for (const auto &route : m_routes)
        {
            filters[route.filter] = route.qos;
        }
    }
    if (filters.empty())
    {
        return;
    }
    std::vector<char *> topics;
    std::vector<int> qos_levels;
    for (const auto &[filter, qos] : filters)
    {
        topics.push_back(const_cast<char *>(filter.c_str()));
        qos_levels.push_back(qos);
    }
    auto token = start_op(Errc::subscribe_failed, "resubscribe",
                          [&](MQTTAsync_responseOptions *opts)
                          {
                              return MQTTAsync_subscribeMany(static_cast<MQTTAsync>(m_handle),
                                                             static_cast<int>(topics.size()),
                                                             topics.data(), qos_levels.data(),
                                                             opts);
                          });
    token->on_complete(
        [n = filters.size()](const std::error_code &ec)
        {
            if (ec)
                LOGGER_WARN("[mqtt] resubscribing {} filters failed: {}", n, ec.message());
        });
}

void PahoClient::set_trace_level(const std::string &level)
{
    if (level.empty() || level == "disabled")
    {
        MQTTAsync_setTraceCallback(nullptr);
        return;
    }
    enum MQTTASYNC_TRACE_LEVELS trace = MQTTASYNC_TRACE_ERROR;
    if (level == "trace")
        trace = MQTTASYNC_TRACE_MAXIMUM;
    else if (level == "debug")
        trace = MQTTASYNC_TRACE_MEDIUM;
    else if (level == "info")
        trace = MQTTASYNC_TRACE_PROTOCOL;
    else if (level == "warn")
        trace = MQTTASYNC_TRACE_ERROR;
    else if (level == "error")
        trace = MQTTASYNC_TRACE_SEVERE;
    MQTTAsync_setTraceLevel(trace);
    MQTTAsync_setTraceCallback(on_trace);
}

} // namespace mqttop::mqtt

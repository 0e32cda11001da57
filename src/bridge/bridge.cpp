#include "bridge/bridge.hpp"
#include "bridge/control.hpp"
#include "bridge/errors.hpp"
#include "metrics/errors.hpp"
#include "mqtt/token.hpp"
#include "utils/callback_dispatcher.hpp"
#include "utils/channel.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <fmt/format.h>

namespace mqttop::bridge
{

namespace
{

/// One unit of work for the publish loop.
struct Event
{
    enum class Kind
    {
        Publish,
        Rediscover,
    };
    Kind kind;
    metrics::MetricPtr metric;
};

bool ends_with(std::string_view s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool is_healthy(const std::error_code &ec)
{
    return !ec || ec == metrics::Errc::no_change || ec == metrics::Errc::rescanned;
}

} // namespace

struct Bridge::Impl : std::enable_shared_from_this<Bridge::Impl>
{
    Impl(std::shared_ptr<mqtt::Client> c, std::vector<metrics::MetricPtr> m, Options o,
         std::optional<discovery::Discovery> d, std::optional<discovery::Discovery> p)
        : client(std::move(c)), options(std::move(o)), doc(std::move(d)), previous(std::move(p)),
          metric_slots(std::move(m)), events(options.event_queue_capacity),
          ready_future(ready_promise.get_future().share()),
          done_future(done_promise.get_future().share())
    {
    }

    ~Impl()
    {
        if (main_thread.joinable())
        {
            main_thread.join();
        }
        tasks.shutdown();
    }

    // --- Wiring ---
    std::shared_ptr<mqtt::Client> client;
    const Options options;
    std::optional<discovery::Discovery> doc;
    std::optional<discovery::Discovery> previous;

    // Guards metric_slots, metric_loops, exited_loops, the lifecycle flags and first_error.
    mutable std::mutex mutex;
    std::vector<metrics::MetricPtr> metric_slots;
    std::vector<std::thread> metric_loops;
    // Loops that returned on their own and still wait to be joined.
    std::vector<std::thread::id> exited_loops;
    bool starting = false;
    // Signalled when a start() attempt leaves the connecting phase.
    std::condition_variable start_cv;
    bool started = false;
    bool scan_done = false;
    bool finished = false;
    std::error_code first_error;

    StateMap states;
    std::mutex states_publish_mutex;

    utils::Channel<Event> events;
    utils::CallbackDispatcher tasks{"BridgeTasks"};

    std::stop_source stop_source;
    std::optional<std::stop_callback<std::function<void()>>> external_stop;

    std::promise<void> ready_promise;
    std::promise<void> done_promise;
    std::shared_future<void> ready_future;
    std::shared_future<void> done_future;

    std::thread main_thread;

    // Sequence number of the last value publish; only its failure is logged.
    std::shared_ptr<std::atomic<uint64_t>> publish_seq = std::make_shared<std::atomic<uint64_t>>(0);

    std::stop_token token() const { return stop_source.get_token(); }

    void record_error(const std::error_code &ec)
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!first_error)
        {
            first_error = ec;
        }
    }

    // ------------------------------------------------------------------
    // State publication
    // ------------------------------------------------------------------

    /// Publishes the state map, or the will payload when @p will is set.
    mqtt::TokenPtr publish_states(bool will)
    {
        const auto &w = client->options().will;
        if (w.topic.empty())
        {
            return mqtt::make_completed_token();
        }
        std::lock_guard<std::mutex> lock(states_publish_mutex);
        return client->publish(w.topic, w.qos, w.retained, will ? w.payload : states.to_json());
    }

    /**
     * @brief Moves @p m to @p healthy and republishes the map if that flipped it.
     * @return true when the state changed.
     */
    bool set_state(const metrics::Metric &m, bool healthy)
    {
        const auto key = m.topic();
        if (!states.compare_and_swap(key, !healthy, healthy))
        {
            return false;
        }
        LOGGER_DEBUG("State of '{}' changed from {} to {}", key, !healthy, healthy);
        if (auto ec = mqtt::wait_token(token(), publish_states(false)))
        {
            LOGGER_WARN("Unable to publish states: {}", ec.message());
        }
        return true;
    }

    bool forward(Event::Kind kind, const metrics::MetricPtr &m)
    {
        return events.send(Event{kind, m}, token());
    }

    // ------------------------------------------------------------------
    // Metrics
    // ------------------------------------------------------------------

    void release_slot(size_t slot)
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (slot < metric_slots.size())
        {
            metric_slots[slot] = nullptr;
        }
    }

    void metric_loop(size_t slot, metrics::MetricPtr m)
    {
        const auto st = token();
        const auto topic = m->topic();
        int consecutive_errors = 0;

        while (auto outcome = m->updated().receive(st))
        {
            const std::error_code ec = *outcome;
            if (is_healthy(ec))
            {
                consecutive_errors = 0;
                const bool flipped = set_state(*m, true);
                if (!ec)
                {
                    forward(Event::Kind::Publish, m);
                }
                else if (ec == metrics::Errc::no_change)
                {
                    // A recovery is worth a publish even without a new value.
                    if (flipped)
                    {
                        forward(Event::Kind::Publish, m);
                    }
                }
                else if (doc)
                {
                    forward(Event::Kind::Rediscover, m);
                }
                continue;
            }

            LOGGER_WARN("Error updating {}: {}", m->type(), ec.message());
            if (options.offline_after_errors > 0 &&
                ++consecutive_errors >= options.offline_after_errors)
            {
                set_state(*m, false);
            }
        }

        m->stop();
        states.erase(topic);
        release_slot(slot);
        LOGGER_INFO("{} unloaded", m->type());

        if (!st.stop_requested())
        {
            client->unsubscribe({topic + "/update", topic + "/stop"});
            if (auto ec = mqtt::wait_token(st, publish_states(false)))
            {
                LOGGER_WARN("Unable to publish states: {}", ec.message());
            }
        }

        std::lock_guard<std::mutex> lock(mutex);
        exited_loops.push_back(std::this_thread::get_id());
    }

    /// Joins loops that already returned. Called with @ref mutex held.
    void reap_exited_loops()
    {
        for (const auto id : exited_loops)
        {
            auto it = std::find_if(metric_loops.begin(), metric_loops.end(),
                                   [id](const std::thread &t) { return t.get_id() == id; });
            if (it != metric_loops.end())
            {
                it->join();
                metric_loops.erase(it);
            }
        }
        exited_loops.clear();
    }

    mqtt::MessageHandler metric_handler(const metrics::MetricPtr &m)
    {
        std::weak_ptr<Impl> weak = weak_from_this();
        std::weak_ptr<metrics::Metric> weak_metric = m;
        return [weak, weak_metric](const mqtt::Message &msg)
        {
            auto self = weak.lock();
            auto metric = weak_metric.lock();
            if (!self || !metric)
            {
                return;
            }
            if (ends_with(msg.topic, "/update"))
            {
                self->tasks.post(
                    [self = self.get(), metric, payload = msg.payload]
                    {
                        if (apply_update_payload(*metric, payload))
                        {
                            LOGGER_DEBUG("Refreshing {} with its current settings", metric->type());
                        }
                        if (!metric->update())
                        {
                            self->forward(Event::Kind::Publish, metric);
                        }
                    });
            }
            else if (ends_with(msg.topic, "/stop"))
            {
                LOGGER_INFO("Stop requested for {}", metric->type());
                self->tasks.post([metric] { metric->stop(); });
            }
        };
    }

    void start_metric(size_t slot, const metrics::MetricPtr &m, bool rediscover)
    {
        const auto topic = m->topic();
        if (topic.empty())
        {
            LOGGER_DEBUG("No topic, skipping {}", m->type());
            return;
        }

        const auto st = token();
        if (auto ec = m->start(st))
        {
            LOGGER_ERROR("Could not start {}: {}", m->type(), ec.message());
            states.store(topic, false);
            release_slot(slot);
            return;
        }
        states.store(topic, true);

        auto sub = client->subscribe_multiple({{topic + "/update", 0}, {topic + "/stop", 0}},
                                              metric_handler(m));
        // Once stopping, the loop or the branch below unloads the metric.
        if (auto ec = mqtt::wait_token(st, sub); ec && !st.stop_requested())
        {
            LOGGER_ERROR("Could not subscribe to {}: {}", topic, ec.message());
            m->stop();
            states.store(topic, false);
            release_slot(slot);
            return;
        }

        bool launched = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!finished)
            {
                reap_exited_loops();
                metric_loops.emplace_back([this, slot, m] { metric_loop(slot, m); });
                launched = true;
            }
        }
        if (!launched)
        {
            // Shutdown already joined the loops; nothing would consume this metric.
            LOGGER_DEBUG("Bridge finished, unloading {}", m->type());
            m->stop();
            states.erase(topic);
            release_slot(slot);
            if (client->is_connected())
            {
                client->unsubscribe({topic + "/update", topic + "/stop"});
            }
            return;
        }
        if (st.stop_requested())
        {
            return;
        }
        LOGGER_INFO("{} loaded on '{}'", m->type(), topic);

        if (rediscover && doc)
        {
            forward(Event::Kind::Rediscover, m);
        }
    }

    /// Refreshes every loaded metric in parallel and queues the results.
    void update_all()
    {
        std::vector<metrics::MetricPtr> loaded;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto &m : metric_slots)
            {
                if (m)
                {
                    loaded.push_back(m);
                }
            }
        }

        const auto st = token();
        std::vector<std::jthread> workers;
        workers.reserve(loaded.size());
        for (const auto &m : loaded)
        {
            if (st.stop_requested())
            {
                break;
            }
            workers.emplace_back(
                [this, m]
                {
                    const auto ec = m->update();
                    if (ec && ec != metrics::Errc::no_change)
                    {
                        LOGGER_WARN("Error updating {}: {}", m->type(), ec.message());
                        return;
                    }
                    set_state(*m, true);
                    forward(Event::Kind::Publish, m);
                });
        }
    }

    // ------------------------------------------------------------------
    // Discovery
    // ------------------------------------------------------------------

    /// The bridge's own component: a button bound to `<base>/bridge/update`.
    void discover_self(discovery::Discovery &d) const
    {
        namespace opt = discovery::opt;
        const auto id = d.origin().name + "_update";
        d.add_component("bridge", id,
                        discovery::Component{
                            {opt::Platform, discovery::platform::Button},
                            {opt::Name, "Update"},
                            {opt::DeviceClass, "restart"},
                            {opt::AvailabilityTopic, d.availability_topic()},
                            {opt::AvailabilityTemplate, "{{ iif(value == 'offline', value, 'online') }}"},
                            {opt::CommandTopic, options.base_topic + "/bridge/update"},
                            {opt::UniqueId, id},
                        });
    }

    void schedule_refresh()
    {
        tasks.post(
            [this]
            {
                if (utils::sleep_for(token(), options.settle_delay))
                {
                    update_all();
                }
            });
    }

    std::error_code discover()
    {
        auto &d = *doc;
        discover_self(d);

        std::vector<metrics::MetricPtr> loaded;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto &m : metric_slots)
            {
                if (m && states.get(m->topic()).value_or(false))
                {
                    loaded.push_back(m);
                }
            }
        }
        for (const auto &m : loaded)
        {
            if (auto *dd = m->as_discoverer())
            {
                dd->discover(d);
            }
        }

        bool migrate = false;
        if (previous)
        {
            migrate = d.diff(*previous);
            if (migrate)
            {
                LOGGER_INFO("Migrating discovery from {} to {}",
                            discovery::to_string(previous->method()),
                            discovery::to_string(d.method()));
            }
        }

        if (auto ec = d.publish(token(), *client, migrate))
        {
            return ec;
        }

        std::weak_ptr<Impl> weak = weak_from_this();
        auto ec = d.subscribe_status(token(), *client,
                                     [weak]
                                     {
                                         if (auto self = weak.lock())
                                         {
                                             self->schedule_refresh();
                                         }
                                     });
        schedule_refresh();
        return ec;
    }

    std::error_code publish_rediscovery(const metrics::MetricPtr &m)
    {
        auto *dd = m->as_discoverer();
        if (!dd || !doc)
        {
            return {};
        }
        const auto node = m->type();
        auto prior = doc->reset_node(node);
        dd->discover(*doc);
        doc->restore_node(node, std::move(prior));
        LOGGER_DEBUG("Rediscovering {}", node);
        return doc->publish_node(token(), *client, node);
    }

    // ------------------------------------------------------------------
    // Main thread: start sequence, publish loop, shutdown
    // ------------------------------------------------------------------

    void run()
    {
        start_sequence();
        {
            std::lock_guard<std::mutex> lock(mutex);
            scan_done = true;
        }
        ready_promise.set_value();
        LOGGER_INFO("Bridge ready");

        publish_loop();
        shutdown();
    }

    void start_sequence()
    {
        const auto st = token();
        for (size_t i = 0;; ++i)
        {
            metrics::MetricPtr m;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (i >= metric_slots.size())
                {
                    scan_done = true;
                    break;
                }
                m = metric_slots[i];
            }
            if (m)
            {
                start_metric(i, m, false);
            }
            if (st.stop_requested())
            {
                return;
            }
        }

        if (auto ec = mqtt::wait_token(st, publish_states(false)))
        {
            LOGGER_WARN("Unable to publish states: {}", ec.message());
            record_error(ec);
        }

        std::weak_ptr<Impl> weak = weak_from_this();
        auto sub = client->subscribe(options.base_topic + "/bridge/stop", 0,
                                     [weak](const mqtt::Message &)
                                     {
                                         if (auto self = weak.lock())
                                         {
                                             LOGGER_INFO("Bridge stop requested");
                                             self->stop_source.request_stop();
                                         }
                                     });
        if (auto ec = mqtt::wait_token(st, sub))
        {
            LOGGER_ERROR("Could not subscribe to bridge stop: {}", ec.message());
            record_error(ec);
        }

        sub = client->subscribe(options.base_topic + "/bridge/update", 0,
                                [weak](const mqtt::Message &)
                                {
                                    if (auto self = weak.lock())
                                    {
                                        self->tasks.post([raw = self.get()] { raw->update_all(); });
                                    }
                                });
        if (auto ec = mqtt::wait_token(st, sub))
        {
            LOGGER_ERROR("Could not subscribe to bridge update: {}", ec.message());
            record_error(ec);
        }

        if (doc && !st.stop_requested())
        {
            if (auto ec = discover())
            {
                LOGGER_WARN("Unable to publish discovery: {}", ec.message());
                record_error(ec);
            }
        }
    }

    void publish_loop()
    {
        const auto st = token();
        while (auto ev = events.receive(st))
        {
            const auto &m = ev->metric;
            if (ev->kind == Event::Kind::Rediscover)
            {
                if (auto ec = publish_rediscovery(m))
                {
                    LOGGER_WARN("Unable to publish discovery: {}", ec.message());
                }
                continue;
            }

            std::string text;
            if (auto ec = m->append_text(text))
            {
                LOGGER_WARN("Unable to marshal {}: {}", m->type(), ec.message());
                continue;
            }
            const uint64_t seq = ++*publish_seq;
            auto token = client->publish(m->topic(), 0, false, std::move(text));
            token->on_complete(
                [latest = publish_seq, seq, type = m->type()](const std::error_code &ec)
                {
                    if (ec && latest->load() == seq)
                    {
                        LOGGER_WARN("Unable to publish {}: {}", type, ec.message());
                    }
                });
        }
    }

    void shutdown()
    {
        LOGGER_INFO("Bridge shutting down");
        if (client->is_connected())
        {
            auto t = publish_states(true);
            if (!t->wait_for(options.final_publish_timeout))
            {
                LOGGER_WARN("Timed out publishing the offline state");
            }
            client->disconnect(options.disconnect_grace);
        }

        events.close();

        std::vector<std::thread> loops;
        {
            std::lock_guard<std::mutex> lock(mutex);
            loops.swap(metric_loops);
            exited_loops.clear();
            finished = true;
        }
        for (auto &t : loops)
        {
            t.join();
        }
        tasks.shutdown();

        done_promise.set_value();
        LOGGER_INFO("Bridge stopped");
    }
};

Bridge::Bridge(std::shared_ptr<mqtt::Client> client, std::vector<metrics::MetricPtr> metrics,
               Options options, std::optional<discovery::Discovery> doc,
               std::optional<discovery::Discovery> previous)
    : pImpl(std::make_shared<Impl>(std::move(client), std::move(metrics), std::move(options),
                                   std::move(doc), std::move(previous)))
{
}

Bridge::~Bridge()
{
    stop();
}

std::error_code Bridge::start(std::stop_token st)
{
    auto &impl = *pImpl;
    {
        std::lock_guard<std::mutex> lock(impl.mutex);
        if (impl.started || impl.starting)
        {
            return {};
        }
        if (impl.metric_slots.empty())
        {
            return make_error_code(Errc::no_metrics);
        }
        impl.starting = true;
    }

    auto connect = impl.client->connect();
    std::stop_callback cancel_connect(st, [&impl] { impl.stop_source.request_stop(); });
    const auto connect_ec = mqtt::wait_token(impl.token(), connect);

    std::lock_guard<std::mutex> lock(impl.mutex);
    impl.starting = false;
    impl.start_cv.notify_all();
    if (connect_ec)
    {
        LOGGER_ERROR("Could not connect to {}: {}", impl.client->options().broker,
                     connect_ec.message());
        return connect_ec;
    }
    impl.started = true;
    if (impl.stop_source.stop_requested())
    {
        // Cancelled while connecting: settle both signals without running.
        impl.finished = true;
        if (connect->is_done())
        {
            impl.client->disconnect(impl.options.disconnect_grace);
        }
        impl.ready_promise.set_value();
        impl.done_promise.set_value();
        return {};
    }
    LOGGER_INFO("Connected to {}", impl.client->options().broker);
    impl.external_stop.emplace(st, [&impl] { impl.stop_source.request_stop(); });
    impl.main_thread = std::thread([&impl] { impl.run(); });
    return {};
}

void Bridge::stop()
{
    auto &impl = *pImpl;
    {
        std::lock_guard<std::mutex> lock(impl.mutex);
        if (!impl.started && !impl.starting)
        {
            // Nothing to stop; a later start() runs normally.
            return;
        }
    }
    LOGGER_DEBUG("Stopping bridge");
    impl.stop_source.request_stop();
    {
        std::unique_lock<std::mutex> lock(impl.mutex);
        impl.start_cv.wait(lock, [&impl] { return !impl.starting; });
        if (!impl.started)
        {
            // The connect attempt failed; start() already reported it.
            return;
        }
    }
    impl.ready_future.wait();
    impl.done_future.wait();
    if (impl.main_thread.joinable() && impl.main_thread.get_id() != std::this_thread::get_id())
    {
        impl.main_thread.join();
    }
}

void Bridge::add_metric(metrics::MetricPtr metric, std::stop_token st)
{
    auto &impl = *pImpl;
    if (!metric || st.stop_requested())
    {
        return;
    }
    size_t slot = 0;
    {
        std::lock_guard<std::mutex> lock(impl.mutex);
        if (impl.finished || impl.stop_source.stop_requested())
        {
            LOGGER_DEBUG("Bridge stopping, not adding {}", metric->type());
            return;
        }
        slot = impl.metric_slots.size();
        impl.metric_slots.push_back(metric);
        if (!impl.started || !impl.scan_done)
        {
            // The start sequence has not reached the end of the list yet.
            return;
        }
    }
    impl.start_metric(slot, metric, true);
}

std::shared_future<void> Bridge::ready() const
{
    return pImpl->ready_future;
}

std::shared_future<void> Bridge::done() const
{
    return pImpl->done_future;
}

std::error_code Bridge::error() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->first_error;
}

std::map<std::string, bool> Bridge::states() const
{
    return pImpl->states.snapshot();
}

const std::optional<discovery::Discovery> &Bridge::discovery() const
{
    return pImpl->doc;
}

} // namespace mqttop::bridge

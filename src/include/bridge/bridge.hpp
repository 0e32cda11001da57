#pragma once
/**
 * @file bridge.hpp
 * @brief Republishes metrics on an MQTT broker.
 *
 * The Bridge owns the broker connection. It starts every metric, runs one
 * event loop per started metric and funnels their outcomes into a single
 * publish loop, keeps a topic -> liveness map on the last-will topic, drives
 * discovery and answers the control topics:
 *
 * | topic                   | effect                                   |
 * |-------------------------|------------------------------------------|
 * | `<metric>/update`       | optional reconfiguration, then refresh   |
 * | `<metric>/stop`         | stops that metric                        |
 * | `<base>/bridge/update`  | refreshes every loaded metric            |
 * | `<base>/bridge/stop`    | shuts the bridge down                    |
 *
 * Threads: one for the start sequence, which then becomes the publish loop;
 * one per loaded metric; one dispatcher for control-topic work. The discovery
 * document is only touched by the start sequence and the publish loop.
 *
 * ```cpp
 * bridge::Bridge b(client, metrics::from_config(cfg), opts, std::move(doc));
 * if (auto ec = b.start(stop.get_token()))
 *     LOGGER_ERROR("Cannot start: {}", ec.message());
 * b.done().wait();
 * ```
 */
#include "bridge/state_map.hpp"
#include "discovery/discovery.hpp"
#include "metrics/metric.hpp"
#include "mqtt/client.hpp"

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>
#include <vector>

namespace mqttop::bridge
{

struct Options
{
    std::string base_topic = "mqttop";
    /// Capacity of the channel feeding the publish loop.
    size_t event_queue_capacity = 64;
    /// Delay between publishing discovery and the first full refresh.
    std::chrono::milliseconds settle_delay{1000};
    std::chrono::milliseconds disconnect_grace{500};
    /// Bound on the final "offline" publish during shutdown.
    std::chrono::milliseconds final_publish_timeout{2000};
    /// Consecutive hard errors before a metric is marked offline. 0 only logs them.
    int offline_after_errors = 0;
};

class Bridge
{
  public:
    /**
     * @param client   The broker connection, not yet connected.
     * @param metrics  Metrics in start order. Entries with an empty topic are skipped.
     * @param doc      Discovery document; discovery is disabled without one.
     * @param previous Document from the last run, diffed against @p doc so
     *                 that vanished components are removed.
     */
    Bridge(std::shared_ptr<mqtt::Client> client, std::vector<metrics::MetricPtr> metrics,
           Options options = {}, std::optional<discovery::Discovery> doc = std::nullopt,
           std::optional<discovery::Discovery> previous = std::nullopt);

    /// Stops the bridge if it is running.
    ~Bridge();

    Bridge(const Bridge &) = delete;
    Bridge &operator=(const Bridge &) = delete;

    /**
     * @brief Connects and starts the bridge.
     *
     * Returns after the connection is established; the remaining start
     * sequence runs in the background and ends by making `ready()` ready.
     * Triggering @p st stops the bridge.
     *
     * @return `Errc::no_metrics` without metrics, or the connection error.
     *         Cancellation while connecting is not an error. Calls made
     *         while another call is connecting, or after a successful start,
     *         do nothing.
     */
    std::error_code start(std::stop_token st = {});

    /**
     * @brief Stops the bridge and waits for the shutdown to finish.
     *
     * Safe to call several times and concurrently with `start()`. Before any
     * `start()` it does nothing, so the bridge can still be started later.
     * Must not be called from a metric or from a message handler.
     */
    void stop();

    /**
     * @brief Adds a metric to a running bridge.
     *
     * Before the start sequence has looked at the metric list the metric just
     * joins it; afterwards it is started here and announced through
     * rediscovery. Ignored once the bridge is stopping.
     */
    void add_metric(metrics::MetricPtr metric, std::stop_token st = {});

    /// Ready once the start sequence has finished, even if it was cancelled.
    std::shared_future<void> ready() const;

    /// Ready once the bridge has shut down.
    std::shared_future<void> done() const;

    /// First error of the start sequence after connecting.
    std::error_code error() const;

    std::map<std::string, bool> states() const;

    /// The discovery document. Only safe to read once `done()` is ready.
    const std::optional<discovery::Discovery> &discovery() const;

  private:
    struct Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mqttop::bridge

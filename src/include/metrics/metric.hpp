#pragma once
/**
 * @file metric.hpp
 * @brief The metric capability consumed by the bridge.
 *
 * A Metric is an independently updating producer of one reportable value. It
 * is started once, reports the outcome of every periodic update on its
 * `updated()` channel, and closes that channel when it stops. Optional
 * capabilities are reached through `as_discoverer()` and
 * `as_reconfigurable()`, which return nullptr when unsupported.
 *
 * Outcomes sent on `updated()`:
 * - empty error_code: the value changed and should be published;
 * - `metrics::Errc::no_change`: nothing to publish;
 * - `metrics::Errc::rescanned`: the set of sub-entities changed;
 * - anything else: the update failed.
 */
#include "utils/channel.hpp"

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <system_error>

namespace mqttop::discovery
{
class Discovery;
}

namespace mqttop::metrics
{

/// Contributes discovery components for a metric.
class Discoverer
{
  public:
    virtual ~Discoverer() = default;

    /**
     * @brief Adds this metric's components to @p doc.
     *
     * Components are registered with `Discovery::add_component` under the
     * metric's type as node, so that they can be republished on their own.
     */
    virtual void discover(discovery::Discovery &doc) = 0;
};

/// Runtime reconfiguration requested through a metric's `/update` topic.
class Reconfigurable
{
  public:
    virtual ~Reconfigurable() = default;

    virtual void set_interval(std::chrono::milliseconds interval) = 0;

    /// Producer-specific selection mode. Returns not_supported by default.
    virtual std::error_code set_selection_mode(const std::string &mode);
};

using UpdateChannel = utils::Channel<std::error_code>;

class Metric
{
  public:
    virtual ~Metric() = default;

    /// Constant label naming the kind of metric, e.g. "memory".
    virtual std::string type() const = 0;

    /// Topic the value is published to. Empty means unaddressable.
    virtual std::string topic() const = 0;

    /**
     * @brief Starts the periodic updates.
     *
     * The metric stops on its own when @p st is triggered. A metric can be
     * started only once; later calls return `Errc::already_running`.
     */
    virtual std::error_code start(std::stop_token st) = 0;

    /// Stops the updates and closes `updated()`. Idempotent.
    virtual void stop() = 0;

    /// Refreshes the value now. The outcome is returned, not sent on `updated()`.
    virtual std::error_code update() = 0;

    virtual UpdateChannel &updated() = 0;

    /// Appends the wire form of the current value to @p out.
    virtual std::error_code append_text(std::string &out) const = 0;

    virtual Discoverer *as_discoverer() { return nullptr; }
    virtual Reconfigurable *as_reconfigurable() { return nullptr; }
};

using MetricPtr = std::shared_ptr<Metric>;

} // namespace mqttop::metrics

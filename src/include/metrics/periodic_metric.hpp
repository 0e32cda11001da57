#pragma once
/**
 * @file periodic_metric.hpp
 * @brief Base class for metrics that refresh on a fixed interval.
 *
 * Subclasses implement `update()`; the base owns the ticker thread and the
 * outcome channel. The interval can be changed while running, which restarts
 * the current period.
 */
#include "metrics/metric.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace mqttop::metrics
{

class PeriodicMetric : public Metric, public Reconfigurable
{
  public:
    explicit PeriodicMetric(std::chrono::milliseconds interval);
    ~PeriodicMetric() override;

    /// Returns `Errc::disabled` without starting when the interval is zero.
    std::error_code start(std::stop_token st) override;
    void stop() override;
    UpdateChannel &updated() override { return m_updates; }

    void set_interval(std::chrono::milliseconds interval) override;
    std::chrono::milliseconds interval() const;

    Reconfigurable *as_reconfigurable() override { return this; }

  protected:
    /// Must be called first thing in the destructor of a subclass that
    /// overrides `update()`, so the ticker never calls into a destroyed object.
    void join();

  private:
    void run(std::stop_token st);

    mutable std::mutex m_mutex;
    std::condition_variable_any m_cv;
    std::chrono::milliseconds m_interval;
    bool m_interval_changed = false;
    bool m_started = false;
    UpdateChannel m_updates{1};
    std::jthread m_thread;
    std::optional<std::stop_callback<std::function<void()>>> m_parent_stop;
};

} // namespace mqttop::metrics

#include "metrics/periodic_metric.hpp"
#include "metrics/errors.hpp"
#include "utils/logger.hpp"

namespace mqttop::metrics
{

std::error_code Reconfigurable::set_selection_mode(const std::string & /*mode*/)
{
    return make_error_code(Errc::not_supported);
}

PeriodicMetric::PeriodicMetric(std::chrono::milliseconds interval) : m_interval(interval) {}

PeriodicMetric::~PeriodicMetric()
{
    join();
}

std::error_code PeriodicMetric::start(std::stop_token st)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_started)
    {
        return make_error_code(Errc::already_running);
    }
    if (m_interval.count() <= 0)
    {
        LOGGER_WARN("{} interval is 0, not starting", type());
        return make_error_code(Errc::disabled);
    }
    m_started = true;
    m_thread = std::jthread([this](std::stop_token own) { run(own); });
    m_parent_stop.emplace(st, [this] { m_thread.request_stop(); });
    LOGGER_DEBUG("{} started", type());
    return {};
}

void PeriodicMetric::stop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_started)
    {
        // Never started: nothing will close the channel on our behalf.
        m_started = true;
        m_updates.close();
        return;
    }
    m_thread.request_stop();
}

void PeriodicMetric::join()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_thread.joinable())
        {
            return;
        }
        m_thread.request_stop();
    }
    if (m_thread.get_id() != std::this_thread::get_id())
    {
        m_thread.join();
    }
    m_parent_stop.reset();
}

void PeriodicMetric::set_interval(std::chrono::milliseconds interval)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (interval == m_interval)
        {
            return;
        }
        m_interval = interval;
        m_interval_changed = true;
    }
    m_cv.notify_all();
    LOGGER_DEBUG("{} interval set to {}ms", type(), interval.count());
}

std::chrono::milliseconds PeriodicMetric::interval() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_interval;
}

void PeriodicMetric::run(std::stop_token st)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    auto deadline = std::chrono::steady_clock::now() + m_interval;
    while (!st.stop_requested())
    {
        const bool changed =
            m_cv.wait_until(lock, st, deadline, [this] { return m_interval_changed; });
        if (st.stop_requested())
        {
            break;
        }
        if (changed)
        {
            m_interval_changed = false;
            if (m_interval.count() <= 0)
            {
                // A zero interval pauses the ticker until it is set again.
                m_cv.wait(lock, st, [this] { return m_interval_changed; });
                continue;
            }
            deadline = std::chrono::steady_clock::now() + m_interval;
            continue;
        }
        deadline += m_interval;

        lock.unlock();
        std::error_code ec = update();
        LOGGER_TRACE("{} updated: {}", type(), ec ? ec.message() : "ok");
        const bool sent = m_updates.send(ec, st);
        lock.lock();
        if (!sent)
        {
            break;
        }
        const auto now = std::chrono::steady_clock::now();
        if (deadline < now)
        {
            deadline = now + m_interval;
        }
    }
    m_updates.close();
    LOGGER_DEBUG("{} stopped", type());
}

} // namespace mqttop::metrics

#pragma once
/**
 * @file channel.hpp
 * @brief Bounded multi-producer/multi-consumer queue with close and cancellation.
 *
 * `Channel<T>` is the hand-off between threads in mqttop: a metric pushes its
 * update outcomes through one, and the bridge funnels every per-metric event
 * into a single one consumed by the publish loop.
 *
 * Semantics:
 * - `send` blocks while the channel is full. It returns false if the channel is
 *   closed or the stop token is triggered first.
 * - `receive` blocks while the channel is empty. It returns std::nullopt once the
 *   channel is closed *and* drained, or as soon as the stop token is triggered.
 *   Cancellation wins over pending items.
 * - `close` is idempotent and wakes every waiter.
 */
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace mqttop::utils
{

template <typename T>
class Channel
{
  public:
    explicit Channel(size_t capacity = 1) : m_capacity(capacity > 0 ? capacity : 1) {}

    Channel(const Channel &) = delete;
    Channel &operator=(const Channel &) = delete;

    bool send(T value, std::stop_token st = {})
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        const bool ready = m_cv_not_full.wait(
            lock, st, [this] { return m_closed || m_queue.size() < m_capacity; });
        if (!ready || m_closed)
        {
            return false;
        }
        m_queue.push_back(std::move(value));
        lock.unlock();
        m_cv_not_empty.notify_one();
        return true;
    }

    /// Non-blocking send. Returns false if the channel is full or closed.
    bool try_send(T value)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed || m_queue.size() >= m_capacity)
            {
                return false;
            }
            m_queue.push_back(std::move(value));
        }
        m_cv_not_empty.notify_one();
        return true;
    }

    std::optional<T> receive(std::stop_token st = {})
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv_not_empty.wait(lock, st, [this] { return m_closed || !m_queue.empty(); });
        if (st.stop_requested() || m_queue.empty())
        {
            return std::nullopt;
        }
        T value = std::move(m_queue.front());
        m_queue.pop_front();
        lock.unlock();
        m_cv_not_full.notify_one();
        return value;
    }

    /// Non-blocking receive.
    std::optional<T> try_receive()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_queue.empty())
        {
            return std::nullopt;
        }
        T value = std::move(m_queue.front());
        m_queue.pop_front();
        lock.unlock();
        m_cv_not_full.notify_one();
        return value;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv_not_empty.notify_all();
        m_cv_not_full.notify_all();
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

  private:
    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable_any m_cv_not_empty;
    std::condition_variable_any m_cv_not_full;
    std::deque<T> m_queue;
    bool m_closed = false;
};

/**
 * @brief Sleeps for @p duration unless @p st is triggered first.
 * @return true if the full duration elapsed, false if cancelled.
 */
template <typename Rep, typename Period>
bool sleep_for(std::stop_token st, std::chrono::duration<Rep, Period> duration)
{
    std::mutex mtx;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, st, duration, [] { return false; });
    return !st.stop_requested();
}

} // namespace mqttop::utils

#pragma once
/**
 * @file callback_dispatcher.hpp
 * @brief Runs posted callbacks in order on a dedicated worker thread.
 *
 * The Logger uses one to invoke its write-error callback outside the logging
 * worker, and the in-memory MQTT client uses one to deliver messages and
 * complete tokens asynchronously, the way a real broker connection would.
 */
#include "mqttop_utils_export.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace mqttop::utils
{

class MQTTOP_UTILS_EXPORT CallbackDispatcher
{
  public:
    /// @param name Used only to label exceptions escaping a callback.
    explicit CallbackDispatcher(std::string name = "CallbackDispatcher");
    ~CallbackDispatcher();

    CallbackDispatcher(const CallbackDispatcher &) = delete;
    CallbackDispatcher &operator=(const CallbackDispatcher &) = delete;

    /// Queues @p fn. Ignored once shutdown has been requested.
    void post(std::function<void()> fn);

    /**
     * @brief Blocks until every callback posted before this call has run.
     *
     * Must not be called from a callback running on this dispatcher.
     */
    void drain();

    /// Runs the remaining queue, then joins the worker. Idempotent.
    void shutdown();

    bool on_worker_thread() const noexcept;

  private:
    void run();

    std::string name_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    bool busy_ = false;
    std::atomic<bool> shutdown_requested_{false};
    std::thread worker_;
};

} // namespace mqttop::utils

#include "mqttop_base.hpp"
#include "utils/callback_dispatcher.hpp"

namespace mqttop::utils
{

CallbackDispatcher::CallbackDispatcher(std::string name) : name_(std::move(name))
{
    worker_ = std::thread([this] { this->run(); });
}

CallbackDispatcher::~CallbackDispatcher()
{
    shutdown();
}

void CallbackDispatcher::post(std::function<void()> fn)
{
    if (shutdown_requested_.load(std::memory_order_relaxed))
        return;
    {
        std::lock_guard<std::mutex> lg(mutex_);
        queue_.push_back(std::move(fn));
    }
    cv_.notify_one();
}

void CallbackDispatcher::drain()
{
    std::unique_lock<std::mutex> ul(mutex_);
    idle_cv_.wait(ul, [this] { return (queue_.empty() && !busy_) || !worker_.joinable(); });
}

void CallbackDispatcher::shutdown()
{
    if (shutdown_requested_.exchange(true))
    {
        return;
    }
    cv_.notify_one();
    if (worker_.joinable())
    {
        if (on_worker_thread())
        {
            worker_.detach();
            return;
        }
        worker_.join();
    }
}

bool CallbackDispatcher::on_worker_thread() const noexcept
{
    return std::this_thread::get_id() == worker_.get_id();
}

void CallbackDispatcher::run()
{
    for (;;)
    {
        std::function<void()> fn;
        {
            std::unique_lock<std::mutex> ul(mutex_);
            busy_ = false;
            if (queue_.empty())
            {
                idle_cv_.notify_all();
            }
            cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
            if (shutdown_requested_.load() && queue_.empty())
            {
                idle_cv_.notify_all();
                return;
            }
            fn = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }
        try
        {
            fn();
        }
        catch (const std::exception &e)
        {
            MQTTOP_DEBUG("[{}] callback threw: {}", name_, e.what());
        }
    }
}

} // namespace mqttop::utils

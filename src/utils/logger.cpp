/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "mqttop_base.hpp"

#include "utils/callback_dispatcher.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"
#include "utils/logger_sinks/syslog_sink.hpp"

using namespace mqttop::format_tools;

namespace mqttop::utils
{

// Represents the lifecycle state of the logger.
enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        MQTTOP_PANIC("Logger method '{}' was called before the Logger module was "
                     "initialized via LifecycleManager. Aborting.",
                     function_name);
    }
    return state == LoggerState::Initialized;
}

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetLogSinkMessagesCommand
{
    bool enabled;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand, SetLogSinkMessagesCommand>;

template <typename T> void promise_set_safe(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (!p)
        return;
    try
    {
        p->set_value(std::move(value));
    }
    catch (const std::future_error &)
    {
        // Already satisfied; the first outcome stands.
    }
}

static LogMessage make_system_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = mqttop::platform::get_pid(),
                      .thread_id = mqttop::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

struct Logger::Impl
{
    Impl();
    ~Impl();
    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    static void reject_command(Command &cmd);
    bool set_sink(std::function<std::unique_ptr<Sink>()> factory, const char *what);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    size_t m_max_queue_size{10000};
    std::chrono::system_clock::time_point m_dropping_since;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex m_sink_mutex;
    CallbackDispatcher callback_dispatcher_{"Logger"};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<bool> m_log_sink_messages_enabled_{true};
    std::atomic<bool> m_was_dropping{false};
    std::atomic<size_t> m_messages_dropped{0}; // batch counter, exchanged to 0 when reported
    std::atomic<size_t> m_total_dropped_since_sink_switch{0};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>(false, false)) {}

Logger::Impl::~Impl()
{
    if (worker_thread_.joinable() && !shutdown_requested_.load())
    {
        MQTTOP_DEBUG("**HIGH ALERT: Logger Impl destructor called without prior shutdown. Check "
                     "lifecycle management.**");
    }
}

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t current_queue_size = queue_.size();
        const bool is_log = std::holds_alternative<LogMessage>(cmd);

        if (current_queue_size >= m_max_queue_size * 2 ||
            (is_log && current_queue_size >= m_max_queue_size))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            m_total_dropped_since_sink_switch.fetch_add(1, std::memory_order_relaxed);
            if (!m_was_dropping.exchange(true, std::memory_order_relaxed))
            {
                m_dropping_since = std::chrono::system_clock::now();
            }
            reject_command(cmd);
            return false;
        }

        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool was_dropping = false;
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);

            if (m_was_dropping.exchange(false, std::memory_order_relaxed))
            {
                was_dropping = true;
                dropped_count = m_messages_dropped.exchange(0, std::memory_order_relaxed);
                dropping_duration_s = std::chrono::duration_cast<std::chrono::duration<double>>(
                                          std::chrono::system_clock::now() - m_dropping_since)
                                          .count();
            }

            if (shutdown_requested_.load())
            {
                g_logger_state.store(LoggerState::ShuttingDown, std::memory_order_release);
            }
        }

        if (was_dropping && dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                sink_->write(make_system_message(
                                 Logger::Level::L_WARNING,
                                 make_buffer("Overflow detected when processing the queue. "
                                             "Messages may have been dropped in the following "
                                             "batch.")));
            }
        }

        // Only the last sink switch of a batch is applied.
        std::ptrdiff_t last_set_sink_idx = -1;
        for (std::ptrdiff_t i = static_cast<std::ptrdiff_t>(local_queue.size()) - 1; i >= 0; --i)
        {
            if (std::holds_alternative<SetSinkCommand>(local_queue[i]))
            {
                last_set_sink_idx = i;
                break;
            }
        }

        for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(local_queue.size()); ++i)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&local_queue[i]))
                {
                    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                    if (sink_ &&
                        msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg);
                    }
                    continue;
                }

                std::visit(
                    [&, this, i](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;

                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            if (i != last_set_sink_idx)
                            {
                                promise_set_safe(arg.promise, false);
                            }
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            if (error_callback_)
                            {
                                auto cb = error_callback_;
                                callback_dispatcher_.post([cb, msg = arg.error_message]()
                                                          { cb(msg); });
                            }
                            else
                            {
                                MQTTOP_DEBUG("Logger sink creation error with no error "
                                             "callback installed: {}",
                                             arg.error_message);
                            }
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            {
                                std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                                if (sink_)
                                {
                                    sink_->flush();
                                }
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetLogSinkMessagesCommand>)
                        {
                            m_log_sink_messages_enabled_.store(arg.enabled,
                                                               std::memory_order_relaxed);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    local_queue[i]);
            }
            catch (const std::exception &e)
            {
                if (error_callback_)
                {
                    auto cb = error_callback_;
                    auto msg = fmt::format("Logger worker error: {}", e.what());
                    callback_dispatcher_.post([cb, msg]() { cb(msg); });
                }
            }
        }

        if (was_dropping && dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                sink_->write(make_system_message(
                                 Logger::Level::L_WARNING,
                                 make_buffer("Summary: At this point in time, the Logger dropped "
                                             "{} messages over {:.2f}s due to full queue.",
                                             dropped_count, dropping_duration_s)));
            }
        }

        if (last_set_sink_idx != -1)
        {
            if (auto *sink_cmd = std::get_if<SetSinkCommand>(&local_queue[last_set_sink_idx]))
            {
                std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                try
                {
                    const bool announce =
                        m_log_sink_messages_enabled_.load(std::memory_order_relaxed);
                    std::string old_desc = sink_ ? sink_->description() : "null";
                    std::string new_desc =
                        sink_cmd->new_sink ? sink_cmd->new_sink->description() : "null";
                    if (announce && sink_)
                    {
                        sink_->write(make_system_message(
                                         Logger::Level::L_SYSTEM,
                                         make_buffer("Switching log sink to: {}", new_desc)));
                        sink_->flush();
                    }
                    m_total_dropped_since_sink_switch.store(0, std::memory_order_relaxed);
                    sink_ = std::move(sink_cmd->new_sink);
                    if (announce && sink_)
                    {
                        sink_->write(make_system_message(
                                         Logger::Level::L_SYSTEM,
                                         make_buffer("Log sink switched from: {}", old_desc)));
                    }
                }
                catch (const std::exception &e)
                {
                    if (error_callback_)
                    {
                        auto cb = error_callback_;
                        auto msg = fmt::format("Logger sink switch error: {}", e.what());
                        callback_dispatcher_.post([cb, msg]() { cb(msg); });
                    }
                }
                promise_set_safe(sink_cmd->promise, true);
            }
        }

        local_queue.clear();

        if (shutdown_requested_.load())
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (!queue_.empty())
            {
                // Commands that raced the shutdown flag; process them first.
                lock.unlock();
                continue;
            }
            lock.unlock();

            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                try
                {
                    sink_->write(make_system_message(Logger::Level::L_SYSTEM,
                                                     make_buffer("Logger is shutting down.")));
                    sink_->flush();
                }
                catch (const std::exception &e)
                {
                    MQTTOP_DEBUG("Logger final write failed: {}", e.what());
                }
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

bool Logger::Impl::set_sink(std::function<std::unique_ptr<Sink>()> factory, const char *what)
{
    try
    {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        enqueue_command(SetSinkCommand{factory(), promise});
        return future.get();
    }
    catch (const std::exception &e)
    {
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        enqueue_command(SinkCreationErrorCommand{
            fmt::format("Failed to create {}: {}", what, e.what()), promise_err});
        (void)future_err.get();
    }
    return false;
}

void Logger::Impl::shutdown()
{
    if (shutdown_completed_.load())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name)
{
    std::string lower(format_tools::trim_whitespace(name));
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
        return Level::L_TRACE;
    if (lower == "debug")
        return Level::L_DEBUG;
    if (lower == "info")
        return Level::L_INFO;
    if (lower == "warn" || lower == "warning")
        return Level::L_WARNING;
    if (lower == "error")
        return Level::L_ERROR;
    if (lower == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::set_console(ConsoleStream stream, LogFormat format)
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    return pImpl->set_sink(
        [stream, format]
        {
            return std::make_unique<ConsoleSink>(stream == ConsoleStream::Stdout,
                                                 format == LogFormat::Json);
        },
        "ConsoleSink");
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock, LogFormat format)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    return pImpl->set_sink(
        [&utf8_path, use_flock, format]
        { return std::make_unique<FileSink>(utf8_path, use_flock, format == LogFormat::Json); },
        "FileSink");
}

bool Logger::set_syslog(const char *ident, int option, int facility)
{
    if (!logger_is_loggable("Logger::set_syslog"))
        return false;
    return pImpl->set_sink([ident, option, facility]
                           { return std::make_unique<SyslogSink>(ident, option, facility); },
                           "SyslogSink");
}

void Logger::shutdown()
{
    if (!lifecycle_initialized())
    {
        return;
    }
    if (pImpl)
        pImpl->shutdown();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    if (!logger_is_loggable("Logger::set_max_queue_size"))
        return;
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->m_max_queue_size = (max_size > 0) ? max_size : 1;
}

size_t Logger::get_max_queue_size() const
{
    if (!logger_is_loggable("Logger::get_max_queue_size"))
        return 0;
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->m_max_queue_size;
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    if (!logger_is_loggable("Logger::get_total_dropped_since_sink_switch"))
        return 0;
    return pImpl->m_total_dropped_since_sink_switch.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!logger_is_loggable("Logger::set_write_error_callback"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

void Logger::set_log_sink_messages_enabled(bool enabled)
{
    if (!logger_is_loggable("Logger::set_log_sink_messages_enabled"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetLogSinkMessagesCommand{enabled, promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    try
    {
        return pImpl->enqueue_command(make_system_message(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        MQTTOP_DEBUG("Logger enqueue failed: {}", e.what());
        return false;
    }
}

void Logger::log_message(Level lvl, std::string_view body) noexcept
{
    if (!should_log(lvl))
        return;
    try
    {
        fmt::memory_buffer mb;
        mb.append(body.data(), body.data() + body.size());
        enqueue_log(lvl, std::move(mb));
    }
    catch (const std::exception &e)
    {
        MQTTOP_DEBUG("Logger::log_message failed: {}", e.what());
    }
}

// C-style callbacks for the ABI-safe lifecycle API.
void do_logger_startup(const char * /*arg*/)
{
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char * /*arg*/)
{
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().pImpl->shutdown();

        int count = 0;
        // Wait up to 5 seconds for the worker to report Shutdown.
        while (count < 50 &&
               g_logger_state.load(std::memory_order_acquire) != LoggerState::Shutdown)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            count++;
        }
        if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Shutdown)
        {
            MQTTOP_DEBUG("Logger shutdown timed out. Forcing shutdown state.");
        }
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("mqttop::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace mqttop::utils

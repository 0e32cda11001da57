/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-queue design**
 * 1.  Calls from application threads (`LOGGER_INFO(...)`) format the message and
 *     push a command onto a queue. That is the only work done on the caller's
 *     thread.
 * 2.  A single worker thread consumes the queue, performs all sink I/O and owns
 *     the active sink. Sink switches are commands too, so they are applied in
 *     order with the messages around them.
 * 3.  The queue is bounded. Past `max_queue_size` log messages are dropped (and
 *     counted); past twice that, control commands are refused as well. The
 *     worker reports the drop count in the log once the queue drains.
 *
 * **Lifecycle**
 * The Logger is a lifecycle module. Register `Logger::GetLifecycleModule()` with
 * the `LifecycleGuard` in `main`; using the Logger before that aborts, and
 * messages logged after shutdown are silently discarded.
 *
 * ```cpp
 * auto &logger = mqttop::utils::Logger::instance();
 * logger.set_level(Logger::Level::L_DEBUG);
 * logger.set_console(Logger::ConsoleStream::Stdout, Logger::LogFormat::Json);
 * LOGGER_INFO("Connected to {}", broker);
 * ```
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "mqttop_utils_export.h"
#include "utils/module_def.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

namespace mqttop::utils
{

void do_logger_startup(const char *arg);
void do_logger_shutdown(const char *arg);

class MQTTOP_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    /// Line layout written by the console and file sinks.
    enum class LogFormat
    {
        Text,
        Json
    };

    enum class ConsoleStream
    {
        Stderr,
        Stdout
    };

    static Logger &instance();

    /// True once the lifecycle has started the Logger (also after shutdown).
    static bool lifecycle_initialized() noexcept;

    static ModuleDef GetLifecycleModule();

    /**
     * @brief Maps a level name to a Level.
     *
     * Accepts "trace", "debug", "info", "warn"/"warning", "error" and "system"
     * (case-insensitive). Returns std::nullopt for anything else.
     */
    static std::optional<Level> parse_level(std::string_view name);

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Each call queues the switch and blocks until the worker has applied it.
    // A false return means the sink could not be created (the reason goes to
    // the write-error callback) or the logger is shutting down.

    bool set_console(ConsoleStream stream = ConsoleStream::Stderr,
                     LogFormat format = LogFormat::Text);

    /**
     * @brief Switches logging to a file, opened for appending.
     * @param use_flock Take an advisory lock around each write so several
     *                  processes can share the file.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = true,
                     LogFormat format = LogFormat::Text);

    /// Switches logging to syslog. @p ident defaults to the program name.
    bool set_syslog(const char *ident = nullptr, int option = 0, int facility = 0);

    /// Blocks until every message queued before the call has been written and flushed.
    void flush();

    /// Drains the queue, then stops the worker. Called by the lifecycle module.
    void shutdown();

    void set_level(Level lvl);
    Level level() const;

    /// Soft cap on queued log messages. The hard cap for commands is twice this.
    void set_max_queue_size(size_t max_size);
    size_t get_max_queue_size() const;
    size_t get_total_dropped_since_sink_switch() const;

    /// The callback runs on a separate dispatcher thread, never on the worker.
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /// Enables or disables the SYSTEM messages written around a sink switch.
    void set_log_sink_messages_enabled(bool enabled);

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    /// Runtime-format path, used for lines coming from the MQTT library's tracer.
    void log_message(Level lvl, std::string_view body) noexcept;

  private:
    Logger();

    friend void do_logger_startup(const char *arg);
    friend void do_logger_shutdown(const char *arg);

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            fmt::memory_buffer mb;
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
            enqueue_log(lvl, std::move(mb));
        }
    }
}

} // namespace mqttop::utils

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::mqttop::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::mqttop::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::mqttop::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::mqttop::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::mqttop::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::mqttop::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

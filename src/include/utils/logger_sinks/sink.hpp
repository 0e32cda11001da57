#pragma once

#include "mqttop_base.hpp"

namespace mqttop::utils
{

// Represents a single log message event.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // Use int to avoid including all of logger.hpp for the enum.
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination.
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string_internal(int lvl);

    // "[LOGGER] [INFO  ] [time] [PID:... TID:...] body\n"
    static std::string format_logmsg(const LogMessage &msg);

    // One JSON object per line: {"time","level","pid","tid","msg"}.
    static std::string format_logmsg_json(const LogMessage &msg);
};

} // namespace mqttop::utils

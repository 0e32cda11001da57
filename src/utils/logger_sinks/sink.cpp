#include "mqttop_base.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <nlohmann/json.hpp>

namespace mqttop::utils
{

// Returns a string representation for a given log level.
const char *Sink::level_to_string_internal(int lvl)
{
    // A switch on int keeps this file free of logger.hpp and its Level enum.
    constexpr int kTraceLevel = 0;
    constexpr int kDebugLevel = 1;
    constexpr int kInfoLevel = 2;
    constexpr int kWarnLevel = 3;
    constexpr int kErrorLevel = 4;
    constexpr int kSystemLevel = 5;
    switch (lvl)
    {
    case kTraceLevel:
        return "TRACE";
    case kDebugLevel:
        return "DEBUG";
    case kInfoLevel:
        return "INFO";
    case kWarnLevel:
        return "WARN";
    case kErrorLevel:
        return "ERROR";
    case kSystemLevel:
        return "SYSTEM";
    default:
        return "UNK";
    }
}

std::string Sink::format_logmsg(const LogMessage &msg)
{
    std::string time_str = format_tools::formatted_time(msg.timestamp);
    return fmt::format("[LOGGER] [{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n",
                       level_to_string_internal(msg.level), time_str, msg.process_id, msg.thread_id,
                       std::string_view(msg.body.data(), msg.body.size()));
}

std::string Sink::format_logmsg_json(const LogMessage &msg)
{
    nlohmann::json line = {
        {"time", format_tools::formatted_time(msg.timestamp)},
        {"level", level_to_string_internal(msg.level)},
        {"pid", msg.process_id},
        {"tid", msg.thread_id},
        {"msg", std::string(msg.body.data(), msg.body.size())},
    };
    // Invalid UTF-8 in a message body is replaced rather than thrown on.
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

} // namespace mqttop::utils

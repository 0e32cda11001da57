#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>

namespace mqttop::utils
{

class ConsoleSink : public Sink
{
  public:
    ConsoleSink(bool to_stdout, bool json) : m_stream(to_stdout ? stdout : stderr), m_json(json) {}

    void write(const LogMessage &msg) override
    {
        fmt::print(m_stream, "{}", m_json ? format_logmsg_json(msg) : format_logmsg(msg));
    }
    void flush() override { std::fflush(m_stream); }
    std::string description() const override
    {
        return m_stream == stdout ? "Console (stdout)" : "Console";
    }

  private:
    std::FILE *m_stream;
    bool m_json;
};

} // namespace mqttop::utils

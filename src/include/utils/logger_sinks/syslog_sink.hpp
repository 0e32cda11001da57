#pragma once

#include "utils/logger_sinks/sink.hpp"

namespace mqttop::utils
{

class SyslogSink : public Sink
{
  public:
    SyslogSink(const char *ident, int option, int facility);
    ~SyslogSink() override;
    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

    static int level_to_syslog_priority(int level);

  private:
    // openlog() keeps the pointer, so the identity string must outlive the sink.
    std::string m_ident;
};

} // namespace mqttop::utils

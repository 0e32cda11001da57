#pragma once

#include "utils/logger_sinks/base_file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <string>

namespace mqttop::utils
{

class FileSink : public Sink, private BaseFileSink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened.
    FileSink(const std::string &path, bool use_flock, bool json = false);

    ~FileSink() override;

    void write(const LogMessage &msg) override;

    void flush() override;

    std::string description() const override;

  private:
    bool m_json;
};

} // namespace mqttop::utils

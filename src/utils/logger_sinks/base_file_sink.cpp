#include "mqttop_base.hpp"
#include "utils/logger_sinks/base_file_sink.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mqttop::utils
{

BaseFileSink::BaseFileSink() = default;

BaseFileSink::~BaseFileSink()
{
    close();
}

void BaseFileSink::open(const std::filesystem::path &path, bool use_flock)
{
    close(); // Ensure any previous handle is closed.
    m_path = path;
    m_use_flock = use_flock;

    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        throw std::system_error(errno, std::generic_category(), "open failed for log file");
    }
}

void BaseFileSink::close()
{
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
}

void BaseFileSink::fwrite(const std::string &content)
{
    if (!is_open())
        return;

    if (m_use_flock)
    {
        // flock is advisory; it serializes writers that also take it.
        ::flock(m_fd, LOCK_EX);
    }

    ssize_t bytes_written = ::write(m_fd, content.c_str(), content.length());
    const int saved_errno = errno;

    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }

    if (bytes_written < 0 || static_cast<size_t>(bytes_written) != content.length())
    {
        throw std::system_error(saved_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
}

void BaseFileSink::fflush()
{
    if (!is_open())
        return;
    ::fsync(m_fd);
}

bool BaseFileSink::is_open() const
{
    return m_fd != -1;
}

} // namespace mqttop::utils

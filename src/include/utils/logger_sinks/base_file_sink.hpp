#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace mqttop::utils
{

/**
 * @class BaseFileSink
 * @brief Internal helper that owns the file descriptor behind a file sink.
 *
 * Not a Sink itself: it opens, writes, flushes and closes one file. Writes go
 * through a single `write(2)` on an `O_APPEND` descriptor, optionally under an
 * advisory `flock`, so lines from several processes never interleave.
 */
class BaseFileSink
{
  public:
    BaseFileSink();
    virtual ~BaseFileSink();

    BaseFileSink(const BaseFileSink &) = delete;
    BaseFileSink &operator=(const BaseFileSink &) = delete;
    BaseFileSink(BaseFileSink &&) = delete;
    BaseFileSink &operator=(BaseFileSink &&) = delete;

  protected:
    /**
     * @brief Opens a file at the given path for appending.
     * @throws std::system_error on failure to open the file.
     */
    void open(const std::filesystem::path &path, bool use_flock);

    void close();

    /// @throws std::system_error on a short or failed write.
    void fwrite(const std::string &content);

    void fflush();

    bool is_open() const;

    const std::filesystem::path &path() const { return m_path; }

  private:
    std::filesystem::path m_path;
    bool m_use_flock = false;
    int m_fd = -1;
};

} // namespace mqttop::utils

// tests/test_framework/shared_test_helpers.cpp
#include "shared_test_helpers.h"
#include "utils/crypto_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mqttop::tests::helper
{

TempDir::TempDir(std::string_view prefix)
{
    m_path = fs::temp_directory_path() /
             fmt::format("{}_{}_{}", prefix, platform::get_pid(), crypto::random_hex(8));
    fs::create_directories(m_path);
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(m_path, ec);
}

bool read_file_contents(const fs::path &path, std::string &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

void write_file(const fs::path &path, std::string_view contents)
{
    if (path.has_parent_path())
    {
        fs::create_directories(path.parent_path());
    }
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        throw std::runtime_error("cannot write " + path.string());
    }
    ofs << contents;
}

size_t count_lines(std::string_view text, std::optional<std::string_view> must_include,
                   std::optional<std::string_view> must_exclude)
{
    size_t count = 0;
    size_t pos = 0;

    while (pos < text.size())
    {
        auto end = text.find('\n', pos);
        auto line = text.substr(pos, end - pos);

        if ((!must_include || line.find(*must_include) != std::string_view::npos) &&
            (!must_exclude || line.find(*must_exclude) == std::string_view::npos))
        {
            ++count;
        }

        if (end == std::string_view::npos)
            break;
        pos = end + 1;
    }

    return count;
}

bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds timeout,
                std::chrono::milliseconds poll)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(poll);
    }
    return pred();
}

ScopedEnv::ScopedEnv(std::string name, const std::optional<std::string> &value)
    : m_name(std::move(name))
{
    if (const char *prev = std::getenv(m_name.c_str()))
    {
        m_previous = prev;
    }
    if (value)
        ::setenv(m_name.c_str(), value->c_str(), 1);
    else
        ::unsetenv(m_name.c_str());
}

ScopedEnv::~ScopedEnv()
{
    if (m_previous)
        ::setenv(m_name.c_str(), m_previous->c_str(), 1);
    else
        ::unsetenv(m_name.c_str());
}

} // namespace mqttop::tests::helper
